#include "ClipProcessor.h"

namespace
{
    // Durations shorter than this are treated as already covering the target
    constexpr double durationTolerance = 0.001;

    juce::String formatSeconds(double seconds)
    {
        return juce::String(seconds, 3);
    }
}

ClipProcessor::ClipProcessor(FFmpegExecutor* ffmpegExecutor)
    : ffmpegExecutor(ffmpegExecutor)
{
}

ClipProcessor::~ClipProcessor()
{
}

void ClipProcessor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void ClipProcessor::setOutputFormat(const RenderTypes::VideoFormat& format, const juce::String& preset)
{
    outputFormat = format;
    intermediatePreset = preset.trim().isEmpty() ? juce::String("veryfast") : preset.trim();
}

ClipProcessor::ClipPlan ClipProcessor::planClip(double sourceDuration, double targetDuration)
{
    ClipPlan plan;
    plan.duration = targetDuration;

    if (!(sourceDuration > 0.0))
    {
        plan.streamLoop = -1;
        return plan;
    }

    if (sourceDuration + durationTolerance >= targetDuration)
        return plan;

    const int plays = static_cast<int>(std::ceil(targetDuration / sourceDuration - 1.0e-9));
    plan.streamLoop = juce::jmax(0, plays - 1);
    return plan;
}

juce::String ClipProcessor::buildScaleFilter(const RenderTypes::VideoFormat& format)
{
    const juce::String w(format.width);
    const juce::String h(format.height);

    return "scale=" + w + ":" + h + ":force_original_aspect_ratio=decrease"
         + ",pad=" + w + ":" + h + ":(ow-iw)/2:(oh-ih)/2:color=black"
         + ",setsar=1"
         + ",fps=" + juce::String(format.frameRate);
}

int ClipProcessor::calculateFrameCount(double position, double duration, int frameRate)
{
    const int fps = juce::jmax(1, frameRate);
    const auto start = std::llround(juce::jmax(0.0, position) * fps);
    const auto end = std::llround(juce::jmax(0.0, position + duration) * fps);
    return static_cast<int>(juce::jmax(1LL, end - start));
}

double ClipProcessor::getClipDuration(const juce::File& clip)
{
    return ffmpegExecutor->getFileDuration(clip);
}

bool ClipProcessor::conformClip(const juce::File& sourceClip,
                                int frameCount,
                                const juce::String& captionFilter,
                                const juce::File& outputFile)
{
    if (!sourceClip.existsAsFile())
    {
        if (logCallback)
            logCallback("ERROR: Clip file does not exist: " + sourceClip.getFullPathName());
        return false;
    }

    if (frameCount <= 0)
    {
        if (logCallback)
            logCallback("ERROR: Invalid frame count for clip: " + juce::String(frameCount));
        return false;
    }

    const double targetDuration = frameCount / static_cast<double>(juce::jmax(1, outputFormat.frameRate));

    const double sourceDuration = getClipDuration(sourceClip);
    const ClipPlan plan = planClip(sourceDuration, targetDuration);

    if (logCallback)
    {
        juce::String message = "Conforming " + sourceClip.getFileName() + " ("
                             + (sourceDuration > 0.0 ? formatSeconds(sourceDuration) + "s" : juce::String("unknown length"))
                             + ") to " + juce::String(frameCount) + " frames (" + formatSeconds(targetDuration) + "s)";
        if (plan.streamLoop > 0)
            message << ", looping " << plan.streamLoop << " extra time(s)";
        else if (plan.streamLoop < 0)
            message << ", looping until cut";
        logCallback(message);
    }

    juce::String filter = buildScaleFilter(outputFormat);
    if (captionFilter.isNotEmpty())
        filter << "," << captionFilter;

    auto command = ffmpegExecutor->createFFmpegCommand();

    if (plan.streamLoop != 0)
        command.addArray({ "-stream_loop", juce::String(plan.streamLoop) });

    command.addArray({ "-i", sourceClip.getFullPathName(),
                       "-vf", filter,
                       "-frames:v", juce::String(frameCount),
                       "-r", juce::String(outputFormat.frameRate),
                       "-c:v", "libx264",
                       "-preset", intermediatePreset,
                       "-crf", juce::String(outputFormat.crf),
                       "-pix_fmt", "yuv420p",
                       "-an",
                       "-movflags", "+faststart",
                       outputFile.getFullPathName() });

    if (!ffmpegExecutor->executeCommand(command, "conform " + outputFile.getFileNameWithoutExtension()))
    {
        if (logCallback)
            logCallback("ERROR: Failed to process clip " + sourceClip.getFileName());
        return false;
    }

    // Verify the output file was created correctly
    if (!outputFile.existsAsFile() || outputFile.getSize() == 0)
    {
        if (logCallback)
            logCallback("ERROR: Conformed clip is missing or empty: " + outputFile.getFileName());
        return false;
    }

    return true;
}
