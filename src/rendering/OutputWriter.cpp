#include "OutputWriter.h"

OutputWriter::OutputWriter(FFmpegExecutor* ffmpegExecutor)
    : ffmpegExecutor(ffmpegExecutor)
{
}

OutputWriter::~OutputWriter()
{
}

void OutputWriter::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void OutputWriter::setOutputFormat(const RenderTypes::VideoFormat& format)
{
    outputFormat = format;
}

void OutputWriter::setAudioSettings(const juce::String& bitrate, int sampleRate)
{
    audioBitrate = bitrate.trim().isEmpty() ? juce::String("192k") : bitrate.trim();
    audioSampleRate = sampleRate > 0 ? sampleRate : 48000;
}

juce::String OutputWriter::buildVideoFadeFilter(double contentDuration, double trailingPad)
{
    if (trailingPad <= 0.001)
        return {};

    return "fade=t=out:st=" + juce::String(juce::jmax(0.0, contentDuration), 6)
         + ":d=" + juce::String(trailingPad, 6);
}

juce::String OutputWriter::createOutputFileName(const juce::String& projectRef, juce::Time time)
{
    juce::String base = juce::File::createLegalFileName(projectRef.trim()).replaceCharacter(' ', '_');
    if (base.isEmpty())
        base = "render";

    return base + "_" + time.formatted("%Y%m%d_%H%M%S") + ".mp4";
}

juce::Result OutputWriter::writeOutput(const RenderTypes::AssembledTimeline& timeline,
                                       const juce::File& audioFile,
                                       const juce::File& outputFile)
{
    if (!timeline.videoTrack.existsAsFile())
        return juce::Result::fail("No assembled video track to encode");

    if (!audioFile.existsAsFile())
        return juce::Result::fail("No mixed audio track to encode");

    const double totalDuration = timeline.getTotalDuration();
    if (totalDuration <= 0.0)
        return juce::Result::fail("Cannot encode an output of " + juce::String(totalDuration, 3) + "s");

    if (outputFile.existsAsFile() && !outputFile.deleteFile())
        return juce::Result::fail("Cannot replace " + outputFile.getFullPathName());

    if (logCallback)
        logCallback("Encoding final output: " + juce::String(totalDuration, 3) + "s at "
                    + juce::String(outputFormat.width) + "x" + juce::String(outputFormat.height) + " "
                    + juce::String(outputFormat.frameRate) + "fps, crf " + juce::String(outputFormat.crf)
                    + ", preset " + outputFormat.preset);

    auto command = ffmpegExecutor->createFFmpegCommand();
    command.addArray({ "-i", timeline.videoTrack.getFullPathName(),
                       "-i", audioFile.getFullPathName(),
                       "-map", "0:v:0",
                       "-map", "1:a:0" });

    const juce::String fadeFilter = buildVideoFadeFilter(timeline.contentDuration, timeline.trailingPad);
    if (fadeFilter.isNotEmpty())
        command.addArray({ "-vf", fadeFilter });

    command.addArray({ "-c:v", "libx264",
                       "-preset", outputFormat.preset,
                       "-crf", juce::String(outputFormat.crf),
                       "-pix_fmt", "yuv420p",
                       "-r", juce::String(outputFormat.frameRate),
                       "-c:a", "aac",
                       "-b:a", audioBitrate,
                       "-ar", juce::String(audioSampleRate),
                       "-t", juce::String(totalDuration, 6),
                       "-movflags", "+faststart",
                       outputFile.getFullPathName() });

    if (!ffmpegExecutor->executeCommand(command, "final encode"))
    {
        if (logCallback)
            logCallback("ERROR: Failed to mux final output");

        juce::String message = "Final encode failed";
        const auto errorOutput = ffmpegExecutor->getLastErrorOutput();
        if (errorOutput.isNotEmpty())
            message << ": " << errorOutput;
        return juce::Result::fail(message);
    }

    if (!outputFile.existsAsFile() || outputFile.getSize() == 0)
        return juce::Result::fail("Final encode produced no output at " + outputFile.getFullPathName());

    if (logCallback) logCallback("Final output muxed successfully: " + outputFile.getFullPathName()
                                 + " (" + juce::String(outputFile.getSize() / 1024) + " KB)");
    return juce::Result::ok();
}
