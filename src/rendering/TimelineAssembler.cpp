#include "TimelineAssembler.h"

namespace
{
    juce::String escapeConcatPath(const juce::File& file)
    {
        // The concat demuxer closes a quoted path at ' so it has to be written as '\''
        return file.getFullPathName().replace("\\", "/").replace("'", "'\\''");
    }
}

TimelineAssembler::TimelineAssembler(FFmpegExecutor* executor, ClipProcessor* processor, SubtitleOverlay* overlay)
    : ffmpegExecutor(executor),
      clipProcessor(processor),
      subtitleOverlay(overlay)
{
}

TimelineAssembler::~TimelineAssembler()
{
}

void TimelineAssembler::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void TimelineAssembler::setProgressCallback(std::function<void(int, int)> callback)
{
    progressCallback = callback;
}

void TimelineAssembler::setOutputFormat(const RenderTypes::VideoFormat& format)
{
    outputFormat = format;
}

void TimelineAssembler::setTrailingPad(double seconds)
{
    trailingPad = juce::jmax(0.0, seconds);
}

double TimelineAssembler::calculateTimelineDuration(const std::vector<RenderTypes::ConformedClip>& clips,
                                                    double pad)
{
    double total = 0.0;
    for (const auto& clip : clips)
        total += clip.duration;

    return total + juce::jmax(0.0, pad);
}

int TimelineAssembler::getPadFrameCount() const
{
    return static_cast<int>(std::llround(trailingPad * juce::jmax(1, outputFormat.frameRate)));
}

juce::String TimelineAssembler::buildConcatList(const std::vector<RenderTypes::ConformedClip>& clips)
{
    juce::String list;
    for (const auto& clip : clips)
        list << "file '" << escapeConcatPath(clip.file) << "'\n";

    return list;
}

bool TimelineAssembler::produceClip(const RenderTypes::Segment& segment,
                                    const juce::File& source,
                                    int frameCount,
                                    bool addSubtitles,
                                    ScratchDirectory& scratch,
                                    RenderTypes::ConformedClip& clip)
{
    const juce::File outputFile = scratch.createFile("clip_" + juce::String(segment.index) + ".mp4");

    juce::String captionFilter;
    if (addSubtitles && subtitleOverlay != nullptr)
        captionFilter = subtitleOverlay->prepareCaption(segment, scratch);

    bool produced = clipProcessor->conformClip(source, frameCount, captionFilter, outputFile);

    // A broken caption must not cost the segment its footage
    if (!produced && captionFilter.isNotEmpty())
    {
        if (logCallback)
            logCallback("WARNING: Captioned encode failed for segment " + juce::String(segment.index)
                        + ", retrying without subtitles");

        outputFile.deleteFile();
        captionFilter.clear();
        produced = clipProcessor->conformClip(source, frameCount, {}, outputFile);
    }

    if (!produced)
        return false;

    clip.segmentIndex = segment.index;
    clip.file = outputFile;
    clip.frameCount = frameCount;
    clip.duration = frameCount / static_cast<double>(juce::jmax(1, outputFormat.frameRate));
    clip.captioned = captionFilter.isNotEmpty();
    return true;
}

juce::Result TimelineAssembler::assembleTimeline(const std::vector<RenderTypes::Segment>& sortedSegments,
                                                 const std::map<int, juce::File>& footage,
                                                 bool addSubtitles,
                                                 ScratchDirectory& scratch,
                                                 RenderTypes::AssembledTimeline& timeline)
{
    timeline = RenderTypes::AssembledTimeline();

    const int total = static_cast<int>(sortedSegments.size());
    int attempted = 0;
    int withFootage = 0;
    double nominalContent = 0.0;

    if (logCallback)
        logCallback("Assembling timeline from " + juce::String(footage.size()) + " fetched clip(s) across "
                    + juce::String(total) + " segment(s)");

    for (const auto& segment : sortedSegments)
    {
        const auto found = footage.find(segment.index);

        if (found == footage.end())
        {
            if (logCallback)
                logCallback("Segment " + juce::String(segment.index) + " has no footage, leaving it out");
        }
        else
        {
            ++withFootage;
            RenderTypes::ConformedClip clip;
            const int frameCount = ClipProcessor::calculateFrameCount(nominalContent, segment.getDuration(),
                                                                      outputFormat.frameRate);

            if (produceClip(segment, found->second, frameCount, addSubtitles, scratch, clip))
            {
                timeline.clips.push_back(clip);
                nominalContent += segment.getDuration();
            }
            else if (logCallback)
            {
                logCallback("WARNING: Dropping segment " + juce::String(segment.index)
                            + ", its clip could not be produced");
            }
        }

        ++attempted;
        if (progressCallback)
            progressCallback(attempted, total);
    }

    if (timeline.clips.empty())
        return juce::Result::fail("No clips could be produced from the " + juce::String(withFootage)
                                  + " fetched footage file(s)");

    const juce::File concatList = scratch.createFile("concat_list.txt");
    if (!concatList.replaceWithText(buildConcatList(timeline.clips), false, false, "\n"))
        return juce::Result::fail("Could not write " + concatList.getFullPathName());

    const juce::File videoTrack = scratch.createFile("timeline.mp4");
    if (!executeConcatWithFallback(concatList, videoTrack, "concatenating " + juce::String(timeline.clips.size()) + " clips"))
    {
        juce::String message = "Failed to concatenate the timeline";
        const auto errorOutput = ffmpegExecutor->getLastErrorOutput();
        if (errorOutput.isNotEmpty())
            message << ": " << errorOutput;
        return juce::Result::fail(message);
    }

    timeline.videoTrack = videoTrack;
    timeline.trailingPad = getPadFrameCount() / static_cast<double>(juce::jmax(1, outputFormat.frameRate));
    timeline.contentDuration = calculateTimelineDuration(timeline.clips, 0.0);

    if (logCallback)
    {
        logCallback("Timeline assembled: " + juce::String(timeline.clips.size()) + " clip(s), "
                    + juce::String(timeline.contentDuration, 3) + "s + "
                    + juce::String(timeline.trailingPad, 3) + "s pad");

        // Container durations are rounded to frames; only report a real mismatch
        const double probed = ffmpegExecutor->getFileDuration(videoTrack);
        const double frame = 1.0 / juce::jmax(1, outputFormat.frameRate);
        if (probed > 0.0 && std::abs(probed - timeline.getTotalDuration()) > 2.0 * frame)
            logCallback("WARNING: Timeline file reports " + juce::String(probed, 3) + "s, expected "
                        + juce::String(timeline.getTotalDuration(), 3) + "s");
    }

    return juce::Result::ok();
}

juce::StringArray TimelineAssembler::buildPadEncodeArguments(bool compatibilityMode) const
{
    juce::StringArray filters;
    if (getPadFrameCount() > 0)
        filters.add("tpad=stop_mode=clone:stop=" + juce::String(getPadFrameCount()));
    if (compatibilityMode)
        filters.add("fps=" + juce::String(outputFormat.frameRate));

    juce::StringArray arguments;
    if (filters.size() > 0)
        arguments.addArray({ "-vf", filters.joinIntoString(",") });

    arguments.addArray({ "-r", juce::String(outputFormat.frameRate),
                         "-c:v", "libx264",
                         "-preset", "veryfast",
                         "-crf", juce::String(outputFormat.crf),
                         "-pix_fmt", "yuv420p" });
    return arguments;
}

bool TimelineAssembler::executeConcatWithFallback(const juce::File& concatList,
                                                  const juce::File& outputFile,
                                                  const juce::String& description)
{
    auto buildCommand = [&](bool compatibilityMode)
    {
        auto command = ffmpegExecutor->createFFmpegCommand();

        if (compatibilityMode)
            command.addArray({ "-fflags", "+genpts" });

        command.addArray({ "-f", "concat", "-safe", "0", "-i", concatList.getFullPathName() });

        // Clips share one encoding, so without a pad a stream copy is enough
        if (getPadFrameCount() > 0 || compatibilityMode)
            command.addArray(buildPadEncodeArguments(compatibilityMode));
        else
            command.addArray({ "-c", "copy" });

        if (compatibilityMode)
            command.addArray({ "-avoid_negative_ts", "make_zero" });

        command.addArray({ "-an", "-movflags", "+faststart", outputFile.getFullPathName() });
        return command;
    };

    if (ffmpegExecutor->executeCommand(buildCommand(false), description))
        return true;

    if (logCallback) logCallback("WARNING: " + description + " failed; retrying with compatibility settings");

    if (outputFile.existsAsFile())
        outputFile.deleteFile();

    if (!ffmpegExecutor->executeCommand(buildCommand(true), description + " (retry)"))
    {
        if (logCallback) logCallback("ERROR: " + description + " failed after retry");
        return false;
    }

    if (logCallback) logCallback("Retry succeeded for " + description);
    return true;
}
