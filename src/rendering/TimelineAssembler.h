#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"
#include "FFmpegExecutor.h"
#include "ClipProcessor.h"
#include "SubtitleOverlay.h"
#include "ScratchDirectory.h"

/**
 * Turns the fetched footage into one continuous visual track.
 *
 * Every segment with footage becomes a clip of the segment's duration,
 * rounded to whole frames against the running track length so rounding
 * never accumulates (see ClipProcessor::calculateFrameCount). Clips are concatenated in segment order and
 * the last frame is held for the trailing pad, which the final encode fades
 * out. A clip that cannot be produced is dropped; the track fails only when
 * no clip at all could be produced.
 */
class TimelineAssembler
{
public:
    /**
     * Creates a new TimelineAssembler.
     * @param executor The FFmpeg executor used for concatenation
     * @param clipProcessor Conforms individual clips
     * @param subtitleOverlay Builds caption filters when subtitles are requested
     */
    TimelineAssembler(FFmpegExecutor* executor, ClipProcessor* clipProcessor, SubtitleOverlay* subtitleOverlay);
    ~TimelineAssembler();

    /**
     * Sets a callback for receiving log messages.
     * @param callback Function called with log messages
     */
    void setLogCallback(std::function<void(const juce::String&)> callback);

    /** Called after each segment is attempted with (attempted, total). */
    void setProgressCallback(std::function<void(int, int)> callback);

    void setOutputFormat(const RenderTypes::VideoFormat& format);

    /** Seconds of held last frame appended to the track; 0 disables the pad. */
    void setTrailingPad(double seconds);

    /**
     * Assembles the visual track into the scratch directory.
     *
     * @param sortedSegments Segments in ascending start time
     * @param footage        Fetched footage keyed by segment index; segments
     *                       without an entry are left out of the track
     * @param addSubtitles   Burn each segment's text into its clip
     * @param scratch        Where clips and the track are written
     * @param timeline       Receives the track and its clip list
     */
    juce::Result assembleTimeline(const std::vector<RenderTypes::Segment>& sortedSegments,
                                  const std::map<int, juce::File>& footage,
                                  bool addSubtitles,
                                  ScratchDirectory& scratch,
                                  RenderTypes::AssembledTimeline& timeline);

    /** Sum of the clip durations plus the trailing pad. */
    static double calculateTimelineDuration(const std::vector<RenderTypes::ConformedClip>& clips,
                                            double trailingPad);

    /** One concat demuxer line per file, paths single-quoted. */
    static juce::String buildConcatList(const std::vector<RenderTypes::ConformedClip>& clips);

private:
    bool produceClip(const RenderTypes::Segment& segment,
                     const juce::File& source,
                     int frameCount,
                     bool addSubtitles,
                     ScratchDirectory& scratch,
                     RenderTypes::ConformedClip& clip);

    bool executeConcatWithFallback(const juce::File& concatList,
                                   const juce::File& outputFile,
                                   const juce::String& description);

    juce::StringArray buildPadEncodeArguments(bool compatibilityMode) const;

    /** The trailing pad as a whole number of frames. */
    int getPadFrameCount() const;

    FFmpegExecutor* ffmpegExecutor;
    ClipProcessor* clipProcessor;
    SubtitleOverlay* subtitleOverlay;

    RenderTypes::VideoFormat outputFormat;
    double trailingPad = 2.0;

    std::function<void(const juce::String&)> logCallback;
    std::function<void(int, int)> progressCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TimelineAssembler)
};
