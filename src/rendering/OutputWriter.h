#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"
#include "FFmpegExecutor.h"

/**
 * Encodes the deliverable: the assembled visual track and the mixed
 * soundtrack muxed into an H.264/AAC mp4 whose length is the visual track's
 * total duration. The picture fades to black across the trailing pad.
 */
class OutputWriter
{
public:
    /**
     * Creates a new OutputWriter.
     * @param ffmpegExecutor The FFmpeg executor used for the final encode
     */
    OutputWriter(FFmpegExecutor* ffmpegExecutor);
    ~OutputWriter();

    /**
     * Sets a callback for receiving log messages.
     * @param logCallback Function called with log messages
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    void setOutputFormat(const RenderTypes::VideoFormat& format);

    /**
     * Sets the AAC encoding parameters.
     * @param bitrate    ffmpeg bitrate string, e.g. "192k"
     * @param sampleRate Output sample rate in Hz
     */
    void setAudioSettings(const juce::String& bitrate, int sampleRate);

    /**
     * Runs the final encode.
     *
     * @param timeline   Visual track and its durations
     * @param audioFile  Mixed soundtrack covering the whole track
     * @param outputFile Destination mp4 (replaced if it exists)
     * @return a failure carrying ffmpeg's own error lines when the encode fails
     */
    juce::Result writeOutput(const RenderTypes::AssembledTimeline& timeline,
                             const juce::File& audioFile,
                             const juce::File& outputFile);

    /**
     * "fade=t=out:st=<content>:d=<pad>", or empty when there is no pad to fade across.
     */
    static juce::String buildVideoFadeFilter(double contentDuration, double trailingPad);

    /** Output name for a project: "<project>_<YYYYmmdd_HHMMSS>.mp4". */
    static juce::String createOutputFileName(const juce::String& projectRef, juce::Time time);

private:
    FFmpegExecutor* ffmpegExecutor;

    RenderTypes::VideoFormat outputFormat;
    juce::String audioBitrate { "192k" };
    int audioSampleRate = 48000;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(OutputWriter)
};
