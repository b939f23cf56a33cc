#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"
#include "FFmpegExecutor.h"

/**
 * Conforms a footage clip to its segment: exact duration (trimmed, or looped
 * when the source is too short), the render's frame geometry and frame rate,
 * no audio, and an optional burned-in caption.
 */
class ClipProcessor
{
public:
    /** How a source must be repeated and cut to fill a target duration */
    struct ClipPlan
    {
        int streamLoop = 0;         // Extra plays after the first; -1 = loop until cut
        double duration = 0.0;      // Seconds of (looped) source the clip consumes
    };

    /**
     * Creates a new ClipProcessor.
     * @param ffmpegExecutor The FFmpeg executor to use for clip processing
     */
    ClipProcessor(FFmpegExecutor* ffmpegExecutor);
    ~ClipProcessor();

    /**
     * Sets a callback for receiving log messages.
     * @param logCallback Function called with log messages
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Sets the frame geometry and the x264 preset for intermediate clips.
     * Clips keep the format's CRF so quality does not drop before the final encode.
     */
    void setOutputFormat(const RenderTypes::VideoFormat& format, const juce::String& intermediatePreset);

    /**
     * Works out the -stream_loop value for a source of sourceDuration seconds.
     * An unknown (zero) source length loops indefinitely and relies on the cut.
     */
    static ClipPlan planClip(double sourceDuration, double targetDuration);

    /** scale + pad to the frame, square pixels, constant frame rate */
    static juce::String buildScaleFilter(const RenderTypes::VideoFormat& format);

    /**
     * Whole frames a clip of `duration` seconds occupies when it starts
     * `position` seconds into the track. Boundaries are rounded to the frame
     * grid, so consecutive clips add up to round(total * frameRate) frames.
     */
    static int calculateFrameCount(double position, double duration, int frameRate);

    /**
     * Produces one conformed clip.
     *
     * @param sourceClip     Downloaded footage
     * @param frameCount     Exact number of frames to encode
     * @param captionFilter  drawtext filter to append, or empty for none
     * @param outputFile     The file to save the processed clip to
     * @return true if the output exists and is non-empty
     */
    bool conformClip(const juce::File& sourceClip,
                     int frameCount,
                     const juce::String& captionFilter,
                     const juce::File& outputFile);

    /**
     * Gets the duration of a video clip in seconds.
     * @param clip The video clip file
     * @return The duration in seconds, 0 when it cannot be probed
     */
    double getClipDuration(const juce::File& clip);

private:
    FFmpegExecutor* ffmpegExecutor;

    RenderTypes::VideoFormat outputFormat;
    juce::String intermediatePreset { "veryfast" };

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ClipProcessor)
};
