#pragma once
#include <JuceHeader.h>
#include "../rendering/RenderTypes.h"

/**
 * Tunable constants of the render pipeline.
 *
 * Defaults match the production behaviour; a JSON file can override any
 * subset of keys and a few environment variables override the locations
 * that differ between deployments:
 *
 *  - NARRATION_RENDER_FFMPEG   -> ffmpegPath
 *  - NARRATION_RENDER_SCRATCH  -> scratchRoot
 *  - NARRATION_RENDER_OUTPUT   -> outputDirectory
 */
struct RenderConfig
{
    RenderConfig();

    //==========================================================================
    // Locations
    juce::File scratchRoot;
    juce::File outputDirectory;
    juce::File logDirectory;
    juce::String ffmpegPath;            // Empty = next to the executable, then PATH
    juce::String ffprobePath;

    //==========================================================================
    // Video
    int frameWidth = 1920;
    int frameHeight = 1080;
    int frameRate = 24;
    double trailingPadSeconds = 2.0;
    int videoCrf = 20;
    juce::String videoPreset = "medium";
    juce::String intermediatePreset = "veryfast";

    // Captions
    juce::File subtitleFontFile;        // Unset = search the fallback list
    int subtitleFontSize = 48;
    int subtitleMaxCharsPerLine = 60;

    //==========================================================================
    // Audio
    double audioSampleRate = 48000.0;
    juce::String audioBitrate = "192k";
    float defaultMusicVolume = 0.7f;
    float duckedMusicVolume = 0.2f;
    double duckFadeSeconds = 0.5;
    double musicFadeOutSeconds = 2.0;
    double voiceOffsetSeconds = 0.0;    // Negative starts the voice-over earlier

    //==========================================================================
    // Downloads
    int downloadTimeoutMs = 120000;
    int maxConcurrentDownloads = 8;

    //==========================================================================
    /**
     * Overrides fields from a parsed JSON object. Unknown keys are ignored;
     * keys with a value of the wrong type keep their default and add a
     * message to warnings.
     */
    juce::Result applyVar(const juce::var& json, juce::StringArray& warnings);

    /** Reads a JSON file and applies it with applyVar(). */
    juce::Result loadFromFile(const juce::File& file, juce::StringArray& warnings);

    /** Applies the NARRATION_RENDER_* environment overrides. */
    void applyEnvironment();

    /** Checks ranges that would make a render meaningless. */
    juce::Result validate() const;

    /** Frame geometry and final-encode settings as one value. */
    RenderTypes::VideoFormat getVideoFormat() const;
};
