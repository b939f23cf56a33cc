#pragma once
#include <JuceHeader.h>
#include "../audio/DuckingEnvelope.h"

/**
 * Builds the render's soundtrack: the voice-over at full level plus looped
 * background music shaped by a DuckingEnvelope, written as a 24-bit stereo
 * WAV of exactly the visual track's length.
 */
class AudioMixer
{
public:
    struct Settings
    {
        double sampleRate = 48000.0;
        double musicFadeOutSeconds = 2.0;
        double voiceOffsetSeconds = 0.0;    // Negative skips the start of the voice-over
    };

    AudioMixer();
    ~AudioMixer();

    /**
     * Sets a callback for receiving log messages.
     * @param logCallback Function called with log messages
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    void setSettings(const Settings& newSettings);
    const Settings& getSettings() const { return settings; }

    /**
     * Renders the mix.
     *
     * Music that is missing or cannot be decoded is left out with a warning.
     * With includeAudio false the result is silence of the same length.
     *
     * @param outputFile      WAV file to write (replaced if it exists)
     * @param durationSeconds Length of the visual track
     * @param voiceOver       Voice-over file; failing to decode it is an error
     * @param music           Background music, or a default File for none
     * @param envelope        Music gain curve
     * @param includeAudio    False renders a silent track
     */
    juce::Result mixAudio(const juce::File& outputFile,
                          double durationSeconds,
                          const juce::File& voiceOver,
                          const juce::File& music,
                          const DuckingEnvelope& envelope,
                          bool includeAudio);

    /** How many times a track of musicSeconds must play to cover targetSeconds. */
    static int calculateMusicRepeats(double musicSeconds, double targetSeconds);

    /** Whether the last mixAudio() call included background music. */
    bool lastMixIncludedMusic() const { return musicWasMixed; }

private:
    class DecodedSource;

    std::unique_ptr<DecodedSource> openSource(const juce::File& file, bool looping, int blockSize);

    /**
     * Linear fade of the music to silence over the last musicFadeOutSeconds
     * of the track. Positions are absolute sample indices.
     */
    void applyMusicFadeOut(juce::AudioBuffer<float>& buffer,
                           int numSamples,
                           juce::int64 chunkStart,
                           juce::int64 totalSamples) const;

    juce::AudioFormatManager formatManager;
    Settings settings;
    bool musicWasMixed = false;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AudioMixer)
};
