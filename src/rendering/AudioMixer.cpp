#include "AudioMixer.h"

namespace
{
    constexpr int numOutputChannels = 2;
}

//==============================================================================
/** A decoded file resampled to the mixer's rate, optionally looping. */
class AudioMixer::DecodedSource
{
public:
    DecodedSource(juce::AudioFormatReader* reader, bool looping, double outputRate, int blockSize)
        : numChannels(static_cast<int>(reader->numChannels)),
          sourceRate(reader->sampleRate),
          lengthSeconds(reader->lengthInSamples / reader->sampleRate),
          readerSource(std::make_unique<juce::AudioFormatReaderSource>(reader, true)),
          resampler(std::make_unique<juce::ResamplingAudioSource>(readerSource.get(), false, numOutputChannels))
    {
        readerSource->setLooping(looping);
        resampler->setResamplingRatio(sourceRate / outputRate);
        resampler->prepareToPlay(blockSize, outputRate);
    }

    ~DecodedSource()
    {
        resampler->releaseResources();
    }

    /** Starts reading this many seconds into the file. */
    void skip(double seconds)
    {
        readerSource->setNextReadPosition(static_cast<juce::int64>(seconds * sourceRate));
    }

    void read(juce::AudioBuffer<float>& buffer, int startSample, int numSamples)
    {
        juce::AudioSourceChannelInfo info(&buffer, startSample, numSamples);
        resampler->getNextAudioBlock(info);

        // Mono files play on both channels
        if (numChannels == 1)
            buffer.copyFrom(1, startSample, buffer, 0, startSample, numSamples);
    }

    double getLengthSeconds() const { return lengthSeconds; }

private:
    int numChannels;
    double sourceRate;
    double lengthSeconds;
    std::unique_ptr<juce::AudioFormatReaderSource> readerSource;
    std::unique_ptr<juce::ResamplingAudioSource> resampler;

    JUCE_DECLARE_NON_COPYABLE(DecodedSource)
};

//==============================================================================
AudioMixer::AudioMixer()
{
    formatManager.registerBasicFormats();
}

AudioMixer::~AudioMixer()
{
}

void AudioMixer::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void AudioMixer::setSettings(const Settings& newSettings)
{
    settings = newSettings;
}

int AudioMixer::calculateMusicRepeats(double musicSeconds, double targetSeconds)
{
    if (musicSeconds <= 0.0 || targetSeconds <= 0.0)
        return 0;

    return static_cast<int>(std::ceil(targetSeconds / musicSeconds - 1.0e-9));
}

std::unique_ptr<AudioMixer::DecodedSource> AudioMixer::openSource(const juce::File& file, bool looping, int blockSize)
{
    if (!file.existsAsFile())
        return nullptr;

    juce::AudioFormatReader* reader = formatManager.createReaderFor(file);
    if (reader == nullptr)
        return nullptr;

    if (reader->lengthInSamples <= 0 || reader->sampleRate <= 0.0 || reader->numChannels == 0)
    {
        delete reader;
        return nullptr;
    }

    return std::make_unique<DecodedSource>(reader, looping, settings.sampleRate, blockSize);
}

void AudioMixer::applyMusicFadeOut(juce::AudioBuffer<float>& buffer,
                                   int numSamples,
                                   juce::int64 chunkStart,
                                   juce::int64 totalSamples) const
{
    const juce::int64 fadeSamples = juce::jmin(totalSamples,
                                               static_cast<juce::int64>(settings.musicFadeOutSeconds * settings.sampleRate));
    if (fadeSamples <= 0)
        return;

    const juce::int64 fadeStart = totalSamples - fadeSamples;
    const juce::int64 firstInChunk = juce::jmax(fadeStart, chunkStart);

    for (juce::int64 position = firstInChunk; position < chunkStart + numSamples; ++position)
    {
        const float gain = static_cast<float>(totalSamples - position) / static_cast<float>(fadeSamples);
        const int index = static_cast<int>(position - chunkStart);

        for (int channel = 0; channel < buffer.getNumChannels(); ++channel)
            buffer.getWritePointer(channel)[index] *= gain;
    }
}

juce::Result AudioMixer::mixAudio(const juce::File& outputFile,
                                  double durationSeconds,
                                  const juce::File& voiceOver,
                                  const juce::File& music,
                                  const DuckingEnvelope& envelope,
                                  bool includeAudio)
{
    musicWasMixed = false;

    if (!(durationSeconds > 0.0))
        return juce::Result::fail("Cannot mix audio for a duration of " + juce::String(durationSeconds) + "s");

    const double sampleRate = settings.sampleRate;
    const juce::int64 totalSamples = static_cast<juce::int64>(std::llround(durationSeconds * sampleRate));

    // Use chunked rendering for long narrations to avoid large allocations
    const int chunkSize = static_cast<int>(sampleRate) * 10;
    const juce::int64 numChunks = (totalSamples + chunkSize - 1) / chunkSize;

    std::unique_ptr<DecodedSource> voiceSource;
    std::unique_ptr<DecodedSource> musicSource;

    if (includeAudio)
    {
        voiceSource = openSource(voiceOver, false, chunkSize);
        if (voiceSource == nullptr)
            return juce::Result::fail("Unable to read voice-over " + voiceOver.getFullPathName());

        if (settings.voiceOffsetSeconds < 0.0)
            voiceSource->skip(-settings.voiceOffsetSeconds);

        if (music != juce::File())
        {
            musicSource = openSource(music, true, chunkSize);

            if (musicSource == nullptr)
            {
                if (logCallback)
                    logCallback("WARNING: Could not decode background music " + music.getFileName()
                                + ", continuing with voice-over only");
            }
            else if (logCallback)
            {
                logCallback("Background music " + juce::String(musicSource->getLengthSeconds(), 2) + "s plays "
                            + juce::String(calculateMusicRepeats(musicSource->getLengthSeconds(), durationSeconds))
                            + "x to cover " + juce::String(durationSeconds, 2) + "s");
            }
        }
    }
    else if (logCallback)
    {
        logCallback("Audio disabled for this render, writing a silent track");
    }

    if (outputFile.exists() && !outputFile.deleteFile())
        return juce::Result::fail("Cannot replace " + outputFile.getFullPathName());

    auto outputStream = std::make_unique<juce::FileOutputStream>(outputFile);
    if (!outputStream->openedOk())
        return juce::Result::fail("Cannot open " + outputFile.getFullPathName() + " for writing");

    juce::WavAudioFormat wavFormat;
    std::unique_ptr<juce::AudioFormatWriter> writer(wavFormat.createWriterFor(outputStream.get(),
                                                                              sampleRate,
                                                                              numOutputChannels,
                                                                              24,
                                                                              {},
                                                                              0));
    if (writer == nullptr)
        return juce::Result::fail("Failed to create audio file writer for " + outputFile.getFileName());

    // The writer owns the stream from here on
    outputStream.release();

    const juce::int64 voiceStartSample = settings.voiceOffsetSeconds > 0.0
        ? static_cast<juce::int64>(settings.voiceOffsetSeconds * sampleRate)
        : 0;

    juce::AudioBuffer<float> chunkBuffer(numOutputChannels, chunkSize);
    juce::AudioBuffer<float> musicBuffer(numOutputChannels, chunkSize);

    for (juce::int64 chunkIndex = 0; chunkIndex < numChunks; ++chunkIndex)
    {
        const juce::int64 chunkStart = chunkIndex * chunkSize;
        const int currentChunkSize = static_cast<int>(juce::jmin(static_cast<juce::int64>(chunkSize),
                                                                 totalSamples - chunkStart));

        chunkBuffer.clear();

        if (voiceSource != nullptr && chunkStart + currentChunkSize > voiceStartSample)
        {
            const int offsetInChunk = static_cast<int>(juce::jmax(static_cast<juce::int64>(0), voiceStartSample - chunkStart));
            voiceSource->read(chunkBuffer, offsetInChunk, currentChunkSize - offsetInChunk);
        }

        if (musicSource != nullptr)
        {
            musicBuffer.clear();
            musicSource->read(musicBuffer, 0, currentChunkSize);

            envelope.applyToBuffer(musicBuffer, 0, currentChunkSize,
                                   static_cast<double>(chunkStart) / sampleRate, sampleRate);
            applyMusicFadeOut(musicBuffer, currentChunkSize, chunkStart, totalSamples);

            for (int channel = 0; channel < numOutputChannels; ++channel)
                chunkBuffer.addFrom(channel, 0, musicBuffer, channel, 0, currentChunkSize);
        }

        if (!writer->writeFromAudioSampleBuffer(chunkBuffer, 0, currentChunkSize))
            return juce::Result::fail("Failed to write audio chunk " + juce::String(chunkIndex)
                                      + " to " + outputFile.getFileName());
    }

    writer.reset();
    musicWasMixed = musicSource != nullptr;

    if (logCallback)
        logCallback("Audio mix written: " + outputFile.getFileName() + " ("
                    + juce::String(durationSeconds, 3) + "s, "
                    + (musicWasMixed ? "voice + music" : (includeAudio ? "voice only" : "silent")) + ")");

    return juce::Result::ok();
}
