#include <JuceHeader.h>
#include "TestHelpers.h"
#include "../src/rendering/AudioMixer.h"

class AudioMixerTests : public juce::UnitTest
{
public:
    AudioMixerTests() : juce::UnitTest("AudioMixer", "NarrationRender") {}

    void runTest() override
    {
        TestHelpers::TemporaryDirectory temp;

        const juce::File silentVoice = temp.getChildFile("silent_voice.wav");
        const juce::File voice = temp.getChildFile("voice.wav");
        const juce::File monoVoice = temp.getChildFile("mono_voice.wav");
        const juce::File shortMusic = temp.getChildFile("music_4s.wav");
        const juce::File longMusic = temp.getChildFile("music_12s.wav");
        const juce::File output = temp.getChildFile("mix.wav");

        expect(TestHelpers::writeConstantWav(silentVoice, 1.0, 0.0f));
        expect(TestHelpers::writeConstantWav(voice, 1.0, 0.25f));
        expect(TestHelpers::writeConstantWav(monoVoice, 1.0, 0.25f, 1));
        expect(TestHelpers::writeConstantWav(shortMusic, 4.0, 0.5f));
        expect(TestHelpers::writeConstantWav(longMusic, 12.0, 0.5f));

        const DuckingEnvelope noVoice({}, 0.7f, 0.2f, 0.5);

        beginTest("music repeats enough times to cover the track");
        {
            expectEquals(AudioMixer::calculateMusicRepeats(4.0, 10.0), 3);
            expectEquals(AudioMixer::calculateMusicRepeats(5.0, 10.0), 2);
            expectEquals(AudioMixer::calculateMusicRepeats(12.0, 10.0), 1);
            expectEquals(AudioMixer::calculateMusicRepeats(0.0, 10.0), 0);
        }

        beginTest("short music loops to the track length and fades out");
        {
            AudioMixer mixer;
            auto result = mixer.mixAudio(output, 10.0, silentVoice, shortMusic, noVoice, true);
            expect(result.wasOk(), result.getErrorMessage());
            expect(mixer.lastMixIncludedMusic());

            juce::AudioBuffer<float> mix;
            double sampleRate = 0.0;
            expect(TestHelpers::readAudioFile(output, mix, sampleRate));
            expectEquals(sampleRate, 48000.0);
            expectEquals(mix.getNumChannels(), 2);
            expectEquals(mix.getNumSamples(), 480000);

            expectWithinAbsoluteError(sampleAt(mix, 1.0), 0.35f, 1.0e-3f);
            expectWithinAbsoluteError(sampleAt(mix, 6.0), 0.35f, 1.0e-3f);   // second pass of the loop
            expectWithinAbsoluteError(sampleAt(mix, 9.5), 0.35f, 1.0e-3f);   // third pass, trimmed
            expectWithinAbsoluteError(sampleAt(mix, 9.0), 0.175f, 1.0e-3f);  // halfway through the 2s fade
            expectWithinAbsoluteError(mix.getSample(1, mix.getNumSamples() - 1), 0.0f, 1.0e-3f);
        }

        beginTest("music ducks under the voice");
        {
            AudioMixer mixer;
            DuckingEnvelope envelope({ { 2.0, 4.0 } }, 0.7f, 0.2f, 0.5);
            auto result = mixer.mixAudio(output, 8.0, silentVoice, longMusic, envelope, true);
            expect(result.wasOk(), result.getErrorMessage());

            juce::AudioBuffer<float> mix;
            double sampleRate = 0.0;
            expect(TestHelpers::readAudioFile(output, mix, sampleRate));

            expectWithinAbsoluteError(sampleAt(mix, 1.0), 0.35f, 1.0e-3f);
            expectWithinAbsoluteError(sampleAt(mix, 1.75), 0.225f, 1.0e-3f);
            expectWithinAbsoluteError(sampleAt(mix, 3.0), 0.1f, 1.0e-3f);
            expectWithinAbsoluteError(sampleAt(mix, 5.0), 0.35f, 1.0e-3f);
        }

        beginTest("voice plays at full level on top of the ducked music");
        {
            AudioMixer mixer;
            DuckingEnvelope envelope({ { 0.0, 1.0 } }, 0.7f, 0.2f, 0.5);
            auto result = mixer.mixAudio(output, 4.0, voice, longMusic, envelope, true);
            expect(result.wasOk(), result.getErrorMessage());

            juce::AudioBuffer<float> mix;
            double sampleRate = 0.0;
            expect(TestHelpers::readAudioFile(output, mix, sampleRate));

            expectWithinAbsoluteError(sampleAt(mix, 0.5), 0.25f + 0.1f, 1.0e-3f);
            expectWithinAbsoluteError(sampleAt(mix, 1.9), 0.35f, 1.0e-3f);
        }

        beginTest("without music the voice alone is written and padded with silence");
        {
            AudioMixer mixer;
            auto result = mixer.mixAudio(output, 3.0, voice, juce::File(), noVoice, true);
            expect(result.wasOk(), result.getErrorMessage());
            expect(!mixer.lastMixIncludedMusic());

            juce::AudioBuffer<float> mix;
            double sampleRate = 0.0;
            expect(TestHelpers::readAudioFile(output, mix, sampleRate));
            expectEquals(mix.getNumSamples(), 144000);
            expectWithinAbsoluteError(sampleAt(mix, 0.5), 0.25f, 1.0e-3f);
            expectWithinAbsoluteError(sampleAt(mix, 2.0), 0.0f, 1.0e-6f);
        }

        beginTest("mono voice plays on both channels");
        {
            AudioMixer mixer;
            auto result = mixer.mixAudio(output, 2.0, monoVoice, juce::File(), noVoice, true);
            expect(result.wasOk(), result.getErrorMessage());

            juce::AudioBuffer<float> mix;
            double sampleRate = 0.0;
            expect(TestHelpers::readAudioFile(output, mix, sampleRate));
            expectWithinAbsoluteError(mix.getSample(0, 24000), 0.25f, 1.0e-3f);
            expectWithinAbsoluteError(mix.getSample(1, 24000), 0.25f, 1.0e-3f);
        }

        beginTest("voice offset shifts the voice-over");
        {
            AudioMixer mixer;
            AudioMixer::Settings settings;
            settings.voiceOffsetSeconds = 1.0;
            mixer.setSettings(settings);

            expect(mixer.mixAudio(output, 3.0, voice, juce::File(), noVoice, true).wasOk());

            juce::AudioBuffer<float> mix;
            double sampleRate = 0.0;
            expect(TestHelpers::readAudioFile(output, mix, sampleRate));
            expectWithinAbsoluteError(sampleAt(mix, 0.5), 0.0f, 1.0e-6f);
            expectWithinAbsoluteError(sampleAt(mix, 1.5), 0.25f, 1.0e-3f);

            settings.voiceOffsetSeconds = -0.5;
            mixer.setSettings(settings);
            expect(mixer.mixAudio(output, 3.0, voice, juce::File(), noVoice, true).wasOk());
            expect(TestHelpers::readAudioFile(output, mix, sampleRate));
            expectWithinAbsoluteError(sampleAt(mix, 0.25), 0.25f, 1.0e-3f);
            expectWithinAbsoluteError(sampleAt(mix, 0.75), 0.0f, 1.0e-3f);
        }

        beginTest("audio disabled renders silence of the full length");
        {
            AudioMixer mixer;
            auto result = mixer.mixAudio(output, 2.5, temp.getChildFile("absent.wav"), longMusic, noVoice, false);
            expect(result.wasOk(), result.getErrorMessage());
            expect(!mixer.lastMixIncludedMusic());

            juce::AudioBuffer<float> mix;
            double sampleRate = 0.0;
            expect(TestHelpers::readAudioFile(output, mix, sampleRate));
            expectEquals(mix.getNumSamples(), 120000);
            expectEquals(mix.getMagnitude(0, mix.getNumSamples()), 0.0f);
        }

        beginTest("a missing voice-over fails the mix");
        {
            AudioMixer mixer;
            auto result = mixer.mixAudio(output, 2.0, temp.getChildFile("absent.wav"), longMusic, noVoice, true);
            expect(result.failed());
            expect(result.getErrorMessage().contains("voice-over"));
        }

        beginTest("undecodable music is dropped with a warning");
        {
            const juce::File brokenMusic = temp.getChildFile("broken_music.wav");
            expect(brokenMusic.replaceWithText("this is not audio"));

            AudioMixer mixer;
            TestHelpers::LogCollector logs;
            mixer.setLogCallback(logs.callback());

            auto result = mixer.mixAudio(output, 2.0, voice, brokenMusic, noVoice, true);
            expect(result.wasOk(), result.getErrorMessage());
            expect(!mixer.lastMixIncludedMusic());
            expect(logs.contains("WARNING"));
        }

        beginTest("a non-positive duration is rejected");
        {
            AudioMixer mixer;
            expect(mixer.mixAudio(output, 0.0, voice, juce::File(), noVoice, true).failed());
        }
    }

private:
    static float sampleAt(const juce::AudioBuffer<float>& buffer, double seconds)
    {
        const int index = juce::jlimit(0, buffer.getNumSamples() - 1, static_cast<int>(seconds * 48000.0));
        return buffer.getSample(0, index);
    }
};

static AudioMixerTests audioMixerTests;
