#include <JuceHeader.h>
#include "TestHelpers.h"
#include "../src/audio/DuckingEnvelope.h"

class DuckingEnvelopeTests : public juce::UnitTest
{
public:
    DuckingEnvelopeTests() : juce::UnitTest("DuckingEnvelope", "NarrationRender") {}

    void runTest() override
    {
        using Interval = DuckingEnvelope::Interval;

        beginTest("overlapping and touching intervals merge");
        {
            const auto merged = DuckingEnvelope::mergeIntervals({ { 5.0, 6.0 }, { 0.0, 2.0 }, { 1.5, 3.0 }, { 3.0, 4.0 } });

            expectEquals(static_cast<int>(merged.size()), 2);
            expect(merged[0] == Interval { 0.0, 4.0 });
            expect(merged[1] == Interval { 5.0, 6.0 });
        }

        beginTest("merging is idempotent and yields sorted disjoint intervals");
        {
            juce::Random random(1234);
            std::vector<Interval> intervals;
            for (int i = 0; i < 200; ++i)
            {
                const double start = random.nextDouble() * 100.0;
                intervals.push_back({ start, start + random.nextDouble() * 5.0 });
            }

            const auto merged = DuckingEnvelope::mergeIntervals(intervals);
            expect(merged == DuckingEnvelope::mergeIntervals(merged));

            for (size_t i = 1; i < merged.size(); ++i)
                expect(merged[i - 1].end < merged[i].start);
        }

        beginTest("reversed intervals are normalised and non-finite ones dropped");
        {
            const auto merged = DuckingEnvelope::mergeIntervals({ { 3.0, 1.0 },
                                                                  { std::numeric_limits<double>::quiet_NaN(), 2.0 } });
            expectEquals(static_cast<int>(merged.size()), 1);
            expect(merged[0] == Interval { 1.0, 3.0 });
        }

        beginTest("music is ducked inside voice intervals and at the default level far away");
        {
            DuckingEnvelope envelope({ { 2.0, 4.0 } }, 0.7f, 0.2f, 0.5);

            expectWithinAbsoluteError(envelope.getVolumeAt(3.0), 0.2f, 1.0e-6f);
            expectWithinAbsoluteError(envelope.getVolumeAt(2.0), 0.2f, 1.0e-6f);
            expectWithinAbsoluteError(envelope.getVolumeAt(4.0), 0.2f, 1.0e-6f);
            expectWithinAbsoluteError(envelope.getVolumeAt(0.0), 0.7f, 1.0e-6f);
            expectWithinAbsoluteError(envelope.getVolumeAt(10.0), 0.7f, 1.0e-6f);
        }

        beginTest("the ramp is linear in the distance to the nearest interval");
        {
            DuckingEnvelope envelope({ { 2.0, 4.0 } }, 0.7f, 0.2f, 0.5);

            expectWithinAbsoluteError(envelope.getVolumeAt(1.75), 0.45f, 1.0e-5f);
            expectWithinAbsoluteError(envelope.getVolumeAt(4.25), 0.45f, 1.0e-5f);
            expectWithinAbsoluteError(envelope.getVolumeAt(4.1), 0.3f, 1.0e-5f);
            expectWithinAbsoluteError(envelope.getVolumeAt(1.5), 0.7f, 1.0e-5f);
        }

        beginTest("a gap shorter than two fades never reaches the default level");
        {
            DuckingEnvelope envelope({ { 0.0, 1.0 }, { 1.6, 3.0 } }, 0.7f, 0.2f, 0.5);
            const float middle = envelope.getVolumeAt(1.3);

            expectWithinAbsoluteError(middle, 0.5f, 1.0e-5f);
            expect(middle < 0.7f);
        }

        beginTest("the curve is continuous");
        {
            DuckingEnvelope envelope({ { 1.0, 2.0 }, { 2.3, 5.0 }, { 8.0, 9.0 } }, 0.7f, 0.2f, 0.5);

            const double step = 1.0 / 48000.0;
            const float maxSlope = (0.7f - 0.2f) / 0.5f;
            float previous = envelope.getVolumeAt(0.0);

            for (double t = step; t < 10.0; t += step * 7.0)
            {
                const float current = envelope.getVolumeAt(t);
                if (std::abs(current - previous) > maxSlope * static_cast<float>(step * 7.0) + 1.0e-5f)
                {
                    expect(false, "Discontinuity at " + juce::String(t, 6));
                    break;
                }
                previous = current;
            }
        }

        beginTest("no voice leaves the music at the default level");
        {
            DuckingEnvelope envelope({}, 0.7f, 0.2f, 0.5);
            expectWithinAbsoluteError(envelope.getVolumeAt(0.0), 0.7f, 1.0e-6f);
            expectWithinAbsoluteError(envelope.getVolumeAt(1000.0), 0.7f, 1.0e-6f);
        }

        beginTest("zero fade switches levels at the interval edges");
        {
            DuckingEnvelope envelope({ { 1.0, 2.0 } }, 0.7f, 0.2f, 0.0);
            expectWithinAbsoluteError(envelope.getVolumeAt(0.999), 0.7f, 1.0e-6f);
            expectWithinAbsoluteError(envelope.getVolumeAt(1.5), 0.2f, 1.0e-6f);
            expectWithinAbsoluteError(envelope.getVolumeAt(2.001), 0.7f, 1.0e-6f);
        }

        beginTest("segments become voice intervals");
        {
            const auto intervals = DuckingEnvelope::intervalsFromSegments({ TestHelpers::makeSegment(0, 0.0, 1.5),
                                                                             TestHelpers::makeSegment(1, 1.5, 3.0) });
            DuckingEnvelope envelope(intervals);
            expectEquals(static_cast<int>(envelope.getSchedule().size()), 1);
            expect(envelope.getSchedule()[0] == Interval { 0.0, 3.0 });
        }

        beginTest("applyToBuffer scales every channel by the curve");
        {
            const double sampleRate = 1000.0;
            DuckingEnvelope envelope({ { 1.0, 2.0 } }, 0.7f, 0.2f, 0.5);

            juce::AudioBuffer<float> buffer(2, 1000);
            for (int channel = 0; channel < 2; ++channel)
                juce::FloatVectorOperations::fill(buffer.getWritePointer(channel), 1.0f, 1000);

            // Buffer covers 0.5s .. 1.5s
            envelope.applyToBuffer(buffer, 0, 1000, 0.5, sampleRate);

            expectWithinAbsoluteError(buffer.getSample(0, 0), 0.7f, 1.0e-5f);
            expectWithinAbsoluteError(buffer.getSample(1, 250), 0.45f, 1.0e-5f);
            expectWithinAbsoluteError(buffer.getSample(0, 750), 0.2f, 1.0e-5f);
        }
    }
};

static DuckingEnvelopeTests duckingEnvelopeTests;
