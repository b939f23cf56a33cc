#pragma once
#include <JuceHeader.h>
#include "../rendering/RenderTypes.h"

/**
 * Background-music gain curve that dips while narration is active.
 *
 * The voice intervals are merged into a sorted, disjoint schedule. The gain
 * is the ducked level inside an interval and the default level once at
 * least fadeSeconds away from every interval; in between it ramps linearly
 * with the distance to the nearest interval. The ramp sits outside the
 * intervals, so the music is already fully ducked when speech starts and the
 * curve is continuous everywhere.
 */
class DuckingEnvelope
{
public:
    struct Interval
    {
        double start = 0.0;
        double end = 0.0;

        bool operator== (const Interval& other) const   { return start == other.start && end == other.end; }
        bool operator!= (const Interval& other) const   { return !operator==(other); }
    };

    DuckingEnvelope(std::vector<Interval> voiceIntervals,
                    float defaultLevel = 0.7f,
                    float duckedLevel = 0.2f,
                    double fadeSeconds = 0.5);

    /**
     * Sorts by start and merges overlapping or touching intervals.
     * Reversed intervals are normalised and non-finite ones dropped.
     */
    static std::vector<Interval> mergeIntervals(std::vector<Interval> intervals);

    /** One [startTime, endTime] interval per segment. */
    static std::vector<Interval> intervalsFromSegments(const std::vector<RenderTypes::Segment>& segments);

    /** Music gain at time t (seconds). */
    float getVolumeAt(double t) const;

    /** Seconds from t to the closest interval; 0 inside one. */
    double getDistanceToSchedule(double t) const;

    /**
     * Multiplies every channel of the buffer by the gain curve, sample by
     * sample, treating startSample as time startTime.
     */
    void applyToBuffer(juce::AudioBuffer<float>& buffer,
                       int startSample,
                       int numSamples,
                       double startTime,
                       double sampleRate) const;

    const std::vector<Interval>& getSchedule() const    { return schedule; }
    float getDefaultLevel() const                       { return defaultLevel; }
    float getDuckedLevel() const                        { return duckedLevel; }
    double getFadeSeconds() const                       { return fadeSeconds; }

private:
    std::vector<Interval> schedule;
    float defaultLevel;
    float duckedLevel;
    double fadeSeconds;

    JUCE_LEAK_DETECTOR(DuckingEnvelope)
};
