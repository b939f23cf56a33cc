#include "DuckingEnvelope.h"

DuckingEnvelope::DuckingEnvelope(std::vector<Interval> voiceIntervals,
                                 float defaultLevel,
                                 float duckedLevel,
                                 double fadeSeconds)
    : schedule(mergeIntervals(std::move(voiceIntervals))),
      defaultLevel(defaultLevel),
      duckedLevel(duckedLevel),
      fadeSeconds(juce::jmax(0.0, fadeSeconds))
{
}

std::vector<DuckingEnvelope::Interval> DuckingEnvelope::mergeIntervals(std::vector<Interval> intervals)
{
    std::vector<Interval> valid;
    valid.reserve(intervals.size());

    for (auto interval : intervals)
    {
        if (!std::isfinite(interval.start) || !std::isfinite(interval.end))
            continue;

        if (interval.end < interval.start)
            std::swap(interval.start, interval.end);

        valid.push_back(interval);
    }

    std::sort(valid.begin(), valid.end(),
              [](const Interval& a, const Interval& b) { return a.start < b.start; });

    std::vector<Interval> merged;

    for (const auto& interval : valid)
    {
        // Touching intervals (next start == current end) merge as well
        if (!merged.empty() && interval.start <= merged.back().end)
            merged.back().end = juce::jmax(merged.back().end, interval.end);
        else
            merged.push_back(interval);
    }

    return merged;
}

std::vector<DuckingEnvelope::Interval> DuckingEnvelope::intervalsFromSegments(const std::vector<RenderTypes::Segment>& segments)
{
    std::vector<Interval> intervals;
    intervals.reserve(segments.size());

    for (const auto& segment : segments)
        intervals.push_back({ segment.startTime, segment.endTime });

    return intervals;
}

double DuckingEnvelope::getDistanceToSchedule(double t) const
{
    if (schedule.empty())
        return std::numeric_limits<double>::infinity();

    // First interval starting after t; the closest one is it or its predecessor
    auto next = std::upper_bound(schedule.begin(), schedule.end(), t,
                                 [](double time, const Interval& interval) { return time < interval.start; });

    double distance = std::numeric_limits<double>::infinity();

    if (next != schedule.end())
        distance = next->start - t;

    if (next != schedule.begin())
    {
        const auto& previous = *(next - 1);
        distance = juce::jmin(distance, t <= previous.end ? 0.0 : t - previous.end);
    }

    return distance;
}

float DuckingEnvelope::getVolumeAt(double t) const
{
    const double distance = getDistanceToSchedule(t);

    if (distance <= 0.0)
        return duckedLevel;

    if (distance >= fadeSeconds)
        return defaultLevel;

    const float proportion = static_cast<float>(distance / fadeSeconds);
    return duckedLevel + (defaultLevel - duckedLevel) * proportion;
}

void DuckingEnvelope::applyToBuffer(juce::AudioBuffer<float>& buffer,
                                    int startSample,
                                    int numSamples,
                                    double startTime,
                                    double sampleRate) const
{
    const int numChannels = buffer.getNumChannels();

    for (int i = 0; i < numSamples; ++i)
    {
        const float gain = getVolumeAt(startTime + i / sampleRate);

        for (int channel = 0; channel < numChannels; ++channel)
            buffer.getWritePointer(channel, startSample)[i] *= gain;
    }
}
