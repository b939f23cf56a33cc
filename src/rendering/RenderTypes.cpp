#include "RenderTypes.h"
#include <set>

namespace
{
    bool readNumber(const juce::var& value, double& out)
    {
        if (!(value.isDouble() || value.isInt() || value.isInt64()))
            return false;

        out = static_cast<double>(value);
        return std::isfinite(out);
    }
}

namespace RenderTypes
{
    juce::Result RenderRequest::validate() const
    {
        if (segments.empty())
            return juce::Result::fail("Render request has no segments");

        if (voiceOver.trim().isEmpty())
            return juce::Result::fail("Render request has no voice-over");

        std::set<int> seenIndexes;

        for (const auto& segment : segments)
        {
            const juce::String label = "Segment " + juce::String(segment.index);

            if (!seenIndexes.insert(segment.index).second)
                return juce::Result::fail(label + " appears more than once");

            if (!std::isfinite(segment.startTime) || !std::isfinite(segment.endTime))
                return juce::Result::fail(label + " has a non-finite time");

            if (segment.startTime < 0.0)
                return juce::Result::fail(label + " starts before zero");

            if (segment.endTime <= segment.startTime)
                return juce::Result::fail(label + " does not end after it starts ("
                                          + juce::String(segment.startTime, 3) + "s - "
                                          + juce::String(segment.endTime, 3) + "s)");
        }

        return juce::Result::ok();
    }

    std::vector<Segment> RenderRequest::getSortedSegments() const
    {
        std::vector<Segment> sorted(segments);
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const Segment& a, const Segment& b) { return a.startTime < b.startTime; });
        return sorted;
    }

    juce::Result RenderRequest::fromVar(const juce::var& json, RenderRequest& request)
    {
        if (json.getDynamicObject() == nullptr)
            return juce::Result::fail("Render request must be a JSON object");

        RenderRequest parsed;
        parsed.taskId = json.getProperty("task_id", {}).toString().trim();
        parsed.projectRef = json.getProperty("project", {}).toString().trim();
        parsed.voiceOver = json.getProperty("voice_over", {}).toString().trim();
        parsed.music = json.getProperty("music", {}).toString().trim();
        parsed.addSubtitles = static_cast<bool>(json.getProperty("add_subtitles", false));
        parsed.includeAudio = static_cast<bool>(json.getProperty("include_audio", true));

        if (parsed.projectRef.isEmpty())
            return juce::Result::fail("Render request has no project");

        const juce::var segmentList = json.getProperty("segments", {});
        if (!segmentList.isArray())
            return juce::Result::fail("Render request segments must be an array");

        for (int i = 0; i < segmentList.size(); ++i)
        {
            const juce::var& item = segmentList[i];
            if (item.getDynamicObject() == nullptr)
                return juce::Result::fail("Segment " + juce::String(i) + " is not an object");

            Segment segment;
            segment.index = item.hasProperty("index") ? static_cast<int>(item["index"]) : i;
            segment.text = item.getProperty("text", {}).toString().trim();
            segment.footageUrl = item.getProperty("footage_url", {}).toString().trim();

            if (!readNumber(item["start_time"], segment.startTime)
                || !readNumber(item["end_time"], segment.endTime))
                return juce::Result::fail("Segment " + juce::String(segment.index)
                                          + " needs numeric start_time and end_time");

            parsed.segments.push_back(segment);
        }

        auto validation = parsed.validate();
        if (validation.failed())
            return validation;

        request = parsed;
        return juce::Result::ok();
    }

    juce::String toString(RenderState state)
    {
        switch (state)
        {
            case RenderState::Pending:      return "pending";
            case RenderState::Processing:   return "processing";
            case RenderState::Complete:     return "complete";
            case RenderState::Failed:       return "failed";
        }

        return "pending";
    }

    bool fromString(const juce::String& name, RenderState& state)
    {
        for (auto candidate : { RenderState::Pending, RenderState::Processing,
                                RenderState::Complete, RenderState::Failed })
        {
            if (name.trim().equalsIgnoreCase(toString(candidate)))
            {
                state = candidate;
                return true;
            }
        }

        return false;
    }
}
