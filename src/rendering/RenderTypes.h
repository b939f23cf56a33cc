#pragma once
#include <JuceHeader.h>

/**
 * Common types used across the rendering system.
 * These types are shared by multiple components to ensure consistency.
 */
namespace RenderTypes
{
    /** A timed unit of narration text paired with a footage reference */
    struct Segment
    {
        int index = 0;
        juce::String text;
        double startTime = 0.0;     // Seconds from the start of the narration
        double endTime = 0.0;       // Always greater than startTime once validated
        juce::String footageUrl;    // Empty when the segment has no footage

        double getDuration() const  { return juce::jmax(0.0, endTime - startTime); }
        bool hasFootage() const     { return footageUrl.trim().isNotEmpty(); }
    };

    /**
     * Everything one render needs from its callers.
     *
     * Built with fromVar() at the ingestion boundary, which rejects malformed
     * payloads before any task or scratch directory exists.
     */
    struct RenderRequest
    {
        juce::String taskId;                // Generated when left empty
        juce::String projectRef;
        std::vector<Segment> segments;
        juce::String voiceOver;             // Local path or URL
        juce::String music;                 // Optional local path or URL
        bool addSubtitles = false;
        bool includeAudio = true;

        /** Checks the invariants every pipeline stage relies on. */
        juce::Result validate() const;

        /** Segments in ascending start time, ties kept in input order. */
        std::vector<Segment> getSortedSegments() const;

        /** Parses and validates a JSON request object. */
        static juce::Result fromVar(const juce::var& json, RenderRequest& request);
    };

    /** Frame geometry and H.264 settings shared by every encode of a render */
    struct VideoFormat
    {
        int width = 1920;
        int height = 1080;
        int frameRate = 24;
        juce::String preset = "medium";
        int crf = 20;
    };

    /** A footage clip conformed to its segment's exact duration */
    struct ConformedClip
    {
        int segmentIndex = 0;
        juce::File file;
        int frameCount = 0;
        double duration = 0.0;          // frameCount at the render frame rate
        bool captioned = false;
    };

    /** The concatenated visual track */
    struct AssembledTimeline
    {
        juce::File videoTrack;
        double contentDuration = 0.0;   // Sum of clip durations, a whole number of frames
        double trailingPad = 0.0;       // Held last frame reserved for the fade-out
        std::vector<ConformedClip> clips;

        double getTotalDuration() const { return contentDuration + trailingPad; }
    };

    /** Lifecycle of one render task */
    enum class RenderState
    {
        Pending,
        Processing,
        Complete,
        Failed
    };

    /** Lower-case wire name used by the status surface ("pending", "processing", ...) */
    juce::String toString(RenderState state);

    /** Inverse of toString(); returns false for unknown names. */
    bool fromString(const juce::String& name, RenderState& state);
}
