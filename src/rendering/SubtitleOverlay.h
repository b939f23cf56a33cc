#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"
#include "ScratchDirectory.h"

/**
 * Builds the ffmpeg drawtext filter that burns a segment's narration text
 * into its clip.
 *
 * Captions are white with a black outline, horizontally centred, and their
 * first line sits at verticalPosition of the frame height. Text is wrapped
 * beforehand and handed to drawtext through a text file with expansion
 * disabled, so caption content is drawn literally and never has to be
 * escaped for the filter graph.
 */
class SubtitleOverlay
{
public:
    struct Style
    {
        juce::File fontFile;            // Unset = first available fallback font
        int fontSize = 48;
        int maxCharsPerLine = 60;
        float verticalPosition = 0.75f;
        int borderWidth = 2;
    };

    SubtitleOverlay();
    ~SubtitleOverlay();

    /**
     * Sets a callback for receiving log messages.
     * @param logCallback Function called with log messages
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    void setStyle(const Style& newStyle);

    /**
     * Writes the caption text for a segment into the scratch directory and
     * returns the drawtext filter that draws it.
     *
     * @return an empty string when the segment has no text or no usable
     *         font exists; the clip is then rendered without a caption
     */
    juce::String prepareCaption(const RenderTypes::Segment& segment, ScratchDirectory& scratch);

    /** The configured font if it exists, otherwise the first fallback found. */
    juce::File findFont() const;

    /** Arial, Helvetica, then DejaVu Sans in the usual system locations. */
    static juce::StringArray getFallbackFontPaths();

    /** Greedy word wrap; words longer than a line are kept whole. */
    static juce::String wrapText(const juce::String& text, int maxCharsPerLine);

    static juce::String buildDrawTextFilter(const juce::File& fontFile,
                                            const juce::File& textFile,
                                            const Style& style);

    /** Escapes a path for use as a filter option value inside a -vf filter graph. */
    static juce::String escapeFilterValue(const juce::String& value);

private:
    Style style;
    std::function<void(const juce::String&)> logCallback;
    bool warnedAboutFont = false;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SubtitleOverlay)
};
