#include "SubtitleOverlay.h"

SubtitleOverlay::SubtitleOverlay()
{
}

SubtitleOverlay::~SubtitleOverlay()
{
}

void SubtitleOverlay::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void SubtitleOverlay::setStyle(const Style& newStyle)
{
    style = newStyle;
    warnedAboutFont = false;
}

juce::StringArray SubtitleOverlay::getFallbackFontPaths()
{
    return {
        // Arial
        "/usr/share/fonts/truetype/msttcorefonts/Arial.ttf",
        "/usr/share/fonts/truetype/msttcorefonts/arial.ttf",
        "/Library/Fonts/Arial.ttf",
        "/System/Library/Fonts/Supplemental/Arial.ttf",
        "C:/Windows/Fonts/arial.ttf",
        // Helvetica
        "/System/Library/Fonts/Helvetica.ttc",
        "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
        // DejaVu Sans
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu-sans-fonts/DejaVuSans.ttf"
    };
}

juce::File SubtitleOverlay::findFont() const
{
    if (style.fontFile.existsAsFile())
        return style.fontFile;

    for (const auto& path : getFallbackFontPaths())
    {
        const juce::File candidate(path);
        if (candidate.existsAsFile())
            return candidate;
    }

    return {};
}

juce::String SubtitleOverlay::wrapText(const juce::String& text, int maxCharsPerLine)
{
    juce::StringArray words;
    words.addTokens(text, " \t\r\n", "");
    words.removeEmptyStrings();

    juce::StringArray lines;
    juce::String current;

    for (const auto& word : words)
    {
        if (current.isEmpty())
            current = word;
        else if (current.length() + 1 + word.length() <= maxCharsPerLine)
            current << ' ' << word;
        else
        {
            lines.add(current);
            current = word;
        }
    }

    if (current.isNotEmpty())
        lines.add(current);

    return lines.joinIntoString("\n");
}

juce::String SubtitleOverlay::escapeFilterValue(const juce::String& value)
{
    // Option level: '\', '\'' and ':' end or split the value
    juce::String optionLevel;
    for (auto character : value.replaceCharacter('\\', '/'))
    {
        if (juce::String("\\':").containsChar(character))
            optionLevel << '\\';
        optionLevel << juce::String::charToString(character);
    }

    // Graph level: the filtergraph parser strips one escape before the filter sees the options
    juce::String graphLevel;
    for (auto character : optionLevel)
    {
        if (juce::String("\\',;[]").containsChar(character))
            graphLevel << '\\';
        graphLevel << juce::String::charToString(character);
    }

    return graphLevel;
}

juce::String SubtitleOverlay::buildDrawTextFilter(const juce::File& fontFile,
                                                  const juce::File& textFile,
                                                  const Style& style)
{
    const juce::String position = juce::String(style.verticalPosition, 3);

    // Keep multi-line captions inside the frame: the block starts at most text_h above the bottom margin
    return "drawtext=fontfile=" + escapeFilterValue(fontFile.getFullPathName())
         + ":textfile=" + escapeFilterValue(textFile.getFullPathName())
         + ":fontsize=" + juce::String(style.fontSize)
         + ":fontcolor=white"
         + ":borderw=" + juce::String(style.borderWidth)
         + ":bordercolor=black"
         + ":line_spacing=" + juce::String(juce::jmax(2, style.fontSize / 6))
         + ":x=(w-text_w)/2"
         + ":y=min(h*" + position + "\\,h-text_h-h*0.04)"
         + ":expansion=none";
}

juce::String SubtitleOverlay::prepareCaption(const RenderTypes::Segment& segment, ScratchDirectory& scratch)
{
    const juce::String wrapped = wrapText(segment.text, style.maxCharsPerLine);
    if (wrapped.isEmpty())
        return {};

    const juce::File font = findFont();
    if (!font.existsAsFile())
    {
        if (logCallback && !warnedAboutFont)
            logCallback("WARNING: No caption font available, rendering clips without subtitles");
        warnedAboutFont = true;
        return {};
    }

    const juce::File textFile = scratch.createFile("caption_" + juce::String(segment.index) + ".txt");
    if (!textFile.replaceWithText(wrapped, false, false, "\n"))
    {
        if (logCallback)
            logCallback("WARNING: Could not write caption for segment " + juce::String(segment.index));
        return {};
    }

    return buildDrawTextFilter(font, textFile, style);
}
