#pragma once
#include <JuceHeader.h>
#include "AssetSource.h"
#include "../rendering/RenderTypes.h"
#include "../rendering/ScratchDirectory.h"

/** Local copies of one render's inputs, all inside its scratch directory */
struct FetchedAssets
{
    std::map<int, juce::File> footage;  // Segment index -> downloaded footage
    juce::File voiceOver;
    juce::File music;                   // Default-constructed when there is no usable music
    int requestedFootage = 0;           // Segments that had a footage reference
};

/**
 * Downloads footage, voice-over and music for one render.
 *
 * All downloads start together on a juce::ThreadPool and the call returns
 * once every one of them has finished, so one slow or failing transfer
 * never holds up the others. Destinations that already exist are reused.
 *
 * Failure policy:
 *  - a segment whose footage fails is dropped with a warning;
 *  - no footage at all fails the fetch;
 *  - a missing or failed voice-over fails the fetch;
 *  - failed music is dropped with a warning.
 */
class AssetFetcher
{
public:
    AssetFetcher(AssetSource& source, int maxConcurrentDownloads);
    ~AssetFetcher();

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /** Called from download threads with (finished, total) after each download resolves. */
    void setProgressCallback(std::function<void(int, int)> progressCallback);

    juce::Result fetchAssets(const std::vector<RenderTypes::Segment>& segments,
                             const juce::String& voiceOverReference,
                             const juce::String& musicReference,
                             ScratchDirectory& scratch,
                             FetchedAssets& assets);

    /** "segment_<index><ext>", extension taken from the footage reference. */
    static juce::String getFootageFileName(const RenderTypes::Segment& segment);

private:
    class DownloadJob;

    void log(const juce::String& message) const;

    AssetSource& source;
    int maxConcurrentDownloads;

    std::function<void(const juce::String&)> logCallback;
    std::function<void(int, int)> progressCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AssetFetcher)
};
