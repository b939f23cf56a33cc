#include "AssetFetcher.h"

//==============================================================================
class AssetFetcher::DownloadJob : public juce::ThreadPoolJob
{
public:
    DownloadJob(AssetSource& source,
                const juce::String& reference,
                const juce::File& destination,
                const juce::String& label,
                std::function<void()> onFinished)
        : juce::ThreadPoolJob("Download " + label),
          source(source),
          reference(reference),
          destination(destination),
          label(label),
          onFinished(std::move(onFinished))
    {
    }

    JobStatus runJob() override
    {
        if (destination.existsAsFile() && destination.getSize() > 0)
        {
            reused = true;
        }
        else
        {
            // Fetch beside the destination so an interrupted download never looks complete
            const juce::File partial = destination.getSiblingFile(destination.getFileName() + ".part");
            result = source.fetch(reference, partial);

            if (result.wasOk() && !partial.moveFileTo(destination))
                result = juce::Result::fail("Cannot move " + partial.getFileName() + " into place");

            if (result.failed())
                partial.deleteFile();
        }

        if (onFinished)
            onFinished();

        return jobHasFinished;
    }

    const juce::String& getLabel() const        { return label; }
    const juce::String& getReference() const    { return reference; }
    const juce::File& getDestination() const    { return destination; }
    const juce::Result& getResult() const       { return result; }
    bool wasReused() const                      { return reused; }

private:
    AssetSource& source;
    juce::String reference;
    juce::File destination;
    juce::String label;
    std::function<void()> onFinished;

    juce::Result result { juce::Result::ok() };
    bool reused = false;

    JUCE_DECLARE_NON_COPYABLE(DownloadJob)
};

//==============================================================================
AssetFetcher::AssetFetcher(AssetSource& source, int maxConcurrentDownloads)
    : source(source),
      maxConcurrentDownloads(juce::jmax(1, maxConcurrentDownloads))
{
}

AssetFetcher::~AssetFetcher()
{
}

void AssetFetcher::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void AssetFetcher::setProgressCallback(std::function<void(int, int)> callback)
{
    progressCallback = callback;
}

juce::String AssetFetcher::getFootageFileName(const RenderTypes::Segment& segment)
{
    return "segment_" + juce::String(segment.index)
           + AssetSource::getExtensionForReference(segment.footageUrl, ".mp4");
}

void AssetFetcher::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

juce::Result AssetFetcher::fetchAssets(const std::vector<RenderTypes::Segment>& segments,
                                       const juce::String& voiceOverReference,
                                       const juce::String& musicReference,
                                       ScratchDirectory& scratch,
                                       FetchedAssets& assets)
{
    assets = FetchedAssets();

    juce::OwnedArray<DownloadJob> jobs;
    std::map<DownloadJob*, int> footageJobs;
    DownloadJob* voiceJob = nullptr;
    DownloadJob* musicJob = nullptr;

    std::atomic<int> finished { 0 };
    int total = 0;

    auto onFinished = [this, &finished, &total]
    {
        const int done = ++finished;
        if (progressCallback)
            progressCallback(done, total);
    };

    for (const auto& segment : segments)
    {
        if (!segment.hasFootage())
        {
            log("WARNING: Segment " + juce::String(segment.index) + " has no footage reference, skipping");
            continue;
        }

        ++assets.requestedFootage;
        auto* job = jobs.add(new DownloadJob(source,
                                             segment.footageUrl,
                                             scratch.createFile(getFootageFileName(segment)),
                                             "footage for segment " + juce::String(segment.index),
                                             onFinished));
        footageJobs[job] = segment.index;
    }

    if (voiceOverReference.isNotEmpty())
    {
        voiceJob = jobs.add(new DownloadJob(source,
                                            voiceOverReference,
                                            scratch.createFile("voice" + AssetSource::getExtensionForReference(voiceOverReference, ".mp3")),
                                            "voice-over",
                                            onFinished));
    }

    if (musicReference.isNotEmpty())
    {
        musicJob = jobs.add(new DownloadJob(source,
                                            musicReference,
                                            scratch.createFile("music" + AssetSource::getExtensionForReference(musicReference, ".mp3")),
                                            "music",
                                            onFinished));
    }

    total = jobs.size();
    log("Fetching " + juce::String(total) + " assets (" + juce::String(assets.requestedFootage) + " footage)");

    {
        juce::ThreadPool pool(juce::jmin(maxConcurrentDownloads, juce::jmax(1, total)));

        for (auto* job : jobs)
            pool.addJob(job, false);

        for (auto* job : jobs)
            pool.waitForJobToFinish(job, -1);
    }

    for (auto* job : jobs)
    {
        if (job->getResult().failed())
            log("WARNING: Could not fetch " + job->getLabel() + ": " + job->getResult().getErrorMessage());
        else if (job->wasReused())
            log("Reusing " + job->getDestination().getFileName() + " for " + job->getLabel());
    }

    for (const auto& entry : footageJobs)
        if (entry.first->getResult().wasOk())
            assets.footage[entry.second] = entry.first->getDestination();

    log("Fetched footage for " + juce::String((int) assets.footage.size()) + " of "
        + juce::String(assets.requestedFootage) + " segments");

    if (assets.footage.empty())
        return juce::Result::fail("No footage available: none of the "
                                  + juce::String((int) segments.size())
                                  + " segments had downloadable footage");

    if (voiceJob == nullptr)
        return juce::Result::fail("No voice-over was provided");

    if (voiceJob->getResult().failed())
        return juce::Result::fail("Voice-over unavailable: " + voiceJob->getResult().getErrorMessage());

    assets.voiceOver = voiceJob->getDestination();

    if (musicJob != nullptr)
    {
        if (musicJob->getResult().wasOk())
            assets.music = musicJob->getDestination();
        else
            log("WARNING: Continuing without background music");
    }

    return juce::Result::ok();
}
