#include "AssetSource.h"

namespace
{
    bool isHttpReference(const juce::String& reference)
    {
        return reference.startsWithIgnoreCase("http://") || reference.startsWithIgnoreCase("https://");
    }

    bool hasScheme(const juce::String& reference)
    {
        return reference.contains("://");
    }
}

juce::String AssetSource::getExtensionForReference(const juce::String& reference, const juce::String& fallback)
{
    juce::String fileName = hasScheme(reference) ? juce::URL(reference).getFileName()
                                                 : juce::File::createFileWithoutCheckingPath(reference).getFileName();

    fileName = fileName.upToFirstOccurrenceOf("?", false, false);

    const int dot = fileName.lastIndexOfChar('.');
    if (dot <= 0)
        return fallback;

    const juce::String extension = fileName.substring(dot).toLowerCase();
    if (extension.length() < 2 || extension.length() > 6
        || !extension.substring(1).containsOnly("abcdefghijklmnopqrstuvwxyz0123456789"))
        return fallback;

    return extension;
}

//==============================================================================
bool LocalFileAssetSource::canFetch(const juce::String& reference) const
{
    return reference.startsWithIgnoreCase("file://") || !hasScheme(reference);
}

juce::File LocalFileAssetSource::resolve(const juce::String& reference)
{
    if (reference.startsWithIgnoreCase("file://"))
        return juce::URL(reference).getLocalFile();

    if (juce::File::isAbsolutePath(reference))
        return juce::File(reference);

    return juce::File::getCurrentWorkingDirectory().getChildFile(reference);
}

juce::Result LocalFileAssetSource::fetch(const juce::String& reference, const juce::File& destination)
{
    const juce::File source = resolve(reference);

    if (!source.existsAsFile())
        return juce::Result::fail("File not found: " + source.getFullPathName());

    if (source == destination)
        return juce::Result::ok();

    if (!source.copyFileTo(destination))
    {
        if (destination.existsAsFile() && !destination.deleteFile())
            juce::Logger::writeToLog("WARNING: Could not remove partial copy " + destination.getFullPathName());

        return juce::Result::fail("Could not copy " + source.getFullPathName());
    }

    return juce::Result::ok();
}

//==============================================================================
UrlAssetSource::UrlAssetSource(int timeoutMs, const juce::String& userAgent)
    : timeoutMs(timeoutMs),
      userAgent(userAgent)
{
}

bool UrlAssetSource::canFetch(const juce::String& reference) const
{
    return isHttpReference(reference);
}

juce::Result UrlAssetSource::fetch(const juce::String& reference, const juce::File& destination)
{
    const juce::URL url(reference);
    if (!url.isWellFormed())
        return juce::Result::fail("Malformed URL: " + reference);

    int statusCode = 0;
    auto options = juce::URL::InputStreamOptions(juce::URL::ParameterHandling::inAddress)
                       .withConnectionTimeoutMs(timeoutMs)
                       .withNumRedirectsToFollow(5)
                       .withExtraHeaders("User-Agent: " + userAgent)
                       .withStatusCode(&statusCode);

    std::unique_ptr<juce::InputStream> stream = url.createInputStream(options);

    if (stream == nullptr)
        return juce::Result::fail("Could not connect to " + url.getDomain()
                                  + (statusCode > 0 ? " (HTTP " + juce::String(statusCode) + ")" : juce::String()));

    if (statusCode >= 400)
        return juce::Result::fail("HTTP " + juce::String(statusCode) + " for " + reference);

    // Downloads land in a sibling temporary file; it is deleted unless the transfer completes
    juce::TemporaryFile temp(destination);

    {
        juce::FileOutputStream out(temp.getFile());
        if (!out.openedOk())
            return juce::Result::fail("Cannot write " + temp.getFile().getFullPathName());

        out.writeFromInputStream(*stream, -1);
        out.flush();

        if (out.getStatus().failed())
            return juce::Result::fail("Write failed for " + destination.getFileName() + ": "
                                      + out.getStatus().getErrorMessage());
    }

    if (!stream->isExhausted())
        return juce::Result::fail("Download of " + reference + " was interrupted");

    if (temp.getFile().getSize() == 0)
        return juce::Result::fail("Empty response for " + reference);

    if (!temp.overwriteTargetFileWithTemporary())
        return juce::Result::fail("Cannot move download into place: " + destination.getFullPathName());

    return juce::Result::ok();
}

//==============================================================================
void CompositeAssetSource::addSource(std::unique_ptr<AssetSource> source)
{
    if (source != nullptr)
        sources.push_back(std::move(source));
}

AssetSource* CompositeAssetSource::findSource(const juce::String& reference) const
{
    for (const auto& source : sources)
        if (source->canFetch(reference))
            return source.get();

    return nullptr;
}

bool CompositeAssetSource::canFetch(const juce::String& reference) const
{
    return findSource(reference) != nullptr;
}

juce::Result CompositeAssetSource::fetch(const juce::String& reference, const juce::File& destination)
{
    if (auto* source = findSource(reference))
        return source->fetch(reference, destination);

    return juce::Result::fail("Unsupported asset reference: " + reference);
}

std::unique_ptr<CompositeAssetSource> CompositeAssetSource::createDefault(int downloadTimeoutMs)
{
    auto composite = std::make_unique<CompositeAssetSource>();
    composite->addSource(std::make_unique<UrlAssetSource>(downloadTimeoutMs));
    composite->addSource(std::make_unique<LocalFileAssetSource>());
    return composite;
}
