#pragma once
#include <JuceHeader.h>

/**
 * Somewhere render inputs can be fetched from.
 *
 * Implementations copy the referenced asset to a local destination file.
 * They must be callable from several download threads at once.
 */
class AssetSource
{
public:
    virtual ~AssetSource() = default;

    /** True if this source understands the reference (scheme or path form). */
    virtual bool canFetch(const juce::String& reference) const = 0;

    /**
     * Copies the asset to destination. On failure no partial destination
     * file is left behind.
     */
    virtual juce::Result fetch(const juce::String& reference, const juce::File& destination) = 0;

    /**
     * The file extension (with dot) implied by a reference's path, or
     * fallback when there is none or it looks implausible.
     */
    static juce::String getExtensionForReference(const juce::String& reference, const juce::String& fallback);
};

//==============================================================================
/** Plain local paths and file:// URLs. */
class LocalFileAssetSource : public AssetSource
{
public:
    LocalFileAssetSource() = default;

    bool canFetch(const juce::String& reference) const override;
    juce::Result fetch(const juce::String& reference, const juce::File& destination) override;

    /** The local file a reference points at. */
    static juce::File resolve(const juce::String& reference);

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(LocalFileAssetSource)
};

//==============================================================================
/**
 * http:// and https:// downloads through juce::URL. Redirects are followed
 * and any HTTP status of 400 or above is treated as a failure.
 */
class UrlAssetSource : public AssetSource
{
public:
    explicit UrlAssetSource(int timeoutMs, const juce::String& userAgent = "NarrationRender/1.0");

    bool canFetch(const juce::String& reference) const override;
    juce::Result fetch(const juce::String& reference, const juce::File& destination) override;

private:
    int timeoutMs;
    juce::String userAgent;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(UrlAssetSource)
};

//==============================================================================
/** Hands each reference to the first registered source that accepts it. */
class CompositeAssetSource : public AssetSource
{
public:
    CompositeAssetSource() = default;

    void addSource(std::unique_ptr<AssetSource> source);

    bool canFetch(const juce::String& reference) const override;
    juce::Result fetch(const juce::String& reference, const juce::File& destination) override;

    /** Local files plus HTTP(S) with the given timeout. */
    static std::unique_ptr<CompositeAssetSource> createDefault(int downloadTimeoutMs);

private:
    AssetSource* findSource(const juce::String& reference) const;

    std::vector<std::unique_ptr<AssetSource>> sources;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(CompositeAssetSource)
};
