#pragma once
#include <JuceHeader.h>

/**
 * Final destination of a rendered video.
 *
 * publish() takes ownership of the rendered file (it may move it) and
 * reports where consumers can find the result.
 */
class OutputSink
{
public:
    virtual ~OutputSink() = default;

    /**
     * @param renderedFile The encoded video inside the scratch directory
     * @param fileName     Suggested name for the published artifact
     * @param location     Receives the published path or URL
     */
    virtual juce::Result publish(const juce::File& renderedFile,
                                 const juce::String& fileName,
                                 juce::String& location) = 0;
};

//==============================================================================
/** Moves rendered videos into a local output directory. */
class LocalDirectoryOutputSink : public OutputSink
{
public:
    explicit LocalDirectoryOutputSink(const juce::File& directory);

    juce::Result publish(const juce::File& renderedFile,
                         const juce::String& fileName,
                         juce::String& location) override;

    const juce::File& getDirectory() const { return directory; }

private:
    juce::File directory;
    juce::CriticalSection lock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(LocalDirectoryOutputSink)
};
