#include "OutputSink.h"

LocalDirectoryOutputSink::LocalDirectoryOutputSink(const juce::File& directory)
    : directory(directory)
{
}

juce::Result LocalDirectoryOutputSink::publish(const juce::File& renderedFile,
                                               const juce::String& fileName,
                                               juce::String& location)
{
    if (!renderedFile.existsAsFile())
        return juce::Result::fail("Rendered file is missing: " + renderedFile.getFullPathName());

    // Serialised so two renders finishing together cannot pick the same name
    juce::ScopedLock sl(lock);

    auto dirResult = directory.createDirectory();
    if (dirResult.failed())
        return juce::Result::fail("Cannot create output directory " + directory.getFullPathName()
                                  + ": " + dirResult.getErrorMessage());

    juce::String baseName = juce::File::createLegalFileName(fileName);
    if (baseName.containsChar('.'))
        baseName = baseName.upToLastOccurrenceOf(".", false, false);

    const juce::File target = directory.getNonexistentChildFile(baseName, renderedFile.getFileExtension(), false);

    if (!renderedFile.moveFileTo(target))
        return juce::Result::fail("Cannot move " + renderedFile.getFileName() + " to " + target.getFullPathName());

    location = target.getFullPathName();
    return juce::Result::ok();
}
