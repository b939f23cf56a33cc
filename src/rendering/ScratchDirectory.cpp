#include "ScratchDirectory.h"

namespace
{
    // Plain (unsuffixed) scratch directories in use by a live ScratchDirectory
    struct ClaimedKeys
    {
        juce::CriticalSection lock;
        juce::StringArray keys;
    };

    ClaimedKeys& getClaimedKeys()
    {
        static ClaimedKeys claimed;
        return claimed;
    }

    bool claimKey(const juce::String& key)
    {
        auto& claimed = getClaimedKeys();
        const juce::ScopedLock sl(claimed.lock);

        if (claimed.keys.contains(key))
            return false;

        claimed.keys.add(key);
        return true;
    }

    void releaseKey(const juce::String& key)
    {
        auto& claimed = getClaimedKeys();
        const juce::ScopedLock sl(claimed.lock);
        claimed.keys.removeString(key);
    }
}

ScratchDirectory::ScratchDirectory(const juce::File& root, const juce::String& renderKey)
    : root(root),
      renderKey(juce::File::createLegalFileName(renderKey))
{
}

ScratchDirectory::~ScratchDirectory()
{
    cleanup();
}

void ScratchDirectory::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

juce::Result ScratchDirectory::create()
{
    juce::ScopedLock sl(lock);

    if (created)
        return juce::Result::ok();

    auto rootResult = root.createDirectory();
    if (rootResult.failed())
        return juce::Result::fail("Cannot create scratch root " + root.getFullPathName()
                                  + ": " + rootResult.getErrorMessage());

    directory = root.getChildFile("render-" + renderKey);
    ownsKey = claimKey(directory.getFullPathName());

    if (!ownsKey)
    {
        directory = root.getChildFile("render-" + renderKey + "-" + juce::Uuid().toString().substring(0, 8));
        log("Scratch directory for " + renderKey + " is busy, using " + directory.getFileName());
    }
    else if (directory.isDirectory())
    {
        // Left behind by an interrupted render: its downloads are reused and removed with the rest
        const auto leftovers = directory.findChildFiles(juce::File::findFiles, false);
        for (const auto& file : leftovers)
            trackedFiles.addIfNotAlreadyThere(file);

        log("Reusing scratch directory " + directory.getFullPathName() + " with "
            + juce::String(leftovers.size()) + " file(s) from an earlier attempt");
    }

    auto result = directory.createDirectory();
    if (result.failed())
    {
        if (ownsKey)
            releaseKey(directory.getFullPathName());
        ownsKey = false;

        return juce::Result::fail("Cannot create scratch directory " + directory.getFullPathName()
                                  + ": " + result.getErrorMessage());
    }

    created = true;
    cleanedUp = false;
    return juce::Result::ok();
}

juce::File ScratchDirectory::createFile(const juce::String& fileName)
{
    const juce::File file = directory.getChildFile(juce::File::createLegalFileName(fileName));
    trackFile(file);
    return file;
}

void ScratchDirectory::trackFile(const juce::File& file)
{
    juce::ScopedLock sl(lock);
    trackedFiles.addIfNotAlreadyThere(file);
}

int ScratchDirectory::getNumTrackedFiles() const
{
    juce::ScopedLock sl(lock);
    return trackedFiles.size();
}

int ScratchDirectory::cleanup()
{
    juce::ScopedLock sl(lock);

    if (!created || cleanedUp)
        return 0;

    int failures = 0;

    for (const auto& file : trackedFiles)
    {
        if (file.existsAsFile() && !file.deleteFile())
        {
            log("WARNING: Could not delete " + file.getFullPathName());
            ++failures;
        }
    }

    trackedFiles.clear();

    if (directory.isDirectory())
    {
        const int remaining = directory.getNumberOfChildFiles(juce::File::findFilesAndDirectories);

        if (remaining == 0)
        {
            if (!directory.deleteFile())
            {
                log("WARNING: Could not remove scratch directory " + directory.getFullPathName());
                ++failures;
            }
        }
        else
        {
            log("Scratch directory kept, " + juce::String(remaining) + " untracked entries remain: "
                + directory.getFullPathName());
        }
    }

    if (ownsKey)
        releaseKey(directory.getFullPathName());
    ownsKey = false;

    cleanedUp = true;
    return failures;
}

void ScratchDirectory::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
    else
        juce::Logger::writeToLog(message);
}
