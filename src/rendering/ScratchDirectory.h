#pragma once
#include <JuceHeader.h>

/**
 * Per-render working directory with guaranteed cleanup.
 *
 * Every file the render downloads or produces is registered with
 * trackFile(). cleanup() deletes the registered files and then removes the
 * directory only if nothing else is left inside it. The destructor runs
 * cleanup() if it has not run yet, so every exit path of a render releases
 * its scratch space.
 *
 * The directory is named after the render key, so a render retried after
 * an interrupted attempt finds the files that attempt already fetched.
 * While another live ScratchDirectory in this process holds the key, a
 * randomly suffixed directory is used instead.
 *
 * Cleanup problems are reported through the log callback and never thrown.
 */
class ScratchDirectory
{
public:
    /**
     * @param root      Parent directory shared by all renders
     * @param renderKey Identifies the render in the directory name
     */
    ScratchDirectory(const juce::File& root, const juce::String& renderKey);
    ~ScratchDirectory();

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Creates root/render-<key>, or root/render-<key>-<random> when the key is
     * busy. Files already inside a reused directory are tracked for deletion.
     */
    juce::Result create();

    const juce::File& getDirectory() const { return directory; }

    /** Returns a child of the scratch directory and registers it for deletion. */
    juce::File createFile(const juce::String& fileName);

    /** Registers an existing file inside the directory for deletion. */
    void trackFile(const juce::File& file);

    /**
     * Deletes every tracked file, then the directory if it is empty.
     * Safe to call more than once.
     * @return the number of files or directories that could not be removed
     */
    int cleanup();

    bool isCleanedUp() const { return cleanedUp; }

    int getNumTrackedFiles() const;

private:
    void log(const juce::String& message) const;

    juce::File root;
    juce::String renderKey;
    juce::File directory;
    juce::Array<juce::File> trackedFiles;
    juce::CriticalSection lock;
    bool created = false;
    bool cleanedUp = false;
    bool ownsKey = false;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ScratchDirectory)
};
