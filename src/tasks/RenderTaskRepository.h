#pragma once
#include <JuceHeader.h>
#include "RenderTask.h"

/**
 * Storage for render task records.
 *
 * The pipeline writes every accepted transition through save(); pollers
 * read the latest copy with load(). Implementations must be safe to call
 * from several threads.
 */
class RenderTaskRepository
{
public:
    virtual ~RenderTaskRepository() = default;

    /** Stores (or replaces) the record with the task's id. */
    virtual bool save(const RenderTask& task) = 0;

    /** Copies the stored record into task; returns false if it is unknown. */
    virtual bool load(const juce::String& taskId, RenderTask& task) const = 0;
};

//==============================================================================
/** Process-local repository, used by the CLI when no task directory is given and by tests. */
class InMemoryRenderTaskRepository : public RenderTaskRepository
{
public:
    InMemoryRenderTaskRepository() = default;

    bool save(const RenderTask& task) override;
    bool load(const juce::String& taskId, RenderTask& task) const override;

    /** Number of saves accepted so far, across all tasks. */
    int getSaveCount() const;

private:
    std::map<juce::String, RenderTask> tasks;
    int saveCount = 0;
    juce::CriticalSection lock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(InMemoryRenderTaskRepository)
};

//==============================================================================
/**
 * Keeps one <task-id>.json file per task in a directory so another process
 * (e.g. "narration-render status") can poll a running render.
 * Files are replaced atomically through a temporary sibling.
 */
class JsonFileRenderTaskRepository : public RenderTaskRepository
{
public:
    explicit JsonFileRenderTaskRepository(const juce::File& directory);

    bool save(const RenderTask& task) override;
    bool load(const juce::String& taskId, RenderTask& task) const override;

    juce::File getFileForTask(const juce::String& taskId) const;

private:
    juce::File directory;
    juce::CriticalSection lock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(JsonFileRenderTaskRepository)
};
