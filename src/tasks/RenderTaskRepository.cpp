#include "RenderTaskRepository.h"

bool InMemoryRenderTaskRepository::save(const RenderTask& task)
{
    juce::ScopedLock sl(lock);
    tasks[task.getId()] = task;
    ++saveCount;
    return true;
}

bool InMemoryRenderTaskRepository::load(const juce::String& taskId, RenderTask& task) const
{
    juce::ScopedLock sl(lock);

    auto found = tasks.find(taskId);
    if (found == tasks.end())
        return false;

    task = found->second;
    return true;
}

int InMemoryRenderTaskRepository::getSaveCount() const
{
    juce::ScopedLock sl(lock);
    return saveCount;
}

//==============================================================================
JsonFileRenderTaskRepository::JsonFileRenderTaskRepository(const juce::File& directory)
    : directory(directory)
{
}

juce::File JsonFileRenderTaskRepository::getFileForTask(const juce::String& taskId) const
{
    return directory.getChildFile(juce::File::createLegalFileName(taskId) + ".json");
}

bool JsonFileRenderTaskRepository::save(const RenderTask& task)
{
    juce::ScopedLock sl(lock);

    if (!directory.isDirectory() && !directory.createDirectory().wasOk())
        return false;

    const juce::File target = getFileForTask(task.getId());
    juce::TemporaryFile temp(target);

    if (!temp.getFile().replaceWithText(juce::JSON::toString(task.toVar())))
        return false;

    return temp.overwriteTargetFileWithTemporary();
}

bool JsonFileRenderTaskRepository::load(const juce::String& taskId, RenderTask& task) const
{
    juce::ScopedLock sl(lock);

    const juce::File source = getFileForTask(taskId);
    if (!source.existsAsFile())
        return false;

    juce::var json;
    if (juce::JSON::parse(source.loadFileAsString(), json).failed())
        return false;

    return RenderTask::fromVar(json, task);
}
