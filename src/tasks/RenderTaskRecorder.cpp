#include "RenderTaskRecorder.h"

RenderTaskRecorder::RenderTaskRecorder(const RenderTask& task, RenderTaskRepository& repository)
    : task(task),
      repository(repository)
{
}

void RenderTaskRecorder::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void RenderTaskRecorder::setProgressSink(std::function<void(int)> sink)
{
    progressSink = sink;
}

bool RenderTaskRecorder::startProcessing()
{
    return apply("start", [](RenderTask& t) { return t.startProcessing(); });
}

bool RenderTaskRecorder::updateProgress(int progress)
{
    return apply("progress " + juce::String(progress),
                 [progress](RenderTask& t) { return t.updateProgress(progress); });
}

bool RenderTaskRecorder::complete(const juce::String& outputLocation)
{
    return apply("complete", [outputLocation](RenderTask& t) { return t.complete(outputLocation); });
}

bool RenderTaskRecorder::fail(const juce::String& message)
{
    return apply("fail", [message](RenderTask& t) { return t.fail(message); });
}

RenderTask RenderTaskRecorder::getSnapshot() const
{
    juce::ScopedLock sl(lock);
    return task;
}

juce::String RenderTaskRecorder::getTaskId() const
{
    juce::ScopedLock sl(lock);
    return task.getId();
}

bool RenderTaskRecorder::apply(const juce::String& transitionName, std::function<bool(RenderTask&)> transition)
{
    int progress = 0;
    juce::String display;

    {
        juce::ScopedLock sl(lock);

        if (!transition(task))
        {
            if (logCallback)
                logCallback("WARNING: Rejected transition '" + transitionName + "' for task "
                            + task.getId() + " in state " + RenderTypes::toString(task.getState()));
            return false;
        }

        // Written through while still holding the lock so saves stay in transition order
        if (!repository.save(task) && logCallback)
            logCallback("WARNING: Failed to persist task " + task.getId() + " after '" + transitionName + "'");

        progress = task.getProgress();
        display = task.getStatusDisplay();
    }

    juce::Logger::writeToLog("RENDER STATUS: " + display);

    if (progressSink)
        progressSink(progress);

    return true;
}
