#pragma once
#include <JuceHeader.h>
#include "RenderTask.h"
#include "RenderTaskRepository.h"

/**
 * The single writer of one RenderTask.
 *
 * Each transition is applied under a lock and the resulting record is saved
 * to the repository before the call returns, so pollers never observe a
 * state the pipeline has moved past. Accepted transitions also forward the
 * task's progress to the optional progress sink.
 */
class RenderTaskRecorder
{
public:
    RenderTaskRecorder(const RenderTask& task, RenderTaskRepository& repository);

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /** Receives the task's progress (0..100) after every accepted transition. */
    void setProgressSink(std::function<void(int)> progressSink);

    bool startProcessing();
    bool updateProgress(int progress);
    bool complete(const juce::String& outputLocation);
    bool fail(const juce::String& message);

    /** Copy of the current record. */
    RenderTask getSnapshot() const;

    juce::String getTaskId() const;

private:
    bool apply(const juce::String& transitionName, std::function<bool(RenderTask&)> transition);

    RenderTask task;
    RenderTaskRepository& repository;
    juce::CriticalSection lock;

    std::function<void(const juce::String&)> logCallback;
    std::function<void(int)> progressSink;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderTaskRecorder)
};
