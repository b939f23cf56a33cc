#pragma once
#include <JuceHeader.h>
#include "../rendering/RenderTypes.h"

/**
 * Lifecycle and progress record of one render invocation.
 *
 * A task starts Pending, moves to Processing when the pipeline picks it up
 * and ends in Complete or Failed. Terminal tasks never change again: every
 * transition method returns false instead of mutating a terminal task.
 *
 * RenderTask itself is a plain value and is not thread-safe; concurrent
 * access goes through RenderTaskRecorder.
 */
class RenderTask
{
public:
    using RenderState = RenderTypes::RenderState;

    RenderTask();
    RenderTask(const juce::String& projectRef, const juce::String& taskId = {});

    /** Returns a fresh "task-<uuid>" identifier. */
    static juce::String createTaskId();

    //==========================================================================
    /**
     * Pending -> Processing. Resets progress to 0 and clears any error.
     * @return false if the task is not Pending
     */
    bool startProcessing();

    /**
     * Updates progress while Processing. Values outside 0..100 are clamped.
     * @return false if the task is not Processing
     */
    bool updateProgress(int newProgress);

    /**
     * Any non-terminal state -> Complete. Sets progress to 100.
     * @return false if the task is terminal or the location is empty
     */
    bool complete(const juce::String& outputLocation);

    /**
     * Any non-terminal state -> Failed. An empty message is recorded as
     * "Render failed" so a failure is never stored without a reason.
     * @return false if the task is already terminal
     */
    bool fail(const juce::String& message);

    //==========================================================================
    const juce::String& getId() const            { return id; }
    const juce::String& getProjectRef() const    { return projectRef; }
    RenderState getState() const                 { return state; }
    int getProgress() const                      { return progress; }
    const juce::String& getOutputLocation() const { return outputLocation; }
    const juce::String& getError() const         { return error; }
    juce::Time getCreatedAt() const              { return createdAt; }
    juce::Time getUpdatedAt() const              { return updatedAt; }

    bool isInProgress() const   { return state == RenderState::Processing; }
    bool isTerminal() const     { return state == RenderState::Complete || state == RenderState::Failed; }

    /** "Pending", "Processing (42%)", "Complete" or "Failed: <error>" */
    juce::String getStatusDisplay() const;

    /** Status surface: id, project, status, progress, output_location, error, timestamps. */
    juce::var toVar() const;

    /** Restores a task written by toVar(); returns false for malformed input. */
    static bool fromVar(const juce::var& json, RenderTask& task);

private:
    void touch();

    juce::String id;
    juce::String projectRef;
    RenderState state = RenderState::Pending;
    int progress = 0;
    juce::String outputLocation;
    juce::String error;
    juce::Time createdAt;
    juce::Time updatedAt;

    JUCE_LEAK_DETECTOR(RenderTask)
};
