#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"
#include "../core/RenderConfig.h"
#include "../assets/AssetSource.h"
#include "../assets/OutputSink.h"
#include "../tasks/RenderTaskRepository.h"

/**
 * Accepts render requests and runs each one as a background job.
 *
 * submit() stores a Pending task and returns immediately; callers follow the
 * render by polling getStatus() (or the repository directly). Each job builds
 * its own RenderPipeline, so renders of different tasks share nothing but the
 * repository, asset source and output sink passed in here.
 */
class RenderService
{
public:
    /**
     * @param config                Settings handed to every pipeline
     * @param repository            Where task records are written through
     * @param assetSource           Shared by all renders; must be thread-safe
     * @param outputSink            Shared by all renders; must be thread-safe
     * @param maxConcurrentRenders  Renders allowed to run at the same time
     */
    RenderService(const RenderConfig& config,
                  RenderTaskRepository& repository,
                  AssetSource& assetSource,
                  OutputSink& outputSink,
                  int maxConcurrentRenders = 1);

    /** Waits for every submitted render to reach a terminal state. */
    ~RenderService();

    /** Receives every render log line, prefixed with the task id. */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /** Called from render threads with (task id, progress) after every accepted transition. */
    void setProgressListener(std::function<void(const juce::String&, int)> progressListener);

    /**
     * Validates the request, records it as Pending and queues the render.
     *
     * @param request Render inputs; a task id is generated when it has none
     * @param taskId  Receives the id of the queued task
     * @return a failure, with no task created, when the request is invalid
     *         or the Pending record cannot be stored
     */
    juce::Result submit(const RenderTypes::RenderRequest& request, juce::String& taskId);

    /** Latest stored record of a task; false if the repository does not know it. */
    bool getStatus(const juce::String& taskId, RenderTask& task) const;

    /**
     * Blocks until no render is queued or running.
     * @param timeoutMs Negative waits indefinitely
     * @return false if the timeout expired first
     */
    bool waitForAll(int timeoutMs);

    int getNumActiveRenders() const;

private:
    class RenderJob;

    void log(const juce::String& message) const;

    RenderConfig config;
    RenderTaskRepository& repository;
    AssetSource& assetSource;
    OutputSink& outputSink;

    juce::ThreadPool threadPool;

    std::function<void(const juce::String&)> logCallback;
    std::function<void(const juce::String&, int)> progressListener;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderService)
};
