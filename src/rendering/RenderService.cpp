#include "RenderService.h"
#include "RenderPipeline.h"
#include "../tasks/RenderTaskRecorder.h"

//==============================================================================
class RenderService::RenderJob : public juce::ThreadPoolJob
{
public:
    RenderJob(RenderService& owner, const RenderTypes::RenderRequest& request, const RenderTask& task)
        : juce::ThreadPoolJob("Render " + task.getId()),
          owner(owner),
          request(request),
          task(task)
    {
    }

    JobStatus runJob() override
    {
        RenderTaskRecorder recorder(task, owner.repository);

        const juce::String taskId = task.getId();
        recorder.setProgressSink([this, taskId](int progress)
        {
            if (owner.progressListener)
                owner.progressListener(taskId, progress);
        });

        RenderPipeline pipeline(owner.config, owner.assetSource, owner.outputSink);

        if (owner.logCallback)
            pipeline.setLogCallback([this, taskId](const juce::String& message)
            {
                owner.logCallback("[render " + taskId + "] " + message);
            });

        const RenderTask finished = pipeline.run(request, recorder);
        owner.log("Render " + taskId + " finished: " + finished.getStatusDisplay());

        return jobHasFinished;
    }

private:
    RenderService& owner;
    RenderTypes::RenderRequest request;
    RenderTask task;

    JUCE_DECLARE_NON_COPYABLE(RenderJob)
};

//==============================================================================
RenderService::RenderService(const RenderConfig& renderConfig,
                             RenderTaskRepository& taskRepository,
                             AssetSource& source,
                             OutputSink& sink,
                             int maxConcurrentRenders)
    : config(renderConfig),
      repository(taskRepository),
      assetSource(source),
      outputSink(sink),
      threadPool(juce::jmax(1, maxConcurrentRenders))
{
}

RenderService::~RenderService()
{
    // Renders have no cancellation point; let every queued one reach a terminal state
    waitForAll(-1);
}

void RenderService::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void RenderService::setProgressListener(std::function<void(const juce::String&, int)> listener)
{
    progressListener = listener;
}

void RenderService::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
    else
        juce::Logger::writeToLog(message);
}

juce::Result RenderService::submit(const RenderTypes::RenderRequest& request, juce::String& taskId)
{
    auto validation = request.validate();
    if (validation.failed())
        return validation;

    RenderTask task(request.projectRef, request.taskId);

    RenderTask existing;
    if (repository.load(task.getId(), existing))
        return juce::Result::fail("Task " + task.getId() + " already exists");

    if (!repository.save(task))
        return juce::Result::fail("Could not store task " + task.getId());

    taskId = task.getId();
    log("RENDER STATUS: " + task.getStatusDisplay() + " (" + taskId + ", project " + request.projectRef + ")");

    threadPool.addJob(new RenderJob(*this, request, task), true);
    return juce::Result::ok();
}

bool RenderService::getStatus(const juce::String& taskId, RenderTask& task) const
{
    return repository.load(taskId, task);
}

bool RenderService::waitForAll(int timeoutMs)
{
    const auto start = juce::Time::getMillisecondCounter();

    while (threadPool.getNumJobs() > 0)
    {
        if (timeoutMs >= 0 && juce::Time::getMillisecondCounter() - start >= static_cast<juce::uint32>(timeoutMs))
            return false;

        juce::Thread::sleep(50);
    }

    return true;
}

int RenderService::getNumActiveRenders() const
{
    return threadPool.getNumJobs();
}
