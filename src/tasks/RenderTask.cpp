#include "RenderTask.h"

namespace
{
    juce::var stringOrNull(const juce::String& value)
    {
        return value.isEmpty() ? juce::var() : juce::var(value);
    }
}

RenderTask::RenderTask()
    : RenderTask(juce::String())
{
}

RenderTask::RenderTask(const juce::String& projectRef, const juce::String& taskId)
    : id(taskId.isNotEmpty() ? taskId : createTaskId()),
      projectRef(projectRef),
      createdAt(juce::Time::getCurrentTime()),
      updatedAt(createdAt)
{
}

juce::String RenderTask::createTaskId()
{
    return "task-" + juce::Uuid().toDashedString();
}

bool RenderTask::startProcessing()
{
    if (state != RenderState::Pending)
        return false;

    state = RenderState::Processing;
    progress = 0;
    error.clear();
    touch();
    return true;
}

bool RenderTask::updateProgress(int newProgress)
{
    if (state != RenderState::Processing)
        return false;

    progress = juce::jlimit(0, 100, newProgress);
    touch();
    return true;
}

bool RenderTask::complete(const juce::String& location)
{
    if (isTerminal() || location.trim().isEmpty())
        return false;

    state = RenderState::Complete;
    progress = 100;
    outputLocation = location.trim();
    error.clear();
    touch();
    return true;
}

bool RenderTask::fail(const juce::String& message)
{
    if (isTerminal())
        return false;

    state = RenderState::Failed;
    error = message.trim().isNotEmpty() ? message.trim() : juce::String("Render failed");
    touch();
    return true;
}

juce::String RenderTask::getStatusDisplay() const
{
    switch (state)
    {
        case RenderState::Pending:      return "Pending";
        case RenderState::Processing:   return "Processing (" + juce::String(progress) + "%)";
        case RenderState::Complete:     return "Complete";
        case RenderState::Failed:       return "Failed: " + error;
    }

    return "Pending";
}

juce::var RenderTask::toVar() const
{
    auto* object = new juce::DynamicObject();
    object->setProperty("id", id);
    object->setProperty("project", projectRef);
    object->setProperty("status", RenderTypes::toString(state));
    object->setProperty("progress", progress);
    object->setProperty("output_location", stringOrNull(outputLocation));
    object->setProperty("error", stringOrNull(error));
    object->setProperty("created_at", createdAt.toISO8601(true));
    object->setProperty("updated_at", updatedAt.toISO8601(true));
    return juce::var(object);
}

bool RenderTask::fromVar(const juce::var& json, RenderTask& task)
{
    if (json.getDynamicObject() == nullptr)
        return false;

    RenderState parsedState;
    if (!RenderTypes::fromString(json["status"].toString(), parsedState))
        return false;

    const juce::String parsedId = json["id"].toString();
    if (parsedId.isEmpty())
        return false;

    RenderTask restored(json["project"].toString(), parsedId);
    restored.state = parsedState;
    restored.progress = juce::jlimit(0, 100, static_cast<int>(json["progress"]));

    if (!json["output_location"].isVoid())
        restored.outputLocation = json["output_location"].toString();
    if (!json["error"].isVoid())
        restored.error = json["error"].toString();

    restored.createdAt = juce::Time::fromISO8601(json["created_at"].toString());
    restored.updatedAt = juce::Time::fromISO8601(json["updated_at"].toString());

    task = restored;
    return true;
}

void RenderTask::touch()
{
    // Keep updatedAt monotonic even if the wall clock steps backwards
    updatedAt = juce::jmax(juce::Time::getCurrentTime(), updatedAt);
}
