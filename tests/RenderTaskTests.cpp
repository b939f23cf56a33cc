#include <JuceHeader.h>
#include "TestHelpers.h"
#include "../src/tasks/RenderTask.h"
#include "../src/tasks/RenderTaskRecorder.h"
#include "../src/tasks/RenderTaskRepository.h"

using RenderTypes::RenderState;

class RenderTaskTests : public juce::UnitTest
{
public:
    RenderTaskTests() : juce::UnitTest("RenderTask", "NarrationRender") {}

    void runTest() override
    {
        beginTest("new tasks are pending with a generated id");
        {
            RenderTask task("project-1");
            expect(task.getState() == RenderState::Pending);
            expect(task.getId().startsWith("task-"));
            expectEquals(task.getProgress(), 0);
            expectEquals(task.getStatusDisplay(), juce::String("Pending"));
            expect(RenderTask("project-1").getId() != task.getId());
            expectEquals(RenderTask("p", "given-id").getId(), juce::String("given-id"));
        }

        beginTest("progress is rejected before processing starts");
        {
            RenderTask task("p");
            expect(!task.updateProgress(40));
            expectEquals(task.getProgress(), 0);
            expect(task.getState() == RenderState::Pending);
        }

        beginTest("happy path reaches Complete with the output location");
        {
            RenderTask task("p");
            expect(task.startProcessing());
            expect(task.isInProgress());
            expect(task.updateProgress(50));
            expectEquals(task.getStatusDisplay(), juce::String("Processing (50%)"));
            expect(task.complete("/out/video.mp4"));
            expect(task.isTerminal());
            expectEquals(task.getProgress(), 100);
            expectEquals(task.getOutputLocation(), juce::String("/out/video.mp4"));
            expect(task.getError().isEmpty());
        }

        beginTest("progress is clamped to 0..100");
        {
            RenderTask task("p");
            task.startProcessing();
            expect(task.updateProgress(150));
            expectEquals(task.getProgress(), 100);
            expect(task.updateProgress(-5));
            expectEquals(task.getProgress(), 0);
        }

        beginTest("terminal states never change");
        {
            RenderTask completed("p");
            completed.startProcessing();
            completed.complete("/out/a.mp4");

            expect(!completed.startProcessing());
            expect(!completed.updateProgress(10));
            expect(!completed.fail("late error"));
            expect(!completed.complete("/out/b.mp4"));
            expect(completed.getState() == RenderState::Complete);
            expectEquals(completed.getOutputLocation(), juce::String("/out/a.mp4"));

            RenderTask failed("p");
            failed.startProcessing();
            expect(failed.fail("No footage available"));
            expect(!failed.complete("/out/c.mp4"));
            expect(!failed.startProcessing());
            expectEquals(failed.getStatusDisplay(), juce::String("Failed: No footage available"));
        }

        beginTest("fail is allowed from Pending and needs a message");
        {
            RenderTask task("p");
            expect(task.fail("   "));
            expect(task.getState() == RenderState::Failed);
            expectEquals(task.getError(), juce::String("Render failed"));
        }

        beginTest("complete requires a location");
        {
            RenderTask task("p");
            task.startProcessing();
            expect(!task.complete(""));
            expect(task.isInProgress());
        }

        beginTest("updatedAt moves with every accepted transition");
        {
            RenderTask task("p");
            const auto created = task.getUpdatedAt();
            juce::Thread::sleep(5);
            task.startProcessing();
            expect(task.getUpdatedAt() >= created);
            expect(task.getCreatedAt() == created);
        }

        beginTest("status surface round-trips through JSON");
        {
            RenderTask task("project-9", "task-abc");
            task.startProcessing();
            task.updateProgress(42);

            const juce::var json = task.toVar();
            expectEquals(json["status"].toString(), juce::String("processing"));
            expectEquals(static_cast<int>(json["progress"]), 42);
            expect(json["output_location"].isVoid());
            expect(json["error"].isVoid());

            RenderTask restored;
            expect(RenderTask::fromVar(juce::JSON::parse(juce::JSON::toString(json)), restored));
            expectEquals(restored.getId(), juce::String("task-abc"));
            expectEquals(restored.getProjectRef(), juce::String("project-9"));
            expect(restored.getState() == RenderState::Processing);
            expectEquals(restored.getProgress(), 42);

            RenderTask garbage;
            expect(!RenderTask::fromVar(juce::var("not an object"), garbage));
        }

        beginTest("state names parse back");
        {
            for (auto state : { RenderState::Pending, RenderState::Processing, RenderState::Complete, RenderState::Failed })
            {
                RenderState parsed = RenderState::Pending;
                expect(RenderTypes::fromString(RenderTypes::toString(state), parsed));
                expect(parsed == state);
            }

            RenderState parsed = RenderState::Pending;
            expect(!RenderTypes::fromString("cancelled", parsed));
        }
    }
};

static RenderTaskTests renderTaskTests;

//==============================================================================
class RenderTaskRecorderTests : public juce::UnitTest
{
public:
    RenderTaskRecorderTests() : juce::UnitTest("RenderTaskRecorder", "NarrationRender") {}

    void runTest() override
    {
        beginTest("every accepted transition is written through");
        {
            InMemoryRenderTaskRepository repository;
            RenderTaskRecorder recorder(RenderTask("p", "task-1"), repository);

            juce::Array<int> progressSeen;
            recorder.setProgressSink([&progressSeen](int progress) { progressSeen.add(progress); });

            expect(recorder.startProcessing());
            expectEquals(repository.getSaveCount(), 1);

            RenderTask stored;
            expect(repository.load("task-1", stored));
            expect(stored.getState() == RenderState::Processing);

            expect(recorder.updateProgress(50));
            expect(repository.load("task-1", stored));
            expectEquals(stored.getProgress(), 50);

            expect(recorder.complete("/out/video.mp4"));
            expect(repository.load("task-1", stored));
            expect(stored.getState() == RenderState::Complete);
            expectEquals(repository.getSaveCount(), 3);

            expectEquals(progressSeen.size(), 3);
            expectEquals(progressSeen.getLast(), 100);
        }

        beginTest("rejected transitions are logged and not saved");
        {
            InMemoryRenderTaskRepository repository;
            RenderTaskRecorder recorder(RenderTask("p", "task-2"), repository);
            TestHelpers::LogCollector logs;
            recorder.setLogCallback(logs.callback());

            expect(!recorder.updateProgress(30));
            expectEquals(repository.getSaveCount(), 0);
            expect(logs.contains("Rejected transition"));
        }

        beginTest("concurrent progress updates are serialized");
        {
            InMemoryRenderTaskRepository repository;
            RenderTaskRecorder recorder(RenderTask("p", "task-3"), repository);
            recorder.startProcessing();

            juce::ThreadPool pool(4);
            for (int i = 0; i < 40; ++i)
                pool.addJob([&recorder, i] { recorder.updateProgress(i); });

            while (pool.getNumJobs() > 0)
                juce::Thread::sleep(5);

            expectEquals(repository.getSaveCount(), 41);

            RenderTask stored;
            expect(repository.load("task-3", stored));
            expectEquals(stored.getProgress(), recorder.getSnapshot().getProgress());
        }
    }
};

static RenderTaskRecorderTests renderTaskRecorderTests;

//==============================================================================
class RenderTaskRepositoryTests : public juce::UnitTest
{
public:
    RenderTaskRepositoryTests() : juce::UnitTest("RenderTaskRepository", "NarrationRender") {}

    void runTest() override
    {
        beginTest("unknown ids are not found");
        {
            InMemoryRenderTaskRepository repository;
            RenderTask task;
            expect(!repository.load("missing", task));
        }

        beginTest("JSON repository keeps one file per task");
        {
            TestHelpers::TemporaryDirectory temp;
            JsonFileRenderTaskRepository repository(temp.getChildFile("tasks"));

            RenderTask task("project-x", "task-json");
            task.startProcessing();
            task.fail("Voice-over unavailable");
            expect(repository.save(task));

            const juce::File file = repository.getFileForTask("task-json");
            expect(file.existsAsFile());
            expectEquals(file.getParentDirectory().getNumberOfChildFiles(juce::File::findFiles), 1);

            RenderTask loaded;
            expect(repository.load("task-json", loaded));
            expect(loaded.getState() == RenderState::Failed);
            expectEquals(loaded.getError(), juce::String("Voice-over unavailable"));
            expectEquals(loaded.getProjectRef(), juce::String("project-x"));
        }

        beginTest("JSON repository replaces the previous record");
        {
            TestHelpers::TemporaryDirectory temp;
            JsonFileRenderTaskRepository repository(temp.getDirectory());

            RenderTask task("p", "task-replace");
            expect(repository.save(task));
            task.startProcessing();
            task.updateProgress(70);
            expect(repository.save(task));

            RenderTask loaded;
            expect(repository.load("task-replace", loaded));
            expectEquals(loaded.getProgress(), 70);
        }

        beginTest("corrupt files are reported as missing");
        {
            TestHelpers::TemporaryDirectory temp;
            JsonFileRenderTaskRepository repository(temp.getDirectory());
            expect(repository.getFileForTask("task-bad").replaceWithText("{ not json"));

            RenderTask loaded;
            expect(!repository.load("task-bad", loaded));
        }
    }
};

static RenderTaskRepositoryTests renderTaskRepositoryTests;
