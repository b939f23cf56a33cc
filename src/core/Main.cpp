/*
  ==============================================================================
    Main.cpp - Command line entry point
  ==============================================================================
*/

#include <JuceHeader.h>
#include <iostream>
#include "ProcessManager.h"
#include "RenderConfig.h"
#include "../rendering/RenderService.h"
#include "../assets/AssetSource.h"
#include "../assets/OutputSink.h"
#include "../tasks/RenderTaskRepository.h"

namespace
{
    /** Writes every log line to the session log file and to stdout. */
    class ConsoleLogger : public juce::Logger
    {
    public:
        explicit ConsoleLogger(std::unique_ptr<juce::FileLogger> logger)
            : fileLogger(std::move(logger))
        {
        }

        void logMessage(const juce::String& message) override
        {
            if (fileLogger != nullptr)
                fileLogger->logMessage(message);

            juce::ScopedLock sl(writeLock);
            std::cout << message << std::endl;
        }

    private:
        std::unique_ptr<juce::FileLogger> fileLogger;
        juce::CriticalSection writeLock;
    };

    juce::String getOptionValue(const juce::ArgumentList& args, const juce::String& option)
    {
        for (int i = 0; i < args.size(); ++i)
        {
            const juce::String& text = args[i].text;

            if (text == option && i + 1 < args.size())
                return args[i + 1].text;

            if (text.startsWith(option + "="))
                return text.fromFirstOccurrenceOf("=", false, false);
        }

        return {};
    }

    juce::File resolvePath(const juce::String& path)
    {
        return juce::File::getCurrentWorkingDirectory().getChildFile(path.unquoted());
    }

    RenderConfig loadConfig(const juce::ArgumentList& args)
    {
        RenderConfig config;
        const juce::String configPath = getOptionValue(args, "--config");

        if (configPath.isNotEmpty())
        {
            juce::StringArray warnings;
            auto loaded = config.loadFromFile(resolvePath(configPath), warnings);

            for (const auto& warning : warnings)
                juce::Logger::writeToLog("WARNING: " + warning);

            if (loaded.failed())
                juce::ConsoleApplication::fail(loaded.getErrorMessage());
        }

        config.applyEnvironment();

        auto valid = config.validate();
        if (valid.failed())
            juce::ConsoleApplication::fail("Invalid configuration: " + valid.getErrorMessage());

        return config;
    }

    std::unique_ptr<RenderTaskRepository> createRepository(const juce::ArgumentList& args)
    {
        const juce::String tasksPath = getOptionValue(args, "--tasks");

        if (tasksPath.isEmpty())
            return std::make_unique<InMemoryRenderTaskRepository>();

        return std::make_unique<JsonFileRenderTaskRepository>(resolvePath(tasksPath));
    }

    juce::String toJson(const RenderTask& task)
    {
        return juce::JSON::toString(task.toVar(), false);
    }

    //==========================================================================
    int runRender(const juce::ArgumentList& args)
    {
        if (args.size() < 2 || args[1].text.startsWith("--"))
            juce::ConsoleApplication::fail("Usage: narration-render render <request.json> [--config <config.json>] [--tasks <dir>]");

        const juce::File requestFile = resolvePath(args[1].text);
        if (!requestFile.existsAsFile())
            juce::ConsoleApplication::fail("Request file not found: " + requestFile.getFullPathName());

        const RenderConfig config = loadConfig(args);

        juce::var json;
        auto parsed = juce::JSON::parse(requestFile.loadFileAsString(), json);
        if (parsed.failed())
            juce::ConsoleApplication::fail("Request is not valid JSON: " + parsed.getErrorMessage());

        RenderTypes::RenderRequest request;
        auto ingested = RenderTypes::RenderRequest::fromVar(json, request);
        if (ingested.failed())
            juce::ConsoleApplication::fail("Invalid render request: " + ingested.getErrorMessage());

        auto repository = createRepository(args);
        auto assetSource = CompositeAssetSource::createDefault(config.downloadTimeoutMs);
        LocalDirectoryOutputSink outputSink(config.outputDirectory);

        juce::String taskId;
        RenderTask finalTask;

        {
            RenderService service(config, *repository, *assetSource, outputSink);

            auto submitted = service.submit(request, taskId);
            if (submitted.failed())
                juce::ConsoleApplication::fail("Render rejected: " + submitted.getErrorMessage());

            service.waitForAll(-1);

            if (!service.getStatus(taskId, finalTask))
                juce::ConsoleApplication::fail("Task " + taskId + " disappeared from the repository");
        }

        juce::Logger::writeToLog("RENDER STATUS: " + finalTask.getStatusDisplay());
        std::cout << toJson(finalTask) << std::endl;

        return finalTask.getState() == RenderTypes::RenderState::Complete ? 0 : 1;
    }

    int runStatus(const juce::ArgumentList& args)
    {
        const juce::String tasksPath = getOptionValue(args, "--tasks");

        if (args.size() < 2 || args[1].text.startsWith("--") || tasksPath.isEmpty())
            juce::ConsoleApplication::fail("Usage: narration-render status <task-id> --tasks <dir>");

        JsonFileRenderTaskRepository repository(resolvePath(tasksPath));

        RenderTask task;
        if (!repository.load(args[1].text, task))
            juce::ConsoleApplication::fail("Unknown task: " + args[1].text);

        std::cout << toJson(task) << std::endl;
        return 0;
    }
}

//==============================================================================
int main(int argc, char* argv[])
{
    // Set up file logging
    juce::File logsDirectory = RenderConfig().logDirectory;
    if (!logsDirectory.isDirectory() && !logsDirectory.createDirectory())
        logsDirectory = juce::File::getSpecialLocation(juce::File::currentExecutableFile).getParentDirectory();

    const juce::String sessionStamp = juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S");
    const juce::File logFile = logsDirectory.getChildFile("NarrationRender_" + sessionStamp + ".log");

    auto logger = std::make_unique<ConsoleLogger>(
        std::make_unique<juce::FileLogger>(logFile, "NarrationRender Session Log", 0));
    juce::Logger::setCurrentLogger(logger.get());

    juce::Logger::writeToLog("Started " + juce::String(ProjectInfo::projectName) + " "
                             + ProjectInfo::versionString + " at " + juce::Time::getCurrentTime().toString(true, true));

    int commandExitCode = 0;
    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h", "Usage: NarrationRender <command> [options]", true);
    app.addVersionCommand("--version|-v", juce::String(ProjectInfo::projectName) + " " + ProjectInfo::versionString);

    app.addCommand({ "render",
                     "render <request.json> [--config <config.json>] [--tasks <dir>]",
                     "Renders a narration video and prints the final task status as JSON.",
                     "Exits with 0 when the task completes and 1 when it fails. With --tasks, every\n"
                     "status change is written to <dir>/<task-id>.json for other processes to poll.",
                     [&commandExitCode] (const juce::ArgumentList& args) { commandExitCode = runRender(args); } });

    app.addCommand({ "status",
                     "status <task-id> --tasks <dir>",
                     "Prints the stored status of a render task as JSON.",
                     {},
                     [&commandExitCode] (const juce::ArgumentList& args) { commandExitCode = runStatus(args); } });

    const int appExitCode = app.findAndRunCommand(argc, argv);
    const int exitCode = appExitCode != 0 ? appExitCode : commandExitCode;

    const int killed = ProcessManager::getInstance().terminateAllProcesses();
    if (killed > 0)
        juce::Logger::writeToLog("Terminated " + juce::String(killed) + " ffmpeg process(es) on exit");

    juce::Logger::writeToLog("Exiting with code " + juce::String(exitCode));
    juce::Logger::setCurrentLogger(nullptr);

    return exitCode;
}
