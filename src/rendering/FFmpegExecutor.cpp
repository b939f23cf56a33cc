//==============================================================================
/**
 * @file FFmpegExecutor.cpp
 *
 * Implementation file for the FFmpegExecutor class, which handles running
 * FFmpeg commands as external processes and recording their output.
 *
 * Output is read in blocks until the child closes its pipe. Only a bounded
 * tail of it is kept in memory; the complete text goes to the per-command
 * session log when session logging is enabled.
 */

#include "FFmpegExecutor.h"

namespace
{
    constexpr int maxCapturedCharacters = 64 * 1024;

    double parseFractionString(const juce::String& fraction)
    {
        auto value = fraction.trim();
        if (value.isEmpty())
            return 0.0;

        const int slashIndex = value.indexOfChar('/');
        if (slashIndex > 0)
        {
            const double numerator = value.substring(0, slashIndex).getDoubleValue();
            const double denominator = value.substring(slashIndex + 1).getDoubleValue();
            if (denominator != 0.0)
                return numerator / denominator;
            return 0.0;
        }

        return value.getDoubleValue();
    }

    juce::String formatCommandLine(const juce::StringArray& arguments)
    {
        juce::StringArray quoted;
        for (const auto& argument : arguments)
            quoted.add(argument.containsAnyOf(" \t'\"") ? argument.quoted() : argument);

        return quoted.joinIntoString(" ");
    }

    juce::String timestamp()
    {
        return juce::Time::getCurrentTime().toString(true, true);
    }
}

//==============================================================================
FFmpegExecutor::FFmpegExecutor()
{
}

FFmpegExecutor::~FFmpegExecutor()
{
    cancelExecution();
}

//==============================================================================
void FFmpegExecutor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void FFmpegExecutor::setExecutablePaths(const juce::String& ffmpegPath, const juce::String& ffprobePath)
{
    configuredFFmpegPath = ffmpegPath.trim();
    configuredFFprobePath = ffprobePath.trim();
}

//==============================================================================
void FFmpegExecutor::setSessionLogDirectory(const juce::File& directory)
{
    juce::ScopedLock sl(logDirectoryLock);

    sessionLoggingEnabled = false;
    sessionLogDirectory = juce::File();
    sessionAggregateLogFile = juce::File();
    sessionCommandIndex = 0;

    if (directory == juce::File())
        return;

    if (!directory.isDirectory() && directory.createDirectory().failed())
        return;

    sessionLogDirectory = directory;
    sessionAggregateLogFile = sessionLogDirectory.getChildFile("ffmpeg.log");
    sessionLoggingEnabled = true;
}

//==============================================================================
juce::File FFmpegExecutor::getNextCommandLogFile(int& outIndex)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
    {
        outIndex = -1;
        return juce::File();
    }

    ++sessionCommandIndex;
    outIndex = sessionCommandIndex;
    return sessionLogDirectory.getChildFile(juce::String::formatted("ffmpeg_%03d.log", sessionCommandIndex));
}

//==============================================================================
void FFmpegExecutor::writeToAggregateLog(const juce::String& message)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
        return;

    juce::FileOutputStream stream(sessionAggregateLogFile, 1024);
    if (stream.openedOk())
        stream.writeText(message + "\n", false, false, nullptr);
}

//==============================================================================
juce::StringArray FFmpegExecutor::createFFmpegCommand() const
{
    return { getFFmpegPath(), "-hide_banner", "-nostats", "-nostdin", "-y" };
}

//==============================================================================
bool FFmpegExecutor::executeCommand(const juce::StringArray& arguments, const juce::String& description)
{
    if (arguments.isEmpty())
        return false;

    const juce::String commandLine = formatCommandLine(arguments);

    int commandLogIndex = -1;
    const juce::File commandLogFile = getNextCommandLogFile(commandLogIndex);
    std::unique_ptr<juce::FileOutputStream> commandLogStream;
    const juce::String commandIndexLabel = (commandLogIndex > 0)
        ? juce::String::formatted("#%03d", commandLogIndex)
        : juce::String("#---");

    if (commandLogFile != juce::File())
    {
        auto stream = std::make_unique<juce::FileOutputStream>(commandLogFile);
        if (stream->openedOk())
        {
            stream->writeText("Started: " + timestamp() + "\n", false, false, nullptr);
            stream->writeText("Task: " + description + "\n", false, false, nullptr);
            stream->writeText("Command: " + commandLine + "\n", false, false, nullptr);
            stream->writeText("------------------------------------------------------------\n", false, false, nullptr);
            commandLogStream = std::move(stream);
        }
    }

    writeToAggregateLog(commandIndexLabel + " [" + timestamp() + "] START " + description + ": " + commandLine);

    {
        juce::ScopedLock sl(errorLock);
        lastErrorOutput.clear();
    }

    shouldCancel.store(false);

    ManagedChildProcess* process = nullptr;
    {
        juce::ScopedLock sl(processLock);
        activeProcess = std::make_unique<ManagedChildProcess>(description);
        process = activeProcess.get();
    }

    if (!process->start(arguments))
    {
        if (commandLogStream)
            commandLogStream->writeText("Failed to start process\n", false, false, nullptr);
        writeToAggregateLog(commandIndexLabel + " [" + timestamp() + "] START_FAILED");

        {
            juce::ScopedLock sl(errorLock);
            lastErrorOutput = "Could not start " + arguments[0];
        }

        if (logCallback)
            logCallback("ERROR: Could not start " + arguments[0] + " for " + description);

        juce::ScopedLock sl(processLock);
        activeProcess.reset();
        return false;
    }

    juce::String capturedOutput;
    char buffer[4096];

    // readProcessOutput() blocks until data arrives or the child closes its pipe
    for (;;)
    {
        if (shouldCancel.load())
        {
            process->kill();
            break;
        }

        const int bytesRead = process->readProcessOutput(buffer, (int) sizeof(buffer));

        if (bytesRead > 0)
        {
            const juce::String chunk = juce::String::fromUTF8(buffer, bytesRead);

            if (commandLogStream)
                commandLogStream->writeText(chunk.replace("\r", "\n"), false, false, nullptr);

            capturedOutput += chunk;
            if (capturedOutput.length() > maxCapturedCharacters)
                capturedOutput = capturedOutput.getLastCharacters(maxCapturedCharacters / 2);

            continue;
        }

        if (!process->isRunning())
            break;

        juce::Thread::sleep(20);
    }

    const bool cancelled = shouldCancel.load();
    const int exitCode = cancelled ? -1 : static_cast<int>(process->getExitCode());

    {
        juce::ScopedLock sl(processLock);
        activeProcess.reset();
    }

    const juce::String finishLabel = cancelled ? juce::String("CANCELLED")
                                               : "END exitCode=" + juce::String(exitCode);

    if (commandLogStream)
    {
        commandLogStream->writeText("\n------------------------------------------------------------\n", false, false, nullptr);
        commandLogStream->writeText("Finished: " + timestamp() + "\n", false, false, nullptr);
        commandLogStream->writeText(finishLabel + "\n", false, false, nullptr);
        commandLogStream->flush();
    }
    writeToAggregateLog(commandIndexLabel + " [" + timestamp() + "] " + finishLabel);

    if (cancelled)
    {
        juce::ScopedLock sl(errorLock);
        lastErrorOutput = description + " was cancelled";
        return false;
    }

    if (exitCode != 0)
    {
        const juce::String summary = extractErrorSummary(capturedOutput);

        {
            juce::ScopedLock sl(errorLock);
            lastErrorOutput = summary.isNotEmpty() ? summary
                                                   : "ffmpeg exited with code " + juce::String(exitCode);
        }

        if (logCallback)
        {
            logCallback("FFmpeg error during " + description + " (exit code: " + juce::String(exitCode) + ")");
            if (summary.isNotEmpty())
                logCallback(summary);
        }

        return false;
    }

    return true;
}

juce::String FFmpegExecutor::getLastErrorOutput() const
{
    juce::ScopedLock sl(errorLock);
    return lastErrorOutput;
}

//==============================================================================
void FFmpegExecutor::cancelExecution()
{
    shouldCancel.store(true);

    juce::ScopedLock sl(processLock);
    if (activeProcess != nullptr && activeProcess->isRunning())
        activeProcess->kill();
}

//==============================================================================
juce::String FFmpegExecutor::executeCommandAndGetOutput(const juce::StringArray& arguments, int timeoutMs)
{
    ManagedChildProcess process("query " + arguments[0]);

    if (!process.start(arguments, juce::ChildProcess::wantStdOut))
        return {};

    // Query output fits in the pipe buffer, so the child can exit before it is read
    if (!process.waitForProcessToFinish(timeoutMs))
    {
        if (logCallback)
            logCallback("WARNING: " + arguments[0] + " did not finish within " + juce::String(timeoutMs) + "ms, killing it");

        process.kill();
        return {};
    }

    return process.readAllProcessOutput();
}

//==============================================================================
juce::String FFmpegExecutor::findExecutable(const juce::String& configuredPath, const juce::String& name)
{
    if (configuredPath.isNotEmpty())
        return configuredPath;

   #if JUCE_WINDOWS
    const juce::String fileName = name + ".exe";
   #else
    const juce::String fileName = name;
   #endif

    // Prefer a copy shipped next to the executable
    juce::File appDir = juce::File::getSpecialLocation(juce::File::currentExecutableFile).getParentDirectory();
    juce::File local = appDir.getChildFile(fileName);
    if (local.existsAsFile())
        return local.getFullPathName();

    // Fallback to system PATH
    return fileName;
}

juce::String FFmpegExecutor::getFFmpegPath() const
{
    return findExecutable(configuredFFmpegPath, "ffmpeg");
}

juce::String FFmpegExecutor::getFFprobePath() const
{
    if (configuredFFprobePath.isEmpty() && configuredFFmpegPath.isNotEmpty())
    {
        // A configured ffmpeg usually has its ffprobe beside it
        juce::File sibling = juce::File(configuredFFmpegPath).getSiblingFile("ffprobe");
        if (juce::File::isAbsolutePath(configuredFFmpegPath) && sibling.existsAsFile())
            return sibling.getFullPathName();
    }

    return findExecutable(configuredFFprobePath, "ffprobe");
}

//==============================================================================
bool FFmpegExecutor::checkFFmpegAvailability()
{
    juce::ChildProcess process;

    if (!process.start(juce::StringArray { getFFmpegPath(), "-version" }))
        return false;

    process.readAllProcessOutput();

    if (!process.waitForProcessToFinish(5000))
    {
        process.kill();
        return false;
    }

    return process.getExitCode() == 0;
}

//==============================================================================
double FFmpegExecutor::getFileDuration(const juce::File& file)
{
    if (!file.existsAsFile())
        return 0.0;

    const juce::String output = executeCommandAndGetOutput({ getFFprobePath(),
                                                             "-v", "error",
                                                             "-show_entries", "format=duration",
                                                             "-of", "default=noprint_wrappers=1:nokey=1",
                                                             file.getFullPathName() });

    const double duration = output.trim().getDoubleValue();
    return (std::isfinite(duration) && duration > 0.0) ? duration : 0.0;
}

FFmpegExecutor::VideoStreamInfo FFmpegExecutor::getVideoStreamInfo(const juce::File& file)
{
    VideoStreamInfo info;

    if (!file.existsAsFile())
        return info;

    const juce::String output = executeCommandAndGetOutput({ getFFprobePath(),
                                                             "-v", "error",
                                                             "-select_streams", "v:0",
                                                             "-show_entries", "stream=width,height,r_frame_rate",
                                                             "-of", "default=noprint_wrappers=1",
                                                             file.getFullPathName() });

    juce::StringArray lines;
    lines.addLines(output);

    for (auto line : lines)
    {
        juce::String trimmed = line.trim();
        const juce::String value = trimmed.fromFirstOccurrenceOf("=", false, false).trim();

        if (trimmed.startsWithIgnoreCase("width="))
            info.width = value.getIntValue();
        else if (trimmed.startsWithIgnoreCase("height="))
            info.height = value.getIntValue();
        else if (trimmed.startsWithIgnoreCase("r_frame_rate="))
            info.fps = juce::jmax(0.0, parseFractionString(value));
    }

    return info;
}

//==============================================================================
juce::String FFmpegExecutor::extractErrorSummary(const juce::String& output, int maxLines)
{
    juce::StringArray lines;
    lines.addLines(output.replace("\r", "\n"));

    juce::StringArray relevant;
    for (auto line : lines)
    {
        line = line.trim();

        if (line.isEmpty())
            continue;

        // Progress reports carry no diagnostic value
        if (line.startsWith("frame=") || line.startsWith("size=") || line.contains(" speed="))
            continue;

        relevant.add(line);
    }

    if (relevant.size() > maxLines)
        relevant.removeRange(0, relevant.size() - maxLines);

    return relevant.joinIntoString("\n");
}
