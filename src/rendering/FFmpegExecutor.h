#pragma once
#include <JuceHeader.h>
#include "../core/ProcessManager.h"

//==============================================================================
/**
 * @file FFmpegExecutor.h
 *
 * This file declares the FFmpegExecutor class which is responsible for running
 * FFmpeg commands as child processes and capturing what they report.
 *
 * The class handles:
 * - FFmpeg command execution with per-command session logs
 * - Keeping the tail of the last failed command's output for error reports
 * - Querying file durations and stream geometry via FFprobe
 * - Locating the FFmpeg/FFprobe executables
 */

//==============================================================================
/**
 * The FFmpegExecutor class handles all interaction with FFmpeg as an external process.
 *
 * Commands are passed as argument lists (executable first) so paths with
 * spaces never need shell quoting. Every process is started through
 * ManagedChildProcess and is therefore killed on application shutdown.
 *
 * @note One executor belongs to one render; it is not meant to run commands
 *       from several threads at once.
 */
class FFmpegExecutor
{
public:
    struct VideoStreamInfo
    {
        int width = 0;
        int height = 0;
        double fps = 0.0;
    };

    FFmpegExecutor();

    /** Kills the running command, if any. */
    ~FFmpegExecutor();

    /**
     * Sets a callback function that will be called with log messages.
     *
     * @param logCallback Function to be called with log messages as juce::String
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Overrides the executable locations. Empty strings restore the default
     * lookup (next to the application, then PATH).
     */
    void setExecutablePaths(const juce::String& ffmpegPath, const juce::String& ffprobePath);

    /**
     * Sets the directory where FFmpeg command output should be recorded.
     * A per-command log file plus an aggregate log will be created in this directory.
     * Passing a default-constructed File disables session logging.
     */
    void setSessionLogDirectory(const juce::File& directory);

    /**
     * Returns "<ffmpeg> -hide_banner -nostats -nostdin -y", the common prefix
     * of every command the render components build.
     */
    juce::StringArray createFFmpegCommand() const;

    /**
     * Runs a command to completion and records its output.
     *
     * @param arguments   Executable followed by its arguments
     * @param description Short label used in logs ("conform segment 3")
     * @return            true if the process exited with code 0
     */
    bool executeCommand(const juce::StringArray& arguments, const juce::String& description);

    /**
     * The last lines of diagnostic output from the most recent failed command,
     * suitable for surfacing to a user verbatim. Empty after a success.
     */
    juce::String getLastErrorOutput() const;

    /**
     * Executes a command and returns its output as a string.
     *
     * @param arguments Executable followed by its arguments
     * @param timeoutMs How long to wait for the process before killing it
     * @return          The captured output, or an empty string if it could not start or timed out
     */
    juce::String executeCommandAndGetOutput(const juce::StringArray& arguments, int timeoutMs = 10000);

    /** Kills the currently running process and makes executeCommand() return false. */
    void cancelExecution();

    juce::String getFFmpegPath() const;
    juce::String getFFprobePath() const;

    /** Runs "ffmpeg -version"; true if it exits cleanly. */
    bool checkFFmpegAvailability();

    /**
     * Gets the container duration of a media file in seconds using FFprobe.
     *
     * @return The duration in seconds, or 0.0 if unavailable
     */
    double getFileDuration(const juce::File& file);

    /**
     * Probes the first video stream of a file and returns width/height/fps.
     *
     * @param file The video file to inspect
     * @return     Populated stream info (fields remain zero if unavailable)
     */
    VideoStreamInfo getVideoStreamInfo(const juce::File& file);

    /**
     * Picks the lines of ffmpeg output that describe a failure: progress and
     * blank lines are dropped and at most maxLines of the remainder are kept.
     */
    static juce::String extractErrorSummary(const juce::String& output, int maxLines = 8);

private:
    juce::File getNextCommandLogFile(int& outIndex);
    void writeToAggregateLog(const juce::String& message);
    static juce::String findExecutable(const juce::String& configuredPath, const juce::String& name);

    //==========================================================================
    /** The active FFmpeg child process being monitored */
    std::unique_ptr<ManagedChildProcess> activeProcess;

    /** Protects activeProcess against cancelExecution() from another thread */
    juce::CriticalSection processLock;

    std::atomic<bool> shouldCancel { false };

    std::function<void(const juce::String&)> logCallback;

    juce::String configuredFFmpegPath;
    juce::String configuredFFprobePath;

    juce::CriticalSection errorLock;
    juce::String lastErrorOutput;

    //==========================================================================
    // Logging helpers
    juce::CriticalSection logDirectoryLock;
    juce::File sessionLogDirectory;
    juce::File sessionAggregateLogFile;
    bool sessionLoggingEnabled { false };
    int sessionCommandIndex { 0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FFmpegExecutor)
};
