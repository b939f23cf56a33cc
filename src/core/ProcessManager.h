#pragma once
#include <JuceHeader.h>

/**
 * Process management singleton that keeps track of all running external processes.
 * Render workers start ffmpeg through ManagedChildProcess, so shutting the
 * CLI down can kill every encoder that is still running.
 */
class ProcessManager
{
public:
    static ProcessManager& getInstance()
    {
        static ProcessManager instance;
        return instance;
    }

    void registerProcess(juce::ChildProcess* process, const juce::String& description)
    {
        juce::ScopedLock sl(criticalSection);
        activeProcesses.addIfNotAlreadyThere(process);
        processDescriptions.set(process, description);
    }

    void unregisterProcess(juce::ChildProcess* process)
    {
        juce::ScopedLock sl(criticalSection);
        activeProcesses.removeFirstMatchingValue(process);
        processDescriptions.remove(process);
    }

    int getActiveProcessCount() const
    {
        juce::ScopedLock sl(criticalSection);
        return activeProcesses.size();
    }

    /**
     * Kills every registered process that is still running.
     * Registrations stay in place; each ManagedChildProcess removes itself when destroyed.
     * @return the number of processes that were killed
     */
    int terminateAllProcesses()
    {
        juce::ScopedLock sl(criticalSection);
        int count = 0;

        for (auto* process : activeProcesses)
        {
            if (process != nullptr && process->isRunning())
            {
                juce::Logger::writeToLog("Terminating process: " + processDescriptions[process]);
                process->kill();
                ++count;
            }
        }

        if (count > 0)
            juce::Logger::writeToLog("Terminated " + juce::String(count) + " running processes");

        return count;
    }

private:
    ProcessManager() = default;

    juce::Array<juce::ChildProcess*> activeProcesses;
    juce::HashMap<juce::ChildProcess*, juce::String> processDescriptions;
    juce::CriticalSection criticalSection;

    ProcessManager(const ProcessManager&) = delete;
    ProcessManager& operator=(const ProcessManager&) = delete;
};

/**
 * ChildProcess that registers itself with ProcessManager for its lifetime
 * and kills the child when destroyed.
 */
class ManagedChildProcess : public juce::ChildProcess
{
public:
    explicit ManagedChildProcess(const juce::String& description)
    {
        ProcessManager::getInstance().registerProcess(this, description);
    }

    ~ManagedChildProcess()
    {
        if (isRunning())
            kill();

        ProcessManager::getInstance().unregisterProcess(this);
    }

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ManagedChildProcess)
};
