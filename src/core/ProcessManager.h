#pragma once
#include <juce_core/juce_core.h>

/**
 * Process management singleton that keeps track of every running ffmpeg/ffprobe child.
 * This ensures that no encoder keeps running when the driver exits or is interrupted.
 */
class ProcessManager
{
public:
    /**
     * Gets the singleton instance
     */
    static ProcessManager& getInstance()
    {
        static ProcessManager instance;
        return instance;
    }

    /**
     * Registers a process with the manager
     * @param process     A pointer to the process to register
     * @param commandLine The command the process runs, for the termination log
     */
    void registerProcess(juce::ChildProcess* process, const juce::String& commandLine)
    {
        const juce::ScopedLock lock(criticalSection);
        activeProcesses.add(process);
        commandLines.set(process, commandLine);
    }

    /**
     * Unregisters a process when it's being destroyed
     * @param process The process to unregister
     */
    void unregisterProcess(juce::ChildProcess* process)
    {
        const juce::ScopedLock lock(criticalSection);
        activeProcesses.removeFirstMatchingValue(process);
        commandLines.remove(process);
    }

    /** Number of children currently registered. */
    int getNumActiveProcesses() const
    {
        const juce::ScopedLock lock(criticalSection);
        return activeProcesses.size();
    }

    /**
     * Kills every registered process that is still running.
     * @return The number of processes that were killed
     */
    int terminateAllProcesses()
    {
        const juce::ScopedLock lock(criticalSection);
        int count = 0;

        for (auto* process : activeProcesses)
        {
            if (process != nullptr && process->isRunning())
            {
                juce::Logger::writeToLog("Terminating: " + commandLines[process]);
                process->kill();
                count++;
            }
        }

        activeProcesses.clear();
        commandLines.clear();

        if (count > 0)
            juce::Logger::writeToLog("Terminated " + juce::String(count) + " media tool processes");

        return count;
    }

private:
    ProcessManager() {}

    juce::Array<juce::ChildProcess*> activeProcesses;
    juce::HashMap<juce::ChildProcess*, juce::String> commandLines;
    juce::CriticalSection criticalSection;

    ProcessManager(const ProcessManager&) = delete;
    ProcessManager& operator=(const ProcessManager&) = delete;
};

/**
 * Wrapper for ChildProcess that automatically registers/unregisters with ProcessManager
 */
class ManagedChildProcess : public juce::ChildProcess
{
public:
    explicit ManagedChildProcess(const juce::String& commandLine)
    {
        ProcessManager::getInstance().registerProcess(this, commandLine);
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
