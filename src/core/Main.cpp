/*
  ==============================================================================
    Main.cpp - Command Line Entry Point
  ==============================================================================
*/

#include <juce_core/juce_core.h>
#include <iostream>
#include "ProcessManager.h"
#include "ClipRequestLoader.h"
#include "RequestRunner.h"
#include "../rendering/FFmpegExecutor.h"

namespace
{
    const char* const applicationName = "CueClip";
    const char* const applicationVersion = "1.0.0";

    /** Installs a session FileLogger for as long as it lives. */
    class ScopedSessionLog
    {
    public:
        ScopedSessionLog()
        {
            juce::File logsDirectory = juce::File::getSpecialLocation(juce::File::userDocumentsDirectory)
                                            .getChildFile("CueClip Logs");
            if (! logsDirectory.isDirectory() && ! logsDirectory.createDirectory())
                logsDirectory = juce::File::getSpecialLocation(juce::File::currentExecutableFile)
                                    .getParentDirectory();

            const juce::String sessionStamp = juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S");
            const juce::File logFile = logsDirectory.getChildFile("CueClip_" + sessionStamp + ".log");

            fileLogger.reset(new juce::FileLogger(logFile, "CueClip Session Log", 0));
            juce::Logger::setCurrentLogger(fileLogger.get());

            juce::Logger::writeToLog("----------------------------------------------------");
            juce::Logger::writeToLog("Session started: " + juce::Time::getCurrentTime().toString(true, true));
            juce::Logger::writeToLog("Version: " + juce::String(applicationVersion));
            juce::Logger::writeToLog("----------------------------------------------------");
        }

        ~ScopedSessionLog()
        {
            juce::Logger::writeToLog("----------------------------------------------------");
            juce::Logger::writeToLog("Session finished: " + juce::Time::getCurrentTime().toString(true, true));
            juce::Logger::writeToLog("----------------------------------------------------");

            ProcessManager::getInstance().terminateAllProcesses();

            juce::Logger::setCurrentLogger(nullptr);
            fileLogger = nullptr;
        }

        juce::File getLogFile() const { return fileLogger != nullptr ? fileLogger->getLogFile() : juce::File(); }

    private:
        std::unique_ptr<juce::FileLogger> fileLogger;

        JUCE_DECLARE_NON_COPYABLE(ScopedSessionLog)
    };

    void printLine(const juce::String& message)
    {
        std::cout << message << std::endl;
    }

    void runRequest(const juce::ArgumentList& args)
    {
        if (args.size() == 0)
            juce::ConsoleApplication::fail("Expected a request file. Run with --help for usage.");

        const juce::File requestFile = args[0].resolveAsExistingFile();

        ScopedSessionLog sessionLog;
        juce::Logger::writeToLog("Request: " + requestFile.getFullPathName());

        auto request = ClipRequestLoader::loadFromFile(requestFile);
        if (request.failed())
        {
            juce::Logger::writeToLog("ERROR: " + request.getErrorMessage());
            juce::ConsoleApplication::fail(request.getErrorMessage());
        }

        FFmpegExecutor executor;
        RequestRunner runner(executor);

        if (args.containsOption("--verbose"))
            runner.setLogCallback(printLine);

        auto output = runner.run(request.getValue());
        if (output.failed())
        {
            juce::Logger::writeToLog("ERROR: " + output.getErrorMessage());
            juce::ConsoleApplication::fail(output.getErrorMessage());
        }

        printLine(output.getValue().outputFile.getFullPathName());
        if (output.getValue().mp4CopyFile != juce::File())
            printLine(output.getValue().mp4CopyFile.getFullPathName());
    }

    void checkTools(const juce::ArgumentList&)
    {
        FFmpegExecutor executor;

        if (! executor.checkFFmpegAvailability())
            juce::ConsoleApplication::fail("ffmpeg not found (looked for " + executor.getFFmpegPath() + ")");

        printLine("ffmpeg:  " + executor.getFFmpegPath());
        printLine("ffprobe: " + executor.getFFprobePath());
    }
}

int main(int argc, char* argv[])
{
    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h", juce::String(applicationName) + " - subtitle clip generator", true);
    app.addVersionCommand("--version|-v", juce::String(applicationName) + " " + applicationVersion);

    app.addCommand({ "--check-tools",
                     "--check-tools",
                     "Checks that ffmpeg can be started",
                     "Prints the ffmpeg and ffprobe locations that will be used.",
                     checkTools });

    app.addDefaultCommand({ "",
                            "<request.json> [--verbose]",
                            "Generates the clip described by a JSON request file",
                            "Writes the GIF, WEBP or MP4 named in the request and prints the output path(s).",
                            runRequest });

    return app.findAndRunCommand(argc, argv);
}
