//==============================================================================
/**
 * @file FFmpegExecutor.cpp
 *
 * Implementation file for the FFmpegExecutor class, which runs FFmpeg and
 * FFprobe as external processes.
 *
 * Output is read while the child runs; a watchdog thread kills the child
 * if it is still running when the timeout expires.
 */

#include "FFmpegExecutor.h"
#include "../core/ProcessManager.h"

namespace
{
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

    juce::String findToolNextToExecutable(const juce::String& toolName)
    {
       #if JUCE_WINDOWS
        const juce::String fileName = toolName + ".exe";
       #else
        const juce::String fileName = toolName;
       #endif

        juce::File appDir = juce::File::getSpecialLocation(juce::File::currentExecutableFile).getParentDirectory();
        juce::File localTool = appDir.getChildFile(fileName);
        if (localTool.existsAsFile())
            return localTool.getFullPathName();

        // Fallback to system PATH
        return fileName;
    }

    /**
     * Kills a child process that is still running when the timeout expires.
     * The owner calls finish() once the child has exited.
     */
    class ProcessWatchdog : public juce::Thread
    {
    public:
        ProcessWatchdog(juce::ChildProcess& processToWatch, int timeoutToUse)
            : juce::Thread("Process watchdog"),
              process(processToWatch),
              timeoutMs(timeoutToUse)
        {
        }

        ~ProcessWatchdog() override
        {
            finish();
        }

        void run() override
        {
            if (wait(timeoutMs))
                return;

            const juce::ScopedLock sl(lock);
            if (! finished)
            {
                expired = true;
                process.kill();
            }
        }

        /** Stops watching; returns true if the child was killed for running too long. */
        bool finish()
        {
            {
                const juce::ScopedLock sl(lock);
                finished = true;
            }

            notify();
            stopThread(1000);
            return expired;
        }

    private:
        juce::ChildProcess& process;
        const int timeoutMs;
        juce::CriticalSection lock;
        bool finished = false;
        bool expired = false;

        JUCE_DECLARE_NON_COPYABLE(ProcessWatchdog)
    };

    bool needsQuoting(const juce::String& argument)
    {
        return argument.isEmpty() || argument.containsAnyOf(" \t\"'[];,|&<>()$\\");
    }
}

//==============================================================================
FFmpegExecutor::FFmpegExecutor()
{
}

FFmpegExecutor::~FFmpegExecutor()
{
}

//==============================================================================
void FFmpegExecutor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

void FFmpegExecutor::setToolPaths(const juce::String& ffmpegPath, const juce::String& ffprobePath)
{
    ffmpegOverride = ffmpegPath.trim();
    ffprobeOverride = ffprobePath.trim();
}

void FFmpegExecutor::setTimeoutMs(int newTimeoutMs)
{
    timeoutMs = newTimeoutMs > 0 ? newTimeoutMs : defaultTimeoutMs;
}

void FFmpegExecutor::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

//==============================================================================
void FFmpegExecutor::setSessionLogDirectory(const juce::File& directory)
{
    const juce::ScopedLock sl(logDirectoryLock);

    sessionLoggingEnabled = false;
    sessionLogDirectory = juce::File();
    sessionAggregateLogFile = juce::File();
    sessionCommandIndex = 0;

    if (directory == juce::File())
        return;

    if (! directory.isDirectory() && ! directory.createDirectory().wasOk())
        return;

    sessionLogDirectory = directory;
    sessionAggregateLogFile = sessionLogDirectory.getChildFile("ffmpeg.log");
    if (sessionAggregateLogFile.existsAsFile())
        sessionAggregateLogFile.deleteFile();

    sessionLoggingEnabled = sessionLogDirectory.isDirectory();
}

juce::File FFmpegExecutor::getNextCommandLogFile(int& outIndex)
{
    const juce::ScopedLock sl(logDirectoryLock);

    if (! sessionLoggingEnabled)
    {
        outIndex = -1;
        return juce::File();
    }

    ++sessionCommandIndex;
    outIndex = sessionCommandIndex;
    return sessionLogDirectory.getChildFile(juce::String::formatted("command_%03d.log", sessionCommandIndex));
}

void FFmpegExecutor::writeToAggregateLog(const juce::String& message)
{
    const juce::ScopedLock sl(logDirectoryLock);

    if (! sessionLoggingEnabled)
        return;

    sessionAggregateLogFile.appendText(message + "\n", false, false, nullptr);
}

//==============================================================================
FFmpegExecutor::ProcessOutcome FFmpegExecutor::executeProcess(const juce::StringArray& commandLine, bool captureStdErr)
{
    ProcessOutcome outcome;

    ManagedChildProcess process(buildCommandLine(commandLine));

    const int streamFlags = captureStdErr ? (juce::ChildProcess::wantStdOut | juce::ChildProcess::wantStdErr)
                                          : juce::ChildProcess::wantStdOut;

    if (! process.start(commandLine, streamFlags))
        return outcome;

    outcome.started = true;

    ProcessWatchdog watchdog(process, timeoutMs);
    watchdog.startThread();

    // Reading until end of stream keeps the pipe from filling up and stalling the child
    outcome.output = UTF8String::readAllProcessOutput(process);
    process.waitForProcessToFinish(-1);

    outcome.timedOut = watchdog.finish();
    if (! outcome.timedOut)
        outcome.exitCode = (int) process.getExitCode();

    return outcome;
}

ClipResult<juce::String> FFmpegExecutor::runTool(const juce::StringArray& commandLine,
                                                 bool captureStdErr,
                                                 const juce::String& description)
{
    const juce::String command = buildCommandLine(commandLine);
    const juce::String startTimeString = juce::Time::getCurrentTime().toString(true, true);

    int commandLogIndex = -1;
    const juce::File commandLogFile = getNextCommandLogFile(commandLogIndex);
    const juce::String commandIndexLabel = (commandLogIndex > 0)
        ? juce::String::formatted("#%03d", commandLogIndex)
        : juce::String("#---");

    writeToAggregateLog(commandIndexLabel + " [" + startTimeString + "] START " + command);
    log(description + ": " + command);

    const ProcessOutcome outcome = executeProcess(commandLine, captureStdErr);

    const juce::String finishTimeString = juce::Time::getCurrentTime().toString(true, true);
    if (commandLogFile != juce::File())
    {
        juce::String record;
        record << "Started: " << startTimeString << "\n"
               << "Command: " << command << "\n"
               << "------------------------------------------------------------\n"
               << outcome.output.replace("\r", "\n") << "\n"
               << "------------------------------------------------------------\n"
               << "Finished: " << finishTimeString << "\n"
               << "Exit code: " << outcome.exitCode << (outcome.timedOut ? " (timed out)" : "") << "\n";
        commandLogFile.replaceWithText(record, false, false, nullptr);
    }
    writeToAggregateLog(commandIndexLabel + " [" + finishTimeString + "] END exitCode=" + juce::String(outcome.exitCode));

    if (! outcome.started)
        return ClipResult<juce::String>::fail(ClipError::make(ClipErrorKind::ToolInvocation,
                                                              description + " failed: could not start " + commandLine[0],
                                                              command));

    if (outcome.timedOut)
    {
        log("ERROR: " + description + " timed out after " + juce::String(timeoutMs) + " ms");
        return ClipResult<juce::String>::fail(ClipError::make(ClipErrorKind::ToolInvocation,
                                                              description + " timed out after " + juce::String(timeoutMs) + " ms",
                                                              command,
                                                              true));
    }

    if (outcome.exitCode != 0)
    {
        juce::String message = description + " failed (exit code: " + juce::String(outcome.exitCode) + ")";
        const juce::String detail = outcome.output.trim();
        if (detail.isNotEmpty())
            message << ": " << detail.fromLastOccurrenceOf("\n", false, false).trim();

        log("ERROR: " + message);
        return ClipResult<juce::String>::fail(ClipError::make(ClipErrorKind::ToolInvocation, message, command));
    }

    return ClipResult<juce::String>::ok(outcome.output);
}

//==============================================================================
ClipStatus FFmpegExecutor::runFFmpeg(const juce::StringArray& arguments, const juce::String& description)
{
    juce::StringArray commandLine;
    commandLine.add(getFFmpegPath());
    commandLine.addArray({ "-hide_banner", "-nostdin", "-y", "-loglevel", "error" });
    commandLine.addArray(arguments);

    auto result = runTool(commandLine, true, description);
    if (result.failed())
        return ClipStatus::fail(result.getError());

    return ClipStatus::ok();
}

ClipResult<juce::String> FFmpegExecutor::runFFprobe(const juce::StringArray& arguments)
{
    juce::StringArray commandLine;
    commandLine.add(getFFprobePath());
    commandLine.addArray(arguments);

    return runTool(commandLine, false, "ffprobe");
}

//==============================================================================
juce::String FFmpegExecutor::getFFmpegPath() const
{
    if (ffmpegOverride.isNotEmpty())
        return ffmpegOverride;

    return findToolNextToExecutable("ffmpeg");
}

juce::String FFmpegExecutor::getFFprobePath() const
{
    if (ffprobeOverride.isNotEmpty())
        return ffprobeOverride;

    return findToolNextToExecutable("ffprobe");
}

bool FFmpegExecutor::checkFFmpegAvailability()
{
    const ProcessOutcome outcome = executeProcess({ getFFmpegPath(), "-version" }, false);
    return outcome.started && ! outcome.timedOut && outcome.exitCode == 0;
}

juce::String FFmpegExecutor::buildCommandLine(const juce::StringArray& commandLine)
{
    juce::StringArray quoted;

    for (const auto& argument : commandLine)
    {
        if (needsQuoting(argument))
            quoted.add("\"" + argument.replace("\\", "\\\\").replace("\"", "\\\"") + "\"");
        else
            quoted.add(argument);
    }

    return quoted.joinIntoString(" ");
}

//==============================================================================
ClipResult<FFmpegExecutor::VideoStreamInfo> FFmpegExecutor::getVideoStreamInfo(const juce::File& file)
{
    using Result = ClipResult<VideoStreamInfo>;

    if (! file.existsAsFile())
        return Result::fail(ClipErrorKind::Probe, "Cannot probe missing file: " + file.getFullPathName());

    auto output = runFFprobe({ "-v", "error",
                               "-select_streams", "v:0",
                               "-show_entries", "stream=width,height,r_frame_rate",
                               "-of", "default=noprint_wrappers=1",
                               file.getFullPathName() });

    if (output.failed())
    {
        ClipError error = output.getError();
        error.kind = ClipErrorKind::Probe;
        return Result::fail(error);
    }

    const VideoStreamInfo info = parseVideoStreamInfo(output.getValue());

    if (info.width <= 0 || info.height <= 0)
        return Result::fail(ClipErrorKind::Probe, "No video dimensions reported for " + file.getFullPathName());

    return Result::ok(info);
}

FFmpegExecutor::VideoStreamInfo FFmpegExecutor::parseVideoStreamInfo(const juce::String& output)
{
    VideoStreamInfo info;

    juce::StringArray lines;
    lines.addLines(output);

    for (auto line : lines)
    {
        juce::String trimmed = line.trim();
        if (trimmed.isEmpty())
            continue;

        const juce::String value = trimmed.fromFirstOccurrenceOf("=", false, false).trim();

        if (trimmed.startsWithIgnoreCase("width="))
        {
            info.width = value.getIntValue();
        }
        else if (trimmed.startsWithIgnoreCase("height="))
        {
            info.height = value.getIntValue();
        }
        else if (trimmed.startsWithIgnoreCase("r_frame_rate="))
        {
            const double fps = parseFractionString(value);
            if (fps > 0.0)
                info.fps = fps;
        }
    }

    return info;
}

ClipResult<std::vector<FFmpegExecutor::MediaStreamInfo>> FFmpegExecutor::getStreams(const juce::File& file)
{
    using Result = ClipResult<std::vector<MediaStreamInfo>>;

    if (! file.existsAsFile())
        return Result::fail(ClipErrorKind::Probe, "Cannot probe missing file: " + file.getFullPathName());

    auto output = runFFprobe({ "-v", "error", "-print_format", "json", "-show_streams", file.getFullPathName() });

    if (output.failed())
    {
        ClipError error = output.getError();
        error.kind = ClipErrorKind::Probe;
        return Result::fail(error);
    }

    return parseStreamList(output.getValue());
}

ClipResult<std::vector<FFmpegExecutor::MediaStreamInfo>> FFmpegExecutor::parseStreamList(const juce::String& json)
{
    using Result = ClipResult<std::vector<MediaStreamInfo>>;

    juce::var parsed;
    const juce::Result parseResult = juce::JSON::parse(json, parsed);

    if (parseResult.failed() || ! parsed.isObject())
        return Result::fail(ClipErrorKind::Probe, "Unreadable ffprobe stream list: " + parseResult.getErrorMessage());

    std::vector<MediaStreamInfo> streams;

    const juce::var streamList = parsed.getProperty("streams", juce::var());

    if (auto* entries = streamList.getArray())
    {
        for (const auto& entry : *entries)
        {
            MediaStreamInfo stream;
            stream.index = (int) entry.getProperty("index", -1);
            stream.codecType = entry.getProperty("codec_type", "").toString();

            const juce::var tags = entry.getProperty("tags", juce::var());
            if (tags.isObject())
            {
                stream.language = tags.getProperty("language", "").toString();
                stream.title = tags.getProperty("title", "").toString();
            }

            streams.push_back(stream);
        }
    }

    return Result::ok(streams);
}

ClipResult<bool> FFmpegExecutor::hasVideoStream(const juce::File& file)
{
    auto streams = getStreams(file);
    if (streams.failed())
        return ClipResult<bool>::fail(streams.getError());

    for (const auto& stream : streams.getValue())
        if (stream.codecType == "video")
            return ClipResult<bool>::ok(true);

    return ClipResult<bool>::ok(false);
}
