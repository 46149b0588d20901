#pragma once
#include <juce_core/juce_core.h>
#include <functional>
#include <vector>
#include "ClipResult.h"

//==============================================================================
/**
 * @file FFmpegExecutor.h
 *
 * This file declares the FFmpegExecutor class which is responsible for running
 * FFmpeg and FFprobe as child processes and turning their outcome into
 * ClipResult values.
 *
 * The class handles:
 * - Tool lookup (next to the executable first, then PATH)
 * - Blocking execution with a bounded timeout
 * - Per-command and aggregate session logs
 * - Probing stream lists and video dimensions via FFprobe
 */

/**
 * Utility for turning raw process output into JUCE strings with explicit
 * UTF-8 decoding (subtitle titles and file names are frequently non-ASCII).
 */
class UTF8String
{
public:
    /**
     * Read a ChildProcess's output as UTF-8 until the stream ends.
     *
     * @param process The process to read from
     * @return        Everything the process wrote to its captured streams
     */
    static juce::String readAllProcessOutput(juce::ChildProcess& process)
    {
        juce::MemoryOutputStream collected;
        char buffer[4096];

        for (;;)
        {
            const int bytesRead = process.readProcessOutput(buffer, (int) sizeof(buffer));
            if (bytesRead <= 0)
                break;

            collected.write(buffer, (size_t) bytesRead);
        }

        return juce::String::fromUTF8(static_cast<const char*>(collected.getData()),
                                      (int) collected.getDataSize());
    }
};

//==============================================================================
/**
 * The FFmpegExecutor class handles all interaction with FFmpeg and FFprobe.
 *
 * Every call is synchronous. A call that exits non-zero, cannot start, or
 * exceeds the configured timeout yields a ToolInvocation error whose command
 * field holds the reconstructed command line.
 *
 * @note executeProcess() is virtual so tests can substitute a scripted
 *       executor; nothing else in the engine depends on that seam.
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

    /** One entry of ffprobe's -show_streams output. */
    struct MediaStreamInfo
    {
        int index = -1;
        juce::String codecType;
        juce::String language;
        juce::String title;
    };

    /** Raw outcome of running one child process. */
    struct ProcessOutcome
    {
        bool started = false;
        bool timedOut = false;
        int exitCode = -1;
        juce::String output;
    };

    static constexpr int defaultTimeoutMs = 10 * 60 * 1000;

    FFmpegExecutor();
    virtual ~FFmpegExecutor();

    /**
     * Sets a callback function that will be called with log messages.
     *
     * @param logCallback Function to be called with log messages
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /** Returns the callback currently receiving log messages (may be empty). */
    std::function<void(const juce::String&)> getLogCallback() const { return logCallback; }

    /**
     * Sets the directory where command output should be recorded.
     * A per-command log file plus an aggregate log will be created in this directory.
     * Pass juce::File() to disable.
     */
    void setSessionLogDirectory(const juce::File& directory);

    /** Overrides the tool locations. Empty strings restore the default lookup. */
    void setToolPaths(const juce::String& ffmpegPath, const juce::String& ffprobePath);

    /** Sets the per-invocation timeout in milliseconds (values <= 0 restore the default). */
    void setTimeoutMs(int timeoutMs);
    int getTimeoutMs() const noexcept { return timeoutMs; }

    /**
     * Runs ffmpeg with the given arguments (the binary is prepended, and
     * -hide_banner -nostdin -y -loglevel error are added in front).
     *
     * @param arguments   Arguments after the global options
     * @param description Short label used in log lines
     */
    ClipStatus runFFmpeg(const juce::StringArray& arguments, const juce::String& description);

    /**
     * Runs ffprobe and returns its standard output.
     */
    ClipResult<juce::String> runFFprobe(const juce::StringArray& arguments);

    /**
     * Probes the first video stream of a file and returns width/height/fps.
     * A missing stream or zero dimensions is a Probe error.
     */
    ClipResult<VideoStreamInfo> getVideoStreamInfo(const juce::File& file);

    /** Lists every stream in a media file. */
    ClipResult<std::vector<MediaStreamInfo>> getStreams(const juce::File& file);

    /** True if the file contains at least one video stream. */
    ClipResult<bool> hasVideoStream(const juce::File& file);

    /**
     * Checks if FFmpeg is available on the system.
     *
     * @return true if `ffmpeg -version` runs and exits cleanly
     */
    bool checkFFmpegAvailability();

    juce::String getFFmpegPath() const;
    juce::String getFFprobePath() const;

    /**
     * Rebuilds a shell-pasteable command line. Arguments containing spaces,
     * quotes or filter-graph punctuation are wrapped in double quotes.
     */
    static juce::String buildCommandLine(const juce::StringArray& commandLine);

    /** Parses `-print_format json -show_streams` output. */
    static ClipResult<std::vector<MediaStreamInfo>> parseStreamList(const juce::String& json);

    /** Parses `-show_entries stream=width,height,r_frame_rate -of default` output. */
    static VideoStreamInfo parseVideoStreamInfo(const juce::String& output);

protected:
    /**
     * Starts the process, waits up to the configured timeout and collects its
     * output. Override to script tool behaviour in tests.
     *
     * @param commandLine   Binary followed by its arguments
     * @param captureStdErr Whether stderr is merged into the captured output
     */
    virtual ProcessOutcome executeProcess(const juce::StringArray& commandLine, bool captureStdErr);

private:
    ClipResult<juce::String> runTool(const juce::StringArray& commandLine,
                                     bool captureStdErr,
                                     const juce::String& description);

    juce::File getNextCommandLogFile(int& outIndex);
    void writeToAggregateLog(const juce::String& message);
    void log(const juce::String& message) const;

    juce::String ffmpegOverride;
    juce::String ffprobeOverride;
    int timeoutMs = defaultTimeoutMs;

    std::function<void(const juce::String&)> logCallback;

    juce::CriticalSection logDirectoryLock;
    juce::File sessionLogDirectory;
    juce::File sessionAggregateLogFile;
    bool sessionLoggingEnabled { false };
    int sessionCommandIndex { 0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FFmpegExecutor)
};

//==============================================================================
/**
 * Sends an executor's log messages to another callback while in scope, and
 * puts the previous callback back on destruction.
 */
class ScopedExecutorLogRedirect
{
public:
    ScopedExecutorLogRedirect(FFmpegExecutor& executorToRedirect,
                              std::function<void(const juce::String&)> callback)
        : executor(executorToRedirect),
          previousCallback(executorToRedirect.getLogCallback())
    {
        executor.setLogCallback(std::move(callback));
    }

    ~ScopedExecutorLogRedirect()
    {
        executor.setLogCallback(previousCallback);
    }

private:
    FFmpegExecutor& executor;
    std::function<void(const juce::String&)> previousCallback;

    JUCE_DECLARE_NON_COPYABLE(ScopedExecutorLogRedirect)
};
