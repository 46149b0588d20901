#pragma once
#include <juce_core/juce_core.h>
#include <atomic>
#include <functional>
#include <vector>
#include "ClipTypes.h"
#include "ClipResult.h"
#include "ClipSettings.h"
#include "FFmpegExecutor.h"
#include "CaptionMeasurer.h"
#include "../subtitles/Subtitle.h"

/**
 * Runs the single-clip pipeline:
 *
 *   Validated -> Trimmed -> FilteredOutput -> (Mp4CopyOutput) -> Done
 *
 * Any failure moves to Failed and is returned unchanged. Every call blocks
 * until its ffmpeg invocations finish; cancel() is honoured between stages
 * and never interrupts a running process.
 */
class ClipGenerator
{
public:
    using GenerationState = ClipTypes::GenerationState;
    using GenerationOutput = ClipTypes::GenerationOutput;

    explicit ClipGenerator(FFmpegExecutor& executor);
    ~ClipGenerator();

    /** Receives every log line (also written to juce::Logger with a [CLIP] tag). */
    void setLogCallback(std::function<void(const juce::String&)> callback);

    /** Called on each state change with a short status message. */
    void setStateCallback(std::function<void(GenerationState, const juce::String&)> callback);

    /** Parent folder for per-request scratch directories (defaults to the system temp folder). */
    void setWorkingDirectoryBase(const juce::File& directory);

    /**
     * Trims, filters and optionally writes the MP4 companion.
     *
     * @param settings     Validated settings
     * @param cues         Subtitle cues to burn in (source timeline)
     * @param captionLines Caption shown above the video for the whole clip; empty for none
     */
    ClipResult<GenerationOutput> generate(const ClipSettings& settings,
                                          const std::vector<Subtitle>& cues,
                                          const juce::StringArray& captionLines = {});

    /**
     * Cuts [start, end] out of the input into the settings' clip file as a
     * stream copy, re-encoding when the copy carries no video stream.
     */
    ClipStatus trim(const ClipSettings& settings);

    /**
     * Builds the script and filter graph for an already trimmed clip and
     * renders the output (and MP4 companion when requested).
     *
     * @param workingDirectory Where the script and caption probe go
     */
    ClipResult<GenerationOutput> renderOutputs(const ClipSettings& settings,
                                               const std::vector<Subtitle>& cues,
                                               const juce::StringArray& captionLines,
                                               const juce::File& workingDirectory);

    /** Requests that no further stage be started. */
    void cancel() noexcept              { cancelRequested = true; }
    void resetCancellation() noexcept   { cancelRequested = false; }
    bool isCancelled() const noexcept   { return cancelRequested.load(); }

    GenerationState getState() const noexcept { return state; }

    /** Encoder arguments placed between -filter_complex and the output path. */
    static juce::StringArray buildEncodingArguments(ClipTypes::VideoFormat format, int crf, const juce::String& preset);

private:
    void updateState(GenerationState newState, const juce::String& statusMessage);
    void log(const juce::String& message);

    ClipStatus checkNotCancelled(const juce::String& nextStage);
    ClipStatus runFilterGraph(const juce::File& source,
                              const juce::String& graph,
                              ClipTypes::VideoFormat format,
                              const ClipSettings& settings,
                              const juce::File& destination,
                              const juce::String& description);

    template <typename ValueType>
    ClipResult<ValueType> failWith(const ClipError& error)
    {
        updateState(GenerationState::Failed, error.describe());
        return ClipResult<ValueType>::fail(error);
    }

    FFmpegExecutor& executor;
    CaptionMeasurer captionMeasurer;

    std::function<void(const juce::String&)> logCallback;
    std::function<void(GenerationState, const juce::String&)> stateCallback;

    juce::File workingDirectoryBase;
    GenerationState state = GenerationState::Idle;
    std::atomic<bool> cancelRequested { false };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ClipGenerator)
};
