#pragma once
#include <juce_core/juce_core.h>
#include <functional>
#include <vector>
#include "ClipRequestLoader.h"
#include "../rendering/ClipGenerator.h"
#include "../rendering/SequenceConcatenator.h"
#include "../rendering/FFmpegExecutor.h"

/**
 * Turns a loaded request into a finished clip: applies the engine options,
 * gathers the cues (inline, from a .srt file, or extracted from the input),
 * then hands over to ClipGenerator or SequenceConcatenator.
 */
class RequestRunner
{
public:
    explicit RequestRunner(FFmpegExecutor& executor);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    ClipResult<ClipTypes::GenerationOutput> run(const LoadedRequest& request);

    /** Stops before the next stage of whichever pipeline is running. */
    void cancel() noexcept;

    /** Loads the cue track named by the request's cue source. */
    ClipResult<SubtitleTrack> loadTrack(const LoadedRequest& request, const juce::File& scratchDirectory);

    /**
     * Applies the cue range to a track. With no range every cue is returned.
     * A range that selects nothing is a Configuration error.
     */
    static ClipResult<std::vector<Subtitle>> selectCues(const SubtitleTrack& track, const CueSource& source);

    /** Keeps cues that overlap [startMs, endMs). */
    static std::vector<Subtitle> cuesInWindow(const std::vector<Subtitle>& cues, juce::int64 startMs, juce::int64 endMs);

private:
    void applyEngineOptions(const EngineOptions& options);
    void log(const juce::String& message) const;

    ClipResult<ClipTypes::GenerationOutput> runSingle(const LoadedRequest& request, const std::vector<Subtitle>& cues);
    ClipResult<ClipTypes::GenerationOutput> runSequence(const LoadedRequest& request, const std::vector<Subtitle>& cues);

    FFmpegExecutor& executor;
    ClipGenerator generator;
    SequenceConcatenator concatenator;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RequestRunner)
};
