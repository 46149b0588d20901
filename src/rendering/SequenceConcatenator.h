#pragma once
#include <juce_core/juce_core.h>
#include <atomic>
#include <functional>
#include <optional>
#include <vector>
#include "ClipTypes.h"
#include "ClipResult.h"
#include "ClipGenerator.h"
#include "FFmpegExecutor.h"

/** One cue-bounded piece of a sequence, with its own burned-in text. */
struct SequenceSegment
{
    int sequenceId = -1;
    juce::int64 startMs = 0;
    juce::int64 endMs = 0;
    juce::StringArray lines;
    juce::String font = "Arial";
    juce::File fontFile;            // takes precedence over `font` when set
    int fontSize = 24;
};

/** A multi-segment request. Every segment shares the global video settings. */
struct SequenceRequest
{
    juce::File inputFile;
    juce::File outputFile;
    ClipTypes::VideoFormat outputFormat = ClipTypes::VideoFormat::Gif;
    int fps = 20;

    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> resolution;

    bool crop = false;
    bool hdGif = false;
    bool mp4Copy = false;
    int crf = 18;
    juce::String preset = "fast";

    std::vector<SequenceSegment> segments;

    juce::StringArray captionLines;
    std::optional<ClipTypes::TextStyle> captionStyle;
};

//==============================================================================
/**
 * Builds one continuous clip from a run of consecutive cues.
 *
 * Each segment is rendered to its own MP4 with its text drawn in, the MP4s are
 * joined with the concat demuxer, and the joined clip goes through the filter
 * graph once so the caption and palette are applied globally.
 */
class SequenceConcatenator
{
public:
    using GenerationOutput = ClipTypes::GenerationOutput;

    /** Time span a segment actually covers once gaps are closed. */
    struct Span
    {
        juce::int64 startMs = 0;
        juce::int64 endMs = 0;
    };

    explicit SequenceConcatenator(FFmpegExecutor& executor);
    ~SequenceConcatenator();

    void setLogCallback(std::function<void(const juce::String&)> callback);
    void setWorkingDirectoryBase(const juce::File& directory);

    /** Runs the whole sequence pipeline. */
    ClipResult<GenerationOutput> generate(const SequenceRequest& request);

    /** Requests that no further stage be started. */
    void cancel() noexcept;

    /**
     * Checks there are at least two segments and that each id is exactly one
     * more than the previous. Failures are Sequence errors.
     */
    static ClipStatus checkContiguous(const std::vector<SequenceSegment>& segments);

    /**
     * Each segment ends where the next one starts; the last keeps its own end.
     * A span with no duration is a Sequence error.
     */
    static ClipResult<std::vector<Span>> computeSpans(const std::vector<SequenceSegment>& segments);

    /** Concat demuxer list: one `file '<path>'` line per file, in order. */
    static juce::String buildConcatList(const std::vector<juce::File>& files);

    /** Makes a segment from a cue, carrying its id, times and text. */
    static SequenceSegment segmentFromCue(const Subtitle& cue, const juce::String& font, int fontSize);

private:
    void log(const juce::String& message);
    ClipStatus checkNotCancelled(const juce::String& nextStage) const;

    ClipStatus renderSegment(const SequenceRequest& request,
                             const SequenceSegment& segment,
                             const Span& span,
                             const ClipSettings& sizing,
                             const juce::File& destination,
                             int segmentNumber);

    FFmpegExecutor& executor;
    ClipGenerator generator;

    std::function<void(const juce::String&)> logCallback;
    juce::File workingDirectoryBase;
    std::atomic<bool> cancelRequested { false };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SequenceConcatenator)
};
