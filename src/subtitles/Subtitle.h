#pragma once
#include <juce_core/juce_core.h>
#include <vector>

/**
 * A single timed cue: a subtitle line or a caption entry.
 *
 * Times are milliseconds in the source video's timeline. The delay is added
 * to the start only when the cue is rendered. Instances are immutable once
 * constructed; the sequence id is the cue's position in its source track and
 * is used to test whether a multi-cue selection is contiguous.
 */
class Subtitle
{
public:
    Subtitle(juce::int64 startMs,
             juce::int64 endMs,
             const juce::StringArray& lines,
             juce::int64 delayMs = 0,
             int sequenceId = -1);

    juce::int64 getStartMs() const noexcept      { return startMs; }
    juce::int64 getEndMs() const noexcept        { return endMs; }
    juce::int64 getDelayMs() const noexcept      { return delayMs; }
    juce::int64 getDurationMs() const noexcept   { return endMs - startMs; }
    int getSequenceId() const noexcept           { return sequenceId; }
    const juce::StringArray& getLines() const    { return lines; }

    /** True when both times are non-negative and the cue has positive length. */
    bool isValid() const noexcept;

    /** Returns a copy with new times, keeping text, delay and sequence id. */
    Subtitle withTimes(juce::int64 newStartMs, juce::int64 newEndMs) const;

    /** Returns a copy carrying a different sequence id. */
    Subtitle withSequenceId(int newSequenceId) const;

    /** Orders by start time only; equal starts compare equal. */
    bool operator< (const Subtitle& other) const noexcept { return startMs < other.startMs; }

private:
    juce::int64 startMs;
    juce::int64 endMs;
    juce::StringArray lines;
    juce::int64 delayMs;
    int sequenceId;
};

/**
 * Sorts cues by start time. Cues with equal starts keep their relative order.
 */
std::vector<Subtitle> sortedByStart(std::vector<Subtitle> cues);

//==============================================================================
/**
 * An immutable, ordered list of cues loaded from one subtitle track.
 *
 * Cues are numbered by position; neighbours are looked up by index so the
 * track never holds references between cues.
 */
class SubtitleTrack
{
public:
    SubtitleTrack() = default;

    /** Sorts the cues by start time and renumbers them 0..n-1. */
    explicit SubtitleTrack(std::vector<Subtitle> cues);

    int size() const noexcept                        { return (int) cues.size(); }
    bool isEmpty() const noexcept                    { return cues.empty(); }
    const Subtitle& operator[] (int index) const     { return cues[(size_t) index]; }
    const std::vector<Subtitle>& getCues() const     { return cues; }

    /** The cue before `index`, or nullptr at the start of the track. */
    const Subtitle* previous(int index) const;

    /** The cue after `index`, or nullptr at the end of the track. */
    const Subtitle* next(int index) const;

    /**
     * Returns cues with sequence ids in [firstId, lastId], in order.
     * Out-of-range ids are clamped to the track; an inverted range is empty.
     */
    std::vector<Subtitle> selectRange(int firstId, int lastId) const;

private:
    std::vector<Subtitle> cues;
};
