#pragma once
#include <juce_core/juce_core.h>
#include <functional>
#include "Subtitle.h"
#include "../rendering/ClipResult.h"

/**
 * Reads SubRip (.srt) text into a SubtitleTrack.
 *
 * Blocks are separated by blank lines: an optional numeric counter, a
 * "start --> end" timing line, then one or more text lines. Simple inline
 * markup (<i>, <b>, <u>, <font ...>) is removed from the text. Blocks with an
 * unreadable timing line, or whose end is not after their start, are skipped
 * and reported through the log callback.
 */
class SubRipParser
{
public:
    SubRipParser() = default;

    void setLogCallback(std::function<void(const juce::String&)> callback) { logCallback = std::move(callback); }

    /** Parses SubRip text. Never fails; an empty input gives an empty track. */
    SubtitleTrack parse(const juce::String& text) const;

    /** Loads and parses a file. A missing or unreadable file is an Extraction error. */
    ClipResult<SubtitleTrack> parseFile(const juce::File& file) const;

    /** Removes inline markup tags, keeping the text between them. */
    static juce::String stripTags(const juce::String& line);

    /** Number of blocks the last parse() call skipped. */
    int getNumSkippedBlocks() const noexcept { return skippedBlocks; }

private:
    void log(const juce::String& message) const
    {
        if (logCallback)
            logCallback(message);
    }

    std::function<void(const juce::String&)> logCallback;
    mutable int skippedBlocks = 0;
};
