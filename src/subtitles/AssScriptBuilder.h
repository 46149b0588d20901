#pragma once
#include <juce_core/juce_core.h>
#include <vector>
#include "Subtitle.h"
#include "../rendering/ClipTypes.h"
#include "../rendering/ClipResult.h"

/**
 * Builds Advanced SubStation Alpha (v4.00+) scripts for the ffmpeg
 * `subtitles` filter.
 *
 * A script is made of blocks; each block is one TextStyle plus the cues
 * rendered in it. Cue times are shifted so the clip start is 0:00:00.00.
 * Blocks with no cues contribute neither a style nor dialogue lines.
 */
class AssScriptBuilder
{
public:
    /**
     * @param playResX Final frame width
     * @param playResY Final frame height, including any caption padding
     */
    AssScriptBuilder(int playResX, int playResY);

    /**
     * Adds a style and its cues. Cues are emitted in start order (stable);
     * overlapping cues are kept as they are.
     */
    void addBlock(const ClipTypes::TextStyle& style, const std::vector<Subtitle>& cues, juce::int64 clipStartMs);

    /** Total number of Dialogue lines the script will contain. */
    int getNumDialogues() const noexcept;

    /** Renders the complete script text. */
    juce::String build() const;

    /** Writes build() as UTF-8 to `file`, replacing anything there. */
    ClipStatus writeTo(const juce::File& file) const;

    //==============================================================================
    static juce::String buildStyleFormatLine();
    static juce::String buildStyleLine(const ClipTypes::TextStyle& style);

    /** Dialogue line for a cue shown over [start + delay - clipStart, end - clipStart]. */
    static juce::String buildDialogueLine(const Subtitle& cue, juce::int64 clipStartMs, const ClipTypes::TextStyle& style);

    /**
     * A script holding just the caption, drawn for five seconds on a frame of
     * the given size. Used to probe-render the caption for measurement.
     */
    static juce::String buildCaptionProbeScript(const ClipTypes::TextStyle& captionStyle,
                                                const juce::StringArray& captionLines,
                                                int width,
                                                int height);

    /**
     * Joins text lines with the ASS forced line break. Braces are escaped and
     * line breaks inside a line also become \N.
     */
    static juce::String joinLines(const juce::StringArray& lines);

private:
    struct Block
    {
        ClipTypes::TextStyle style;
        std::vector<Subtitle> cues;
        juce::int64 clipStartMs = 0;
    };

    static juce::String buildScriptInfo(int width, int height);

    int playResX;
    int playResY;
    std::vector<Block> blocks;
};
