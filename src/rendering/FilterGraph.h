#pragma once
#include <juce_core/juce_core.h>
#include <optional>
#include <vector>
#include "ClipTypes.h"
#include "../subtitles/Subtitle.h"

class ClipSettings;

/** Options for a burned-in text overlay (ffmpeg drawtext). */
struct DrawTextOptions
{
    juce::StringArray lines;
    juce::String font;          // fontconfig family name; ignored when fontFile is set
    juce::File fontFile;
    int fontSize = 24;
    juce::String fontColour = "white";
    int borderWidth = 2;
    juce::String borderColour = "black";
    int bottomMargin = 10;
};

//==============================================================================
/**
 * One typed step of a filter graph.
 *
 * Stages carry only values; FilterGraphFormatter turns them into ffmpeg
 * syntax and owns every escaping rule.
 */
class FilterStage
{
public:
    enum class Kind
    {
        ReverseConcat,
        Fps,
        Crop,
        Scale,
        Pad,
        DrawText,
        Subtitles,
        Palette
    };

    /** Appends a time-reversed copy of the input. */
    static FilterStage reverseConcat();
    static FilterStage fps(int framesPerSecond);

    /** Centred square crop to min(iw, ih). */
    static FilterStage squareCrop();

    /** Lanczos scale to the exact size. */
    static FilterStage scale(int width, int height);

    /** Adds `padding` rows above the frame; odd values are rounded up to even. */
    static FilterStage padTop(int padding);

    static FilterStage drawText(const DrawTextOptions& options);
    static FilterStage subtitles(const juce::File& scriptFile);

    /** GIF palette: full palettegen, or 32 colours with bayer dithering. */
    static FilterStage palette(bool fullPalette);

    Kind getKind() const noexcept                       { return kind; }
    int getFps() const noexcept                         { return first; }
    int getWidth() const noexcept                       { return first; }
    int getHeight() const noexcept                      { return second; }
    int getPadding() const noexcept                     { return first; }
    bool isFullPalette() const noexcept                 { return fullPalette; }
    const juce::File& getScriptFile() const noexcept    { return scriptFile; }
    const DrawTextOptions& getDrawText() const noexcept { return drawTextOptions; }

    static juce::String getKindName(Kind kind);

private:
    explicit FilterStage(Kind k) : kind(k) {}

    Kind kind;
    int first = 0;
    int second = 0;
    bool fullPalette = false;
    juce::File scriptFile;
    DrawTextOptions drawTextOptions;
};

//==============================================================================
/**
 * Serialises filter stages into a -filter_complex string.
 *
 * Values embedded in filter options are escaped twice: first for the option
 * parser (\ : '), then for the graph parser (\ ' [ ] , ;).
 */
namespace FilterGraphFormatter
{
    /** Escapes a value for use inside a single filter option. */
    juce::String escapeOptionValue(const juce::String& value);

    /** Escapes already option-escaped text for embedding in a filter graph. */
    juce::String escapeGraphText(const juce::String& text);

    /** Both escaping levels, as needed for a file path inside a filter graph. */
    juce::String escapePath(const juce::File& file);

    juce::String formatStage(const FilterStage& stage);

    /** Comma-joins the formatted stages in order. */
    juce::String format(const std::vector<FilterStage>& stages);
}

//==============================================================================
/**
 * Decides which stages a clip needs and in what order.
 *
 * The order is fixed: reverse-concat, fps, crop, scale, pad, subtitles,
 * palette. Palette quantisation must see the final pixels, so it is last.
 */
namespace FilterGraphBuilder
{
    /**
     * @param settings       Validated clip settings
     * @param scriptFile     ASS script to burn in; juce::File() for none
     * @param captionPadding Measured caption padding, when a caption is shown
     * @param includePalette False to drop the palette stage (the MP4 companion)
     */
    std::vector<FilterStage> buildStages(const ClipSettings& settings,
                                         const juce::File& scriptFile,
                                         std::optional<int> captionPadding,
                                         bool includePalette);

    /**
     * Stages for one sequence segment: fps, optional crop, scale and the
     * segment's text overlay. Segments never carry captions or palettes.
     */
    std::vector<FilterStage> buildSegmentStages(int fps, bool crop, int width, int height,
                                                const DrawTextOptions& overlay);

    /**
     * Cues for a boomerang clip: each cue is kept and a mirrored copy added.
     * A cue at (rs, re) relative to the clip start, in a clip of length D,
     * is mirrored to (2D - re, 2D - rs).
     */
    std::vector<Subtitle> mirrorForBoomerang(const std::vector<Subtitle>& cues,
                                             juce::int64 clipStartMs,
                                             juce::int64 durationMs);

    /** The caption cue: spans the whole clip, twice its length for a boomerang. */
    Subtitle makeCaptionCue(const juce::StringArray& lines,
                            juce::int64 clipStartMs,
                            juce::int64 durationMs,
                            bool boomerang);
}
