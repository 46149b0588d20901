#pragma once
#include <juce_core/juce_core.h>
#include <optional>
#include "ClipTypes.h"
#include "ClipResult.h"

class FFmpegExecutor;

/**
 * Raw fields of a generation request, as supplied by a UI or a request file.
 * Nothing here is validated; pass it to ClipSettings::fromRequest().
 */
struct ClipRequest
{
    juce::File inputFile;
    juce::File clipFile;            // intermediate trim; empty = working directory
    juce::File outputFile;
    ClipTypes::VideoFormat outputFormat = ClipTypes::VideoFormat::Gif;

    juce::int64 startMs = 0;
    juce::int64 endMs = 0;
    int fps = 20;

    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> resolution;  // output height; width follows the source aspect ratio

    std::optional<ClipTypes::TextStyle> subtitleStyle;
    std::optional<ClipTypes::TextStyle> captionStyle;

    bool crop = false;              // square crop
    bool boomerang = false;         // append a reversed copy
    bool hdGif = false;             // full palette instead of 32 dithered colours
    bool mp4Copy = false;           // also write an MP4 with the text burned in

    int crf = 18;
    juce::String preset = "fast";
};

//==============================================================================
/**
 * Validated, immutable settings for one clip generation.
 *
 * Instances only come from fromRequest(), which checks every invariant and
 * derives width/height from `resolution` in the same pass.
 */
class ClipSettings
{
public:
    /**
     * Validates a request and derives the output size.
     *
     * When `resolution` is used without crop, the source is probed through
     * `executor` for its native size; a failed probe is returned as-is.
     * `executor` may be null when explicit width/height are given.
     */
    static ClipResult<ClipSettings> fromRequest(const ClipRequest& request, FFmpegExecutor* executor);

    /** Width for `resolution` on a source of the given size, rounded to an even number. */
    static int deriveWidth(int resolution, int sourceWidth, int sourceHeight);

    const juce::File& getInputFile() const noexcept     { return inputFile; }
    const juce::File& getClipFile() const noexcept      { return clipFile; }
    const juce::File& getOutputFile() const noexcept    { return outputFile; }
    ClipTypes::VideoFormat getOutputFormat() const      { return outputFormat; }

    juce::int64 getStartMs() const noexcept             { return startMs; }
    juce::int64 getEndMs() const noexcept               { return endMs; }
    juce::int64 getDurationMs() const noexcept          { return endMs - startMs; }
    int getFps() const noexcept                         { return fps; }

    int getWidth() const noexcept                       { return width; }
    int getHeight() const noexcept                      { return height; }
    std::optional<int> getResolution() const            { return resolution; }
    bool isSizeDerivedFromResolution() const noexcept   { return resolution.has_value(); }

    const ClipTypes::TextStyle& getSubtitleStyle() const { return subtitleStyle; }
    const ClipTypes::TextStyle& getCaptionStyle() const  { return captionStyle; }

    bool shouldCrop() const noexcept                    { return crop; }
    bool isBoomerang() const noexcept                   { return boomerang; }
    bool isHdGif() const noexcept                       { return hdGif; }
    bool wantsMp4Copy() const noexcept                  { return mp4Copy; }
    int getCrf() const noexcept                         { return crf; }
    const juce::String& getPreset() const               { return preset; }

    /** Location of the MP4 companion written when wantsMp4Copy() is set. */
    juce::File getMp4CopyFile() const;

    /** Settings identical to these but reading from, and trimmed against, another file. */
    ClipSettings withClipFile(const juce::File& newClipFile) const;

private:
    ClipSettings() = default;

    juce::File inputFile;
    juce::File clipFile;
    juce::File outputFile;
    ClipTypes::VideoFormat outputFormat = ClipTypes::VideoFormat::Gif;
    juce::int64 startMs = 0;
    juce::int64 endMs = 0;
    int fps = 20;
    int width = 0;
    int height = 0;
    std::optional<int> resolution;
    ClipTypes::TextStyle subtitleStyle;
    ClipTypes::TextStyle captionStyle;
    bool crop = false;
    bool boomerang = false;
    bool hdGif = false;
    bool mp4Copy = false;
    int crf = 18;
    juce::String preset;
};
