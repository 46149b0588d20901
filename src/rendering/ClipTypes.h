#pragma once
#include <juce_core/juce_core.h>
#include <optional>

/**
 * Common types used across the clip engine.
 * These types are shared by multiple components to ensure consistency.
 */
namespace ClipTypes
{
    /** Output formats the engine can produce. */
    enum class VideoFormat
    {
        Gif,
        Webp,
        Mp4
    };

    /** Lower-case file extension (without the dot) for a format. */
    juce::String getExtension(VideoFormat format);

    /** Maps a file extension (with or without the dot, any case) to a format. */
    std::optional<VideoFormat> formatFromExtension(const juce::String& extension);

    /**
     * A named ASS rendering style.
     *
     * Colours are ASS colour literals (&HAABBGGRR). Alignment uses the ASS
     * numpad layout (1-3 bottom, 4-6 middle, 7-9 top).
     */
    struct TextStyle
    {
        juce::String name = "subtitle_style";
        juce::String font = "Arial";
        int fontSize = 20;
        juce::String fontColour = "&H00FFFFFF";
        std::optional<int> outlineWidthOverride;
        juce::String outlineColour = "&H00000000";
        bool bold = false;
        bool italic = false;
        bool shadow = false;
        int alignment = 2;      // bottom centre
        int marginL = 0;
        int marginR = 0;
        int marginV = 10;

        /** Outline width, font size / 20 unless explicitly overridden. */
        int getOutlineWidth() const
        {
            return outlineWidthOverride.has_value() ? *outlineWidthOverride : fontSize / 20;
        }
    };

    /** Default style for subtitle dialogue. */
    TextStyle makeDefaultSubtitleStyle();

    /** Default caption style: top-left, same size as the given subtitle style. */
    TextStyle makeDefaultCaptionStyle(const TextStyle& subtitleStyle);

    /** Pipeline states for a single clip generation. */
    enum class GenerationState
    {
        Idle,
        Validated,
        Trimmed,
        FilteredOutput,
        Mp4CopyOutput,
        Done,
        Failed
    };

    juce::String getStateName(GenerationState state);

    /** Files produced by a successful generation. */
    struct GenerationOutput
    {
        juce::File outputFile;
        juce::File mp4CopyFile;     // empty unless an MP4 companion was requested
    };
}
