#pragma once
#include <juce_core/juce_core.h>
#include <juce_graphics/juce_graphics.h>
#include <functional>
#include "ClipTypes.h"
#include "ClipResult.h"
#include "FFmpegExecutor.h"

/**
 * Works out how many rows a caption needs above the video.
 *
 * The caption is rendered by ffmpeg onto a solid magenta frame of the target
 * size and the resulting PNG is scanned for rows that differ from the
 * background. Renderer-specific outline, shadow and line spacing are all
 * accounted for because the real renderer drew the text.
 */
class CaptionMeasurer
{
public:
    explicit CaptionMeasurer(FFmpegExecutor& executor);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Renders the caption and returns the padding to reserve:
     * text block height + 2 * the style's vertical margin.
     *
     * @param workingDirectory Where the probe script and frame are written
     */
    ClipResult<int> measurePadding(const juce::StringArray& captionLines,
                                   const ClipTypes::TextStyle& captionStyle,
                                   int width,
                                   int height,
                                   const juce::File& workingDirectory);

    /**
     * Height of the band of rows containing any pixel whose RGB differs from
     * the top-left pixel, or 0 if every row matches it.
     */
    static int measureTextBlockHeight(const juce::Image& frame);

private:
    void log(const juce::String& message) const;

    FFmpegExecutor& executor;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(CaptionMeasurer)
};
