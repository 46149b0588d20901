#include "CaptionMeasurer.h"
#include "FilterGraph.h"
#include "../subtitles/AssScriptBuilder.h"

CaptionMeasurer::CaptionMeasurer(FFmpegExecutor& executorToUse)
    : executor(executorToUse)
{
}

void CaptionMeasurer::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

void CaptionMeasurer::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

int CaptionMeasurer::measureTextBlockHeight(const juce::Image& frame)
{
    if (! frame.isValid())
        return 0;

    const juce::Colour background = frame.getPixelAt(0, 0);
    const juce::Image::BitmapData pixels(frame, juce::Image::BitmapData::readOnly);

    int firstRow = -1;
    int lastRow = -1;

    for (int y = 0; y < pixels.height; ++y)
    {
        bool rowDiffers = false;

        for (int x = 0; x < pixels.width && ! rowDiffers; ++x)
        {
            const juce::Colour pixel = pixels.getPixelColour(x, y);
            rowDiffers = pixel.getRed() != background.getRed()
                      || pixel.getGreen() != background.getGreen()
                      || pixel.getBlue() != background.getBlue();
        }

        if (rowDiffers)
        {
            if (firstRow < 0)
                firstRow = y;

            lastRow = y;
        }
    }

    return firstRow < 0 ? 0 : lastRow - firstRow + 1;
}

ClipResult<int> CaptionMeasurer::measurePadding(const juce::StringArray& captionLines,
                                                const ClipTypes::TextStyle& captionStyle,
                                                int width,
                                                int height,
                                                const juce::File& workingDirectory)
{
    const juce::File scriptFile = workingDirectory.getChildFile("caption_probe.ass");
    const juce::File frameFile = workingDirectory.getChildFile("caption_probe.png");

    const juce::String script = AssScriptBuilder::buildCaptionProbeScript(captionStyle, captionLines, width, height);
    if (! scriptFile.replaceWithText(script, false, false, "\n"))
        return ClipResult<int>::fail(ClipErrorKind::MissingArtifact,
                                     "Could not write caption probe script: " + scriptFile.getFullPathName());

    frameFile.deleteFile();

    const juce::String videoFilter = FilterGraphFormatter::formatStage(FilterStage::subtitles(scriptFile)) + ",format=rgba";

    auto status = executor.runFFmpeg({ "-f", "lavfi",
                                       "-i", "color=0xFF00FF:size=" + juce::String(width) + "x" + juce::String(height) + ":duration=1",
                                       "-vf", videoFilter,
                                       "-frames:v", "1",
                                       frameFile.getFullPathName() },
                                     "Caption probe render");
    if (status.failed())
        return ClipResult<int>::fail(status.getError());

    if (! frameFile.existsAsFile())
        return ClipResult<int>::fail(ClipErrorKind::MissingArtifact,
                                     "Caption probe frame was not written: " + frameFile.getFullPathName());

    const juce::Image frame = juce::ImageFileFormat::loadFrom(frameFile);
    if (! frame.isValid())
        return ClipResult<int>::fail(ClipErrorKind::MissingArtifact,
                                     "Caption probe frame is not a readable image: " + frameFile.getFullPathName());

    const int textHeight = measureTextBlockHeight(frame);
    const int padding = textHeight + 2 * captionStyle.marginV;

    log("Caption measured at " + juce::String(textHeight) + " px, padding " + juce::String(padding) + " px");
    return ClipResult<int>::ok(padding);
}
