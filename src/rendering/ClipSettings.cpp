#include "ClipSettings.h"
#include "FFmpegExecutor.h"
#include <cmath>

namespace
{
    ClipResult<ClipSettings> reject(const juce::String& message)
    {
        return ClipResult<ClipSettings>::fail(ClipErrorKind::Configuration, message);
    }
}

int ClipSettings::deriveWidth(int resolution, int sourceWidth, int sourceHeight)
{
    if (sourceHeight <= 0)
        return 0;

    const double scaledWidth = (double) sourceWidth * (double) resolution / (double) sourceHeight;
    return 2 * (int) std::round(scaledWidth / 2.0);
}

ClipResult<ClipSettings> ClipSettings::fromRequest(const ClipRequest& request, FFmpegExecutor* executor)
{
    using namespace ClipTypes;

    if (request.startMs < 0)
        return reject("Clip start time cannot be negative");

    if (request.startMs >= request.endMs)
        return reject("Clip start time must be before end time ("
                      + juce::String(request.startMs) + " >= " + juce::String(request.endMs) + ")");

    const bool widthSet = request.width.has_value();
    const bool heightSet = request.height.has_value();
    const bool resolutionSet = request.resolution.has_value();

    if (resolutionSet && (widthSet || heightSet))
        return reject("Either set resolution OR width+height, not both");

    if (! resolutionSet && ! (widthSet && heightSet))
        return reject("You must set either resolution OR both width and height");

    if (resolutionSet && *request.resolution <= 0)
        return reject("Resolution must be positive");

    if (! resolutionSet && (*request.width <= 0 || *request.height <= 0))
        return reject("Width and height must be positive");

    const auto extensionFormat = formatFromExtension(request.outputFile.getFileExtension());
    if (! extensionFormat.has_value())
        return reject("Output file '" + request.outputFile.getFileName() + "' has no supported extension (gif, webp, mp4)");

    if (*extensionFormat != request.outputFormat)
        return reject("Output file extension '" + request.outputFile.getFileExtension()
                      + "' does not match output format " + getExtension(request.outputFormat));

    if (request.crop && ! resolutionSet && *request.width != *request.height)
        return reject("Crop was set, but width (" + juce::String(*request.width)
                      + ") doesn't match height (" + juce::String(*request.height) + ")");

    if (request.fps <= 0)
        return reject("Frame rate must be positive");

    if (request.crf < 0 || request.crf > 51)
        return reject("CRF must be between 0 and 51");

    if (request.preset.trim().isEmpty())
        return reject("Encoder preset must not be empty");

    ClipSettings settings;
    settings.inputFile = request.inputFile;
    settings.clipFile = request.clipFile;
    settings.outputFile = request.outputFile;
    settings.outputFormat = request.outputFormat;
    settings.startMs = request.startMs;
    settings.endMs = request.endMs;
    settings.fps = request.fps;
    settings.resolution = request.resolution;
    settings.crop = request.crop;
    settings.boomerang = request.boomerang;
    settings.hdGif = request.hdGif;
    settings.mp4Copy = request.mp4Copy;
    settings.crf = request.crf;
    settings.preset = request.preset.trim();

    if (resolutionSet)
    {
        if (request.crop)
        {
            settings.width = settings.height = *request.resolution;
        }
        else
        {
            if (executor == nullptr)
                return reject("Resolution sizing needs a media probe");

            auto sourceInfo = executor->getVideoStreamInfo(request.inputFile);
            if (sourceInfo.failed())
                return ClipResult<ClipSettings>::fail(sourceInfo.getError());

            const auto& source = sourceInfo.getValue();
            settings.height = *request.resolution;
            settings.width = deriveWidth(*request.resolution, source.width, source.height);

            if (settings.width <= 0)
                return reject("Resolution " + juce::String(*request.resolution) + " gives a zero width for a "
                              + juce::String(source.width) + "x" + juce::String(source.height) + " source");
        }
    }
    else
    {
        settings.width = *request.width;
        settings.height = *request.height;
    }

    // libx264 with yuv420p only encodes even frame sizes
    const bool encodesMp4 = request.outputFormat == VideoFormat::Mp4 || request.mp4Copy;
    if (encodesMp4 && (settings.width % 2 != 0 || settings.height % 2 != 0))
        return reject("MP4 output needs an even frame size, got "
                      + juce::String(settings.width) + "x" + juce::String(settings.height));

    settings.subtitleStyle = request.subtitleStyle.has_value() ? *request.subtitleStyle
                                                               : makeDefaultSubtitleStyle();
    settings.captionStyle = request.captionStyle.has_value() ? *request.captionStyle
                                                             : makeDefaultCaptionStyle(settings.subtitleStyle);

    return ClipResult<ClipSettings>::ok(settings);
}

juce::File ClipSettings::getMp4CopyFile() const
{
    if (outputFormat == ClipTypes::VideoFormat::Mp4)
        return outputFile.getSiblingFile(outputFile.getFileNameWithoutExtension() + "_copy.mp4");

    return outputFile.withFileExtension("mp4");
}

ClipSettings ClipSettings::withClipFile(const juce::File& newClipFile) const
{
    ClipSettings copy(*this);
    copy.clipFile = newClipFile;
    return copy;
}
