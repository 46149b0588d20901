#include "ClipTypes.h"
#include "ClipResult.h"

juce::String getErrorKindName(ClipErrorKind kind)
{
    switch (kind)
    {
        case ClipErrorKind::None:            return "None";
        case ClipErrorKind::Configuration:   return "ConfigurationError";
        case ClipErrorKind::Probe:           return "ProbeError";
        case ClipErrorKind::Extraction:      return "ExtractionError";
        case ClipErrorKind::ToolInvocation:  return "ToolInvocationError";
        case ClipErrorKind::MissingArtifact: return "MissingArtifactError";
        case ClipErrorKind::Sequence:        return "SequenceError";
        case ClipErrorKind::Cancelled:       return "Cancelled";
    }

    return "Unknown";
}

namespace ClipTypes
{
    juce::String getExtension(VideoFormat format)
    {
        switch (format)
        {
            case VideoFormat::Gif:  return "gif";
            case VideoFormat::Webp: return "webp";
            case VideoFormat::Mp4:  return "mp4";
        }

        return {};
    }

    std::optional<VideoFormat> formatFromExtension(const juce::String& extension)
    {
        const juce::String ext = extension.trimCharactersAtStart(".").toLowerCase();

        if (ext == "gif")  return VideoFormat::Gif;
        if (ext == "webp") return VideoFormat::Webp;
        if (ext == "mp4")  return VideoFormat::Mp4;

        return std::nullopt;
    }

    TextStyle makeDefaultSubtitleStyle()
    {
        return TextStyle();
    }

    TextStyle makeDefaultCaptionStyle(const TextStyle& subtitleStyle)
    {
        TextStyle caption;
        caption.name = "caption_style";
        caption.fontSize = subtitleStyle.fontSize;
        caption.alignment = 7;      // top left
        caption.marginL = 15;
        caption.marginR = 0;
        caption.marginV = 10;
        return caption;
    }

    juce::String getStateName(GenerationState state)
    {
        switch (state)
        {
            case GenerationState::Idle:           return "Idle";
            case GenerationState::Validated:      return "Validated";
            case GenerationState::Trimmed:        return "Trimmed";
            case GenerationState::FilteredOutput: return "FilteredOutput";
            case GenerationState::Mp4CopyOutput:  return "Mp4CopyOutput";
            case GenerationState::Done:           return "Done";
            case GenerationState::Failed:         return "Failed";
        }

        return "Unknown";
    }
}
