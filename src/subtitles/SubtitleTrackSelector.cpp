#include "SubtitleTrackSelector.h"

namespace SubtitleTrackSelector
{
    bool isClosedCaptionTitle(const juce::String& title)
    {
        const juce::String lower = title.toLowerCase();
        return lower.contains("sdh") || lower.contains("cc") || lower.contains("hearing impaired");
    }

    ClipResult<int> selectTrack(const std::vector<FFmpegExecutor::MediaStreamInfo>& streams,
                                const juce::StringArray& languages,
                                bool includeCc)
    {
        std::vector<const FFmpegExecutor::MediaStreamInfo*> subtitleStreams;
        int nonSubtitleStreams = 0;

        for (const auto& stream : streams)
        {
            if (stream.codecType == "subtitle")
                subtitleStreams.push_back(&stream);
            else
                ++nonSubtitleStreams;
        }

        if (subtitleStreams.empty())
            return ClipResult<int>::fail(ClipErrorKind::Extraction, "No subtitle streams found");

        for (const auto& language : languages)
        {
            for (auto* stream : subtitleStreams)
            {
                if (stream->language != language)
                    continue;

                if (includeCc || ! isClosedCaptionTitle(stream->title))
                    return ClipResult<int>::ok(stream->index - nonSubtitleStreams);
            }
        }

        return ClipResult<int>::fail(ClipErrorKind::Extraction,
                                     "No subtitle stream exists for any of the requested languages: "
                                         + languages.joinIntoString(","));
    }
}
