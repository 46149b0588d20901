#pragma once
#include <juce_core/juce_core.h>
#include <vector>
#include "../rendering/FFmpegExecutor.h"

/**
 * Chooses which subtitle stream of a media file to extract.
 */
namespace SubtitleTrackSelector
{
    /** True if a stream title marks it as SDH / closed captions. */
    bool isClosedCaptionTitle(const juce::String& title);

    /**
     * Picks the first subtitle stream matching the earliest language in
     * `languages`. Streams titled as SDH/CC are skipped unless `includeCc`.
     *
     * @return The subtitle-relative index (for `-map 0:s:N`), or an
     *         Extraction error if there are no subtitle streams or no match
     */
    ClipResult<int> selectTrack(const std::vector<FFmpegExecutor::MediaStreamInfo>& streams,
                                const juce::StringArray& languages,
                                bool includeCc);
}
