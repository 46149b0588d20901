#pragma once
#include <juce_core/juce_core.h>
#include <functional>
#include "Subtitle.h"
#include "SubRipParser.h"
#include "../rendering/FFmpegExecutor.h"

/**
 * Pulls a subtitle track out of a media file and loads it as cues.
 *
 * Track choice is by language (see SubtitleTrackSelector); the stream is then
 * written to SubRip with ffmpeg and parsed.
 */
class SubtitleExtractor
{
public:
    explicit SubtitleExtractor(FFmpegExecutor& executor);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /** Probes `input` and returns the subtitle-relative index to extract. */
    ClipResult<int> findTrack(const juce::File& input, const juce::StringArray& languages, bool includeCc);

    /**
     * Writes subtitle track `trackIndex` to `srtFile` and parses it.
     * A missing output file is an Extraction error even if ffmpeg succeeded.
     */
    ClipResult<SubtitleTrack> extractTrack(const juce::File& input, int trackIndex, const juce::File& srtFile);

    /** findTrack() followed by extractTrack(). */
    ClipResult<SubtitleTrack> extract(const juce::File& input,
                                      const juce::StringArray& languages,
                                      bool includeCc,
                                      const juce::File& srtFile);

private:
    void log(const juce::String& message) const;

    FFmpegExecutor& executor;
    SubRipParser parser;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SubtitleExtractor)
};
