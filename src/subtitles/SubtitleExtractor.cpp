#include "SubtitleExtractor.h"
#include "SubtitleTrackSelector.h"

SubtitleExtractor::SubtitleExtractor(FFmpegExecutor& executorToUse)
    : executor(executorToUse)
{
}

void SubtitleExtractor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
    parser.setLogCallback(callback);
}

void SubtitleExtractor::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

ClipResult<int> SubtitleExtractor::findTrack(const juce::File& input, const juce::StringArray& languages, bool includeCc)
{
    auto streams = executor.getStreams(input);
    if (streams.failed())
        return ClipResult<int>::fail(streams.getError());

    auto track = SubtitleTrackSelector::selectTrack(streams.getValue(), languages, includeCc);
    if (track.failed())
    {
        ClipError error = track.getError();
        error.message << " in " << input.getFullPathName();
        return ClipResult<int>::fail(error);
    }

    log("Selected subtitle track " + juce::String(track.getValue()) + " of " + input.getFileName());
    return track;
}

ClipResult<SubtitleTrack> SubtitleExtractor::extractTrack(const juce::File& input, int trackIndex, const juce::File& srtFile)
{
    using Result = ClipResult<SubtitleTrack>;

    if (srtFile.existsAsFile())
        srtFile.deleteFile();

    auto status = executor.runFFmpeg({ "-i", input.getFullPathName(),
                                       "-map", "0:s:" + juce::String(trackIndex),
                                       "-an", "-vn",
                                       srtFile.getFullPathName() },
                                     "Extract subtitles");

    if (status.failed())
    {
        ClipError error = status.getError();
        error.message = "Could not extract subtitles from " + input.getFullPathName()
                      + " at sub track " + juce::String(trackIndex) + ": " + error.message;
        return Result::fail(error);
    }

    if (! srtFile.existsAsFile())
        return Result::fail(ClipErrorKind::Extraction,
                            "Could not extract subtitles from " + input.getFullPathName()
                                + " at sub track " + juce::String(trackIndex));

    auto parsed = parser.parseFile(srtFile);
    if (parsed.wasOk())
        log("Loaded " + juce::String(parsed.getValue().size()) + " cues from " + srtFile.getFileName());

    return parsed;
}

ClipResult<SubtitleTrack> SubtitleExtractor::extract(const juce::File& input,
                                                     const juce::StringArray& languages,
                                                     bool includeCc,
                                                     const juce::File& srtFile)
{
    auto track = findTrack(input, languages, includeCc);
    if (track.failed())
        return ClipResult<SubtitleTrack>::fail(track.getError());

    return extractTrack(input, track.getValue(), srtFile);
}
