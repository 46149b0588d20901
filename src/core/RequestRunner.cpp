#include "RequestRunner.h"
#include "../rendering/ScopedWorkingDirectory.h"
#include "../subtitles/SubRipParser.h"
#include "../subtitles/SubtitleExtractor.h"

RequestRunner::RequestRunner(FFmpegExecutor& executorToUse)
    : executor(executorToUse),
      generator(executorToUse),
      concatenator(executorToUse)
{
}

void RequestRunner::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
    generator.setLogCallback(callback);
    concatenator.setLogCallback(callback);
}

void RequestRunner::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

void RequestRunner::cancel() noexcept
{
    generator.cancel();
    concatenator.cancel();
}

void RequestRunner::applyEngineOptions(const EngineOptions& options)
{
    executor.setToolPaths(options.ffmpegPath, options.ffprobePath);
    executor.setTimeoutMs(options.timeoutMs);
    executor.setSessionLogDirectory(options.logDirectory);

    generator.setWorkingDirectoryBase(options.workingDirectory);
    concatenator.setWorkingDirectoryBase(options.workingDirectory);
}

//==============================================================================
ClipResult<SubtitleTrack> RequestRunner::loadTrack(const LoadedRequest& request, const juce::File& scratchDirectory)
{
    const CueSource& source = request.cueSource;

    switch (source.kind)
    {
        case CueSource::Kind::None:
            return ClipResult<SubtitleTrack>::ok(SubtitleTrack());

        case CueSource::Kind::Inline:
            return ClipResult<SubtitleTrack>::ok(SubtitleTrack(source.inlineCues));

        case CueSource::Kind::SubRipFile:
        {
            SubRipParser parser;
            parser.setLogCallback(logCallback);
            return parser.parseFile(source.srtFile);
        }

        case CueSource::Kind::Extract:
        {
            SubtitleExtractor extractor(executor);
            extractor.setLogCallback(logCallback);
            return extractor.extract(request.clip.inputFile,
                                     source.languages,
                                     source.includeCc,
                                     scratchDirectory.getChildFile("extracted.srt"));
        }
    }

    return ClipResult<SubtitleTrack>::fail(ClipErrorKind::Configuration, "Unknown cue source");
}

ClipResult<std::vector<Subtitle>> RequestRunner::selectCues(const SubtitleTrack& track, const CueSource& source)
{
    if (! source.firstCue.has_value())
        return ClipResult<std::vector<Subtitle>>::ok(track.getCues());

    const int first = *source.firstCue;
    const int last = source.lastCue.value_or(first);
    auto selection = track.selectRange(first, last);

    if (selection.empty())
        return ClipResult<std::vector<Subtitle>>::fail(ClipErrorKind::Configuration,
                                                       "Cue range " + juce::String(first) + "-" + juce::String(last)
                                                           + " selects nothing from a track of " + juce::String(track.size()) + " cues");

    return ClipResult<std::vector<Subtitle>>::ok(selection);
}

std::vector<Subtitle> RequestRunner::cuesInWindow(const std::vector<Subtitle>& cues, juce::int64 startMs, juce::int64 endMs)
{
    std::vector<Subtitle> inside;

    for (const auto& cue : cues)
        if (cue.getEndMs() > startMs && cue.getStartMs() < endMs)
            inside.push_back(cue);

    return inside;
}

//==============================================================================
ClipResult<ClipTypes::GenerationOutput> RequestRunner::run(const LoadedRequest& request)
{
    using Result = ClipResult<ClipTypes::GenerationOutput>;

    applyEngineOptions(request.engine);

    ScopedWorkingDirectory scratch("cueclip_cues", request.engine.workingDirectory);
    if (! scratch.isValid())
        return Result::fail(ClipErrorKind::MissingArtifact, "Could not create a working directory");

    auto track = loadTrack(request, scratch.getDirectory());
    if (track.failed())
        return Result::fail(track.getError());

    auto cues = selectCues(track.getValue(), request.cueSource);
    if (cues.failed())
        return Result::fail(cues.getError());

    log("Using " + juce::String((int) cues.getValue().size()) + " of " + juce::String(track.getValue().size()) + " cues");

    return request.isSequence ? runSequence(request, cues.getValue())
                              : runSingle(request, cues.getValue());
}

ClipResult<ClipTypes::GenerationOutput> RequestRunner::runSingle(const LoadedRequest& request, const std::vector<Subtitle>& cues)
{
    using Result = ClipResult<ClipTypes::GenerationOutput>;

    ClipRequest clip = request.clip;

    if (! request.hasExplicitTimes)
    {
        if (cues.empty())
            return Result::fail(ClipErrorKind::Configuration, "No cues to take the clip times from");

        clip.startMs = cues.front().getStartMs();
        clip.endMs = cues.front().getEndMs();

        for (const auto& cue : cues)
            clip.endMs = juce::jmax(clip.endMs, cue.getEndMs());
    }

    auto settings = ClipSettings::fromRequest(clip, &executor);
    if (settings.failed())
        return Result::fail(settings.getError());

    return generator.generate(settings.getValue(),
                              cuesInWindow(cues, clip.startMs, clip.endMs),
                              request.captionLines);
}

ClipResult<ClipTypes::GenerationOutput> RequestRunner::runSequence(const LoadedRequest& request, const std::vector<Subtitle>& cues)
{
    const ClipRequest& clip = request.clip;

    SequenceRequest sequence;
    sequence.inputFile = clip.inputFile;
    sequence.outputFile = clip.outputFile;
    sequence.outputFormat = clip.outputFormat;
    sequence.fps = clip.fps;
    sequence.width = clip.width;
    sequence.height = clip.height;
    sequence.resolution = clip.resolution;
    sequence.crop = clip.crop;
    sequence.hdGif = clip.hdGif;
    sequence.mp4Copy = clip.mp4Copy;
    sequence.crf = clip.crf;
    sequence.preset = clip.preset;
    sequence.captionLines = request.captionLines;
    sequence.captionStyle = clip.captionStyle;

    if (! request.explicitSegments.empty())
    {
        sequence.segments = request.explicitSegments;
    }
    else
    {
        for (const auto& cue : cues)
        {
            auto segment = SequenceConcatenator::segmentFromCue(cue, request.segmentFont, request.segmentFontSize);
            segment.fontFile = request.segmentFontFile;
            sequence.segments.push_back(segment);
        }
    }

    return concatenator.generate(sequence);
}
