#include "SequenceConcatenator.h"
#include "FilterGraph.h"
#include "ScopedWorkingDirectory.h"
#include "../subtitles/SubtitleTiming.h"

SequenceConcatenator::SequenceConcatenator(FFmpegExecutor& executorToUse)
    : executor(executorToUse),
      generator(executorToUse)
{
    generator.setLogCallback([this](const juce::String& message)
    {
        if (logCallback)
            logCallback(message);
    });
}

SequenceConcatenator::~SequenceConcatenator()
{
}

void SequenceConcatenator::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

void SequenceConcatenator::setWorkingDirectoryBase(const juce::File& directory)
{
    workingDirectoryBase = directory;
}

void SequenceConcatenator::cancel() noexcept
{
    cancelRequested = true;
    generator.cancel();
}

void SequenceConcatenator::log(const juce::String& message)
{
    juce::Logger::writeToLog("[SEQUENCE] " + message);

    if (logCallback)
        logCallback(message);
}

ClipStatus SequenceConcatenator::checkNotCancelled(const juce::String& nextStage) const
{
    if (cancelRequested)
        return ClipStatus::fail(ClipErrorKind::Cancelled, "Cancelled before " + nextStage);

    return ClipStatus::ok();
}

//==============================================================================
ClipStatus SequenceConcatenator::checkContiguous(const std::vector<SequenceSegment>& segments)
{
    if (segments.size() < 2)
        return ClipStatus::fail(ClipErrorKind::Sequence,
                                "A sequence needs at least two segments, got " + juce::String((int) segments.size()));

    for (size_t i = 1; i < segments.size(); ++i)
    {
        const int previousId = segments[i - 1].sequenceId;
        const int currentId = segments[i].sequenceId;

        if (currentId != previousId + 1)
            return ClipStatus::fail(ClipErrorKind::Sequence,
                                    "Segments are not contiguous: " + juce::String(currentId)
                                        + " does not follow " + juce::String(previousId));
    }

    return ClipStatus::ok();
}

ClipResult<std::vector<SequenceConcatenator::Span>> SequenceConcatenator::computeSpans(const std::vector<SequenceSegment>& segments)
{
    using Result = ClipResult<std::vector<Span>>;

    std::vector<Span> spans;

    for (size_t i = 0; i < segments.size(); ++i)
    {
        Span span;
        span.startMs = segments[i].startMs;
        span.endMs = (i + 1 < segments.size()) ? segments[i + 1].startMs : segments[i].endMs;

        if (span.startMs < 0 || span.endMs <= span.startMs)
            return Result::fail(ClipErrorKind::Sequence,
                                "Segment " + juce::String(segments[i].sequenceId) + " covers no time ("
                                    + juce::String(span.startMs) + " to " + juce::String(span.endMs) + " ms)");

        spans.push_back(span);
    }

    return Result::ok(spans);
}

juce::String SequenceConcatenator::buildConcatList(const std::vector<juce::File>& files)
{
    juce::String list;

    for (const auto& file : files)
    {
        juce::String path = file.getFullPathName();

       #if JUCE_WINDOWS
        path = path.replaceCharacter('\\', '/');
       #endif

        // Inside single quotes a quote is written as '\''
        list << "file '" << path.replace("'", "'\\''") << "'\n";
    }

    return list;
}

SequenceSegment SequenceConcatenator::segmentFromCue(const Subtitle& cue, const juce::String& font, int fontSize)
{
    SequenceSegment segment;
    segment.sequenceId = cue.getSequenceId();
    segment.startMs = cue.getStartMs();
    segment.endMs = cue.getEndMs();
    segment.lines = cue.getLines();
    segment.font = font;
    segment.fontSize = fontSize;
    return segment;
}

//==============================================================================
ClipStatus SequenceConcatenator::renderSegment(const SequenceRequest& request,
                                               const SequenceSegment& segment,
                                               const Span& span,
                                               const ClipSettings& sizing,
                                               const juce::File& destination,
                                               int segmentNumber)
{
    DrawTextOptions overlay;
    overlay.lines = segment.lines;
    overlay.font = segment.font.isNotEmpty() ? segment.font : juce::String("Arial");
    overlay.fontFile = segment.fontFile;
    overlay.fontSize = segment.fontSize;

    const auto stages = FilterGraphBuilder::buildSegmentStages(request.fps,
                                                               request.crop,
                                                               sizing.getWidth(),
                                                               sizing.getHeight(),
                                                               overlay);

    juce::StringArray arguments { "-ss", SubtitleTiming::toSecondsArgument(span.startMs),
                                  "-t", SubtitleTiming::toSecondsArgument(span.endMs - span.startMs),
                                  "-i", request.inputFile.getFullPathName(),
                                  "-vf", FilterGraphFormatter::format(stages) };
    arguments.addArray(ClipGenerator::buildEncodingArguments(ClipTypes::VideoFormat::Mp4, request.crf, request.preset));
    arguments.add(destination.getFullPathName());

    auto status = executor.runFFmpeg(arguments, "Segment " + juce::String(segmentNumber));
    if (status.failed())
        return status;

    if (! destination.existsAsFile())
        return ClipStatus::fail(ClipErrorKind::MissingArtifact,
                                "Segment " + juce::String(segmentNumber) + " was not written: " + destination.getFullPathName());

    return ClipStatus::ok();
}

ClipResult<SequenceConcatenator::GenerationOutput> SequenceConcatenator::generate(const SequenceRequest& request)
{
    using Result = ClipResult<GenerationOutput>;

    cancelRequested = false;
    generator.resetCancellation();
    const ScopedExecutorLogRedirect logRedirect(executor, [this](const juce::String& message) { log(message); });

    auto contiguous = checkContiguous(request.segments);
    if (contiguous.failed())
    {
        log("ERROR: " + contiguous.getErrorMessage());
        return Result::fail(contiguous.getError());
    }

    auto spans = computeSpans(request.segments);
    if (spans.failed())
    {
        log("ERROR: " + spans.getErrorMessage());
        return Result::fail(spans.getError());
    }

    const juce::int64 firstStart = spans.getValue().front().startMs;
    const juce::int64 lastEnd = spans.getValue().back().endMs;

    // Validates the shared settings and derives the frame size once
    ClipRequest sizingRequest;
    sizingRequest.inputFile = request.inputFile;
    sizingRequest.outputFile = request.outputFile;
    sizingRequest.outputFormat = request.outputFormat;
    sizingRequest.startMs = firstStart;
    sizingRequest.endMs = lastEnd;
    sizingRequest.fps = request.fps;
    sizingRequest.width = request.width;
    sizingRequest.height = request.height;
    sizingRequest.resolution = request.resolution;
    sizingRequest.crop = request.crop;
    sizingRequest.hdGif = request.hdGif;
    sizingRequest.crf = request.crf;
    sizingRequest.preset = request.preset;

    auto sizing = ClipSettings::fromRequest(sizingRequest, &executor);
    if (sizing.failed())
    {
        log("ERROR: " + sizing.getErrorMessage());
        return Result::fail(sizing.getError());
    }

    log("Sequence of " + juce::String((int) request.segments.size()) + " segments, "
        + juce::String(request.segments.front().sequenceId) + " to " + juce::String(request.segments.back().sequenceId)
        + ", " + juce::String(sizing.getValue().getWidth()) + "x" + juce::String(sizing.getValue().getHeight()));

    ScopedWorkingDirectory workingDirectory("cueclip_sequence", workingDirectoryBase);
    if (! workingDirectory.isValid())
        return Result::fail(ClipErrorKind::MissingArtifact, "Could not create a working directory");

    std::vector<juce::File> segmentFiles;

    for (size_t i = 0; i < request.segments.size(); ++i)
    {
        const int segmentNumber = (int) i + 1;

        auto cancelled = checkNotCancelled("segment " + juce::String(segmentNumber));
        if (cancelled.failed())
            return Result::fail(cancelled.getError());

        const juce::File segmentFile = workingDirectory.getChildFile(juce::String::formatted("segment_%03d.mp4", segmentNumber));

        auto status = renderSegment(request, request.segments[i], spans.getValue()[i], sizing.getValue(), segmentFile, segmentNumber);
        if (status.failed())
        {
            log("ERROR: " + status.getErrorMessage());
            return Result::fail(status.getError());
        }

        segmentFiles.push_back(segmentFile);
    }

    auto cancelled = checkNotCancelled("concatenation");
    if (cancelled.failed())
        return Result::fail(cancelled.getError());

    const juce::File listFile = workingDirectory.getChildFile("concat_list.txt");
    if (! listFile.replaceWithText(buildConcatList(segmentFiles), false, false, "\n"))
        return Result::fail(ClipErrorKind::MissingArtifact, "Could not write concat list: " + listFile.getFullPathName());

    const juce::File combinedFile = workingDirectory.getChildFile("combined.mp4");

    auto status = executor.runFFmpeg({ "-f", "concat",
                                       "-safe", "0",
                                       "-i", listFile.getFullPathName(),
                                       "-c", "copy",
                                       combinedFile.getFullPathName() },
                                     "Concatenate segments");
    if (status.failed())
    {
        log("ERROR: " + status.getErrorMessage());
        return Result::fail(status.getError());
    }

    if (! combinedFile.existsAsFile())
        return Result::fail(ClipErrorKind::MissingArtifact,
                            "Concatenation reported success but did not write " + combinedFile.getFullPathName());

    cancelled = checkNotCancelled("the final conversion");
    if (cancelled.failed())
        return Result::fail(cancelled.getError());

    // The joined clip is already cropped and scaled; this pass adds caption and palette
    ClipRequest finalRequest;
    finalRequest.inputFile = combinedFile;
    finalRequest.clipFile = combinedFile;
    finalRequest.outputFile = request.outputFile;
    finalRequest.outputFormat = request.outputFormat;
    finalRequest.startMs = 0;
    finalRequest.endMs = lastEnd - firstStart;
    finalRequest.fps = request.fps;
    finalRequest.width = sizing.getValue().getWidth();
    finalRequest.height = sizing.getValue().getHeight();
    finalRequest.captionStyle = request.captionStyle;
    finalRequest.hdGif = request.hdGif;
    finalRequest.mp4Copy = request.mp4Copy;
    finalRequest.crf = request.crf;
    finalRequest.preset = request.preset;

    auto finalSettings = ClipSettings::fromRequest(finalRequest, nullptr);
    if (finalSettings.failed())
        return Result::fail(finalSettings.getError());

    auto output = generator.renderOutputs(finalSettings.getValue(), {}, request.captionLines, workingDirectory.getDirectory());
    if (output.failed())
    {
        log("ERROR: " + output.getErrorMessage());
        return output;
    }

    log("Sequence written to " + output.getValue().outputFile.getFullPathName());
    return output;
}
