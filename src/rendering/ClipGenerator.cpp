#include "ClipGenerator.h"
#include "FilterGraph.h"
#include "ScopedWorkingDirectory.h"
#include "../subtitles/AssScriptBuilder.h"
#include "../subtitles/SubtitleTiming.h"

namespace
{
    bool hasVisibleText(const juce::StringArray& lines)
    {
        for (const auto& line : lines)
            if (line.trim().isNotEmpty())
                return true;

        return false;
    }

    ClipError missingArtifact(const juce::File& file, const juce::String& stage)
    {
        return ClipError::make(ClipErrorKind::MissingArtifact,
                               stage + " reported success but did not write " + file.getFullPathName());
    }
}

ClipGenerator::ClipGenerator(FFmpegExecutor& executorToUse)
    : executor(executorToUse),
      captionMeasurer(executorToUse)
{
    captionMeasurer.setLogCallback([this](const juce::String& message) { log(message); });
}

ClipGenerator::~ClipGenerator()
{
}

void ClipGenerator::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

void ClipGenerator::setStateCallback(std::function<void(GenerationState, const juce::String&)> callback)
{
    stateCallback = std::move(callback);
}

void ClipGenerator::setWorkingDirectoryBase(const juce::File& directory)
{
    workingDirectoryBase = directory;
}

void ClipGenerator::log(const juce::String& message)
{
    juce::Logger::writeToLog("[CLIP] " + message);

    if (logCallback)
        logCallback(message);
}

void ClipGenerator::updateState(GenerationState newState, const juce::String& statusMessage)
{
    state = newState;
    log(ClipTypes::getStateName(newState) + ": " + statusMessage);

    if (stateCallback)
        stateCallback(newState, statusMessage);
}

ClipStatus ClipGenerator::checkNotCancelled(const juce::String& nextStage)
{
    if (! cancelRequested)
        return ClipStatus::ok();

    const ClipError error = ClipError::make(ClipErrorKind::Cancelled, "Cancelled before " + nextStage);
    updateState(GenerationState::Failed, error.describe());
    return ClipStatus::fail(error);
}

//==============================================================================
juce::StringArray ClipGenerator::buildEncodingArguments(ClipTypes::VideoFormat format, int crf, const juce::String& preset)
{
    if (format == ClipTypes::VideoFormat::Mp4)
        return { "-c:v", "libx264",
                 "-crf", juce::String(crf),
                 "-preset", preset,
                 "-pix_fmt", "yuv420p",
                 "-an",
                 "-movflags", "+faststart" };

    return { "-loop", "0" };
}

ClipStatus ClipGenerator::runFilterGraph(const juce::File& source,
                                         const juce::String& graph,
                                         ClipTypes::VideoFormat format,
                                         const ClipSettings& settings,
                                         const juce::File& destination,
                                         const juce::String& description)
{
    juce::StringArray arguments { "-i", source.getFullPathName(), "-filter_complex", graph };
    arguments.addArray(buildEncodingArguments(format, settings.getCrf(), settings.getPreset()));
    arguments.add(destination.getFullPathName());

    auto status = executor.runFFmpeg(arguments, description);
    if (status.failed())
        return status;

    if (! destination.existsAsFile())
        return ClipStatus::fail(missingArtifact(destination, description));

    return ClipStatus::ok();
}

//==============================================================================
ClipStatus ClipGenerator::trim(const ClipSettings& settings)
{
    const juce::File& clipFile = settings.getClipFile();
    const juce::String start = SubtitleTiming::toSecondsArgument(settings.getStartMs());
    const juce::String duration = SubtitleTiming::toSecondsArgument(settings.getDurationMs());

    log("Trimming " + settings.getInputFile().getFileName() + " from " + start + " s for " + duration + " s");

    auto status = executor.runFFmpeg({ "-ss", start,
                                       "-t", duration,
                                       "-i", settings.getInputFile().getFullPathName(),
                                       "-c", "copy",
                                       clipFile.getFullPathName() },
                                     "Trim (stream copy)");
    if (status.failed())
        return status;

    if (! clipFile.existsAsFile())
        return ClipStatus::fail(missingArtifact(clipFile, "Trim (stream copy)"));

    auto hasVideo = executor.hasVideoStream(clipFile);
    if (hasVideo.failed())
        return ClipStatus::fail(hasVideo.getError());

    if (hasVideo.getValue())
        return ClipStatus::ok();

    // Stream copy can silently drop video across container boundaries
    log("Trimmed clip has no video stream, re-encoding");

    status = executor.runFFmpeg({ "-ss", start,
                                  "-t", duration,
                                  "-i", settings.getInputFile().getFullPathName(),
                                  "-c:v", "libx265",
                                  "-crf", juce::String(settings.getCrf()),
                                  "-preset", settings.getPreset(),
                                  clipFile.getFullPathName() },
                                "Trim (re-encode)");
    if (status.failed())
        return status;

    if (! clipFile.existsAsFile())
        return ClipStatus::fail(missingArtifact(clipFile, "Trim (re-encode)"));

    return ClipStatus::ok();
}

ClipResult<ClipGenerator::GenerationOutput> ClipGenerator::renderOutputs(const ClipSettings& settings,
                                                                         const std::vector<Subtitle>& cues,
                                                                         const juce::StringArray& captionLines,
                                                                         const juce::File& workingDirectory)
{
    const juce::int64 clipStart = settings.getStartMs();
    const juce::int64 duration = settings.getDurationMs();

    std::vector<Subtitle> subtitleCues = settings.isBoomerang()
        ? FilterGraphBuilder::mirrorForBoomerang(cues, clipStart, duration)
        : cues;

    std::optional<int> captionPadding;
    if (hasVisibleText(captionLines))
    {
        auto measured = captionMeasurer.measurePadding(captionLines,
                                                       settings.getCaptionStyle(),
                                                       settings.getWidth(),
                                                       settings.getHeight(),
                                                       workingDirectory);
        if (measured.failed())
            return failWith<GenerationOutput>(measured.getError());

        captionPadding = measured.getValue() + (measured.getValue() & 1);
    }

    AssScriptBuilder script(settings.getWidth(), settings.getHeight() + captionPadding.value_or(0));
    script.addBlock(settings.getSubtitleStyle(), subtitleCues, clipStart);

    if (captionPadding.has_value())
        script.addBlock(settings.getCaptionStyle(),
                        { FilterGraphBuilder::makeCaptionCue(captionLines, clipStart, duration, settings.isBoomerang()) },
                        clipStart);

    juce::File scriptFile;
    if (script.getNumDialogues() > 0)
    {
        scriptFile = workingDirectory.getChildFile("sub.ass");

        auto written = script.writeTo(scriptFile);
        if (written.failed())
            return failWith<GenerationOutput>(written.getError());

        log("Wrote " + juce::String(script.getNumDialogues()) + " dialogue lines to " + scriptFile.getFileName());
    }

    auto cancelled = checkNotCancelled("filtering");
    if (cancelled.failed())
        return ClipResult<GenerationOutput>::fail(cancelled.getError());

    const auto stages = FilterGraphBuilder::buildStages(settings, scriptFile, captionPadding, true);
    auto status = runFilterGraph(settings.getClipFile(),
                                 FilterGraphFormatter::format(stages),
                                 settings.getOutputFormat(),
                                 settings,
                                 settings.getOutputFile(),
                                 "Filter");
    if (status.failed())
        return failWith<GenerationOutput>(status.getError());

    GenerationOutput output;
    output.outputFile = settings.getOutputFile();
    updateState(GenerationState::FilteredOutput, "Wrote " + output.outputFile.getFullPathName());

    if (! settings.wantsMp4Copy())
        return ClipResult<GenerationOutput>::ok(output);

    cancelled = checkNotCancelled("the MP4 copy");
    if (cancelled.failed())
        return ClipResult<GenerationOutput>::fail(cancelled.getError());

    const juce::File mp4File = settings.getMp4CopyFile();
    const auto mp4Stages = FilterGraphBuilder::buildStages(settings, scriptFile, captionPadding, false);

    status = runFilterGraph(settings.getClipFile(),
                            FilterGraphFormatter::format(mp4Stages),
                            ClipTypes::VideoFormat::Mp4,
                            settings,
                            mp4File,
                            "MP4 copy");
    if (status.failed())
    {
        log("MP4 copy failed; keeping " + output.outputFile.getFullPathName());
        return failWith<GenerationOutput>(status.getError());
    }

    output.mp4CopyFile = mp4File;
    updateState(GenerationState::Mp4CopyOutput, "Wrote " + mp4File.getFullPathName());
    return ClipResult<GenerationOutput>::ok(output);
}

ClipResult<ClipGenerator::GenerationOutput> ClipGenerator::generate(const ClipSettings& settings,
                                                                    const std::vector<Subtitle>& cues,
                                                                    const juce::StringArray& captionLines)
{
    resetCancellation();
    const ScopedExecutorLogRedirect logRedirect(executor, [this](const juce::String& message) { log(message); });

    updateState(GenerationState::Validated,
                settings.getInputFile().getFileName() + " -> " + settings.getOutputFile().getFileName()
                    + " (" + juce::String(settings.getWidth()) + "x" + juce::String(settings.getHeight())
                    + ", " + juce::String(cues.size()) + " cues)");

    ScopedWorkingDirectory workingDirectory("cueclip", workingDirectoryBase);
    if (! workingDirectory.isValid())
        return failWith<GenerationOutput>(ClipError::make(ClipErrorKind::MissingArtifact,
                                                          "Could not create a working directory"));

    ClipSettings effectiveSettings = settings;
    if (settings.getClipFile() == juce::File())
    {
        juce::String extension = settings.getInputFile().getFileExtension();
        if (extension.isEmpty())
            extension = ".mkv";

        effectiveSettings = settings.withClipFile(workingDirectory.getChildFile("clip" + extension));
    }

    auto cancelled = checkNotCancelled("trimming");
    if (cancelled.failed())
        return ClipResult<GenerationOutput>::fail(cancelled.getError());

    auto trimmed = trim(effectiveSettings);
    if (trimmed.failed())
        return failWith<GenerationOutput>(trimmed.getError());

    updateState(GenerationState::Trimmed, effectiveSettings.getClipFile().getFullPathName());

    auto cancelledAfterTrim = checkNotCancelled("rendering");
    if (cancelledAfterTrim.failed())
        return ClipResult<GenerationOutput>::fail(cancelledAfterTrim.getError());

    auto output = renderOutputs(effectiveSettings, cues, captionLines, workingDirectory.getDirectory());
    if (output.failed())
        return output;

    updateState(GenerationState::Done, "Generation finished");
    return output;
}
