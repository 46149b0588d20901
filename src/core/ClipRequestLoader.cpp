#include "ClipRequestLoader.h"

namespace
{
    using Result = ClipResult<LoadedRequest>;

    juce::File resolvePath(const juce::File& baseDirectory, const juce::String& path)
    {
        if (path.isEmpty())
            return {};

        return baseDirectory.getChildFile(path);
    }

    std::optional<int> optionalInt(const juce::var& object, const juce::Identifier& key)
    {
        if (! object.hasProperty(key))
            return std::nullopt;

        return (int) object.getProperty(key, 0);
    }

    /** Accepts either a single string (split on newlines) or an array of strings. */
    juce::StringArray readLines(const juce::var& value)
    {
        juce::StringArray lines;

        if (auto* array = value.getArray())
        {
            for (const auto& line : *array)
                lines.add(line.toString());
        }
        else if (value.isString())
        {
            lines.addLines(value.toString());
        }

        return lines;
    }

    bool readCue(const juce::var& entry, std::vector<Subtitle>& cues)
    {
        if (! entry.isObject() || ! entry.hasProperty("startMs") || ! entry.hasProperty("endMs"))
            return false;

        cues.emplace_back((juce::int64) entry.getProperty("startMs", 0),
                          (juce::int64) entry.getProperty("endMs", 0),
                          readLines(entry.getProperty("lines", entry.getProperty("text", juce::var()))),
                          (juce::int64) entry.getProperty("delayMs", 0));
        return true;
    }

    bool readSegment(const juce::var& entry, const LoadedRequest& request,
                     const juce::File& baseDirectory, SequenceSegment& segment)
    {
        if (! entry.isObject() || ! entry.hasProperty("id") || ! entry.hasProperty("startMs") || ! entry.hasProperty("endMs"))
            return false;

        segment.sequenceId = (int) entry.getProperty("id", -1);
        segment.startMs = (juce::int64) entry.getProperty("startMs", 0);
        segment.endMs = (juce::int64) entry.getProperty("endMs", 0);
        segment.lines = readLines(entry.getProperty("lines", entry.getProperty("text", juce::var())));
        segment.font = entry.getProperty("font", request.segmentFont).toString();
        segment.fontSize = (int) entry.getProperty("fontSize", request.segmentFontSize);

        const juce::String fontFile = entry.getProperty("fontFile", "").toString();
        segment.fontFile = fontFile.isNotEmpty() ? resolvePath(baseDirectory, fontFile) : request.segmentFontFile;
        return true;
    }
}

//==============================================================================
ClipTypes::TextStyle ClipRequestLoader::parseStyle(const juce::var& object, const ClipTypes::TextStyle& defaults)
{
    ClipTypes::TextStyle style = defaults;

    if (! object.isObject())
        return style;

    style.name = object.getProperty("name", style.name).toString();
    style.font = object.getProperty("font", style.font).toString();
    style.fontSize = (int) object.getProperty("fontSize", style.fontSize);
    style.fontColour = object.getProperty("fontColour", style.fontColour).toString();
    style.outlineColour = object.getProperty("outlineColour", style.outlineColour).toString();
    style.bold = (bool) object.getProperty("bold", style.bold);
    style.italic = (bool) object.getProperty("italic", style.italic);
    style.shadow = (bool) object.getProperty("shadow", style.shadow);
    style.alignment = (int) object.getProperty("alignment", style.alignment);
    style.marginL = (int) object.getProperty("marginL", style.marginL);
    style.marginR = (int) object.getProperty("marginR", style.marginR);
    style.marginV = (int) object.getProperty("marginV", style.marginV);

    if (object.hasProperty("outlineWidth"))
        style.outlineWidthOverride = (int) object.getProperty("outlineWidth", 0);

    return style;
}

ClipResult<LoadedRequest> ClipRequestLoader::loadFromFile(const juce::File& requestFile)
{
    if (! requestFile.existsAsFile())
        return Result::fail(ClipErrorKind::Configuration, "Request file not found: " + requestFile.getFullPathName());

    return parse(requestFile.loadFileAsString(), requestFile.getParentDirectory());
}

ClipResult<LoadedRequest> ClipRequestLoader::parse(const juce::String& json, const juce::File& baseDirectory)
{
    juce::var root;
    const juce::Result parseResult = juce::JSON::parse(json, root);

    if (parseResult.failed())
        return Result::fail(ClipErrorKind::Configuration, "Request is not valid JSON: " + parseResult.getErrorMessage());

    if (! root.isObject())
        return Result::fail(ClipErrorKind::Configuration, "Request must be a JSON object");

    LoadedRequest request;

    //==============================================================================
    const juce::var engine = root.getProperty("engine", juce::var());
    if (engine.isObject())
    {
        request.engine.ffmpegPath = engine.getProperty("ffmpeg", "").toString();
        request.engine.ffprobePath = engine.getProperty("ffprobe", "").toString();
        request.engine.timeoutMs = (int) ((double) engine.getProperty("timeoutSeconds", 0.0) * 1000.0);
        request.engine.logDirectory = resolvePath(baseDirectory, engine.getProperty("logDirectory", "").toString());
        request.engine.workingDirectory = resolvePath(baseDirectory, engine.getProperty("workingDirectory", "").toString());
    }

    //==============================================================================
    const juce::String input = root.getProperty("input", "").toString();
    const juce::String output = root.getProperty("output", "").toString();

    if (input.isEmpty())
        return Result::fail(ClipErrorKind::Configuration, "Request has no \"input\"");

    if (output.isEmpty())
        return Result::fail(ClipErrorKind::Configuration, "Request has no \"output\"");

    ClipRequest& clip = request.clip;
    clip.inputFile = resolvePath(baseDirectory, input);
    clip.outputFile = resolvePath(baseDirectory, output);
    clip.clipFile = resolvePath(baseDirectory, root.getProperty("clip", "").toString());

    const juce::String formatName = root.getProperty("format", clip.outputFile.getFileExtension()).toString();
    const auto format = ClipTypes::formatFromExtension(formatName);
    if (! format.has_value())
        return Result::fail(ClipErrorKind::Configuration, "Unknown output format \"" + formatName + "\"");

    clip.outputFormat = *format;

    request.hasExplicitTimes = root.hasProperty("startMs") && root.hasProperty("endMs");
    if (root.hasProperty("startMs") != root.hasProperty("endMs"))
        return Result::fail(ClipErrorKind::Configuration, "\"startMs\" and \"endMs\" must be given together");

    clip.startMs = (juce::int64) root.getProperty("startMs", 0);
    clip.endMs = (juce::int64) root.getProperty("endMs", 0);
    clip.fps = (int) root.getProperty("fps", clip.fps);
    clip.width = optionalInt(root, "width");
    clip.height = optionalInt(root, "height");
    clip.resolution = optionalInt(root, "resolution");
    clip.crop = (bool) root.getProperty("crop", false);
    clip.boomerang = (bool) root.getProperty("boomerang", false);
    clip.hdGif = (bool) root.getProperty("hdGif", false);
    clip.mp4Copy = (bool) root.getProperty("mp4Copy", false);
    clip.crf = (int) root.getProperty("crf", clip.crf);
    clip.preset = root.getProperty("preset", clip.preset).toString();

    const auto subtitleDefaults = ClipTypes::makeDefaultSubtitleStyle();
    if (root.hasProperty("subtitleStyle"))
        clip.subtitleStyle = parseStyle(root.getProperty("subtitleStyle", juce::var()), subtitleDefaults);

    if (root.hasProperty("captionStyle"))
        clip.captionStyle = parseStyle(root.getProperty("captionStyle", juce::var()),
                                       ClipTypes::makeDefaultCaptionStyle(clip.subtitleStyle.value_or(subtitleDefaults)));

    request.captionLines = readLines(root.getProperty("caption", juce::var()));

    //==============================================================================
    const juce::var cues = root.getProperty("cues", juce::var());
    const juce::var subtitles = root.getProperty("subtitles", juce::var());

    if (! cues.isVoid() && ! subtitles.isVoid())
        return Result::fail(ClipErrorKind::Configuration, "Use either \"cues\" or \"subtitles\", not both");

    CueSource& source = request.cueSource;

    if (auto* cueArray = cues.getArray())
    {
        source.kind = CueSource::Kind::Inline;

        for (int i = 0; i < cueArray->size(); ++i)
        {
            if (! readCue(cueArray->getReference(i), source.inlineCues))
                return Result::fail(ClipErrorKind::Configuration,
                                    "Cue " + juce::String(i) + " needs \"startMs\" and \"endMs\"");

            const Subtitle& cue = source.inlineCues.back();
            if (! cue.isValid())
                return Result::fail(ClipErrorKind::Configuration,
                                    "Cue " + juce::String(i) + " has an invalid time range ("
                                        + juce::String(cue.getStartMs()) + " - " + juce::String(cue.getEndMs())
                                        + " ms); start must be >= 0 and end after start");
        }
    }
    else if (! cues.isVoid())
    {
        return Result::fail(ClipErrorKind::Configuration, "\"cues\" must be an array");
    }

    if (subtitles.isObject())
    {
        const juce::String srt = subtitles.getProperty("file", "").toString();

        if (srt.isNotEmpty())
        {
            source.kind = CueSource::Kind::SubRipFile;
            source.srtFile = resolvePath(baseDirectory, srt);
        }
        else
        {
            source.kind = CueSource::Kind::Extract;
            source.languages = readLines(subtitles.getProperty("languages", juce::var()));
            source.includeCc = (bool) subtitles.getProperty("includeCc", false);

            if (source.languages.isEmpty())
                return Result::fail(ClipErrorKind::Configuration, "\"subtitles\" needs a \"file\" or a \"languages\" list");
        }

        source.firstCue = optionalInt(subtitles, "firstCue");
        source.lastCue = optionalInt(subtitles, "lastCue");
    }
    else if (! subtitles.isVoid())
    {
        return Result::fail(ClipErrorKind::Configuration, "\"subtitles\" must be an object");
    }

    //==============================================================================
    const juce::var sequence = root.getProperty("sequence", juce::var());
    if (sequence.isObject())
    {
        request.isSequence = true;
        request.segmentFont = sequence.getProperty("font", request.segmentFont).toString();
        request.segmentFontSize = (int) sequence.getProperty("fontSize", request.segmentFontSize);
        request.segmentFontFile = resolvePath(baseDirectory, sequence.getProperty("fontFile", "").toString());

        const juce::var segments = sequence.getProperty("segments", juce::var());
        if (auto* segmentArray = segments.getArray())
        {
            for (int i = 0; i < segmentArray->size(); ++i)
            {
                SequenceSegment segment;
                if (! readSegment(segmentArray->getReference(i), request, baseDirectory, segment))
                    return Result::fail(ClipErrorKind::Configuration,
                                        "Segment " + juce::String(i) + " needs \"id\", \"startMs\" and \"endMs\"");

                request.explicitSegments.push_back(segment);
            }
        }

        if (request.explicitSegments.empty() && source.kind == CueSource::Kind::None)
            return Result::fail(ClipErrorKind::Configuration, "A sequence needs \"segments\" or a cue source");
    }
    else if (! sequence.isVoid())
    {
        return Result::fail(ClipErrorKind::Configuration, "\"sequence\" must be an object");
    }

    if (! request.isSequence && ! request.hasExplicitTimes && source.kind == CueSource::Kind::None)
        return Result::fail(ClipErrorKind::Configuration,
                            "Give \"startMs\"/\"endMs\", or cues to take the clip times from");

    return Result::ok(request);
}
