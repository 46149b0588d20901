#include "FilterGraph.h"
#include "ClipSettings.h"

//==============================================================================
FilterStage FilterStage::reverseConcat()
{
    return FilterStage(Kind::ReverseConcat);
}

FilterStage FilterStage::fps(int framesPerSecond)
{
    FilterStage stage(Kind::Fps);
    stage.first = framesPerSecond;
    return stage;
}

FilterStage FilterStage::squareCrop()
{
    return FilterStage(Kind::Crop);
}

FilterStage FilterStage::scale(int width, int height)
{
    FilterStage stage(Kind::Scale);
    stage.first = width;
    stage.second = height;
    return stage;
}

FilterStage FilterStage::padTop(int padding)
{
    FilterStage stage(Kind::Pad);
    stage.first = padding + (padding & 1);
    return stage;
}

FilterStage FilterStage::drawText(const DrawTextOptions& options)
{
    FilterStage stage(Kind::DrawText);
    stage.drawTextOptions = options;
    return stage;
}

FilterStage FilterStage::subtitles(const juce::File& file)
{
    FilterStage stage(Kind::Subtitles);
    stage.scriptFile = file;
    return stage;
}

FilterStage FilterStage::palette(bool full)
{
    FilterStage stage(Kind::Palette);
    stage.fullPalette = full;
    return stage;
}

juce::String FilterStage::getKindName(Kind kind)
{
    switch (kind)
    {
        case Kind::ReverseConcat: return "ReverseConcat";
        case Kind::Fps:           return "Fps";
        case Kind::Crop:          return "Crop";
        case Kind::Scale:         return "Scale";
        case Kind::Pad:           return "Pad";
        case Kind::DrawText:      return "DrawText";
        case Kind::Subtitles:     return "Subtitles";
        case Kind::Palette:       return "Palette";
    }

    return "Unknown";
}

//==============================================================================
namespace FilterGraphFormatter
{
    juce::String escapeOptionValue(const juce::String& value)
    {
        return value.replace("\\", "\\\\")
                    .replace(":", "\\:")
                    .replace("'", "\\'");
    }

    juce::String escapeGraphText(const juce::String& text)
    {
        juce::String escaped;

        for (auto c : text)
        {
            if (c == '\\' || c == '\'' || c == '[' || c == ']' || c == ',' || c == ';')
                escaped << '\\';

            escaped << c;
        }

        return escaped;
    }

    juce::String escapePath(const juce::File& file)
    {
        juce::String path = file.getFullPathName();

       #if JUCE_WINDOWS
        // ffmpeg accepts forward slashes on Windows; elsewhere a backslash is part of the name
        path = path.replaceCharacter('\\', '/');
       #endif

        return escapeGraphText(escapeOptionValue(path));
    }

    namespace
    {
        juce::String formatDrawText(const DrawTextOptions& options)
        {
            juce::String text = "drawtext=";

            if (options.fontFile != juce::File())
                text << "fontfile=" << escapePath(options.fontFile);
            else
                text << "font=" << escapeGraphText(escapeOptionValue(options.font));

            text << ":fontsize=" << options.fontSize
                 << ":fontcolor=" << options.fontColour
                 << ":borderw=" << options.borderWidth
                 << ":bordercolor=" << options.borderColour
                 << ":x=(w-text_w)/2"
                 << ":y=h-text_h-" << options.bottomMargin
                 << ":expansion=none"
                 << ":text=" << escapeGraphText(escapeOptionValue(options.lines.joinIntoString("\n")));

            return text;
        }
    }

    juce::String formatStage(const FilterStage& stage)
    {
        using Kind = FilterStage::Kind;

        switch (stage.getKind())
        {
            case Kind::ReverseConcat:
                return "[0]reverse[r];[0][r]concat=n=2:v=1:a=0";

            case Kind::Fps:
                return "fps=" + juce::String(stage.getFps());

            case Kind::Crop:
                return "crop=min(iw\\,ih):min(iw\\,ih)";

            case Kind::Scale:
                return "scale=" + juce::String(stage.getWidth()) + ":" + juce::String(stage.getHeight()) + ":flags=lanczos";

            case Kind::Pad:
                return "pad=iw:ih+" + juce::String(stage.getPadding()) + ":0:" + juce::String(stage.getPadding());

            case Kind::DrawText:
                return formatDrawText(stage.getDrawText());

            case Kind::Subtitles:
                return "subtitles=" + escapePath(stage.getScriptFile());

            case Kind::Palette:
                return stage.isFullPalette()
                    ? "split[s0][s1];[s0]palettegen[p];[s1][p]paletteuse"
                    : "split[s0][s1];[s0]palettegen=max_colors=32[p];[s1][p]paletteuse=dither=bayer";
        }

        jassertfalse;
        return {};
    }

    juce::String format(const std::vector<FilterStage>& stages)
    {
        juce::StringArray parts;

        for (const auto& stage : stages)
            parts.add(formatStage(stage));

        return parts.joinIntoString(",");
    }
}

//==============================================================================
namespace FilterGraphBuilder
{
    std::vector<FilterStage> buildStages(const ClipSettings& settings,
                                         const juce::File& scriptFile,
                                         std::optional<int> captionPadding,
                                         bool includePalette)
    {
        std::vector<FilterStage> stages;

        if (settings.isBoomerang())
            stages.push_back(FilterStage::reverseConcat());

        stages.push_back(FilterStage::fps(settings.getFps()));

        if (settings.shouldCrop())
            stages.push_back(FilterStage::squareCrop());

        stages.push_back(FilterStage::scale(settings.getWidth(), settings.getHeight()));

        if (captionPadding.has_value())
            stages.push_back(FilterStage::padTop(*captionPadding));

        if (scriptFile != juce::File())
            stages.push_back(FilterStage::subtitles(scriptFile));

        if (includePalette && settings.getOutputFormat() == ClipTypes::VideoFormat::Gif)
            stages.push_back(FilterStage::palette(settings.isHdGif()));

        return stages;
    }

    std::vector<FilterStage> buildSegmentStages(int fps, bool crop, int width, int height,
                                                const DrawTextOptions& overlay)
    {
        std::vector<FilterStage> stages;
        stages.push_back(FilterStage::fps(fps));

        if (crop)
            stages.push_back(FilterStage::squareCrop());

        stages.push_back(FilterStage::scale(width, height));

        if (overlay.lines.size() > 0)
            stages.push_back(FilterStage::drawText(overlay));

        return stages;
    }

    std::vector<Subtitle> mirrorForBoomerang(const std::vector<Subtitle>& cues,
                                             juce::int64 clipStartMs,
                                             juce::int64 durationMs)
    {
        std::vector<Subtitle> result(cues);

        for (const auto& cue : cues)
        {
            const juce::int64 relativeStart = cue.getStartMs() - clipStartMs;
            const juce::int64 relativeEnd = cue.getEndMs() - clipStartMs;

            result.push_back(cue.withTimes(clipStartMs + 2 * durationMs - relativeEnd,
                                           clipStartMs + 2 * durationMs - relativeStart));
        }

        return result;
    }

    Subtitle makeCaptionCue(const juce::StringArray& lines,
                            juce::int64 clipStartMs,
                            juce::int64 durationMs,
                            bool boomerang)
    {
        const juce::int64 span = boomerang ? 2 * durationMs : durationMs;
        return Subtitle(clipStartMs, clipStartMs + span, lines);
    }
}
