#include "AssScriptBuilder.h"
#include "SubtitleTiming.h"

namespace
{
    const char* const eventFormatLine = "Format: Layer,Start,End,Style,Name,MarginL,MarginR,MarginV,Effect,Text";

    // ASS booleans are -1 for true
    juce::String assBool(bool value)
    {
        return value ? "-1" : "0";
    }

    // Braces would open an override block; raw line breaks would end the event
    juce::String escapeDialogueText(const juce::String& text)
    {
        return text.replace("{", "\\{")
                   .replace("}", "\\}")
                   .replace("\r\n", "\n")
                   .replace("\r", "\n")
                   .replace("\n", "\\N");
    }
}

AssScriptBuilder::AssScriptBuilder(int resX, int resY)
    : playResX(resX),
      playResY(resY)
{
}

void AssScriptBuilder::addBlock(const ClipTypes::TextStyle& style, const std::vector<Subtitle>& cues, juce::int64 clipStartMs)
{
    if (cues.empty())
        return;

    Block block;
    block.style = style;
    block.cues = sortedByStart(cues);
    block.clipStartMs = clipStartMs;
    blocks.push_back(std::move(block));
}

int AssScriptBuilder::getNumDialogues() const noexcept
{
    int count = 0;
    for (const auto& block : blocks)
        count += (int) block.cues.size();
    return count;
}

juce::String AssScriptBuilder::joinLines(const juce::StringArray& lines)
{
    juce::StringArray escaped;
    for (const auto& line : lines)
        escaped.add(escapeDialogueText(line));

    return escaped.joinIntoString("\\N");
}

juce::String AssScriptBuilder::buildScriptInfo(int width, int height)
{
    juce::String text;
    text << "[Script Info]\n"
         << "ScriptType: v4.00+\n"
         << "PlayResX: " << width << "\n"
         << "PlayResY: " << height << "\n";
    return text;
}

juce::String AssScriptBuilder::buildStyleFormatLine()
{
    return "Format: Name,Fontname,Fontsize,PrimaryColour,SecondaryColour,"
           "OutlineColour,BackColour,Bold,Italic,Underline,StrikeOut,"
           "ScaleX,ScaleY,Spacing,Angle,BorderStyle,Outline,Shadow,"
           "Alignment,MarginL,MarginR,MarginV,Encoding";
}

juce::String AssScriptBuilder::buildStyleLine(const ClipTypes::TextStyle& style)
{
    juce::String line;
    line << "Style: " << style.name << ","
         << style.font << ","
         << style.fontSize << ","
         << style.fontColour << ",&H00000000,"
         << style.outlineColour << ",&H00000000,"
         << assBool(style.bold) << ","
         << assBool(style.italic) << ",0,0,100,100,0,0,1,"
         << style.getOutlineWidth() << ","
         << (style.shadow ? 1 : 0) << ","
         << style.alignment << ","
         << style.marginL << ","
         << style.marginR << ","
         << style.marginV << ",1";
    return line;
}

juce::String AssScriptBuilder::buildDialogueLine(const Subtitle& cue, juce::int64 clipStartMs, const ClipTypes::TextStyle& style)
{
    const juce::String start = SubtitleTiming::toAssTimestamp(cue.getStartMs() + cue.getDelayMs() - clipStartMs);
    const juce::String end = SubtitleTiming::toAssTimestamp(cue.getEndMs() - clipStartMs);

    juce::String line;
    line << "Dialogue: 0," << start << "," << end << "," << style.name << ",,"
         << style.marginL << "," << style.marginR << "," << style.marginV << ",,"
         << joinLines(cue.getLines());
    return line;
}

juce::String AssScriptBuilder::build() const
{
    juce::String script = buildScriptInfo(playResX, playResY);

    script << "\n[V4+ Styles]\n" << buildStyleFormatLine() << "\n";
    for (const auto& block : blocks)
        script << buildStyleLine(block.style) << "\n";

    script << "\n[Events]\n" << eventFormatLine << "\n";
    for (const auto& block : blocks)
        for (const auto& cue : block.cues)
            script << buildDialogueLine(cue, block.clipStartMs, block.style) << "\n";

    return script;
}

ClipStatus AssScriptBuilder::writeTo(const juce::File& file) const
{
    if (! file.replaceWithText(build(), false, false, "\n"))
        return ClipStatus::fail(ClipErrorKind::MissingArtifact, "Could not write subtitle script: " + file.getFullPathName());

    return ClipStatus::ok();
}

juce::String AssScriptBuilder::buildCaptionProbeScript(const ClipTypes::TextStyle& captionStyle,
                                                       const juce::StringArray& captionLines,
                                                       int width,
                                                       int height)
{
    AssScriptBuilder builder(width, height);
    builder.addBlock(captionStyle, { Subtitle(0, 5000, captionLines) }, 0);
    return builder.build();
}
