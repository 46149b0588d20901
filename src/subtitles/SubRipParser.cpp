#include "SubRipParser.h"
#include "SubtitleTiming.h"

namespace
{
    bool isCounterLine(const juce::String& line)
    {
        return line.isNotEmpty() && line.containsOnly("0123456789");
    }

    bool parseTimingLine(const juce::String& line, juce::int64& startMs, juce::int64& endMs)
    {
        if (! line.contains("-->"))
            return false;

        const juce::String startText = line.upToFirstOccurrenceOf("-->", false, false).trim();

        // Some writers append position hints ("X1:... Y1:...") after the end time
        const juce::String endText = line.fromFirstOccurrenceOf("-->", false, false).trim()
                                         .upToFirstOccurrenceOf(" ", false, false);

        startMs = SubtitleTiming::parseSrtTimestamp(startText);
        endMs = SubtitleTiming::parseSrtTimestamp(endText);
        return startMs >= 0 && endMs >= 0;
    }
}

juce::String SubRipParser::stripTags(const juce::String& line)
{
    juce::String result;
    int position = 0;

    while (position < line.length())
    {
        const int open = line.indexOfChar(position, '<');
        if (open < 0)
        {
            result << line.substring(position);
            break;
        }

        const int close = line.indexOfChar(open, '>');
        if (close < 0)
        {
            result << line.substring(position);
            break;
        }

        const juce::String tag = line.substring(open + 1, close).trim().toLowerCase().trimCharactersAtStart("/");
        const bool knownTag = tag == "i" || tag == "b" || tag == "u" || tag.startsWith("font");

        result << line.substring(position, knownTag ? open : close + 1);
        position = close + 1;
    }

    return result;
}

SubtitleTrack SubRipParser::parse(const juce::String& text) const
{
    skippedBlocks = 0;

    juce::StringArray allLines;
    allLines.addLines(text.replace("\r\n", "\n").replace("\r", "\n"));

    // A leading byte-order mark survives addLines()
    if (allLines.size() > 0 && allLines[0].startsWithChar((juce::juce_wchar) 0xfeff))
        allLines.set(0, allLines[0].substring(1));

    std::vector<Subtitle> cues;
    int lineIndex = 0;
    int blockNumber = 0;

    while (lineIndex < allLines.size())
    {
        while (lineIndex < allLines.size() && allLines[lineIndex].trim().isEmpty())
            ++lineIndex;

        if (lineIndex >= allLines.size())
            break;

        juce::StringArray block;
        while (lineIndex < allLines.size() && allLines[lineIndex].trim().isNotEmpty())
            block.add(allLines[lineIndex++].trim());

        ++blockNumber;

        int timingIndex = isCounterLine(block[0]) ? 1 : 0;
        juce::int64 startMs = -1, endMs = -1;

        if (! parseTimingLine(block[timingIndex], startMs, endMs))
        {
            log("Skipping subtitle block " + juce::String(blockNumber) + ": unreadable timing line '" + block[timingIndex] + "'");
            ++skippedBlocks;
            continue;
        }

        if (endMs <= startMs)
        {
            log("Skipping subtitle block " + juce::String(blockNumber) + ": end "
                + juce::String(endMs) + " ms is not after start " + juce::String(startMs) + " ms");
            ++skippedBlocks;
            continue;
        }

        juce::StringArray cueLines;
        for (int i = timingIndex + 1; i < block.size(); ++i)
        {
            const juce::String cleaned = stripTags(block[i]).trim();
            if (cleaned.isNotEmpty())
                cueLines.add(cleaned);
        }

        if (cueLines.isEmpty())
        {
            log("Skipping subtitle block " + juce::String(blockNumber) + ": no text after removing tags");
            ++skippedBlocks;
            continue;
        }

        cues.emplace_back(startMs, endMs, cueLines);
    }

    return SubtitleTrack(std::move(cues));
}

ClipResult<SubtitleTrack> SubRipParser::parseFile(const juce::File& file) const
{
    if (! file.existsAsFile())
        return ClipResult<SubtitleTrack>::fail(ClipErrorKind::Extraction,
                                               "Subtitle file not found: " + file.getFullPathName());

    juce::MemoryBlock data;
    if (! file.loadFileAsData(data))
        return ClipResult<SubtitleTrack>::fail(ClipErrorKind::Extraction,
                                               "Could not read subtitle file: " + file.getFullPathName());

    const juce::String text = juce::String::fromUTF8(static_cast<const char*>(data.getData()), (int) data.getSize());
    return ClipResult<SubtitleTrack>::ok(parse(text));
}
