#include "SubtitleTiming.h"

namespace SubtitleTiming
{
    juce::String toAssTimestamp(juce::int64 milliseconds)
    {
        if (milliseconds < 0)
            milliseconds = 0;

        juce::int64 cs = (milliseconds + 5) / 10;

        const juce::int64 hours = cs / 360000;
        cs %= 360000;
        const int minutes = (int) (cs / 6000);
        cs %= 6000;
        const int seconds = (int) (cs / 100);
        cs %= 100;

        return juce::String(hours) + ":"
             + juce::String(minutes).paddedLeft('0', 2) + ":"
             + juce::String(seconds).paddedLeft('0', 2) + "."
             + juce::String((int) cs).paddedLeft('0', 2);
    }

    juce::int64 parseSrtTimestamp(const juce::String& timestamp)
    {
        const juce::String text = timestamp.trim().replaceCharacter(',', '.');

        juce::StringArray parts;
        parts.addTokens(text, ":", "");

        if (parts.size() != 3)
            return -1;

        if (parts[0].isEmpty() || parts[1].isEmpty()
             || ! parts[0].containsOnly("0123456789") || ! parts[1].containsOnly("0123456789")
             || ! parts[2].containsOnly("0123456789."))
            return -1;

        const juce::String secondsPart = parts[2].upToFirstOccurrenceOf(".", false, false);
        juce::String millisPart = parts[2].fromFirstOccurrenceOf(".", false, false);

        if (secondsPart.isEmpty() || millisPart.containsChar('.'))
            return -1;

        // "1", "12" and "123" mean 100, 120 and 123 ms
        millisPart = millisPart.substring(0, 3).paddedRight('0', 3);

        const juce::int64 hours = parts[0].getLargeIntValue();
        const juce::int64 minutes = parts[1].getLargeIntValue();
        const juce::int64 seconds = secondsPart.getLargeIntValue();

        if (minutes > 59 || seconds > 59)
            return -1;

        return ((hours * 60 + minutes) * 60 + seconds) * 1000 + millisPart.getLargeIntValue();
    }

    juce::String toSecondsArgument(juce::int64 milliseconds)
    {
        return juce::String((double) milliseconds / 1000.0, 3);
    }
}
