#pragma once
#include <juce_core/juce_core.h>

/**
 * Conversions between millisecond times and the timestamp formats used by
 * ASS scripts and SubRip files.
 */
namespace SubtitleTiming
{
    /**
     * Formats milliseconds as an ASS timestamp "H:MM:SS.CC".
     *
     * Centiseconds are rounded half-up, hours are unbounded and carry no
     * leading zero. Negative input is clamped to 0:00:00.00.
     */
    juce::String toAssTimestamp(juce::int64 milliseconds);

    /**
     * Parses a SubRip timestamp ("HH:MM:SS,mmm", a '.' separator is also
     * accepted) into milliseconds. Returns -1 if the text is malformed.
     */
    juce::int64 parseSrtTimestamp(const juce::String& timestamp);

    /** Seconds with millisecond precision, as passed to ffmpeg's -ss / -t. */
    juce::String toSecondsArgument(juce::int64 milliseconds);
}
