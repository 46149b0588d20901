#pragma once
#include <juce_core/juce_core.h>
#include <optional>
#include <vector>
#include "../rendering/ClipResult.h"
#include "../rendering/ClipSettings.h"
#include "../rendering/SequenceConcatenator.h"
#include "../subtitles/Subtitle.h"

/** Engine-wide options read from the "engine" object of a request file. */
struct EngineOptions
{
    juce::String ffmpegPath;        // empty = default lookup
    juce::String ffprobePath;
    int timeoutMs = 0;              // <= 0 = executor default
    juce::File logDirectory;        // per-command ffmpeg logs; empty = off
    juce::File workingDirectory;    // parent of scratch directories; empty = system temp
};

/** Where the cues for a request come from. */
struct CueSource
{
    enum class Kind
    {
        None,
        Inline,         // "cues" array in the request
        SubRipFile,     // "subtitles": { "file": ... }
        Extract         // "subtitles": { "languages": [...] }, pulled from the input
    };

    Kind kind = Kind::None;
    std::vector<Subtitle> inlineCues;
    juce::File srtFile;
    juce::StringArray languages;
    bool includeCc = false;

    /** Inclusive range of cue ids to use; unset = every cue inside the clip window. */
    std::optional<int> firstCue;
    std::optional<int> lastCue;
};

/** A fully parsed request document. Times may still depend on the cues. */
struct LoadedRequest
{
    EngineOptions engine;
    CueSource cueSource;

    ClipRequest clip;
    bool hasExplicitTimes = false;  // startMs/endMs were given

    juce::StringArray captionLines;

    /** Set when the request asks for a sequence of per-cue segments. */
    bool isSequence = false;
    juce::String segmentFont = "Arial";
    juce::File segmentFontFile;
    int segmentFontSize = 24;
    std::vector<SequenceSegment> explicitSegments;
};

//==============================================================================
/**
 * Reads JSON request documents.
 *
 * Relative paths are resolved against the directory holding the request
 * file. Every structural problem is a Configuration error; range checks on
 * the values themselves are left to ClipSettings::fromRequest().
 */
class ClipRequestLoader
{
public:
    /** Loads and parses a request file. */
    static ClipResult<LoadedRequest> loadFromFile(const juce::File& requestFile);

    /** Parses request text; relative paths resolve against `baseDirectory`. */
    static ClipResult<LoadedRequest> parse(const juce::String& json, const juce::File& baseDirectory);

    /** Reads a style object over `defaults`; missing keys keep their default. */
    static ClipTypes::TextStyle parseStyle(const juce::var& object, const ClipTypes::TextStyle& defaults);
};
