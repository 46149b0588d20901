// SubRip parsing, subtitle track selection, cue neighbourhood and extraction.
#include <iostream>
#include <string>

#include "test_utils.h"
#include "../src/rendering/ScopedWorkingDirectory.h"
#include "../src/subtitles/SubRipParser.h"
#include "../src/subtitles/SubtitleExtractor.h"
#include "../src/subtitles/SubtitleTrackSelector.h"

using test_utils::FakeExecutor;
using StreamInfo = FFmpegExecutor::MediaStreamInfo;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[subtitles_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

StreamInfo stream(int index, const char *type, const char *language = "", const char *title = "") {
    StreamInfo info;
    info.index = index;
    info.codecType = type;
    info.language = language;
    info.title = title;
    return info;
}

bool test_parse_srt() {
    const juce::String srt = "1\r\n"
                             "00:00:01,000 --> 00:00:02,500\r\n"
                             "<i>Hello</i> there\r\n"
                             "<font color=\"#ffffff\">second</font> line\r\n"
                             "\r\n"
                             "2\r\n"
                             "00:00:03,000 --> 00:00:04,000 X1:10 X2:20\r\n"
                             "Positioned\r\n"
                             "\r\n"
                             "\r\n"
                             "00:00:05,000 --> 00:00:06,000\r\n"
                             "No counter\r\n";

    SubRipParser parser;
    const SubtitleTrack track = parser.parse(srt);
    bool ok = check(track.size() == 3, "three cues parsed");
    ok &= check(parser.getNumSkippedBlocks() == 0, "nothing skipped");
    if (track.size() != 3) {
        return false;
    }
    ok &= check(track[0].getStartMs() == 1000 && track[0].getEndMs() == 2500, "first cue times");
    ok &= check(track[0].getLines().size() == 2, "multi-line cue");
    ok &= check(track[0].getLines()[0] == "Hello there", "italic tags removed");
    ok &= check(track[0].getLines()[1] == "second line", "font tags removed");
    ok &= check(track[1].getEndMs() == 4000, "position hints ignored");
    ok &= check(track[2].getLines()[0] == "No counter", "counter line optional");
    ok &= check(track[2].getSequenceId() == 2, "cues numbered by position");
    return ok;
}

bool test_skipped_blocks() {
    const char *srt = "\xef\xbb\xbf" "1\n"
                             "00:00:01,000 --> 00:00:02,000\n"
                             "Good\n"
                             "\n"
                             "2\n"
                             "garbage timing\n"
                             "Bad\n"
                             "\n"
                             "3\n"
                             "00:00:05,000 --> 00:00:05,000\n"
                             "Zero length\n"
                             "\n"
                             "4\n"
                             "00:00:07,000 --> 00:00:08,000\n"
                             "Also good\n";

    SubRipParser parser;
    juce::StringArray messages;
    parser.setLogCallback([&messages](const juce::String &message) { messages.add(message); });

    const SubtitleTrack track = parser.parse(juce::String::fromUTF8(srt));
    bool ok = check(track.size() == 2, "bad blocks dropped");
    ok &= check(parser.getNumSkippedBlocks() == 2, "two blocks skipped");
    ok &= check(messages.size() == 2, "each skip logged");
    if (track.size() == 2) {
        ok &= check(track[0].getLines()[0] == "Good", "byte-order mark stripped");
        ok &= check(track[1].getLines()[0] == "Also good", "parsing resumes after a bad block");
    }
    ok &= check(parser.parse("").isEmpty(), "empty input gives an empty track");
    return ok;
}

bool test_textless_blocks() {
    const juce::String srt = "1\n"
                             "00:00:01,000 --> 00:00:02,000\n"
                             "<i></i>\n"
                             "\n"
                             "2\n"
                             "00:00:03,000 --> 00:00:04,000\n"
                             "\n"
                             "3\n"
                             "00:00:05,000 --> 00:00:06,000\n"
                             "<b>Kept</b>\n";

    SubRipParser parser;
    juce::StringArray messages;
    parser.setLogCallback([&messages](const juce::String &message) { messages.add(message); });

    const SubtitleTrack track = parser.parse(srt);
    bool ok = check(track.size() == 1, "cues without text dropped");
    ok &= check(parser.getNumSkippedBlocks() == 2, "both text-less blocks counted");
    ok &= check(messages.size() == 2 && messages[0].contains("no text"), "text-less skips logged");
    if (track.size() == 1) {
        ok &= check(track[0].getLines()[0] == "Kept" && track[0].getStartMs() == 5000, "tagged cue kept");
    }
    return ok;
}

bool test_strip_tags() {
    bool ok = check(SubRipParser::stripTags("<b>bold</b> and <u>under</u>") == "bold and under", "b and u tags");
    ok &= check(SubRipParser::stripTags("a < b") == "a < b", "unclosed bracket kept");
    ok &= check(SubRipParser::stripTags("<c.yellow>x</c>") == "<c.yellow>x</c>", "unknown tags kept");
    return ok;
}

bool test_track_navigation() {
    const SubtitleTrack track({Subtitle(3000, 4000, {"c"}), Subtitle(1000, 2000, {"a"}), Subtitle(2000, 3000, {"b"})});

    bool ok = check(track[0].getLines()[0] == "a" && track[2].getLines()[0] == "c", "track sorted by start");
    ok &= check(track.previous(0) == nullptr, "no cue before the first");
    ok &= check(track.next(2) == nullptr, "no cue after the last");
    ok &= check(track.next(0) != nullptr && track.next(0)->getLines()[0] == "b", "next cue");
    ok &= check(track.previous(2) != nullptr && track.previous(2)->getLines()[0] == "b", "previous cue");

    const auto range = track.selectRange(1, 5);
    ok &= check(range.size() == 2 && range[0].getSequenceId() == 1, "range clamped to the track");
    ok &= check(track.selectRange(2, 1).empty(), "inverted range is empty");
    return ok;
}

bool test_track_selection() {
    const std::vector<StreamInfo> streams = {stream(0, "video"), stream(1, "audio", "eng"),
                                             stream(2, "subtitle", "eng", "English SDH"),
                                             stream(3, "subtitle", "eng", "English"),
                                             stream(4, "subtitle", "fre")};

    auto plain = SubtitleTrackSelector::selectTrack(streams, {"eng"}, false);
    bool ok = check(plain.wasOk() && plain.getValue() == 1, "SDH skipped, index relative to subtitles");

    auto withCc = SubtitleTrackSelector::selectTrack(streams, {"eng"}, true);
    ok &= check(withCc.wasOk() && withCc.getValue() == 0, "SDH accepted when asked");

    auto preference = SubtitleTrackSelector::selectTrack(streams, {"ger", "fre", "eng"}, false);
    ok &= check(preference.wasOk() && preference.getValue() == 2, "earliest matching language wins");

    auto missing = SubtitleTrackSelector::selectTrack(streams, {"spa"}, false);
    ok &= check(missing.failed() && missing.getError().kind == ClipErrorKind::Extraction, "no language match");
    ok &= check(missing.getError().message.contains("spa"), "message names the languages");

    auto none = SubtitleTrackSelector::selectTrack({stream(0, "video")}, {"eng"}, false);
    ok &= check(none.failed() && none.getError().message == "No subtitle streams found", "no subtitle streams");

    ok &= check(SubtitleTrackSelector::isClosedCaptionTitle("Hearing Impaired"), "hearing impaired title");
    ok &= check(!SubtitleTrackSelector::isClosedCaptionTitle("Commentary"), "ordinary title");
    return ok;
}

bool test_extraction(const juce::File &dir) {
    FakeExecutor executor;
    executor.streamsJson = R"({"streams":[{"index":0,"codec_type":"video"},)"
                           R"({"index":1,"codec_type":"subtitle","tags":{"language":"eng","title":"CC"}},)"
                           R"({"index":2,"codec_type":"subtitle","tags":{"language":"eng"}}]})";
    const juce::File input = test_utils::touch(dir, "movie.mkv");
    const juce::File srt = dir.getChildFile("subs.srt");

    SubtitleExtractor extractor(executor);
    auto track = extractor.extract(input, {"eng"}, false, srt);
    bool ok = check(track.wasOk(), "extraction succeeds");
    ok &= check(track.wasOk() && track.getValue().size() == 1, "extracted cues parsed");

    const auto commands = executor.ffmpegCommands();
    ok &= check(commands.size() == 1 && FakeExecutor::argumentAfter(commands[0], "-map") == "0:s:1",
                "maps the selected subtitle track");

    executor.skipOutputWhenContains = "0:s:1";
    auto missing = extractor.extract(input, {"eng"}, false, srt);
    ok &= check(missing.failed() && missing.getError().kind == ClipErrorKind::Extraction,
                "missing output is an Extraction error");

    executor.skipOutputWhenContains = {};
    executor.failWhenContains = "0:s:1";
    auto failed = extractor.extract(input, {"eng"}, false, srt);
    ok &= check(failed.failed() && failed.getError().kind == ClipErrorKind::ToolInvocation, "tool failure keeps its kind");
    ok &= check(failed.getErrorMessage().contains("sub track 1"), "tool failure names the track");
    ok &= check(failed.getError().command.contains("0:s:1"), "failure carries the command");

    executor.failWhenContains = {};
    auto noMatch = extractor.extract(input, {"jpn"}, false, srt);
    ok &= check(noMatch.failed() && noMatch.getError().message.contains("movie.mkv"), "no match names the input");

    SubRipParser parser;
    auto absent = parser.parseFile(dir.getChildFile("absent.srt"));
    ok &= check(absent.failed() && absent.getError().kind == ClipErrorKind::Extraction, "missing srt file");
    return ok;
}

} // namespace

int main() {
    ScopedWorkingDirectory scratch("cueclip_subtitles_unit");
    if (!scratch.isValid()) {
        std::cerr << "[subtitles_unit] could not create a scratch directory\n";
        return 1;
    }

    bool ok = true;
    ok &= test_parse_srt();
    ok &= test_skipped_blocks();
    ok &= test_textless_blocks();
    ok &= test_strip_tags();
    ok &= test_track_navigation();
    ok &= test_track_selection();
    ok &= test_extraction(scratch.getDirectory());

    if (!ok) {
        return 1;
    }
    std::cout << "subtitles_unit OK\n";
    return 0;
}
