// Filter stage order, ffmpeg syntax and escaping, boomerang cue mirroring.
#include <iostream>
#include <string>

#include "test_utils.h"
#include "../src/rendering/ClipSettings.h"
#include "../src/rendering/FilterGraph.h"

using Kind = FilterStage::Kind;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[filter_graph_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

const juce::File work_dir("/tmp/cueclip_filter_unit");

ClipSettings make_settings(ClipTypes::VideoFormat format, bool boomerang, bool crop, bool hd) {
    ClipRequest request;
    request.inputFile = work_dir.getChildFile("input.mkv");
    request.outputFile = work_dir.getChildFile("out." + ClipTypes::getExtension(format));
    request.outputFormat = format;
    request.startMs = 10000;
    request.endMs = 15000;
    request.width = crop ? 320 : 480;
    request.height = crop ? 320 : 270;
    request.crop = crop;
    request.boomerang = boomerang;
    request.hdGif = hd;
    return ClipSettings::fromRequest(request, nullptr).getValue();
}

std::vector<Kind> kinds_of(const std::vector<FilterStage> &stages) {
    std::vector<Kind> kinds;
    for (const auto &stage : stages) {
        kinds.push_back(stage.getKind());
    }
    return kinds;
}

bool test_stage_order() {
    const auto settings = make_settings(ClipTypes::VideoFormat::Gif, true, true, false);
    const juce::File script = work_dir.getChildFile("sub.ass");

    auto stages = FilterGraphBuilder::buildStages(settings, script, std::nullopt, true);
    const std::vector<Kind> expected = {Kind::ReverseConcat, Kind::Fps, Kind::Crop, Kind::Scale,
                                        Kind::Subtitles, Kind::Palette};
    bool ok = check(kinds_of(stages) == expected, "boomerang crop gif order");
    ok &= check(!stages.back().isFullPalette(), "reduced palette by default");

    auto padded = FilterGraphBuilder::buildStages(settings, script, 40, true);
    const std::vector<Kind> withPad = {Kind::ReverseConcat, Kind::Fps, Kind::Crop, Kind::Scale, Kind::Pad,
                                       Kind::Subtitles, Kind::Palette};
    ok &= check(kinds_of(padded) == withPad, "pad sits between scale and subtitles");

    auto bare = FilterGraphBuilder::buildStages(make_settings(ClipTypes::VideoFormat::Gif, false, false, true),
                                                juce::File(), std::nullopt, true);
    const std::vector<Kind> minimal = {Kind::Fps, Kind::Scale, Kind::Palette};
    ok &= check(kinds_of(bare) == minimal, "no script means no subtitles stage");
    ok &= check(bare.back().isFullPalette(), "hd gif uses the full palette");
    return ok;
}

bool test_palette_only_for_gif() {
    const juce::File script = work_dir.getChildFile("sub.ass");

    auto mp4 = FilterGraphBuilder::buildStages(make_settings(ClipTypes::VideoFormat::Mp4, false, false, false),
                                               script, std::nullopt, true);
    bool ok = check(kinds_of(mp4).back() == Kind::Subtitles, "mp4 has no palette");

    auto webp = FilterGraphBuilder::buildStages(make_settings(ClipTypes::VideoFormat::Webp, false, false, false),
                                                script, std::nullopt, true);
    ok &= check(kinds_of(webp).back() == Kind::Subtitles, "webp has no palette");

    auto companion = FilterGraphBuilder::buildStages(make_settings(ClipTypes::VideoFormat::Gif, false, false, false),
                                                     script, std::nullopt, false);
    ok &= check(kinds_of(companion).back() == Kind::Subtitles, "companion graph drops the palette");
    return ok;
}

bool test_formatting() {
    bool ok = check(FilterGraphFormatter::formatStage(FilterStage::fps(12)) == "fps=12", "fps");
    ok &= check(FilterGraphFormatter::formatStage(FilterStage::squareCrop()) == R"(crop=min(iw\,ih):min(iw\,ih))", "crop");
    ok &= check(FilterGraphFormatter::formatStage(FilterStage::scale(480, 270)) == "scale=480:270:flags=lanczos", "scale");
    ok &= check(FilterGraphFormatter::formatStage(FilterStage::reverseConcat()) == "[0]reverse[r];[0][r]concat=n=2:v=1:a=0",
                "reverse concat");
    ok &= check(FilterGraphFormatter::formatStage(FilterStage::palette(true))
                    == "split[s0][s1];[s0]palettegen[p];[s1][p]paletteuse",
                "full palette");
    ok &= check(FilterGraphFormatter::formatStage(FilterStage::palette(false))
                    == "split[s0][s1];[s0]palettegen=max_colors=32[p];[s1][p]paletteuse=dither=bayer",
                "reduced palette");

    const auto settings = make_settings(ClipTypes::VideoFormat::Gif, false, false, false);
    const juce::String graph = FilterGraphFormatter::format(
        FilterGraphBuilder::buildStages(settings, juce::File(), std::nullopt, true));
    ok &= check(graph == "fps=20,scale=480:270:flags=lanczos,"
                         "split[s0][s1];[s0]palettegen=max_colors=32[p];[s1][p]paletteuse=dither=bayer",
                "stages joined with commas");
    return ok;
}

bool test_padding() {
    bool ok = check(FilterStage::padTop(51).getPadding() == 52, "odd padding rounds up");
    ok &= check(FilterStage::padTop(50).getPadding() == 50, "even padding kept");
    ok &= check(FilterGraphFormatter::formatStage(FilterStage::padTop(51)) == "pad=iw:ih+52:0:52", "pad syntax");
    return ok;
}

bool test_escaping() {
    bool ok = check(FilterGraphFormatter::escapeOptionValue(R"(C:\a'b)") == R"(C\:\\a\'b)", "option escaping");
    ok &= check(FilterGraphFormatter::escapeGraphText(R"(a,b;[c]'d\)") == R"(a\,b\;\[c\]\'d\\)", "graph escaping");
    ok &= check(FilterGraphFormatter::escapePath(juce::File("/tmp/a:b.ass")) == R"(/tmp/a\\:b.ass)", "colon in a path");
    ok &= check(FilterGraphFormatter::escapePath(juce::File("/tmp/it's.ass")) == R"(/tmp/it\\\'s.ass)",
                "quote in a path");
    ok &= check(FilterGraphFormatter::formatStage(FilterStage::subtitles(juce::File("/tmp/x,y.ass")))
                    == R"(subtitles=/tmp/x\,y.ass)",
                "subtitles stage path");
#if !JUCE_WINDOWS
    ok &= check(FilterGraphFormatter::escapePath(juce::File(R"(/tmp/a\b.ass)")) == R"(/tmp/a\\\\b.ass)",
                "backslash in a path is escaped, not rewritten");
    ok &= check(FilterGraphFormatter::formatStage(FilterStage::subtitles(juce::File(R"(/tmp/x\y.ass)")))
                    == R"(subtitles=/tmp/x\\\\y.ass)",
                "subtitles stage keeps a backslash");
#endif
    return ok;
}

bool test_draw_text() {
    DrawTextOptions options;
    options.lines = {"Hi: there", "it's"};
    options.font = "Arial";

    const juce::String expected = juce::String("drawtext=font=Arial:fontsize=24:fontcolor=white:borderw=2:bordercolor=black:"
                                               "x=(w-text_w)/2:y=h-text_h-10:expansion=none:text=")
                                  + R"(Hi\\: there)" + "\n" + R"(it\\\'s)";
    bool ok = check(FilterGraphFormatter::formatStage(FilterStage::drawText(options)) == expected, "drawtext syntax");

    options.fontFile = juce::File("/fonts/Sans.ttf");
    ok &= check(FilterGraphFormatter::formatStage(FilterStage::drawText(options)).startsWith("drawtext=fontfile=/fonts/Sans.ttf:"),
                "font file replaces the family");
    return ok;
}

bool test_segment_stages() {
    DrawTextOptions overlay;
    overlay.lines = {"Segment"};

    const std::vector<Kind> full = {Kind::Fps, Kind::Crop, Kind::Scale, Kind::DrawText};
    bool ok = check(kinds_of(FilterGraphBuilder::buildSegmentStages(20, true, 320, 320, overlay)) == full,
                    "segment with crop and text");

    const std::vector<Kind> plain = {Kind::Fps, Kind::Scale};
    ok &= check(kinds_of(FilterGraphBuilder::buildSegmentStages(20, false, 480, 270, DrawTextOptions())) == plain,
                "segment without text has no drawtext");
    return ok;
}

bool test_boomerang_mirroring() {
    const std::vector<Subtitle> cues = {Subtitle(11000, 12000, {"one"}, 0, 4)};
    const auto mirrored = FilterGraphBuilder::mirrorForBoomerang(cues, 10000, 5000);

    bool ok = check(mirrored.size() == 2, "original plus mirror");
    if (mirrored.size() == 2) {
        ok &= check(mirrored[0].getStartMs() == 11000 && mirrored[0].getEndMs() == 12000, "original untouched");
        ok &= check(mirrored[1].getStartMs() - 10000 == 8000 && mirrored[1].getEndMs() - 10000 == 9000,
                    "(1000,2000) mirrors to (8000,9000)");
        ok &= check(mirrored[1].getLines()[0] == "one" && mirrored[1].getSequenceId() == 4, "mirror keeps text and id");
    }

    const Subtitle caption = FilterGraphBuilder::makeCaptionCue({"Cap"}, 10000, 5000, false);
    ok &= check(caption.getStartMs() == 10000 && caption.getEndMs() == 15000, "caption spans the clip");

    const Subtitle boomerangCaption = FilterGraphBuilder::makeCaptionCue({"Cap"}, 10000, 5000, true);
    ok &= check(boomerangCaption.getEndMs() == 20000, "boomerang caption spans twice the clip");
    return ok;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_stage_order();
    ok &= test_palette_only_for_gif();
    ok &= test_formatting();
    ok &= test_padding();
    ok &= test_escaping();
    ok &= test_draw_text();
    ok &= test_segment_stages();
    ok &= test_boomerang_mirroring();

    if (!ok) {
        return 1;
    }
    std::cout << "filter_graph_unit OK\n";
    return 0;
}
