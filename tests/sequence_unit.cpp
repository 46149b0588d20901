// Multi-segment sequences: contiguity, spans, concat list and the full run.
#include <cmath>
#include <iostream>
#include <string>

#include "test_utils.h"
#include "../src/rendering/ScopedWorkingDirectory.h"
#include "../src/rendering/SequenceConcatenator.h"

using test_utils::FakeExecutor;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[sequence_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

SequenceSegment segment(int id, juce::int64 start, juce::int64 end, const char *text) {
    SequenceSegment s;
    s.sequenceId = id;
    s.startMs = start;
    s.endMs = end;
    s.lines = {text};
    return s;
}

SequenceRequest make_request(const juce::File &dir, std::vector<SequenceSegment> segments) {
    SequenceRequest request;
    request.inputFile = dir.getChildFile("movie.mkv");
    request.outputFile = dir.getChildFile("sequence.gif");
    request.width = 480;
    request.height = 270;
    request.segments = std::move(segments);
    return request;
}

std::vector<SequenceSegment> three_segments() {
    return {segment(3, 1000, 2500, "first"), segment(4, 3000, 5000, "second"), segment(5, 6000, 8000, "third")};
}

bool near_seconds(const juce::String &argument, double expected) {
    return std::abs(argument.getDoubleValue() - expected) < 1.0e-6;
}

bool test_contiguity() {
    bool ok = check(SequenceConcatenator::checkContiguous(three_segments()).wasOk(), "3,4,5 is contiguous");

    auto gap = SequenceConcatenator::checkContiguous(
        {segment(3, 0, 1000, "a"), segment(5, 1000, 2000, "b"), segment(6, 2000, 3000, "c")});
    ok &= check(gap.failed() && gap.getError().kind == ClipErrorKind::Sequence, "3,5,6 rejected");

    auto single = SequenceConcatenator::checkContiguous({segment(3, 0, 1000, "a")});
    ok &= check(single.failed() && single.getError().kind == ClipErrorKind::Sequence, "one segment rejected");

    auto reversed = SequenceConcatenator::checkContiguous({segment(4, 0, 1000, "a"), segment(3, 1000, 2000, "b")});
    ok &= check(reversed.failed(), "descending ids rejected");
    return ok;
}

bool test_spans() {
    auto spans = SequenceConcatenator::computeSpans(three_segments());
    bool ok = check(spans.wasOk() && spans.getValue().size() == 3, "one span per segment");
    if (spans.wasOk() && spans.getValue().size() == 3) {
        const auto &s = spans.getValue();
        ok &= check(s[0].startMs == 1000 && s[0].endMs == 3000, "gap closed up to the next start");
        ok &= check(s[1].startMs == 3000 && s[1].endMs == 6000, "middle span");
        ok &= check(s[2].startMs == 6000 && s[2].endMs == 8000, "last span keeps its end");
    }

    auto empty = SequenceConcatenator::computeSpans({segment(1, 1000, 2000, "a"), segment(2, 1000, 3000, "b")});
    ok &= check(empty.failed() && empty.getError().kind == ClipErrorKind::Sequence, "zero-length span rejected");
    return ok;
}

bool test_concat_list() {
    const juce::String list = SequenceConcatenator::buildConcatList(
        {juce::File("/tmp/work/segment_001.mp4"), juce::File("/tmp/it's here/segment_002.mp4")});
    bool ok = check(list == "file '/tmp/work/segment_001.mp4'\n"
                            "file '/tmp/it'\\''s here/segment_002.mp4'\n",
                    "list lines quoted in order");
    ok &= check(SequenceConcatenator::buildConcatList({}).isEmpty(), "empty list");
#if !JUCE_WINDOWS
    ok &= check(SequenceConcatenator::buildConcatList({juce::File(R"(/tmp/a\b/segment_001.mp4)")})
                    == R"(file '/tmp/a\b/segment_001.mp4')" "\n",
                "backslash kept in a list line");
#endif
    return ok;
}

bool test_segment_from_cue() {
    const Subtitle cue(1000, 2000, {"Hello", "there"}, 0, 7);
    const SequenceSegment s = SequenceConcatenator::segmentFromCue(cue, "Helvetica", 30);
    bool ok = check(s.sequenceId == 7 && s.startMs == 1000 && s.endMs == 2000, "id and times copied");
    ok &= check(s.lines.size() == 2 && s.font == "Helvetica" && s.fontSize == 30, "text and font copied");
    return ok;
}

bool test_full_run(const juce::File &dir) {
    const juce::File workBase = dir.getChildFile("work_full");
    FakeExecutor executor;
    SequenceConcatenator concatenator(executor);
    concatenator.setWorkingDirectoryBase(workBase);

    auto output = concatenator.generate(make_request(dir, three_segments()));
    bool ok = check(output.wasOk(), "sequence succeeds");
    ok &= check(dir.getChildFile("sequence.gif").existsAsFile(), "sequence output written");

    const auto commands = executor.ffmpegCommands();
    ok &= check(commands.size() == 5, "three segments, concat, final pass");
    ok &= check(executor.commands.size() == 5, "explicit size needs no probe");
    if (commands.size() != 5) {
        return false;
    }

    ok &= check(near_seconds(FakeExecutor::argumentAfter(commands[0], "-ss"), 1.0), "segment 1 start");
    ok &= check(near_seconds(FakeExecutor::argumentAfter(commands[0], "-t"), 2.0), "segment 1 runs to segment 2");
    ok &= check(near_seconds(FakeExecutor::argumentAfter(commands[1], "-t"), 3.0), "segment 2 runs to segment 3");
    ok &= check(near_seconds(FakeExecutor::argumentAfter(commands[2], "-t"), 2.0), "segment 3 keeps its end");

    const juce::String segmentFilter = FakeExecutor::argumentAfter(commands[0], "-vf");
    ok &= check(segmentFilter.startsWith("fps=20,scale=480:270:flags=lanczos,drawtext=font=Arial:fontsize=24:"),
                "segment filter");
    ok &= check(segmentFilter.endsWith(":text=first"), "segment text drawn");
    ok &= check(FakeExecutor::argumentAfter(commands[0], "-c:v") == "libx264", "segments are mp4");
    ok &= check(commands[2][commands[2].size() - 1].endsWith("segment_003.mp4"), "segments numbered");

    ok &= check(FakeExecutor::argumentAfter(commands[3], "-f") == "concat", "concat demuxer");
    ok &= check(FakeExecutor::argumentAfter(commands[3], "-safe") == "0", "unsafe paths allowed");
    ok &= check(FakeExecutor::argumentAfter(commands[3], "-c") == "copy", "concat copies");

    ok &= check(FakeExecutor::argumentAfter(commands[4], "-i").endsWith("combined.mp4"), "final pass reads the join");
    const juce::String finalGraph = FakeExecutor::argumentAfter(commands[4], "-filter_complex");
    ok &= check(finalGraph.startsWith("fps=20,scale=480:270:flags=lanczos,split"), "final pass applies the palette");
    ok &= check(!finalGraph.contains("crop"), "final pass does not crop again");

    ok &= check(workBase.getNumberOfChildFiles(juce::File::findFilesAndDirectories) == 0, "working directory removed");
    return ok;
}

bool test_caption_and_failures(const juce::File &dir) {
    FakeExecutor executor;
    SequenceConcatenator concatenator(executor);
    concatenator.setWorkingDirectoryBase(dir.getChildFile("work_caption"));

    auto request = make_request(dir, three_segments());
    request.outputFile = dir.getChildFile("captioned.gif");
    request.captionLines = {"Top"};
    auto output = concatenator.generate(request);
    bool ok = check(output.wasOk(), "captioned sequence succeeds");

    const auto commands = executor.ffmpegCommands();
    ok &= check(commands.size() == 6, "caption probe added");
    if (commands.size() == 6) {
        ok &= check(commands[4].contains("lavfi"), "probe before the final pass");
        ok &= check(FakeExecutor::argumentAfter(commands[5], "-filter_complex").contains("pad=iw:ih+50:0:50,subtitles="),
                    "caption padded and burned once");
    }

    FakeExecutor gapExecutor;
    SequenceConcatenator gapConcatenator(gapExecutor);
    auto gap = gapConcatenator.generate(make_request(
        dir, {segment(3, 0, 1000, "a"), segment(5, 1000, 2000, "b"), segment(6, 2000, 3000, "c")}));
    ok &= check(gap.failed() && gap.getError().kind == ClipErrorKind::Sequence, "gap is a Sequence error");
    ok &= check(gapExecutor.commands.empty(), "nothing run for a gap");

    FakeExecutor failing;
    failing.failWhenContains = "segment_002";
    SequenceConcatenator failingConcatenator(failing);
    failingConcatenator.setWorkingDirectoryBase(dir.getChildFile("work_fail"));
    auto failed = failingConcatenator.generate(make_request(dir, three_segments()));
    ok &= check(failed.failed() && failed.getError().kind == ClipErrorKind::ToolInvocation, "segment failure reported");
    ok &= check(failing.ffmpegCommands().size() == 2, "stops at the failing segment");

    FakeExecutor cancelled;
    SequenceConcatenator cancelledConcatenator(cancelled);
    cancelledConcatenator.setWorkingDirectoryBase(dir.getChildFile("work_cancel"));
    cancelledConcatenator.cancel();
    auto fresh = cancelledConcatenator.generate(make_request(dir, three_segments()));
    ok &= check(fresh.wasOk(), "a cancel before generate does not carry over");
    return ok;
}

} // namespace

int main() {
    ScopedWorkingDirectory scratch("cueclip_sequence_unit");
    if (!scratch.isValid()) {
        std::cerr << "[sequence_unit] could not create a scratch directory\n";
        return 1;
    }

    bool ok = true;
    ok &= test_contiguity();
    ok &= test_spans();
    ok &= test_concat_list();
    ok &= test_segment_from_cue();
    ok &= test_full_run(scratch.getDirectory());
    ok &= test_caption_and_failures(scratch.getDirectory());

    if (!ok) {
        return 1;
    }
    std::cout << "sequence_unit OK\n";
    return 0;
}
