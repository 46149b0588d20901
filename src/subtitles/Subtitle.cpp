#include "Subtitle.h"
#include <algorithm>

Subtitle::Subtitle(juce::int64 start, juce::int64 end, const juce::StringArray& text, juce::int64 delay, int id)
    : startMs(start),
      endMs(end),
      lines(text),
      delayMs(delay),
      sequenceId(id)
{
}

bool Subtitle::isValid() const noexcept
{
    return startMs >= 0 && endMs > startMs;
}

Subtitle Subtitle::withTimes(juce::int64 newStartMs, juce::int64 newEndMs) const
{
    return Subtitle(newStartMs, newEndMs, lines, delayMs, sequenceId);
}

Subtitle Subtitle::withSequenceId(int newSequenceId) const
{
    return Subtitle(startMs, endMs, lines, delayMs, newSequenceId);
}

std::vector<Subtitle> sortedByStart(std::vector<Subtitle> cues)
{
    std::stable_sort(cues.begin(), cues.end());
    return cues;
}

//==============================================================================
SubtitleTrack::SubtitleTrack(std::vector<Subtitle> source)
{
    source = sortedByStart(std::move(source));
    cues.reserve(source.size());

    for (size_t i = 0; i < source.size(); ++i)
        cues.push_back(source[i].withSequenceId((int) i));
}

const Subtitle* SubtitleTrack::previous(int index) const
{
    if (index <= 0 || index > size())
        return nullptr;

    return &cues[(size_t) index - 1];
}

const Subtitle* SubtitleTrack::next(int index) const
{
    if (index < 0 || index + 1 >= size())
        return nullptr;

    return &cues[(size_t) index + 1];
}

std::vector<Subtitle> SubtitleTrack::selectRange(int firstId, int lastId) const
{
    std::vector<Subtitle> selection;

    const int first = juce::jmax(0, firstId);
    const int last = juce::jmin(size() - 1, lastId);

    for (int i = first; i <= last; ++i)
        selection.push_back(cues[(size_t) i]);

    return selection;
}
