#include "diar/diarization_merger.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>

namespace speechjobs {
namespace diar {

namespace {

constexpr double kEpsilon = 1e-9;

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string joinWords(const std::vector<stt::Word>& words) {
    std::string text;
    for (const auto& word : words) {
        std::string piece = trim(word.text);
        if (piece.empty()) {
            continue;
        }
        if (!text.empty()) {
            text += ' ';
        }
        text += piece;
    }
    return text;
}

void clampWords(stt::TranscriptSegment& segment) {
    for (auto& word : segment.words) {
        word.start = std::clamp(word.start, segment.start, segment.end);
        word.end = std::clamp(word.end, word.start, segment.end);
    }
}

std::vector<SpeakerTurn> sanitizeTurns(const std::vector<SpeakerTurn>& turns) {
    std::vector<SpeakerTurn> sorted;
    sorted.reserve(turns.size());
    for (const auto& turn : turns) {
        if (turn.end > turn.start) {
            sorted.push_back(turn);
        }
    }
    std::sort(sorted.begin(), sorted.end(), [](const SpeakerTurn& a, const SpeakerTurn& b) {
        if (a.start != b.start) return a.start < b.start;
        if (a.end != b.end) return a.end < b.end;
        return a.speaker < b.speaker;
    });
    return sorted;
}

} // namespace

SplitStrategy parseSplitStrategy(const std::string& name) {
    if (name == "word_boundary") return SplitStrategy::WORD_BOUNDARY;
    if (name == "midpoint") return SplitStrategy::MIDPOINT;
    throw utils::ValidationException("Unknown split strategy", name);
}

std::string splitStrategyToString(SplitStrategy strategy) {
    return strategy == SplitStrategy::MIDPOINT ? "midpoint" : "word_boundary";
}

MergePolicy MergePolicy::fromSettings(const utils::DiarizationSettings& settings) {
    MergePolicy policy;
    policy.dominance_threshold = settings.dominance_threshold;
    policy.split_strategy = parseSplitStrategy(settings.split_strategy);
    policy.min_split_duration = settings.min_split_duration;
    return policy;
}

DiarizationMerger::DiarizationMerger(const MergePolicy& policy)
    : policy_(policy) {
}

std::vector<stt::TranscriptSegment> DiarizationMerger::merge(
    const std::vector<stt::TranscriptSegment>& segments,
    const std::vector<SpeakerTurn>& turns) const {

    std::vector<stt::TranscriptSegment> input = segments;
    stt::normalizeSegments(input);
    auto sortedTurns = sanitizeTurns(turns);

    std::vector<stt::TranscriptSegment> output;
    output.reserve(input.size());
    for (auto& segment : input) {
        assign(std::move(segment), sortedTurns, output);
    }

    stt::normalizeSegments(output);

    std::string violation;
    if (!stt::validateSegments(output, &violation)) {
        throw utils::InternalException("Merged transcript violates segment ordering", violation);
    }

    utils::Logger::debug("Merged " + std::to_string(segments.size()) + " segments with " +
                         std::to_string(sortedTurns.size()) + " speaker turns into " +
                         std::to_string(output.size()) + " segments");
    return output;
}

std::vector<DiarizationMerger::SpeakerOverlap> DiarizationMerger::overlapsFor(
    double start, double end, const std::vector<SpeakerTurn>& turns) const {

    std::map<std::string, double> bySpeaker;
    for (const auto& turn : turns) {
        if (turn.start >= end) {
            break;
        }
        double overlap = std::min(end, turn.end) - std::max(start, turn.start);
        if (overlap > kEpsilon) {
            bySpeaker[turn.speaker] += overlap;
        }
    }

    std::vector<SpeakerOverlap> overlaps;
    overlaps.reserve(bySpeaker.size());
    for (const auto& entry : bySpeaker) {
        overlaps.push_back({entry.first, entry.second});
    }
    // Largest overlap first; equal overlaps resolve by speaker label
    std::stable_sort(overlaps.begin(), overlaps.end(), [](const SpeakerOverlap& a, const SpeakerOverlap& b) {
        return a.overlap > b.overlap;
    });
    return overlaps;
}

void DiarizationMerger::assign(stt::TranscriptSegment piece, const std::vector<SpeakerTurn>& turns,
                               std::vector<stt::TranscriptSegment>& output) const {
    auto overlaps = overlapsFor(piece.start, piece.end, turns);
    if (overlaps.empty()) {
        piece.speaker.reset();
        output.push_back(std::move(piece));
        return;
    }

    const auto& top = overlaps.front();
    double duration = piece.duration();
    bool dominant = overlaps.size() == 1 ||
                    top.overlap / duration + kEpsilon >= policy_.dominance_threshold;

    if (!dominant && duration >= policy_.min_split_duration) {
        // A rejected cut falls through to the next candidate change
        for (double change : findSpeakerChanges(piece.start, piece.end, turns)) {
            stt::TranscriptSegment left;
            stt::TranscriptSegment right;
            if (splitAt(piece, change, left, right)) {
                assign(std::move(left), turns, output);
                assign(std::move(right), turns, output);
                return;
            }
        }
    }

    piece.speaker = top.speaker;
    output.push_back(std::move(piece));
}

std::vector<double> DiarizationMerger::findSpeakerChanges(double start, double end,
                                                          const std::vector<SpeakerTurn>& turns) const {
    std::vector<double> changes;
    for (size_t i = 0; i + 1 < turns.size(); ++i) {
        const auto& current = turns[i];
        const auto& next = turns[i + 1];
        if (current.speaker == next.speaker) {
            continue;
        }
        // Overlapping turns change speaker where the next one starts; a gap
        // between turns changes speaker at its midpoint.
        double change = next.start < current.end ? next.start : (current.end + next.start) / 2.0;
        if (change > start + kEpsilon && change < end - kEpsilon) {
            changes.push_back(change);
        }
        if (next.start >= end) {
            break;
        }
    }

    double middle = (start + end) / 2.0;
    std::stable_sort(changes.begin(), changes.end(), [middle](double a, double b) {
        return std::abs(a - middle) < std::abs(b - middle);
    });
    return changes;
}

bool DiarizationMerger::splitAt(const stt::TranscriptSegment& piece, double time,
                                stt::TranscriptSegment& left, stt::TranscriptSegment& right) const {
    bool split = piece.hasWords() ? splitByWords(piece, time, left, right)
                                  : splitByText(piece, time, left, right);
    if (!split) {
        return false;
    }
    if (left.duration() < policy_.min_split_duration || right.duration() < policy_.min_split_duration) {
        return false;
    }
    clampWords(left);
    clampWords(right);
    return true;
}

bool DiarizationMerger::splitByWords(const stt::TranscriptSegment& piece, double time,
                                     stt::TranscriptSegment& left, stt::TranscriptSegment& right) const {
    const auto& words = piece.words;
    if (words.size() < 2) {
        return false;
    }

    size_t leftCount = 0;
    double boundary = time;

    if (policy_.split_strategy == SplitStrategy::WORD_BOUNDARY) {
        // Gap midpoint nearest the speaker change
        double bestDistance = 0.0;
        for (size_t k = 0; k + 1 < words.size(); ++k) {
            double gap = (words[k].end + words[k + 1].start) / 2.0;
            if (gap <= piece.start + kEpsilon || gap >= piece.end - kEpsilon) {
                continue;
            }
            double distance = std::abs(gap - time);
            if (leftCount == 0 || distance < bestDistance) {
                bestDistance = distance;
                boundary = gap;
                leftCount = k + 1;
            }
        }
    } else {
        for (const auto& word : words) {
            if ((word.start + word.end) / 2.0 < time) {
                ++leftCount;
            }
        }
        if (leftCount == words.size()) {
            leftCount = 0;
        }
    }

    if (leftCount == 0) {
        return false;
    }

    left = piece;
    right = piece;
    left.end = boundary;
    right.start = boundary;
    left.words.assign(words.begin(), words.begin() + static_cast<std::ptrdiff_t>(leftCount));
    right.words.assign(words.begin() + static_cast<std::ptrdiff_t>(leftCount), words.end());
    left.text = joinWords(left.words);
    right.text = joinWords(right.words);
    return !left.text.empty() && !right.text.empty();
}

bool DiarizationMerger::splitByText(const stt::TranscriptSegment& piece, double time,
                                    stt::TranscriptSegment& left, stt::TranscriptSegment& right) const {
    std::string text = trim(piece.text);
    if (text.empty()) {
        return false;
    }

    double fraction = (time - piece.start) / piece.duration();
    double target = fraction * static_cast<double>(text.size());

    size_t best = std::string::npos;
    double bestDistance = 0.0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (!std::isspace(static_cast<unsigned char>(text[i]))) {
            continue;
        }
        double distance = std::abs(static_cast<double>(i) - target);
        if (best == std::string::npos || distance < bestDistance) {
            best = i;
            bestDistance = distance;
        }
    }
    if (best == std::string::npos) {
        return false;
    }

    left = piece;
    right = piece;
    left.end = time;
    right.start = time;
    left.text = trim(text.substr(0, best));
    right.text = trim(text.substr(best + 1));
    return !left.text.empty() && !right.text.empty();
}

} // namespace diar
} // namespace speechjobs
