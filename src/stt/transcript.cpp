#include "stt/transcript.hpp"
#include <algorithm>
#include <sstream>

namespace speechjobs {
namespace stt {

bool operator==(const Word& a, const Word& b) {
    return a.text == b.text && a.start == b.start && a.end == b.end &&
           a.confidence == b.confidence;
}

bool operator==(const TranscriptSegment& a, const TranscriptSegment& b) {
    return a.id == b.id && a.text == b.text && a.start == b.start && a.end == b.end &&
           a.confidence == b.confidence && a.speaker == b.speaker && a.words == b.words;
}

void normalizeSegments(std::vector<TranscriptSegment>& segments) {
    std::vector<TranscriptSegment> normalized;
    normalized.reserve(segments.size());

    for (auto& segment : segments) {
        if (!normalized.empty() && segment.start < normalized.back().end) {
            segment.start = normalized.back().end;
        }
        if (segment.end <= segment.start) {
            continue;
        }

        for (auto& word : segment.words) {
            word.start = std::clamp(word.start, segment.start, segment.end);
            word.end = std::clamp(word.end, word.start, segment.end);
        }

        segment.id = static_cast<int>(normalized.size());
        normalized.push_back(std::move(segment));
    }

    segments = std::move(normalized);
}

bool validateSegments(const std::vector<TranscriptSegment>& segments, std::string* reason) {
    auto fail = [reason](const std::string& message) {
        if (reason) {
            *reason = message;
        }
        return false;
    };

    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = segments[i];
        if (segment.id != static_cast<int>(i)) {
            return fail("segment " + std::to_string(i) + " has id " + std::to_string(segment.id));
        }
        if (!(segment.end > segment.start)) {
            return fail("segment " + std::to_string(i) + " has end <= start");
        }
        if (i + 1 < segments.size() && segment.end > segments[i + 1].start) {
            return fail("segment " + std::to_string(i) + " overlaps segment " + std::to_string(i + 1));
        }
    }
    return true;
}

std::string joinSegmentText(const std::vector<TranscriptSegment>& segments) {
    std::ostringstream text;
    bool first = true;
    for (const auto& segment : segments) {
        if (segment.text.empty()) {
            continue;
        }
        if (!first) {
            text << ' ';
        }
        text << segment.text;
        first = false;
    }
    return text.str();
}

} // namespace stt
} // namespace speechjobs
