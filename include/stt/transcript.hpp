#pragma once

#include <optional>
#include <string>
#include <vector>

namespace speechjobs {
namespace stt {

// Word-level timing and confidence information (seconds)
struct Word {
    std::string text;
    double start = 0.0;
    double end = 0.0;
    float confidence = 0.0f;

    Word() = default;
    Word(const std::string& t, double s, double e, float conf)
        : text(t), start(s), end(e), confidence(conf) {}
};

/**
 * Contiguous span of transcript text. Word intervals, when present, nest
 * inside the segment interval.
 */
struct TranscriptSegment {
    int id = 0;
    std::string text;
    double start = 0.0;
    double end = 0.0;
    float confidence = 0.0f;
    std::optional<std::string> speaker;
    std::vector<Word> words;

    double duration() const { return end - start; }
    bool hasWords() const { return !words.empty(); }
};

/**
 * What the recognition capability returns for one audio file
 */
struct TranscriptionOutput {
    std::vector<TranscriptSegment> segments;
    std::string language;
    double duration = 0.0;
};

/**
 * Final result attached to a completed job
 */
struct TranscriptionResult {
    std::string text;
    std::vector<TranscriptSegment> segments;
    std::string language;
    double duration = 0.0;
    std::vector<std::string> warnings;
};

bool operator==(const Word& a, const Word& b);
bool operator==(const TranscriptSegment& a, const TranscriptSegment& b);

/**
 * Enforce the ordering invariant in place: each start is clamped to the
 * previous end, words are clamped into their segment, segments left with
 * no duration are dropped and ids are renumbered from 0.
 */
void normalizeSegments(std::vector<TranscriptSegment>& segments);

/**
 * Check ids are contiguous from 0, end > start, and
 * segments[i].end <= segments[i+1].start.
 * @param reason receives a description of the first violation
 */
bool validateSegments(const std::vector<TranscriptSegment>& segments, std::string* reason = nullptr);

/**
 * Segment texts joined with single spaces, empty texts skipped
 */
std::string joinSegmentText(const std::vector<TranscriptSegment>& segments);

} // namespace stt
} // namespace speechjobs
