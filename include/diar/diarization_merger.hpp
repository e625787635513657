#pragma once

#include "diar/diarizer.hpp"
#include "stt/transcript.hpp"
#include "utils/config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace speechjobs {
namespace diar {

enum class SplitStrategy {
    WORD_BOUNDARY, // split at the inter-word gap nearest the speaker change
    MIDPOINT       // split exactly at the speaker change
};

/**
 * @throws ValidationException for unknown names
 */
SplitStrategy parseSplitStrategy(const std::string& name);
std::string splitStrategyToString(SplitStrategy strategy);

struct MergePolicy {
    double dominance_threshold = 0.8;
    SplitStrategy split_strategy = SplitStrategy::WORD_BOUNDARY;
    double min_split_duration = 0.2;

    static MergePolicy fromSettings(const utils::DiarizationSettings& settings);
};

/**
 * Assigns speakers to transcript segments.
 *
 * A segment whose overlap with the speaker turns is held by a single
 * speaker, or by one speaker for at least dominance_threshold of its
 * duration, takes that speaker whole. Otherwise it is split at the speaker
 * change inside it and each piece is assigned the same way. Segments that
 * overlap no turn keep no speaker.
 *
 * The output is renumbered from 0, satisfies
 * segments[i].end <= segments[i+1].start, and merging the output again with
 * the same turns yields the same output.
 */
class DiarizationMerger {
public:
    explicit DiarizationMerger(const MergePolicy& policy = MergePolicy());

    /**
     * @throws InternalException if the merged sequence violates the ordering invariant
     */
    std::vector<stt::TranscriptSegment> merge(const std::vector<stt::TranscriptSegment>& segments,
                                              const std::vector<SpeakerTurn>& turns) const;

    const MergePolicy& policy() const { return policy_; }

private:
    struct SpeakerOverlap {
        std::string speaker;
        double overlap;
    };

    std::vector<SpeakerOverlap> overlapsFor(double start, double end,
                                            const std::vector<SpeakerTurn>& turns) const;

    void assign(stt::TranscriptSegment piece, const std::vector<SpeakerTurn>& turns,
                std::vector<stt::TranscriptSegment>& output) const;

    /**
     * Speaker-change times strictly inside (start, end), nearest the middle first
     */
    std::vector<double> findSpeakerChanges(double start, double end,
                                           const std::vector<SpeakerTurn>& turns) const;

    bool splitAt(const stt::TranscriptSegment& piece, double time,
                 stt::TranscriptSegment& left, stt::TranscriptSegment& right) const;
    bool splitByWords(const stt::TranscriptSegment& piece, double time,
                      stt::TranscriptSegment& left, stt::TranscriptSegment& right) const;
    bool splitByText(const stt::TranscriptSegment& piece, double time,
                     stt::TranscriptSegment& left, stt::TranscriptSegment& right) const;

    MergePolicy policy_;
};

} // namespace diar
} // namespace speechjobs
