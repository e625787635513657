#pragma once

#include <optional>
#include <string>
#include <vector>

namespace speechjobs {
namespace diar {

/**
 * Contiguous span attributed to one speaker (seconds). Turns of the same
 * speaker never overlap; turns of different speakers may.
 */
struct SpeakerTurn {
    double start = 0.0;
    double end = 0.0;
    std::string speaker;

    SpeakerTurn() = default;
    SpeakerTurn(double s, double e, const std::string& label)
        : start(s), end(e), speaker(label) {}

    double duration() const { return end - start; }
};

/**
 * Speaker-diarization capability
 */
class Diarizer {
public:
    virtual ~Diarizer() = default;

    /**
     * Partition a whole normalized file by speaker
     * @param numSpeakersHint Expected number of speakers, if known
     * @return Turns ordered by start time
     * @throws DiarizationException on failure
     */
    virtual std::vector<SpeakerTurn> diarize(const std::string& audioPath,
                                             const std::optional<int>& numSpeakersHint) = 0;
};

} // namespace diar
} // namespace speechjobs
