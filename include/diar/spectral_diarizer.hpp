#pragma once

#include "diar/diarizer.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace speechjobs {
namespace diar {

struct SpectralDiarizerConfig {
    double window_seconds = 1.0;   // audio summarized by one embedding
    float silence_rms = 0.01f;     // quieter windows get no speaker
    size_t frame_size = 512;       // DFT length inside a window
    size_t num_filters = 26;
    size_t num_coefficients = 13;
    float new_speaker_distance = 0.5f;
    size_t max_speakers = 8;
    int max_iterations = 50;
};

/**
 * Speaker diarization from cepstral embeddings.
 *
 * The audio is cut into fixed windows; each voiced window is summarized by
 * the mean and spread of its MFCCs. Windows are grouped with k-means when
 * the speaker count is known, otherwise by distance-threshold clustering
 * refined with k-means. Consecutive windows of one speaker form a turn.
 */
class SpectralDiarizer : public Diarizer {
public:
    explicit SpectralDiarizer(const SpectralDiarizerConfig& config = SpectralDiarizerConfig());

    /**
     * @throws DiarizationException if the audio cannot be read
     */
    std::vector<SpeakerTurn> diarize(const std::string& audioPath,
                                     const std::optional<int>& numSpeakersHint) override;

    /**
     * Diarize samples already in the recognition format (mono, 16 kHz)
     */
    std::vector<SpeakerTurn> diarizeSamples(const std::vector<float>& samples, uint32_t sampleRate,
                                            const std::optional<int>& numSpeakersHint) const;

private:
    using Embedding = std::vector<float>;

    Embedding embedWindow(const float* samples, size_t count, uint32_t sampleRate) const;
    std::vector<float> mfcc(const std::vector<float>& frame, uint32_t sampleRate) const;
    std::vector<float> powerSpectrum(const std::vector<float>& frame) const;
    std::vector<float> melEnergies(const std::vector<float>& spectrum, uint32_t sampleRate) const;

    std::vector<size_t> clusterByThreshold(const std::vector<Embedding>& embeddings) const;
    std::vector<size_t> kmeans(const std::vector<Embedding>& embeddings, size_t k) const;

    static float distance(const Embedding& a, const Embedding& b);

    SpectralDiarizerConfig config_;
    std::vector<float> cos_table_;
    std::vector<float> sin_table_;
    std::vector<float> hamming_;
};

} // namespace diar
} // namespace speechjobs
