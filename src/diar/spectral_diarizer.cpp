#include "diar/spectral_diarizer.hpp"
#include "audio/audio_utils.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace speechjobs {
namespace diar {

namespace {

constexpr double kPi = 3.14159265358979323846;

float hzToMel(float hz) { return 2595.0f * std::log10(1.0f + hz / 700.0f); }
float melToHz(float mel) { return 700.0f * (std::pow(10.0f, mel / 2595.0f) - 1.0f); }

float rms(const float* samples, size_t count) {
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return count == 0 ? 0.0f : static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

void normalize(std::vector<float>& v) {
    float norm = 0.0f;
    for (float x : v) norm += x * x;
    norm = std::sqrt(norm);
    if (norm > 0.0f) {
        for (float& x : v) x /= norm;
    }
}

} // namespace

SpectralDiarizer::SpectralDiarizer(const SpectralDiarizerConfig& config)
    : config_(config) {
    if (config_.frame_size < 16) config_.frame_size = 16;
    if (config_.num_coefficients < 2) config_.num_coefficients = 2;
    if (config_.max_speakers == 0) config_.max_speakers = 1;

    const size_t n = config_.frame_size;
    cos_table_.resize(n);
    sin_table_.resize(n);
    hamming_.resize(n);
    for (size_t i = 0; i < n; ++i) {
        double angle = 2.0 * kPi * static_cast<double>(i) / static_cast<double>(n);
        cos_table_[i] = static_cast<float>(std::cos(angle));
        sin_table_[i] = static_cast<float>(std::sin(angle));
        hamming_[i] = static_cast<float>(0.54 - 0.46 * std::cos(2.0 * kPi * static_cast<double>(i) /
                                                              static_cast<double>(n - 1)));
    }
}

std::vector<SpeakerTurn> SpectralDiarizer::diarize(const std::string& audioPath,
                                                   const std::optional<int>& numSpeakersHint) {
    audio::PcmAudio pcm;
    try {
        pcm = audio::WavCodec::readFile(audioPath);
    } catch (const utils::AudioProcessingException& e) {
        throw utils::DiarizationException("Cannot read audio for diarization", e.what(), false);
    }

    auto samples = audio::AudioFormatConverter::toTargetFormat(pcm);
    auto turns = diarizeSamples(samples, audio::kTargetSampleRate, numSpeakersHint);

    utils::Logger::debug("Diarization found " + std::to_string(turns.size()) + " turns in " + audioPath);
    return turns;
}

std::vector<SpeakerTurn> SpectralDiarizer::diarizeSamples(const std::vector<float>& samples, uint32_t sampleRate,
                                                          const std::optional<int>& numSpeakersHint) const {
    std::vector<SpeakerTurn> turns;
    if (samples.empty() || sampleRate == 0) {
        return turns;
    }

    size_t windowLength = static_cast<size_t>(std::lround(config_.window_seconds * sampleRate));
    windowLength = std::max(windowLength, config_.frame_size);

    struct Window {
        size_t start;
        size_t count;
        size_t embedding;
    };
    std::vector<Window> voiced;
    std::vector<Embedding> embeddings;

    for (size_t start = 0; start + config_.frame_size <= samples.size(); start += windowLength) {
        size_t count = std::min(windowLength, samples.size() - start);
        const float* data = samples.data() + start;
        if (rms(data, count) < config_.silence_rms) {
            continue;
        }
        auto embedding = embedWindow(data, count, sampleRate);
        if (embedding.empty()) {
            continue;
        }
        voiced.push_back(Window{start, count, embeddings.size()});
        embeddings.push_back(std::move(embedding));
    }

    if (embeddings.empty()) {
        return turns;
    }

    size_t k;
    if (numSpeakersHint && *numSpeakersHint > 0) {
        k = static_cast<size_t>(*numSpeakersHint);
    } else {
        auto initial = clusterByThreshold(embeddings);
        k = initial.empty() ? 1 : *std::max_element(initial.begin(), initial.end()) + 1;
    }
    k = std::min({k, embeddings.size(), config_.max_speakers});
    auto labels = kmeans(embeddings, k);

    // Speakers are numbered in order of first appearance
    std::map<size_t, std::string> names;
    for (const auto& window : voiced) {
        size_t label = labels[window.embedding];
        if (names.find(label) == names.end()) {
            names[label] = "Speaker " + std::to_string(names.size() + 1);
        }

        double start = static_cast<double>(window.start) / sampleRate;
        double end = static_cast<double>(window.start + window.count) / sampleRate;
        const std::string& speaker = names[label];

        if (!turns.empty() && turns.back().speaker == speaker && std::abs(turns.back().end - start) < 1e-9) {
            turns.back().end = end;
        } else {
            turns.emplace_back(start, end, speaker);
        }
    }
    return turns;
}

SpectralDiarizer::Embedding SpectralDiarizer::embedWindow(const float* samples, size_t count,
                                                          uint32_t sampleRate) const {
    const size_t n = config_.frame_size;
    const size_t dims = config_.num_coefficients - 1; // c0 tracks loudness, not voice

    std::vector<std::vector<float>> frames;
    for (size_t offset = 0; offset + n <= count; offset += n) {
        std::vector<float> frame(samples + offset, samples + offset + n);
        auto coefficients = mfcc(frame, sampleRate);
        frames.emplace_back(coefficients.begin() + 1, coefficients.end());
    }
    if (frames.empty()) {
        return {};
    }

    Embedding embedding(dims * 2, 0.0f);
    for (const auto& frame : frames) {
        for (size_t c = 0; c < dims; ++c) {
            embedding[c] += frame[c];
        }
    }
    for (size_t c = 0; c < dims; ++c) {
        embedding[c] /= static_cast<float>(frames.size());
    }
    for (const auto& frame : frames) {
        for (size_t c = 0; c < dims; ++c) {
            float diff = frame[c] - embedding[c];
            embedding[dims + c] += diff * diff;
        }
    }
    for (size_t c = 0; c < dims; ++c) {
        embedding[dims + c] = std::sqrt(embedding[dims + c] / static_cast<float>(frames.size()));
    }

    normalize(embedding);
    return embedding;
}

std::vector<float> SpectralDiarizer::mfcc(const std::vector<float>& frame, uint32_t sampleRate) const {
    std::vector<float> windowed(frame.size());
    for (size_t i = 0; i < frame.size(); ++i) {
        windowed[i] = frame[i] * hamming_[i];
    }

    auto mel = melEnergies(powerSpectrum(windowed), sampleRate);

    // DCT-II of the log mel energies
    std::vector<float> coefficients(config_.num_coefficients, 0.0f);
    for (size_t k = 0; k < coefficients.size(); ++k) {
        double sum = 0.0;
        for (size_t m = 0; m < mel.size(); ++m) {
            sum += mel[m] * std::cos(kPi * static_cast<double>(k) * (static_cast<double>(m) + 0.5) /
                                     static_cast<double>(mel.size()));
        }
        coefficients[k] = static_cast<float>(sum);
    }
    return coefficients;
}

std::vector<float> SpectralDiarizer::powerSpectrum(const std::vector<float>& frame) const {
    const size_t n = frame.size();
    std::vector<float> power(n / 2 + 1, 0.0f);

    for (size_t k = 0; k < power.size(); ++k) {
        float re = 0.0f;
        float im = 0.0f;
        for (size_t i = 0; i < n; ++i) {
            size_t index = (k * i) % n;
            re += frame[i] * cos_table_[index];
            im -= frame[i] * sin_table_[index];
        }
        power[k] = re * re + im * im;
    }
    return power;
}

std::vector<float> SpectralDiarizer::melEnergies(const std::vector<float>& spectrum, uint32_t sampleRate) const {
    const size_t filters = config_.num_filters;
    const size_t n = config_.frame_size;
    const float maxMel = hzToMel(static_cast<float>(sampleRate) / 2.0f);

    // Filter edges as FFT bin indices
    std::vector<size_t> bins(filters + 2);
    for (size_t i = 0; i < bins.size(); ++i) {
        float hz = melToHz(maxMel * static_cast<float>(i) / static_cast<float>(filters + 1));
        bins[i] = std::min(spectrum.size() - 1,
                           static_cast<size_t>(std::floor((n + 1) * hz / static_cast<float>(sampleRate))));
    }

    std::vector<float> energies(filters, 0.0f);
    for (size_t m = 1; m <= filters; ++m) {
        size_t left = bins[m - 1];
        size_t center = bins[m];
        size_t right = bins[m + 1];
        float energy = 0.0f;

        for (size_t k = left; k < center; ++k) {
            energy += spectrum[k] * static_cast<float>(k - left) / static_cast<float>(center - left);
        }
        for (size_t k = center; k <= right; ++k) {
            float weight = right == center ? 1.0f
                                           : static_cast<float>(right - k) / static_cast<float>(right - center);
            energy += spectrum[k] * weight;
        }
        energies[m - 1] = std::log(std::max(energy, 1e-10f));
    }
    return energies;
}

std::vector<size_t> SpectralDiarizer::clusterByThreshold(const std::vector<Embedding>& embeddings) const {
    std::vector<Embedding> centroids;
    std::vector<size_t> counts;
    std::vector<size_t> labels;
    labels.reserve(embeddings.size());

    for (const auto& embedding : embeddings) {
        size_t nearest = 0;
        float best = std::numeric_limits<float>::max();
        for (size_t c = 0; c < centroids.size(); ++c) {
            float d = distance(embedding, centroids[c]);
            if (d < best) {
                best = d;
                nearest = c;
            }
        }

        if (centroids.empty() || (best >= config_.new_speaker_distance && centroids.size() < config_.max_speakers)) {
            centroids.push_back(embedding);
            counts.push_back(1);
            labels.push_back(centroids.size() - 1);
            continue;
        }

        // Running mean of the cluster
        auto& centroid = centroids[nearest];
        ++counts[nearest];
        for (size_t i = 0; i < centroid.size(); ++i) {
            centroid[i] += (embedding[i] - centroid[i]) / static_cast<float>(counts[nearest]);
        }
        labels.push_back(nearest);
    }
    return labels;
}

std::vector<size_t> SpectralDiarizer::kmeans(const std::vector<Embedding>& embeddings, size_t k) const {
    std::vector<size_t> labels(embeddings.size(), 0);
    if (k <= 1 || embeddings.size() <= 1) {
        return labels;
    }

    // Farthest-point seeding keeps the result deterministic
    std::vector<Embedding> centroids{embeddings.front()};
    while (centroids.size() < k) {
        size_t farthest = 0;
        float farthestDistance = 0.0f;
        for (size_t i = 0; i < embeddings.size(); ++i) {
            float nearest = std::numeric_limits<float>::max();
            for (const auto& centroid : centroids) {
                nearest = std::min(nearest, distance(embeddings[i], centroid));
            }
            if (nearest > farthestDistance) {
                farthestDistance = nearest;
                farthest = i;
            }
        }
        if (farthestDistance <= 0.0f) {
            break; // fewer distinct embeddings than requested speakers
        }
        centroids.push_back(embeddings[farthest]);
    }

    for (int iteration = 0; iteration < config_.max_iterations; ++iteration) {
        bool changed = iteration == 0;
        for (size_t i = 0; i < embeddings.size(); ++i) {
            size_t nearest = 0;
            float best = std::numeric_limits<float>::max();
            for (size_t c = 0; c < centroids.size(); ++c) {
                float d = distance(embeddings[i], centroids[c]);
                if (d < best) {
                    best = d;
                    nearest = c;
                }
            }
            if (labels[i] != nearest) {
                labels[i] = nearest;
                changed = true;
            }
        }
        if (!changed) {
            break;
        }

        for (size_t c = 0; c < centroids.size(); ++c) {
            Embedding sum(centroids[c].size(), 0.0f);
            size_t members = 0;
            for (size_t i = 0; i < embeddings.size(); ++i) {
                if (labels[i] != c) continue;
                for (size_t d = 0; d < sum.size(); ++d) {
                    sum[d] += embeddings[i][d];
                }
                ++members;
            }
            if (members > 0) {
                for (float& value : sum) value /= static_cast<float>(members);
                centroids[c] = std::move(sum);
            }
        }
    }
    return labels;
}

float SpectralDiarizer::distance(const Embedding& a, const Embedding& b) {
    float sum = 0.0f;
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
        float diff = a[i] - b[i];
        sum += diff * diff;
    }
    return std::sqrt(sum);
}

} // namespace diar
} // namespace speechjobs
