#include "audio_playback.hpp"
#include "base64.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cstdint>

std::vector<float> decode_pcm16le(const std::vector<uint8_t>& bytes) {
    size_t count = bytes.size() / 2; // a trailing odd byte is ignored
    Eigen::ArrayXf samples(static_cast<Eigen::Index>(count));
    for (size_t i = 0; i < count; ++i) {
        uint16_t raw = static_cast<uint16_t>(bytes[2 * i] | (bytes[2 * i + 1] << 8));
        samples(static_cast<Eigen::Index>(i)) = static_cast<float>(static_cast<int16_t>(raw));
    }
    samples /= 32768.0f;
    return std::vector<float>(samples.data(), samples.data() + samples.size());
}

AudioPlaybackScheduler::AudioPlaybackScheduler(AudioOutput& output)
    : output_(output), next_play_time_(0.0) {}

std::optional<double> AudioPlaybackScheduler::play_pcm_24k(const std::string& pcm_base64) {
    std::optional<std::vector<uint8_t>> bytes = base64_decode(pcm_base64);
    if (!bytes) return std::nullopt;
    std::vector<float> samples = decode_pcm16le(*bytes);
    if (samples.empty()) return std::nullopt;
    double duration = static_cast<double>(samples.size()) / RECV_SAMPLE_RATE;
    double start = std::max(next_play_time_, output_.current_time());
    output_.schedule(std::move(samples), start);
    next_play_time_ = start + duration;
    return start;
}

void AudioPlaybackScheduler::stop() {
    output_.cancel_all();
    next_play_time_ = 0.0;
}
