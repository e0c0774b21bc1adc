#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

constexpr int RECV_SAMPLE_RATE = 24000;

// Output device timeline. Times are seconds on the device clock.
class AudioOutput {
public:
    virtual ~AudioOutput() = default;
    virtual double current_time() const = 0;
    virtual void schedule(std::vector<float> samples, double start_time) = 0;
    // Drops everything scheduled that has not finished playing.
    virtual void cancel_all() = 0;
};

std::vector<float> decode_pcm16le(const std::vector<uint8_t>& bytes);

// Plays a stream of 24 kHz PCM chunks back to back: each chunk starts where
// the previous one ends, never in the past.
class AudioPlaybackScheduler {
public:
    explicit AudioPlaybackScheduler(AudioOutput& output);
    // Start time of the chunk, or std::nullopt when it could not be decoded.
    std::optional<double> play_pcm_24k(const std::string& pcm_base64);
    // Called on interruption so stale audio never plays.
    void stop();
    double next_play_time() const { return next_play_time_; }
private:
    AudioOutput& output_;
    double next_play_time_;
};
