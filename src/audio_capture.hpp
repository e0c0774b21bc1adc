#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

constexpr int SEND_SAMPLE_RATE = 16000;
constexpr int CHUNK_MS = 100;
constexpr int SEND_FRAMES = SEND_SAMPLE_RATE * CHUNK_MS / 1000; // 1600

using SampleCallback = std::function<void(const float* samples, size_t count)>;

// Live mono microphone. Delivers float samples in [-1,1] at sample_rate().
class MicrophoneSource {
public:
    virtual ~MicrophoneSource() = default;
    virtual int sample_rate() const = 0;
    virtual void start(SampleCallback on_samples) = 0;
    virtual void stop() = 0;
};

// Clamps to [-1,1], scales by 32767, floors, and writes little-endian int16.
std::vector<uint8_t> encode_pcm16le(const float* samples, size_t count);

// Linear resampler keeping its phase across blocks.
class LinearResampler {
public:
    LinearResampler(int from_rate, int to_rate);
    void process(const float* in, size_t count, std::vector<float>& out);
    void reset();
private:
    double step_;
    double pos_;      // position of the next output sample relative to last_
    float last_;
    bool has_last_;
};

// Turns a live microphone into 100 ms, 16 kHz, 16-bit PCM chunks, base64 encoded.
class AudioCaptureEncoder {
public:
    using ChunkCallback = std::function<void(const std::string& pcm_base64)>;

    AudioCaptureEncoder() = default;
    ~AudioCaptureEncoder();
    AudioCaptureEncoder(const AudioCaptureEncoder&) = delete;
    AudioCaptureEncoder& operator=(const AudioCaptureEncoder&) = delete;

    void start(MicrophoneSource& source, ChunkCallback on_chunk);
    // Safe when never started; samples delivered afterwards are discarded.
    void stop();
    bool running() const { return source_ != nullptr; }

    // Entry point for the capture graph; samples are at 16 kHz.
    void push_samples(const float* samples, size_t count);
    size_t buffered() const { return buffer_.size(); }
private:
    MicrophoneSource* source_ = nullptr;
    ChunkCallback on_chunk_;
    std::vector<float> buffer_;
    std::vector<float> resampled_;
    std::unique_ptr<LinearResampler> resampler_;
    uint64_t generation_ = 0;
};
