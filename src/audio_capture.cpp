#include "audio_capture.hpp"
#include "base64.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <iostream>

std::vector<uint8_t> encode_pcm16le(const float* samples, size_t count) {
    Eigen::Map<const Eigen::ArrayXf> in(samples, static_cast<Eigen::Index>(count));
    // Non-finite samples become silence
    Eigen::ArrayXf clean = in.isFinite().select(in, 0.0f);
    Eigen::ArrayXf scaled = (clean.cwiseMax(-1.0f).cwiseMin(1.0f) * 32767.0f).floor();
    std::vector<uint8_t> bytes(count * 2);
    for (size_t i = 0; i < count; ++i) {
        float v = std::min(32767.0f, std::max(-32768.0f, scaled(static_cast<Eigen::Index>(i))));
        uint16_t s = static_cast<uint16_t>(static_cast<int16_t>(v));
        bytes[2 * i] = static_cast<uint8_t>(s & 0xFF);
        bytes[2 * i + 1] = static_cast<uint8_t>(s >> 8);
    }
    return bytes;
}

LinearResampler::LinearResampler(int from_rate, int to_rate)
    : step_(static_cast<double>(from_rate) / to_rate), pos_(0.0), last_(0.0f), has_last_(false) {}

void LinearResampler::process(const float* in, size_t count, std::vector<float>& out) {
    if (count == 0) return;
    size_t i = 0;
    if (!has_last_) {
        last_ = in[0];
        has_last_ = true;
        i = 1;
        pos_ = 0.0;
    }
    // Output sample k lies between last_ (t=0) and in[i] (t=1)
    for (; i < count; ++i) {
        float next = in[i];
        while (pos_ < 1.0) {
            out.push_back(static_cast<float>(last_ + (next - last_) * pos_));
            pos_ += step_;
        }
        pos_ -= 1.0;
        last_ = next;
    }
}

void LinearResampler::reset() {
    pos_ = 0.0;
    has_last_ = false;
}

AudioCaptureEncoder::~AudioCaptureEncoder() {
    stop();
}

void AudioCaptureEncoder::start(MicrophoneSource& source, ChunkCallback on_chunk) {
    stop();
    source_ = &source;
    on_chunk_ = std::move(on_chunk);
    buffer_.clear();
    if (source.sample_rate() != SEND_SAMPLE_RATE) {
        resampler_ = std::make_unique<LinearResampler>(source.sample_rate(), SEND_SAMPLE_RATE);
    } else {
        resampler_.reset();
    }
    uint64_t gen = ++generation_;
    std::cout << "[AudioCapture] capturing at " << source.sample_rate() << " Hz" << std::endl;
    source.start([this, gen](const float* samples, size_t count) {
        if (gen != generation_) return;
        if (resampler_) {
            resampled_.clear();
            resampler_->process(samples, count, resampled_);
            push_samples(resampled_.data(), resampled_.size());
        } else {
            push_samples(samples, count);
        }
    });
}

void AudioCaptureEncoder::stop() {
    ++generation_;
    if (source_) {
        MicrophoneSource* source = source_;
        source_ = nullptr;
        source->stop();
    }
    buffer_.clear();
    on_chunk_ = nullptr;
}

void AudioCaptureEncoder::push_samples(const float* samples, size_t count) {
    if (!source_) return;
    buffer_.insert(buffer_.end(), samples, samples + count);
    size_t offset = 0;
    uint64_t gen = generation_;
    while (buffer_.size() - offset >= static_cast<size_t>(SEND_FRAMES)) {
        std::vector<uint8_t> pcm = encode_pcm16le(buffer_.data() + offset, SEND_FRAMES);
        offset += SEND_FRAMES;
        ChunkCallback cb = on_chunk_; // stop() inside the callback resets on_chunk_
        if (cb) cb(base64_encode(pcm));
        if (gen != generation_) return; // stopped from inside the callback
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
}
