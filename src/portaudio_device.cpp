#include "portaudio_device.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

PortAudioSystem::PortAudioSystem() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw DeviceError(std::string("Audio system unavailable: ") + Pa_GetErrorText(err));
    }
}

PortAudioSystem::~PortAudioSystem() {
    Pa_Terminate();
}

PortAudioMicrophone::PortAudioMicrophone(int sample_rate, unsigned long frames_per_buffer)
    : stream_(nullptr), sample_rate_(sample_rate), frames_per_buffer_(frames_per_buffer) {}

PortAudioMicrophone::~PortAudioMicrophone() {
    stop();
}

void PortAudioMicrophone::start(SampleCallback on_samples) {
    stop();
    if (Pa_GetDefaultInputDevice() == paNoDevice) {
        throw DeviceError("Microphone not available. Connect a microphone and try again.");
    }
    PaError err = Pa_OpenDefaultStream(&stream_, 1, 0, paFloat32, sample_rate_, frames_per_buffer_, nullptr, nullptr);
    if (err != paNoError) {
        stream_ = nullptr;
        throw DeviceError(std::string("Could not open microphone: ") + Pa_GetErrorText(err));
    }
    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        throw DeviceError(std::string("Could not start microphone: ") + Pa_GetErrorText(err));
    }
    on_samples_ = std::move(on_samples);
    std::cout << "[PortAudio] microphone open at " << sample_rate_ << " Hz" << std::endl;
}

void PortAudioMicrophone::stop() {
    on_samples_ = nullptr;
    if (!stream_) return;
    Pa_StopStream(stream_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
}

size_t PortAudioMicrophone::poll() {
    if (!stream_) return 0;
    signed long available = Pa_GetStreamReadAvailable(stream_);
    if (available < 0) {
        std::cerr << "[PortAudio] read available failed: " << Pa_GetErrorText(static_cast<PaError>(available))
                  << std::endl;
        return 0;
    }
    if (available == 0) return 0;
    scratch_.resize(static_cast<size_t>(available));
    PaError err = Pa_ReadStream(stream_, scratch_.data(), static_cast<unsigned long>(available));
    if (err != paNoError && err != paInputOverflowed) {
        std::cerr << "[PortAudio] read failed: " << Pa_GetErrorText(err) << std::endl;
        return 0;
    }
    // The callback may stop this source
    SampleCallback cb = on_samples_;
    if (cb) cb(scratch_.data(), scratch_.size());
    return scratch_.size();
}

PortAudioOutput::PortAudioOutput(int sample_rate, unsigned long frames_per_buffer)
    : stream_(nullptr), sample_rate_(sample_rate), frames_written_(0) {
    if (Pa_GetDefaultOutputDevice() == paNoDevice) {
        throw DeviceError("No audio output device found.");
    }
    PaError err = Pa_OpenDefaultStream(&stream_, 0, 1, paFloat32, sample_rate_, frames_per_buffer, nullptr, nullptr);
    if (err != paNoError) {
        stream_ = nullptr;
        throw DeviceError(std::string("Could not open audio output: ") + Pa_GetErrorText(err));
    }
    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        throw DeviceError(std::string("Could not start audio output: ") + Pa_GetErrorText(err));
    }
}

PortAudioOutput::~PortAudioOutput() {
    if (!stream_) return;
    Pa_StopStream(stream_);
    Pa_CloseStream(stream_);
}

double PortAudioOutput::current_time() const {
    return static_cast<double>(frames_written_) / sample_rate_;
}

void PortAudioOutput::schedule(std::vector<float> samples, double start_time) {
    int64_t start_frame = static_cast<int64_t>(std::llround(start_time * sample_rate_));
    pending_.push_back({std::max(start_frame, frames_written_), std::move(samples)});
}

void PortAudioOutput::cancel_all() {
    pending_.clear();
}

size_t PortAudioOutput::pump() {
    signed long writable = Pa_GetStreamWriteAvailable(stream_);
    if (writable <= 0) return 0;
    size_t frames = static_cast<size_t>(writable);
    int64_t window_start = frames_written_;
    int64_t window_end = window_start + static_cast<int64_t>(frames);
    mix_.assign(frames, 0.0f);
    for (const auto& buf : pending_) {
        int64_t buf_end = buf.start_frame + static_cast<int64_t>(buf.samples.size());
        int64_t from = std::max(buf.start_frame, window_start);
        int64_t to = std::min(buf_end, window_end);
        for (int64_t f = from; f < to; ++f) {
            mix_[static_cast<size_t>(f - window_start)] += buf.samples[static_cast<size_t>(f - buf.start_frame)];
        }
    }
    for (auto& s : mix_) s = std::clamp(s, -1.0f, 1.0f);
    PaError err = Pa_WriteStream(stream_, mix_.data(), static_cast<unsigned long>(frames));
    if (err != paNoError && err != paOutputUnderflowed) {
        std::cerr << "[PortAudio] write failed: " << Pa_GetErrorText(err) << std::endl;
        return 0;
    }
    frames_written_ = window_end;
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
        [window_end](const Scheduled& buf) {
            return buf.start_frame + static_cast<int64_t>(buf.samples.size()) <= window_end;
        }), pending_.end());
    return frames;
}
