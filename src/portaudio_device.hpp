#pragma once
#include <cstdint>
#include <vector>
#include <portaudio.h>
#include "audio_capture.hpp"
#include "audio_playback.hpp"

// Pa_Initialize / Pa_Terminate for the lifetime of a device object.
class PortAudioSystem {
public:
    PortAudioSystem();
    ~PortAudioSystem();
    PortAudioSystem(const PortAudioSystem&) = delete;
    PortAudioSystem& operator=(const PortAudioSystem&) = delete;
};

// Default input device, mono float, blocking stream. poll() is called from
// the event loop so samples arrive on the same thread as everything else.
class PortAudioMicrophone : public MicrophoneSource {
public:
    explicit PortAudioMicrophone(int sample_rate = SEND_SAMPLE_RATE, unsigned long frames_per_buffer = 512);
    ~PortAudioMicrophone() override;
    int sample_rate() const override { return sample_rate_; }
    // Throws DeviceError when no microphone can be opened.
    void start(SampleCallback on_samples) override;
    void stop() override;
    size_t poll();
private:
    PortAudioSystem system_;
    PaStream* stream_;
    int sample_rate_;
    unsigned long frames_per_buffer_;
    SampleCallback on_samples_;
    std::vector<float> scratch_;
};

// Default output device. Scheduled buffers are mixed into the stream as the
// device accepts frames; the clock is frames written / sample rate.
class PortAudioOutput : public AudioOutput {
public:
    explicit PortAudioOutput(int sample_rate = RECV_SAMPLE_RATE, unsigned long frames_per_buffer = 512);
    ~PortAudioOutput() override;
    double current_time() const override;
    void schedule(std::vector<float> samples, double start_time) override;
    void cancel_all() override;
    // Writes as many frames as the device will take without blocking.
    size_t pump();
    size_t scheduled() const { return pending_.size(); }
private:
    struct Scheduled {
        int64_t start_frame;
        std::vector<float> samples;
    };
    PortAudioSystem system_;
    PaStream* stream_;
    int sample_rate_;
    int64_t frames_written_;
    std::vector<Scheduled> pending_;
    std::vector<float> mix_;
};
