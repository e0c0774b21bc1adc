// Microphone -> 16 kHz PCM chunks -> 24 kHz playback loop on the local devices.
// Requires PortAudio (install with: sudo apt-get install portaudio19-dev)
#include <iostream>
#include <optional>
#include <string>
#include "audio_capture.hpp"
#include "audio_playback.hpp"
#include "base64.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "event_loop.hpp"
#include "portaudio_device.hpp"

int main(int argc, char** argv) {
    std::optional<int> seconds_opt = parse_int(get_arg(argc, argv, "--seconds", "5"));
    std::optional<int> delay_opt = parse_int(get_arg(argc, argv, "--delay-ms", "300"));
    if (!seconds_opt || !delay_opt) {
        std::cerr << "--seconds and --delay-ms expect integers" << std::endl;
        return 1;
    }
    int seconds = *seconds_opt;
    int delay_ms = *delay_opt;

    try {
        PortAudioMicrophone mic;
        PortAudioOutput speaker;
        EventLoop loop;
        AudioCaptureEncoder capture;
        AudioPlaybackScheduler playback(speaker);
        LinearResampler upsample(SEND_SAMPLE_RATE, RECV_SAMPLE_RATE);
        int chunks = 0;

        capture.start(mic, [&](const std::string& pcm_base64) {
            ++chunks;
            auto bytes = base64_decode(pcm_base64);
            if (!bytes) return;
            std::vector<float> in = decode_pcm16le(*bytes);
            std::vector<float> out;
            upsample.process(in.data(), in.size(), out);
            // Round trip back through the wire format the model's audio arrives in
            std::vector<uint8_t> pcm = encode_pcm16le(out.data(), out.size());
            loop.call_after(std::chrono::milliseconds(delay_ms),
                            [&playback, pcm]() { playback.play_pcm_24k(base64_encode(pcm)); });
        });

        loop.call_every(std::chrono::milliseconds(10), [&]() {
            mic.poll();
            speaker.pump();
        });
        loop.call_after(std::chrono::seconds(seconds), [&]() { loop.stop(); });
        std::cout << "[AudioCheck] echoing microphone for " << seconds << " s" << std::endl;
        loop.run();

        capture.stop();
        playback.stop();
        std::cout << "[AudioCheck] " << chunks << " chunks of " << CHUNK_MS << " ms captured" << std::endl;
    } catch (const DeviceError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
