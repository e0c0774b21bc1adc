// Live shopping assistant: camera + microphone in, model speech out.
// Requires OpenCV, PortAudio, Boost (Beast) and OpenSSL.
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <opencv2/videoio.hpp>
#include "assistant.hpp"
#include "beast_transport.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "event_loop.hpp"
#include "http_completion.hpp"
#include "portaudio_device.hpp"
#include "rate_limit.hpp"
#include "tool_bridge.hpp"

static std::atomic<bool> interrupted(false);

static void on_signal(int) {
    interrupted = true;
}

int main(int argc, char** argv) {
    std::string config_file = get_arg(argc, argv, "--config", "");
    std::string camera_arg = get_arg(argc, argv, "--camera", "0");
    std::string seconds_arg = get_arg(argc, argv, "--seconds", "0");
    const char* env_key = std::getenv("GEMINI_API_KEY");
    std::string api_key = get_arg(argc, argv, "--key", env_key ? env_key : "");

    std::optional<int> camera_index = parse_int(camera_arg);
    std::optional<int> seconds = parse_int(seconds_arg);
    if (!camera_index || !seconds) {
        std::cerr << "--camera and --seconds expect integers" << std::endl;
        return 1;
    }
    if (api_key.empty()) {
        std::cerr << "No API key: set GEMINI_API_KEY or pass --key" << std::endl;
        return 1;
    }

    AppConfig config;
    if (!config_file.empty()) {
        try {
            config = load_config(config_file);
        } catch (const std::runtime_error& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
    }

    cv::VideoCapture camera(*camera_index);
    if (!camera.isOpened()) {
        std::cerr << "Camera not available: " << *camera_index << std::endl;
        return 1;
    }

    try {
        EventLoop loop;
        RateLimitGate gate(std::chrono::milliseconds(config.rate_limit_backoff_ms));
        HttpTextCompletion completion(loop, config.completion, api_key);
        CompletionTaskExecutor executor(completion, gate);
        PortAudioMicrophone mic;
        PortAudioOutput speaker;
        ShopperAssistant assistant(loop, config, beast_transport_factory(loop), executor, speaker, completion, gate);

        AssistantCallbacks cb;
        cb.on_session_state = [](SessionState state, const std::string& message) {
            std::cout << "[Assistant] session " << to_string(state) << (message.empty() ? "" : ": ") << message
                      << std::endl;
        };
        cb.on_input_transcription = [](const std::string& text) { std::cout << "[You] " << text << std::endl; };
        cb.on_output_transcription = [](const std::string& text) { std::cout << "[Model] " << text << std::endl; };
        cb.on_detection_error = [](const std::string& message) {
            std::cerr << "[Assistant] detection: " << message << std::endl;
        };
        size_t shown = 0;
        cb.on_overlay = [&shown](const std::vector<TrackedItem>& items) {
            if (items.size() == shown) return;
            shown = items.size();
            std::cout << "[Assistant] " << shown << " items on screen" << std::endl;
        };
        assistant.configure(cb);

        // Keep only the newest camera frame; the cadences read it
        cv::Mat latest;
        loop.call_every(std::chrono::milliseconds(33), [&camera, &latest]() {
            cv::Mat frame;
            if (camera.read(frame) && !frame.empty()) latest = frame;
        });
        loop.call_every(std::chrono::milliseconds(10), [&mic, &speaker]() {
            mic.poll();
            speaker.pump();
        });
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        loop.call_every(std::chrono::milliseconds(100), [&loop]() {
            if (interrupted) loop.stop();
        });
        if (*seconds > 0) loop.call_after(std::chrono::seconds(*seconds), [&loop]() { loop.stop(); });

        assistant.start(api_key, mic, [&latest]() { return latest.clone(); }, [](bool ok) {
            std::cout << "[Assistant] " << (ok ? "listening" : "session failed to start") << std::endl;
        });
        loop.run();
        assistant.stop();
    } catch (const DeviceError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
