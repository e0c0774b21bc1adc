#pragma once
#include <functional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "audio_capture.hpp"
#include "audio_playback.hpp"
#include "config.hpp"
#include "event_loop.hpp"
#include "item_detector.hpp"
#include "live_session.hpp"
#include "rate_limit.hpp"
#include "tool_bridge.hpp"
#include "tracker.hpp"

// Latest camera frame; an empty Mat when none is available yet.
using FrameSource = std::function<cv::Mat()>;

struct AssistantCallbacks {
    std::function<void(SessionState, const std::string&)> on_session_state;
    std::function<void(const std::string&)> on_input_transcription;
    std::function<void(const std::string&)> on_output_transcription;
    std::function<void(const std::vector<TrackedItem>&)> on_overlay;
    std::function<void(const std::string&)> on_detection_error;
};

// The capture loop: camera frames and microphone audio into the live session,
// detection results into the tracker, model speech out to the speaker, tool
// calls out to the task executor.
class ShopperAssistant {
public:
    ShopperAssistant(EventLoop& loop, const AppConfig& config, TransportFactory transport_factory,
                     TaskExecutor& executor, AudioOutput& output, TextCompletion& completion, RateLimitGate& gate);
    ~ShopperAssistant();

    void configure(AssistantCallbacks callbacks) { callbacks_ = std::move(callbacks); }

    // Starts the tracking cadences right away and the session handshake;
    // microphone capture starts once the session is ready.
    void start(const std::string& credential, MicrophoneSource& mic, FrameSource frames,
               std::function<void(bool)> on_ready = nullptr);
    void stop();

    void run_detection();
    void send_frame();
    void animation_tick();

    LiveSessionClient& session() { return session_; }
    const DetectionTracker& tracker() const { return tracker_; }
    bool capturing() const { return capture_.running(); }
private:
    EventLoop& loop_;
    AppConfig config_;
    AssistantCallbacks callbacks_;
    LiveSessionClient session_;
    AudioCaptureEncoder capture_;
    AudioPlaybackScheduler playback_;
    ToolCallBridge bridge_;
    DetectionTracker tracker_;
    ItemDetector detector_;
    FrameSource frames_;
    std::vector<EventLoop::TimerId> timers_;

    void on_session_state(SessionState state, const std::string& message);
    void on_detection(const DetectionOutcome& outcome);
};
