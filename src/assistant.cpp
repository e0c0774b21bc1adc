#include "assistant.hpp"
#include "errors.hpp"
#include "frame_encoder.hpp"
#include <iostream>

ShopperAssistant::ShopperAssistant(EventLoop& loop, const AppConfig& config, TransportFactory transport_factory,
                                   TaskExecutor& executor, AudioOutput& output, TextCompletion& completion,
                                   RateLimitGate& gate)
    : loop_(loop),
      config_(config),
      session_(loop, std::move(transport_factory), config.session),
      playback_(output),
      bridge_(loop, executor, [this](const ToolResponse& r) { session_.send_tool_response(r); },
              std::chrono::milliseconds(config.session.tool_timeout_ms)),
      tracker_(config.tracker.merge_blend, config.tracker.step_blend),
      detector_(completion, gate) {
    LiveSessionCallbacks cb;
    cb.on_state_change = [this](SessionState state, const std::string& message) { on_session_state(state, message); };
    cb.on_audio = [this](const std::string& pcm) {
        if (!playback_.play_pcm_24k(pcm)) std::cerr << "[Assistant] dropped undecodable audio chunk" << std::endl;
    };
    cb.on_interrupted = [this]() { playback_.stop(); };
    cb.on_tool_call = [this](const ToolCall& call) { bridge_.handle(call); };
    cb.on_input_transcription = [this](const std::string& text) {
        if (callbacks_.on_input_transcription) callbacks_.on_input_transcription(text);
    };
    cb.on_output_transcription = [this](const std::string& text) {
        if (callbacks_.on_output_transcription) callbacks_.on_output_transcription(text);
    };
    session_.configure(std::move(cb));
}

ShopperAssistant::~ShopperAssistant() {
    stop();
}

void ShopperAssistant::start(const std::string& credential, MicrophoneSource& mic, FrameSource frames,
                             std::function<void(bool)> on_ready) {
    stop();
    frames_ = std::move(frames);
    timers_.push_back(loop_.call_every(std::chrono::milliseconds(config_.tracker.frame_interval_ms),
                                       [this]() { animation_tick(); }));
    timers_.push_back(loop_.call_every(std::chrono::milliseconds(config_.tracker.detection_interval_ms),
                                       [this]() { run_detection(); }));
    timers_.push_back(loop_.call_every(std::chrono::milliseconds(config_.session.video_interval_ms),
                                       [this]() { send_frame(); }));
    loop_.post([this]() { run_detection(); });

    MicrophoneSource* source = &mic;
    session_.connect(credential, [this, source, on_ready](bool ok) {
        if (ok) {
            try {
                capture_.start(*source, [this](const std::string& pcm) { session_.send_audio(pcm); });
            } catch (const DeviceError& e) {
                std::cerr << "[Assistant] " << e.what() << std::endl;
                if (callbacks_.on_session_state) callbacks_.on_session_state(session_.state(), e.what());
            }
        }
        if (on_ready) on_ready(ok);
    });
}

void ShopperAssistant::stop() {
    for (auto id : timers_) loop_.cancel(id);
    timers_.clear();
    capture_.stop();
    playback_.stop();
    bridge_.cancel_all();
    detector_.cancel();
    session_.disconnect();
    tracker_.reset();
}

void ShopperAssistant::on_session_state(SessionState state, const std::string& message) {
    if (state == SessionState::Disconnected || state == SessionState::Error) {
        capture_.stop();
        playback_.stop();
        bridge_.cancel_all();
    }
    if (callbacks_.on_session_state) callbacks_.on_session_state(state, message);
}

void ShopperAssistant::run_detection() {
    if (!frames_) return;
    cv::Mat frame = frames_();
    auto jpeg = encode_frame_for_detection(frame);
    if (!jpeg) return;
    // Skipped while backing off or while the previous cycle is still out
    detector_.detect(*jpeg, [this](const DetectionOutcome& outcome) { on_detection(outcome); });
}

void ShopperAssistant::on_detection(const DetectionOutcome& outcome) {
    if (outcome.error) {
        tracker_.on_detection_failed();
        if (callbacks_.on_detection_error) {
            callbacks_.on_detection_error(outcome.error->rate_limited() ? "Rate limited. Pausing detection."
                                                                        : outcome.error->what());
        }
    } else {
        tracker_.on_detections(outcome.items);
    }
    if (callbacks_.on_overlay) callbacks_.on_overlay(tracker_.displayed());
}

void ShopperAssistant::send_frame() {
    if (!frames_ || session_.state() != SessionState::Ready) return;
    auto b64 = encode_frame_jpeg_base64(frames_());
    if (b64) session_.send_video_frame(*b64);
}

void ShopperAssistant::animation_tick() {
    tracker_.on_animation_frame();
    if (callbacks_.on_overlay) callbacks_.on_overlay(tracker_.displayed());
}
