#pragma once
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "errors.hpp"
#include "event_loop.hpp"
#include "session_messages.hpp"
#include "transport.hpp"

enum class SessionState { Disconnected, Connecting, SettingUp, Ready, Error };

enum class SessionEvent {
    ConnectRequested,
    TransportOpened,
    SetupAcknowledged,
    SetupTimedOut,
    TransportFailed,
    TransportClosed,
    GoAwayReceived,
    DisconnectRequested,
};

const char* to_string(SessionState state);
const char* to_string(SessionEvent event);

// Events that are not valid in a state leave it unchanged.
SessionState next_state(SessionState state, SessionEvent event);

struct LiveSessionCallbacks {
    std::function<void(SessionState, const std::string& message)> on_state_change;
    std::function<void(const std::string& pcm_base64)> on_audio;
    std::function<void(const std::string&)> on_input_transcription;
    std::function<void(const std::string&)> on_output_transcription;
    std::function<void(const ToolCall&)> on_tool_call;
    std::function<void()> on_turn_complete;
    std::function<void()> on_interrupted;
    std::function<void(const std::string& reason)> on_disconnected;
    std::function<void(ErrorKind, const std::string&)> on_error;
};

// Bidirectional streaming session with the remote model. All methods and
// transport callbacks run on the event-loop thread.
class LiveSessionClient {
public:
    using ConnectResult = std::function<void(bool)>;

    LiveSessionClient(EventLoop& loop, TransportFactory transport_factory, SessionConfig config = SessionConfig());
    ~LiveSessionClient();
    LiveSessionClient(const LiveSessionClient&) = delete;
    LiveSessionClient& operator=(const LiveSessionClient&) = delete;

    void configure(LiveSessionCallbacks callbacks);

    // Resolves true once the setup acknowledgment arrives; false on timeout,
    // transport error or close before acknowledgment.
    void connect(const std::string& credential, ConnectResult on_result);
    void disconnect();

    void send_video_frame(const std::string& jpeg_base64);
    void send_audio(const std::string& pcm_base64);
    void send_tool_response(const ToolResponse& response);

    SessionState state() const { return state_; }
    bool speaking() const { return speaking_; }
    size_t queued() const { return send_queue_.size(); }
    uint64_t generation() const { return generation_; }
private:
    EventLoop& loop_;
    TransportFactory transport_factory_;
    SessionConfig config_;
    LiveSessionCallbacks callbacks_;
    std::unique_ptr<Transport> transport_;
    std::deque<std::string> send_queue_;
    std::vector<ConnectResult> pending_results_;
    SessionState state_;
    bool speaking_;
    uint64_t generation_;
    EventLoop::TimerId setup_timer_;
    std::shared_ptr<bool> alive_;

    void apply(SessionEvent event, const std::string& message = "");
    void resolve_pending(bool ok);
    void cancel_setup_timer();
    void teardown_transport();

    void handle_open(uint64_t gen);
    void handle_message(uint64_t gen, const std::string& payload);
    void handle_close(uint64_t gen, int code, const std::string& reason);
    void handle_error(uint64_t gen, const std::string& message);
    void handle_setup_timeout(uint64_t gen);

    void dispatch(const InboundMessage& msg);
    void dispatch_server_content(const ServerContent& content);

    void send_json(const nlohmann::json& message);
    void flush_send_queue();
};

std::string build_session_url(const std::string& endpoint, const std::string& credential);
