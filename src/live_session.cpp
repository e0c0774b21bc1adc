#include "live_session.hpp"
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Connecting: return "connecting";
        case SessionState::SettingUp: return "settingUp";
        case SessionState::Ready: return "ready";
        case SessionState::Error: return "error";
    }
    return "unknown";
}

const char* to_string(SessionEvent event) {
    switch (event) {
        case SessionEvent::ConnectRequested: return "connect requested";
        case SessionEvent::TransportOpened: return "transport opened";
        case SessionEvent::SetupAcknowledged: return "setup acknowledged";
        case SessionEvent::SetupTimedOut: return "setup timed out";
        case SessionEvent::TransportFailed: return "transport failed";
        case SessionEvent::TransportClosed: return "transport closed";
        case SessionEvent::GoAwayReceived: return "go away received";
        case SessionEvent::DisconnectRequested: return "disconnect requested";
    }
    return "unknown";
}

static bool connection_live(SessionState s) {
    return s == SessionState::Connecting || s == SessionState::SettingUp || s == SessionState::Ready;
}

SessionState next_state(SessionState state, SessionEvent event) {
    switch (event) {
        case SessionEvent::ConnectRequested:
            if (state == SessionState::Disconnected || state == SessionState::Error) return SessionState::Connecting;
            return state;
        case SessionEvent::TransportOpened:
            return state == SessionState::Connecting ? SessionState::SettingUp : state;
        case SessionEvent::SetupAcknowledged:
            return state == SessionState::SettingUp ? SessionState::Ready : state;
        case SessionEvent::SetupTimedOut:
            if (state == SessionState::Connecting || state == SessionState::SettingUp) return SessionState::Error;
            return state;
        case SessionEvent::TransportFailed:
            return connection_live(state) ? SessionState::Error : state;
        case SessionEvent::TransportClosed:
        case SessionEvent::GoAwayReceived:
            return connection_live(state) ? SessionState::Disconnected : state;
        case SessionEvent::DisconnectRequested:
            return SessionState::Disconnected;
    }
    return state;
}

std::string build_session_url(const std::string& endpoint, const std::string& credential) {
    std::ostringstream url;
    url << endpoint << "?key=";
    for (unsigned char c : credential) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            url << c;
        } else {
            url << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << int(c)
                << std::nouppercase << std::dec;
        }
    }
    return url.str();
}

LiveSessionClient::LiveSessionClient(EventLoop& loop, TransportFactory transport_factory, SessionConfig config)
    : loop_(loop),
      transport_factory_(std::move(transport_factory)),
      config_(std::move(config)),
      state_(SessionState::Disconnected),
      speaking_(false),
      generation_(0),
      setup_timer_(0),
      alive_(std::make_shared<bool>(true)) {}

LiveSessionClient::~LiveSessionClient() {
    // Handlers of a retired transport may still fire after this
    alive_.reset();
    cancel_setup_timer();
    ++generation_;
    if (transport_) transport_->close();
}

void LiveSessionClient::configure(LiveSessionCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

void LiveSessionClient::apply(SessionEvent event, const std::string& message) {
    SessionState next = next_state(state_, event);
    if (next == state_) return;
    std::cout << "[LiveSession] " << to_string(state_) << " -> " << to_string(next) << " (" << to_string(event)
              << ")" << (message.empty() ? "" : ": ") << message << std::endl;
    state_ = next;
    if (callbacks_.on_state_change) callbacks_.on_state_change(state_, message);
}

void LiveSessionClient::resolve_pending(bool ok) {
    std::vector<ConnectResult> pending;
    pending.swap(pending_results_);
    for (auto& resolve : pending) {
        if (resolve) resolve(ok);
    }
}

void LiveSessionClient::cancel_setup_timer() {
    if (setup_timer_ != 0) {
        loop_.cancel(setup_timer_);
        setup_timer_ = 0;
    }
}

// Invalidates callbacks of the current connection and releases the handle.
// The handle is destroyed on the next loop turn since this may run inside one
// of its own callbacks.
void LiveSessionClient::teardown_transport() {
    ++generation_;
    cancel_setup_timer();
    send_queue_.clear();
    speaking_ = false;
    if (!transport_) return;
    transport_->close();
    std::shared_ptr<Transport> retired(std::move(transport_));
    loop_.post([retired]() {});
}

void LiveSessionClient::connect(const std::string& credential, ConnectResult on_result) {
    if (state_ == SessionState::Ready) {
        if (on_result) on_result(true);
        return;
    }
    pending_results_.push_back(std::move(on_result));
    if (state_ == SessionState::Connecting || state_ == SessionState::SettingUp) return;

    teardown_transport();
    uint64_t gen = generation_;
    apply(SessionEvent::ConnectRequested);
    transport_ = transport_factory_ ? transport_factory_() : nullptr;
    if (!transport_) {
        apply(SessionEvent::TransportFailed, "No transport available");
        if (callbacks_.on_error) callbacks_.on_error(ErrorKind::Transport, "No transport available");
        resolve_pending(false);
        return;
    }
    setup_timer_ = loop_.call_after(std::chrono::milliseconds(config_.setup_timeout_ms),
                                    [this, gen]() { handle_setup_timeout(gen); });
    std::weak_ptr<bool> alive = alive_;
    TransportHandlers handlers;
    handlers.on_open = [this, alive, gen]() {
        if (!alive.expired()) handle_open(gen);
    };
    handlers.on_message = [this, alive, gen](const std::string& payload) {
        if (!alive.expired()) handle_message(gen, payload);
    };
    handlers.on_close = [this, alive, gen](int code, const std::string& reason) {
        if (!alive.expired()) handle_close(gen, code, reason);
    };
    handlers.on_error = [this, alive, gen](const std::string& message) {
        if (!alive.expired()) handle_error(gen, message);
    };
    transport_->open(build_session_url(config_.endpoint, credential), std::move(handlers));
}

void LiveSessionClient::disconnect() {
    teardown_transport();
    apply(SessionEvent::DisconnectRequested);
    resolve_pending(false);
}

void LiveSessionClient::handle_open(uint64_t gen) {
    if (gen != generation_) return;
    apply(SessionEvent::TransportOpened);
    // Setup goes out ahead of anything queued
    transport_->send(make_setup_message(config_).dump());
}

void LiveSessionClient::handle_message(uint64_t gen, const std::string& payload) {
    if (gen != generation_) return;
    std::optional<InboundMessage> msg = decode_inbound(payload);
    if (!msg) return; // malformed frames are expected on this stream
    dispatch(*msg);
}

void LiveSessionClient::handle_close(uint64_t gen, int code, const std::string& reason) {
    if (gen != generation_) return;
    teardown_transport();
    std::string text = "Connection closed: " + std::to_string(code) + (reason.empty() ? "" : " " + reason);
    apply(SessionEvent::TransportClosed, text);
    if (callbacks_.on_disconnected) callbacks_.on_disconnected(text);
    resolve_pending(false);
}

void LiveSessionClient::handle_error(uint64_t gen, const std::string& message) {
    if (gen != generation_) return;
    std::cerr << "[LiveSession] transport error: " << message << std::endl;
    teardown_transport();
    apply(SessionEvent::TransportFailed, "WebSocket error");
    if (callbacks_.on_error) callbacks_.on_error(ErrorKind::Transport, message);
    resolve_pending(false);
}

void LiveSessionClient::handle_setup_timeout(uint64_t gen) {
    setup_timer_ = 0;
    if (gen != generation_) return;
    std::cerr << "[LiveSession] no setup acknowledgment after " << config_.setup_timeout_ms << " ms" << std::endl;
    teardown_transport();
    apply(SessionEvent::SetupTimedOut, "Connection timed out");
    if (callbacks_.on_error) callbacks_.on_error(ErrorKind::SetupTimeout, "Connection timed out");
    resolve_pending(false);
}

void LiveSessionClient::dispatch(const InboundMessage& msg) {
    switch (msg.kind) {
        case InboundMessage::Kind::SetupComplete:
            if (state_ != SessionState::SettingUp) return;
            cancel_setup_timer();
            apply(SessionEvent::SetupAcknowledged);
            flush_send_queue();
            resolve_pending(true);
            return;
        case InboundMessage::Kind::GoAway:
            teardown_transport();
            apply(SessionEvent::GoAwayReceived, "Server closing");
            if (callbacks_.on_disconnected) callbacks_.on_disconnected("Server closing");
            resolve_pending(false);
            return;
        case InboundMessage::Kind::ToolCall:
            for (const auto& call : msg.tool_calls) {
                std::cout << "[LiveSession] tool call " << call.name << " (" << call.id << ")" << std::endl;
                if (callbacks_.on_tool_call) callbacks_.on_tool_call(call);
            }
            return;
        case InboundMessage::Kind::ServerContent:
            dispatch_server_content(msg.content);
            return;
        case InboundMessage::Kind::Unknown:
            return;
    }
}

void LiveSessionClient::dispatch_server_content(const ServerContent& content) {
    if (content.interrupted) {
        speaking_ = false;
        if (callbacks_.on_interrupted) callbacks_.on_interrupted();
        return;
    }
    for (const auto& part : content.parts) {
        if (part.audio) {
            speaking_ = true;
            if (callbacks_.on_audio) callbacks_.on_audio(*part.audio);
        }
        if (part.text && callbacks_.on_output_transcription) callbacks_.on_output_transcription(*part.text);
    }
    if (content.turn_complete) {
        speaking_ = false;
        if (callbacks_.on_turn_complete) callbacks_.on_turn_complete();
    }
    if (!content.input_transcription.empty() && callbacks_.on_input_transcription) {
        callbacks_.on_input_transcription(content.input_transcription);
    }
    if (!content.output_transcription.empty() && callbacks_.on_output_transcription) {
        callbacks_.on_output_transcription(content.output_transcription);
    }
}

void LiveSessionClient::send_json(const nlohmann::json& message) {
    std::string text = message.dump();
    bool open = transport_ && transport_->is_open();
    if (state_ == SessionState::Connecting || state_ == SessionState::SettingUp) {
        // Held until the setup acknowledgment so nothing overtakes the handshake
        send_queue_.push_back(std::move(text));
    } else if (open && send_queue_.empty()) {
        transport_->send(text);
    } else if (open) {
        flush_send_queue();
        transport_->send(text);
    } else {
        std::cerr << "[LiveSession] dropping message while " << to_string(state_) << std::endl;
    }
}

void LiveSessionClient::flush_send_queue() {
    while (!send_queue_.empty() && transport_ && transport_->is_open()) {
        transport_->send(send_queue_.front());
        send_queue_.pop_front();
    }
}

void LiveSessionClient::send_video_frame(const std::string& jpeg_base64) {
    if (state_ != SessionState::Ready || !transport_ || !transport_->is_open()) return;
    transport_->send(make_video_message(jpeg_base64).dump());
}

void LiveSessionClient::send_audio(const std::string& pcm_base64) {
    if (state_ != SessionState::Ready || !transport_ || !transport_->is_open()) return;
    transport_->send(make_audio_message(pcm_base64).dump());
}

void LiveSessionClient::send_tool_response(const ToolResponse& response) {
    send_json(make_tool_response_message(response));
}
