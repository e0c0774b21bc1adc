#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"

constexpr const char* VIDEO_MIME_TYPE = "image/jpeg";
constexpr const char* AUDIO_MIME_TYPE = "audio/pcm;rate=16000";
constexpr const char* EXECUTE_TOOL_NAME = "execute";

struct ToolCall {
    std::string id;
    std::string name;
    nlohmann::json args = nlohmann::json::object();
};

struct ToolResponse {
    std::string id;
    std::string name;
    std::optional<std::string> result;
    std::optional<std::string> error;

    static ToolResponse success(const ToolCall& call, const std::string& result);
    static ToolResponse failure(const ToolCall& call, const std::string& error);
};

struct ModelPart {
    std::optional<std::string> audio; // base64 PCM
    std::optional<std::string> text;
};

struct ServerContent {
    bool interrupted = false;
    std::vector<ModelPart> parts;
    bool turn_complete = false;
    std::string input_transcription;  // trimmed, empty when absent
    std::string output_transcription; // trimmed, empty when absent
};

struct InboundMessage {
    enum class Kind { SetupComplete, GoAway, ToolCall, ServerContent, Unknown };
    Kind kind = Kind::Unknown;
    std::vector<ToolCall> tool_calls;
    ServerContent content;
};

nlohmann::json make_execute_tool_declaration();
nlohmann::json make_setup_message(const SessionConfig& config);
nlohmann::json make_video_message(const std::string& jpeg_base64);
nlohmann::json make_audio_message(const std::string& pcm_base64);
nlohmann::json make_tool_response_message(const ToolResponse& response);

// std::nullopt when the payload does not parse as a JSON object.
std::optional<InboundMessage> decode_inbound(const std::string& payload);

std::string trim(const std::string& text);
