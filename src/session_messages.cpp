#include "session_messages.hpp"

using json = nlohmann::json;

ToolResponse ToolResponse::success(const ToolCall& call, const std::string& result) {
    ToolResponse r;
    r.id = call.id;
    r.name = call.name;
    r.result = result;
    return r;
}

ToolResponse ToolResponse::failure(const ToolCall& call, const std::string& error) {
    ToolResponse r;
    r.id = call.id;
    r.name = call.name;
    r.error = error;
    return r;
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

json make_execute_tool_declaration() {
    return {
        {"name", EXECUTE_TOOL_NAME},
        {"description",
         "Your only way to take action. Use for: sending messages, searching the web, adding to lists, "
         "setting reminders, creating notes, research, smart home, app interactions. When in doubt, use this tool."},
        {"parameters", {
            {"type", "object"},
            {"properties", {
                {"task", {
                    {"type", "string"},
                    {"description",
                     "Clear, detailed description of what to do. Include all relevant context: names, content, "
                     "platforms, quantities."},
                }},
            }},
            {"required", json::array({"task"})},
        }},
        {"behavior", "BLOCKING"},
    };
}

json make_setup_message(const SessionConfig& config) {
    json setup = {
        {"model", config.model},
        {"generationConfig", {
            {"responseModalities", json::array({"AUDIO"})},
            {"thinkingConfig", {{"thinkingBudget", 0}}},
        }},
        {"systemInstruction", {
            {"parts", json::array({{{"text", config.system_instruction}}})},
        }},
        {"tools", json::array({{{"functionDeclarations", json::array({make_execute_tool_declaration()})}}})},
        {"realtimeInputConfig", {
            {"automaticActivityDetection", {
                {"disabled", false},
                {"startOfSpeechSensitivity", config.vad.start_sensitivity},
                {"endOfSpeechSensitivity", config.vad.end_sensitivity},
                {"silenceDurationMs", config.vad.silence_duration_ms},
                {"prefixPaddingMs", config.vad.prefix_padding_ms},
            }},
            {"activityHandling", "START_OF_ACTIVITY_INTERRUPTS"},
            {"turnCoverage", "TURN_INCLUDES_ALL_INPUT"},
        }},
        {"inputAudioTranscription", json::object()},
        {"outputAudioTranscription", json::object()},
    };
    return {{"setup", setup}};
}

json make_video_message(const std::string& jpeg_base64) {
    return {{"realtimeInput", {{"video", {{"mimeType", VIDEO_MIME_TYPE}, {"data", jpeg_base64}}}}}};
}

json make_audio_message(const std::string& pcm_base64) {
    return {{"realtimeInput", {{"audio", {{"mimeType", AUDIO_MIME_TYPE}, {"data", pcm_base64}}}}}};
}

json make_tool_response_message(const ToolResponse& response) {
    json body = json::object();
    if (response.result) body["result"] = *response.result;
    if (response.error) body["error"] = *response.error;
    json entry = {{"id", response.id}, {"name", response.name}, {"response", body}};
    return {{"toolResponse", {{"functionResponses", json::array({entry})}}}};
}

static std::string string_or_empty(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

static bool flag_set(const json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

static std::string transcription_text(const json& content, const char* key) {
    auto it = content.find(key);
    if (it == content.end() || !it->is_object()) return "";
    return trim(string_or_empty(*it, "text"));
}

static void decode_model_turn(const json& model_turn, ServerContent& out) {
    auto parts = model_turn.find("parts");
    if (parts == model_turn.end() || !parts->is_array()) return;
    for (const auto& part : *parts) {
        if (!part.is_object()) continue;
        ModelPart decoded;
        auto inline_data = part.find("inlineData");
        if (inline_data != part.end() && inline_data->is_object()) {
            std::string mime = string_or_empty(*inline_data, "mimeType");
            auto data = inline_data->find("data");
            if (mime.rfind("audio/", 0) == 0 && data != inline_data->end() && data->is_string()) {
                decoded.audio = data->get<std::string>();
            }
        }
        auto text = part.find("text");
        if (text != part.end() && text->is_string()) {
            decoded.text = text->get<std::string>();
        }
        if (decoded.audio || decoded.text) out.parts.push_back(std::move(decoded));
    }
}

std::optional<InboundMessage> decode_inbound(const std::string& payload) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    InboundMessage msg;
    if (j.contains("setupComplete") && !j["setupComplete"].is_null()) {
        msg.kind = InboundMessage::Kind::SetupComplete;
        return msg;
    }
    if (j.contains("goAway") && !j["goAway"].is_null()) {
        msg.kind = InboundMessage::Kind::GoAway;
        return msg;
    }
    auto tool_call = j.find("toolCall");
    if (tool_call != j.end() && tool_call->is_object()) {
        auto calls = tool_call->find("functionCalls");
        if (calls != tool_call->end() && calls->is_array()) {
            msg.kind = InboundMessage::Kind::ToolCall;
            for (const auto& c : *calls) {
                if (!c.is_object()) continue;
                ToolCall call;
                call.id = string_or_empty(c, "id");
                call.name = string_or_empty(c, "name");
                auto args = c.find("args");
                if (args != c.end() && args->is_object()) call.args = *args;
                msg.tool_calls.push_back(std::move(call));
            }
            return msg;
        }
    }
    auto content = j.find("serverContent");
    if (content == j.end() || !content->is_object()) return msg;

    msg.kind = InboundMessage::Kind::ServerContent;
    ServerContent& out = msg.content;
    out.interrupted = flag_set(*content, "interrupted");
    auto model_turn = content->find("modelTurn");
    if (model_turn != content->end() && model_turn->is_object()) decode_model_turn(*model_turn, out);
    out.turn_complete = flag_set(*content, "turnComplete");
    out.input_transcription = transcription_text(*content, "inputTranscription");
    out.output_transcription = transcription_text(*content, "outputTranscription");
    return msg;
}
