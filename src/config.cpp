#include "config.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

const char* const DEFAULT_ENDPOINT =
    "wss://generativelanguage.googleapis.com/ws/"
    "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
const char* const DEFAULT_MODEL = "models/gemini-2.5-flash-native-audio-preview-12-2025";
const char* const DEFAULT_SYSTEM_INSTRUCTION =
    "You are an AI assistant for someone grocery shopping with a live camera (e.g. phone or AR glasses). "
    "You can see through their camera and have a voice conversation.\n\n"
    "You help with: identifying products, nutrition questions, dietary restrictions (halal, haram, allergies), "
    "comparing prices, and adding items to lists. Keep responses concise and natural.\n\n"
    "You have exactly ONE tool: execute. Use it for: adding to shopping lists, searching the web for prices or "
    "ingredients, sending messages, reminders, notes, or any persistent action. Always speak a brief "
    "acknowledgment before calling execute. Never pretend to do actions yourself.";

const char* const DEFAULT_COMPLETION_URL =
    "https://generativelanguage.googleapis.com/v1beta/models/gemini-2.0-flash:generateContent";

AppConfig config_from_json(const json& j) {
    AppConfig config;
    if (j.contains("session")) {
        const json& s = j["session"];
        SessionConfig& out = config.session;
        out.endpoint = s.value("endpoint", out.endpoint);
        out.model = s.value("model", out.model);
        out.system_instruction = s.value("system_instruction", out.system_instruction);
        out.setup_timeout_ms = s.value("setup_timeout_ms", out.setup_timeout_ms);
        out.tool_timeout_ms = s.value("tool_timeout_ms", out.tool_timeout_ms);
        out.video_interval_ms = s.value("video_interval_ms", out.video_interval_ms);
        if (s.contains("vad")) {
            const json& v = s["vad"];
            out.vad.start_sensitivity = v.value("start_sensitivity", out.vad.start_sensitivity);
            out.vad.end_sensitivity = v.value("end_sensitivity", out.vad.end_sensitivity);
            out.vad.silence_duration_ms = v.value("silence_duration_ms", out.vad.silence_duration_ms);
            out.vad.prefix_padding_ms = v.value("prefix_padding_ms", out.vad.prefix_padding_ms);
        }
    }
    if (j.contains("tracker")) {
        const json& t = j["tracker"];
        TrackerConfig& out = config.tracker;
        out.merge_blend = t.value("merge_blend", out.merge_blend);
        out.step_blend = t.value("step_blend", out.step_blend);
        out.frame_interval_ms = t.value("frame_interval_ms", out.frame_interval_ms);
        out.detection_interval_ms = t.value("detection_interval_ms", out.detection_interval_ms);
    }
    if (j.contains("completion")) {
        const json& c = j["completion"];
        CompletionConfig& out = config.completion;
        out.url = c.value("url", out.url);
        out.temperature = c.value("temperature", out.temperature);
        out.max_output_tokens = c.value("max_output_tokens", out.max_output_tokens);
        out.timeout_ms = c.value("timeout_ms", out.timeout_ms);
        out.workers = c.value("workers", out.workers);
    }
    config.rate_limit_backoff_ms = j.value("rate_limit_backoff_ms", config.rate_limit_backoff_ms);
    return config;
}

json config_to_json(const AppConfig& config) {
    const SessionConfig& s = config.session;
    const TrackerConfig& t = config.tracker;
    const CompletionConfig& c = config.completion;
    return {
        {"session", {
            {"endpoint", s.endpoint},
            {"model", s.model},
            {"system_instruction", s.system_instruction},
            {"setup_timeout_ms", s.setup_timeout_ms},
            {"tool_timeout_ms", s.tool_timeout_ms},
            {"video_interval_ms", s.video_interval_ms},
            {"vad", {
                {"start_sensitivity", s.vad.start_sensitivity},
                {"end_sensitivity", s.vad.end_sensitivity},
                {"silence_duration_ms", s.vad.silence_duration_ms},
                {"prefix_padding_ms", s.vad.prefix_padding_ms},
            }},
        }},
        {"tracker", {
            {"merge_blend", t.merge_blend},
            {"step_blend", t.step_blend},
            {"frame_interval_ms", t.frame_interval_ms},
            {"detection_interval_ms", t.detection_interval_ms},
        }},
        {"completion", {
            {"url", c.url},
            {"temperature", c.temperature},
            {"max_output_tokens", c.max_output_tokens},
            {"timeout_ms", c.timeout_ms},
            {"workers", c.workers},
        }},
        {"rate_limit_backoff_ms", config.rate_limit_backoff_ms},
    };
}

AppConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw std::runtime_error("Config file is not a JSON object: " + path);
    }
    try {
        return config_from_json(j);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config " + path + ": " + e.what());
    }
}

std::string get_arg(int argc, char** argv, const std::string& flag, const std::string& def) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string(argv[i]) == flag) return argv[i + 1];
    }
    return def;
}

std::optional<int> parse_int(const std::string& text) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}
