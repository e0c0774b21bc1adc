#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

extern const char* const DEFAULT_ENDPOINT;
extern const char* const DEFAULT_MODEL;
extern const char* const DEFAULT_SYSTEM_INSTRUCTION;
extern const char* const DEFAULT_COMPLETION_URL;

struct VadConfig {
    std::string start_sensitivity = "START_SENSITIVITY_HIGH";
    std::string end_sensitivity = "END_SENSITIVITY_LOW";
    int silence_duration_ms = 500;
    int prefix_padding_ms = 40;
};

struct SessionConfig {
    std::string endpoint = DEFAULT_ENDPOINT;
    std::string model = DEFAULT_MODEL;
    std::string system_instruction = DEFAULT_SYSTEM_INSTRUCTION;
    VadConfig vad;
    int setup_timeout_ms = 15000;
    int tool_timeout_ms = 30000;
    int video_interval_ms = 1000;
};

struct TrackerConfig {
    double merge_blend = 0.35;
    double step_blend = 0.18;
    int frame_interval_ms = 16;
    int detection_interval_ms = 4500;
};

// Request/response text completion used by detection and the execute tool.
struct CompletionConfig {
    std::string url = DEFAULT_COMPLETION_URL;
    double temperature = 0.1;
    int max_output_tokens = 1024;
    int timeout_ms = 60000;
    int workers = 2;
};

struct AppConfig {
    SessionConfig session;
    TrackerConfig tracker;
    CompletionConfig completion;
    int rate_limit_backoff_ms = 45000;
};

// Every key is optional; missing keys keep the defaults above.
AppConfig config_from_json(const nlohmann::json& j);
nlohmann::json config_to_json(const AppConfig& config);
// Throws std::runtime_error when the file cannot be read or parsed.
AppConfig load_config(const std::string& path);

std::string get_arg(int argc, char** argv, const std::string& flag, const std::string& def);
// std::nullopt unless the whole text is a base-10 integer in range.
std::optional<int> parse_int(const std::string& text);
