#include "detection_parser.hpp"
#include "geometry.hpp"
#include <iostream>
#include <regex>

using json = nlohmann::json;

std::string strip_code_fence(const std::string& text) {
    static const std::regex open_fence(R"(^\s*```(?:json)?\s*)", std::regex::icase);
    static const std::regex close_fence(R"(\s*```\s*$)");
    std::string out = std::regex_replace(text, open_fence, "", std::regex_constants::format_first_only);
    out = std::regex_replace(out, close_fence, "");
    auto first = out.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = out.find_last_not_of(" \t\r\n");
    return out.substr(first, last - first + 1);
}

static double number_or(const json& j, const char* key, double def) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return def;
    return it->get<double>();
}

BoundingBox bbox_from_json(const json& j) {
    BoundingBox box;
    box.x = number_or(j, "x", 0.0);
    box.y = number_or(j, "y", 0.0);
    box.width = number_or(j, "width", 0.1);
    box.height = number_or(j, "height", 0.1);
    return clamp_bbox(box);
}

json bbox_to_json(const BoundingBox& box) {
    return {{"x", box.x}, {"y", box.y}, {"width", box.width}, {"height", box.height}};
}

std::vector<DetectedItem> parse_detection_json(const std::string& text) {
    std::vector<DetectedItem> items;
    json parsed = json::parse(strip_code_fence(text), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) return items;
    for (const auto& el : parsed) {
        if (!el.is_object()) continue;
        auto label = el.find("label");
        auto bbox = el.find("bbox");
        if (label == el.end() || !label->is_string()) continue;
        if (bbox == el.end() || !bbox->is_object()) continue;
        items.push_back({label->get<std::string>(), bbox_from_json(*bbox)});
    }
    return items;
}

std::vector<DetectionBatch> batches_from_json(const nlohmann::json& j) {
    std::vector<DetectionBatch> batches;
    if (!j.is_array()) return batches;
    for (const auto& entry : j) {
        if (!entry.is_object()) {
            std::cerr << "[Recording] skipping non-object batch" << std::endl;
            continue;
        }
        auto ts = entry.find("timestamp_ms");
        if (ts != entry.end() && !ts->is_number()) {
            std::cerr << "[Recording] skipping batch with non-numeric timestamp" << std::endl;
            continue;
        }
        DetectionBatch batch;
        batch.timestamp_ms = ts == entry.end() ? 0LL : ts->get<long long>();
        auto dets = entry.find("detections");
        // Same element rules as a live detection answer
        batch.detections = dets == entry.end() ? std::vector<DetectedItem>() : parse_detection_json(dets->dump());
        batches.push_back(std::move(batch));
    }
    return batches;
}
