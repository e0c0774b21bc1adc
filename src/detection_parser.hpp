#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "data_types.hpp"

// Strips a surrounding ```json ... ``` fence if the model added one.
std::string strip_code_fence(const std::string& text);

// Parses a model answer of the form [{"label": ..., "bbox": {x,y,width,height}}, ...].
// Elements without a string label or an object bbox are skipped and boxes are
// clamped. Anything that is not a JSON array yields an empty list.
std::vector<DetectedItem> parse_detection_json(const std::string& text);

// Recorded detection batches: [{"timestamp_ms": n, "detections": [...]}, ...].
// Elements that are not objects or carry a non-numeric timestamp are skipped.
std::vector<DetectionBatch> batches_from_json(const nlohmann::json& j);

BoundingBox bbox_from_json(const nlohmann::json& j);
nlohmann::json bbox_to_json(const BoundingBox& box);
