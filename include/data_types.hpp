#pragma once
#include <string>
#include <vector>

// Normalized to [0,1] of the frame; x,y is the top-left corner.
struct BoundingBox {
    double x, y, width, height;
};

struct DetectedItem {
    std::string label;
    BoundingBox bbox;
};

struct TrackedItem {
    int id = -1; // -1 until the tracker assigns one
    std::string label;
    BoundingBox bbox;
};

struct DetectionBatch {
    long long timestamp_ms;
    std::vector<DetectedItem> detections;
};
