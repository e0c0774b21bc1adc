#pragma once
#include "data_types.hpp"
#include <string>
#include <vector>

constexpr double MATCH_IOU_THRESHOLD = 0.15;
constexpr double STEP_MATCH_IOU_THRESHOLD = 0.05;
// Above this the camera and item are treated as static and the box is frozen
constexpr double STABILITY_IOU = 0.82;
constexpr double MERGE_BLEND = 0.35;
constexpr double STEP_BLEND = 0.18;

bool is_generic_label(const std::string& label);
bool is_more_specific_than(const std::string& prev_label, const std::string& new_label);

// Authoritative update on each new detection result. Output follows target order;
// displayed items nothing matched are dropped.
std::vector<TrackedItem> merge_with_previous(const std::vector<TrackedItem>& displayed,
                                             const std::vector<DetectedItem>& target,
                                             double blend = MERGE_BLEND);

// Per-frame easing of displayed boxes toward the last detection batch.
std::vector<TrackedItem> step_displayed_toward_target(const std::vector<TrackedItem>& displayed,
                                                      const std::vector<DetectedItem>& target,
                                                      double blend = STEP_BLEND);

class DetectionTracker {
public:
    DetectionTracker(double merge_blend = MERGE_BLEND, double step_blend = STEP_BLEND, bool verbose = false);
    void on_detections(const std::vector<DetectedItem>& detections);
    void on_detection_failed();
    void on_animation_frame();
    void reset();
    const std::vector<TrackedItem>& displayed() const { return displayed_; }
    const std::vector<DetectedItem>& target() const { return target_; }
private:
    std::vector<TrackedItem> displayed_;
    std::vector<DetectedItem> target_;
    int next_id;
    double merge_blend;
    double step_blend;
    bool verbose;
    void assign_ids(std::vector<TrackedItem>& items);
};
