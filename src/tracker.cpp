#include "tracker.hpp"
#include "geometry.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <sstream>

static const std::set<std::string> GENERIC_LABELS = {
    "box", "boxes", "bottle", "bottles", "can", "cans",
    "container", "containers", "item", "items",
};

static std::string normalize_label(const std::string& label) {
    auto begin = std::find_if_not(label.begin(), label.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(label.rbegin(), label.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    std::string out = begin < end ? std::string(begin, end) : std::string();
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

static size_t word_count(const std::string& label) {
    std::istringstream ss(label);
    std::string word;
    size_t n = 0;
    while (ss >> word) ++n;
    return n;
}

bool is_generic_label(const std::string& label) {
    std::string lower = normalize_label(label);
    return GENERIC_LABELS.count(lower) > 0 || lower.size() <= 3;
}

bool is_more_specific_than(const std::string& prev_label, const std::string& new_label) {
    if (!is_generic_label(prev_label)) return false;
    if (is_generic_label(new_label)) return false;
    return new_label.size() >= prev_label.size() || word_count(new_label) > 1;
}

std::vector<TrackedItem> merge_with_previous(const std::vector<TrackedItem>& displayed,
                                             const std::vector<DetectedItem>& target,
                                             double blend) {
    std::vector<bool> used(displayed.size(), false);
    std::vector<TrackedItem> out;
    out.reserve(target.size());
    for (const auto& det : target) {
        int best_idx = -1;
        double best_iou = MATCH_IOU_THRESHOLD;
        for (size_t i = 0; i < displayed.size(); ++i) {
            if (used[i]) continue;
            double o = iou(displayed[i].bbox, det.bbox);
            if (o > best_iou) {
                best_iou = o;
                best_idx = static_cast<int>(i);
            }
        }
        if (best_idx < 0) {
            out.push_back({-1, det.label, det.bbox});
            continue;
        }
        used[best_idx] = true;
        const TrackedItem& prev = displayed[best_idx];
        TrackedItem item;
        item.id = prev.id;
        item.label = is_more_specific_than(prev.label, det.label) ? det.label : prev.label;
        item.bbox = best_iou >= STABILITY_IOU ? prev.bbox : lerp_bbox(prev.bbox, det.bbox, blend);
        out.push_back(item);
    }
    return out;
}

std::vector<TrackedItem> step_displayed_toward_target(const std::vector<TrackedItem>& displayed,
                                                      const std::vector<DetectedItem>& target,
                                                      double blend) {
    std::vector<bool> used(target.size(), false);
    std::vector<TrackedItem> out;
    out.reserve(displayed.size() + target.size());
    for (const auto& shown : displayed) {
        int best_idx = -1;
        double best_iou = STEP_MATCH_IOU_THRESHOLD;
        for (size_t i = 0; i < target.size(); ++i) {
            if (used[i]) continue;
            double o = iou(shown.bbox, target[i].bbox);
            if (o > best_iou) {
                best_iou = o;
                best_idx = static_cast<int>(i);
            }
        }
        if (best_idx < 0) continue;
        used[best_idx] = true;
        const DetectedItem& det = target[best_idx];
        TrackedItem item;
        item.id = shown.id;
        item.label = is_more_specific_than(shown.label, det.label) ? det.label : shown.label;
        item.bbox = best_iou >= STABILITY_IOU ? shown.bbox : lerp_bbox(shown.bbox, det.bbox, blend);
        out.push_back(item);
    }
    for (size_t i = 0; i < target.size(); ++i) {
        if (used[i]) continue;
        out.push_back({-1, target[i].label, target[i].bbox});
    }
    return out;
}

DetectionTracker::DetectionTracker(double merge_blend, double step_blend, bool verbose)
    : next_id(0), merge_blend(merge_blend), step_blend(step_blend), verbose(verbose) {}

void DetectionTracker::on_detections(const std::vector<DetectedItem>& detections) {
    std::vector<TrackedItem> merged = merge_with_previous(displayed_, detections, merge_blend);
    size_t fresh = std::count_if(merged.begin(), merged.end(), [](const TrackedItem& t) { return t.id < 0; });
    if (verbose) {
        std::cout << "[DEBUG] detections: " << detections.size() << ", displayed: " << displayed_.size()
                  << ", matched: " << merged.size() - fresh << ", new: " << fresh
                  << ", dropped: " << displayed_.size() - (merged.size() - fresh) << std::endl;
    }
    assign_ids(merged);
    target_ = detections;
    displayed_ = std::move(merged);
}

void DetectionTracker::on_detection_failed() {
    if (verbose) std::cout << "[DEBUG] detection failed, clearing " << displayed_.size() << " items" << std::endl;
    target_.clear();
    displayed_.clear();
}

void DetectionTracker::on_animation_frame() {
    std::vector<TrackedItem> stepped = step_displayed_toward_target(displayed_, target_, step_blend);
    assign_ids(stepped);
    displayed_ = std::move(stepped);
}

void DetectionTracker::reset() {
    target_.clear();
    displayed_.clear();
}

void DetectionTracker::assign_ids(std::vector<TrackedItem>& items) {
    for (auto& item : items) {
        if (item.id < 0) item.id = next_id++;
    }
}
