#include "geometry.hpp"
#include <algorithm>

double iou(const BoundingBox& a, const BoundingBox& b) {
    double ix1 = std::max(a.x, b.x);
    double iy1 = std::max(a.y, b.y);
    double ix2 = std::min(a.x + a.width, b.x + b.width);
    double iy2 = std::min(a.y + a.height, b.y + b.height);
    if (ix2 <= ix1 || iy2 <= iy1) return 0.0;
    double inter = (ix2 - ix1) * (iy2 - iy1);
    double uni = a.width * a.height + b.width * b.height - inter;
    return uni <= 0.0 ? 0.0 : inter / uni;
}

Eigen::Vector4d to_vector(const BoundingBox& box) {
    return Eigen::Vector4d(box.x, box.y, box.width, box.height);
}

BoundingBox from_vector(const Eigen::Vector4d& v) {
    return {v(0), v(1), v(2), v(3)};
}

BoundingBox lerp_bbox(const BoundingBox& a, const BoundingBox& b, double t) {
    Eigen::Vector4d va = to_vector(a);
    Eigen::Vector4d vb = to_vector(b);
    return from_vector(va + (vb - va) * t);
}

BoundingBox clamp_bbox(const BoundingBox& box) {
    return {
        std::clamp(box.x, 0.0, 1.0),
        std::clamp(box.y, 0.0, 1.0),
        std::clamp(box.width, MIN_BOX_EXTENT, 1.0),
        std::clamp(box.height, MIN_BOX_EXTENT, 1.0),
    };
}

bool contains_point(const BoundingBox& box, double x, double y) {
    return x >= box.x && x <= box.x + box.width && y >= box.y && y <= box.y + box.height;
}

const TrackedItem* find_item_at_point(const std::vector<TrackedItem>& items, double x, double y) {
    const TrackedItem* best = nullptr;
    double best_area = 0.0;
    for (const auto& item : items) {
        if (!contains_point(item.bbox, x, y)) continue;
        double area = item.bbox.width * item.bbox.height;
        if (!best || area < best_area) {
            best = &item;
            best_area = area;
        }
    }
    return best;
}

std::optional<NormalizedPoint> view_to_normalized(const ViewRect& view, double content_w, double content_h,
                                                  double px, double py) {
    if (view.width <= 0 || view.height <= 0) return std::nullopt;
    double aspect = (content_w > 0 ? content_w : 1.0) / (content_h > 0 ? content_h : 1.0);
    double view_aspect = view.width / view.height;
    double left, top, w, h;
    if (view_aspect > aspect) {
        // Bars left and right
        h = view.height;
        w = view.height * aspect;
        left = view.left + (view.width - w) / 2;
        top = view.top;
    } else {
        w = view.width;
        h = view.width / aspect;
        left = view.left;
        top = view.top + (view.height - h) / 2;
    }
    double x = (px - left) / w;
    double y = (py - top) / h;
    if (x < 0 || x > 1 || y < 0 || y > 1) return std::nullopt;
    return NormalizedPoint{x, y};
}
