#pragma once
#include <optional>
#include <vector>
#include <Eigen/Dense>
#include "data_types.hpp"

constexpr double MIN_BOX_EXTENT = 0.01;

struct NormalizedPoint {
    double x, y;
};

// Rectangle of a view in view pixels
struct ViewRect {
    double left, top, width, height;
};

double iou(const BoundingBox& a, const BoundingBox& b);
BoundingBox lerp_bbox(const BoundingBox& a, const BoundingBox& b, double t);

// x,y into [0,1], width,height into [MIN_BOX_EXTENT,1]
BoundingBox clamp_bbox(const BoundingBox& box);

Eigen::Vector4d to_vector(const BoundingBox& box);
BoundingBox from_vector(const Eigen::Vector4d& v);

bool contains_point(const BoundingBox& box, double x, double y);

// Item whose box contains the point; the smallest box wins when several do.
const TrackedItem* find_item_at_point(const std::vector<TrackedItem>& items, double x, double y);

// Maps a point in a view that letterboxes a content_w x content_h frame
// (scaled to fit, centered) to normalized frame coordinates.
std::optional<NormalizedPoint> view_to_normalized(const ViewRect& view, double content_w, double content_h,
                                                  double px, double py);
