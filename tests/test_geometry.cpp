#include <gtest/gtest.h>
#include "geometry.hpp"

TEST(GeometryTest, IouOfIdenticalBoxesIsOne) {
    BoundingBox a{0.1, 0.2, 0.3, 0.4};
    EXPECT_DOUBLE_EQ(iou(a, a), 1.0);
}

TEST(GeometryTest, IouOfDisjointOrTouchingBoxesIsZero) {
    BoundingBox a{0.0, 0.0, 0.2, 0.2};
    EXPECT_DOUBLE_EQ(iou(a, {0.5, 0.5, 0.2, 0.2}), 0.0);
    EXPECT_DOUBLE_EQ(iou(a, {0.2, 0.0, 0.2, 0.2}), 0.0);
}

TEST(GeometryTest, IouOfHalfShiftedBoxes) {
    // Intersection 0.1 x 0.2 over union 0.06
    EXPECT_NEAR(iou({0.0, 0.0, 0.2, 0.2}, {0.1, 0.0, 0.2, 0.2}), 1.0 / 3.0, 1e-12);
}

TEST(GeometryTest, IouOfDegenerateBoxesIsZero) {
    EXPECT_DOUBLE_EQ(iou({0.1, 0.1, 0.0, 0.0}, {0.1, 0.1, 0.0, 0.0}), 0.0);
}

TEST(GeometryTest, LerpEndpointsAndMidpoint) {
    BoundingBox a{0.1, 0.2, 0.3, 0.4};
    BoundingBox b{0.5, 0.6, 0.1, 0.2};
    BoundingBox start = lerp_bbox(a, b, 0.0);
    BoundingBox end = lerp_bbox(a, b, 1.0);
    BoundingBox mid = lerp_bbox(a, b, 0.5);
    EXPECT_DOUBLE_EQ(start.x, a.x);
    EXPECT_DOUBLE_EQ(start.height, a.height);
    EXPECT_DOUBLE_EQ(end.x, b.x);
    EXPECT_DOUBLE_EQ(end.y, b.y);
    EXPECT_DOUBLE_EQ(end.width, b.width);
    EXPECT_DOUBLE_EQ(end.height, b.height);
    EXPECT_NEAR(mid.x, 0.3, 1e-12);
    EXPECT_NEAR(mid.width, 0.2, 1e-12);
}

TEST(GeometryTest, ClampKeepsBoxesInsideTheFrame) {
    BoundingBox c = clamp_bbox({-0.2, 1.4, 0.0, 3.0});
    EXPECT_DOUBLE_EQ(c.x, 0.0);
    EXPECT_DOUBLE_EQ(c.y, 1.0);
    EXPECT_DOUBLE_EQ(c.width, MIN_BOX_EXTENT);
    EXPECT_DOUBLE_EQ(c.height, 1.0);
}

TEST(GeometryTest, HitTestPrefersSmallestContainingBox) {
    std::vector<TrackedItem> items = {
        {0, "shelf", {0.0, 0.0, 1.0, 1.0}},
        {1, "olive oil", {0.4, 0.4, 0.2, 0.3}},
        {2, "canned tuna", {0.8, 0.8, 0.1, 0.1}},
    };
    const TrackedItem* hit = find_item_at_point(items, 0.5, 0.5);
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->label, "olive oil");
    hit = find_item_at_point(items, 0.1, 0.1);
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->id, 0);
}

TEST(GeometryTest, HitTestMissReturnsNull) {
    std::vector<TrackedItem> items = {{0, "milk", {0.1, 0.1, 0.1, 0.1}}};
    EXPECT_EQ(find_item_at_point(items, 0.9, 0.9), nullptr);
    EXPECT_EQ(find_item_at_point({}, 0.5, 0.5), nullptr);
}

TEST(GeometryTest, LetterboxedViewMapsToFrameCoordinates) {
    // Square frame in a 200x100 view: content spans x in [50,150]
    ViewRect view{0, 0, 200, 100};
    auto center = view_to_normalized(view, 640, 640, 100, 50);
    ASSERT_TRUE(center.has_value());
    EXPECT_NEAR(center->x, 0.5, 1e-12);
    EXPECT_NEAR(center->y, 0.5, 1e-12);
    auto corner = view_to_normalized(view, 640, 640, 50, 0);
    ASSERT_TRUE(corner.has_value());
    EXPECT_NEAR(corner->x, 0.0, 1e-12);
    EXPECT_FALSE(view_to_normalized(view, 640, 640, 10, 50).has_value());
}

TEST(GeometryTest, PillarboxedViewUsesVerticalBars) {
    // Wide frame in a square view: content spans y in [25,75]
    ViewRect view{10, 10, 100, 100};
    auto p = view_to_normalized(view, 200, 100, 60, 35);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->x, 0.5, 1e-12);
    EXPECT_NEAR(p->y, 0.0, 1e-12);
    EXPECT_FALSE(view_to_normalized(view, 200, 100, 60, 20).has_value());
    EXPECT_FALSE(view_to_normalized({0, 0, 0, 0}, 200, 100, 0, 0).has_value());
}
