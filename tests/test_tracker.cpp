#include <gtest/gtest.h>
#include "geometry.hpp"
#include "tracker.hpp"

namespace {

const BoundingBox B{0.0, 0.0, 0.2, 0.2};

BoundingBox shifted(const BoundingBox& box, double dx) {
    return {box.x + dx, box.y, box.width, box.height};
}

} // namespace

TEST(LabelTest, GenericLabels) {
    EXPECT_TRUE(is_generic_label("box"));
    EXPECT_TRUE(is_generic_label("  Bottles "));
    EXPECT_TRUE(is_generic_label("jar"));  // three letters or fewer
    EXPECT_FALSE(is_generic_label("canned tuna"));
    EXPECT_FALSE(is_generic_label("yogurt"));
}

TEST(LabelTest, SpecificityRequiresGenericPrevious) {
    EXPECT_TRUE(is_more_specific_than("box", "oatmeal box"));
    EXPECT_TRUE(is_more_specific_than("can", "tuna"));
    EXPECT_FALSE(is_more_specific_than("olive oil", "bottle"));
    EXPECT_FALSE(is_more_specific_than("box", "item"));
    // Shorter single word does not win over a longer generic label
    EXPECT_FALSE(is_more_specific_than("containers", "yogurt"));
    EXPECT_TRUE(is_more_specific_than("containers", "oat milk"));
}

TEST(MergeTest, EmptyTargetClearsDisplayed) {
    std::vector<TrackedItem> displayed = {{3, "milk", B}, {4, "eggs", shifted(B, 0.5)}};
    EXPECT_TRUE(merge_with_previous(displayed, {}).empty());
}

TEST(MergeTest, StableBoxIsFrozen) {
    std::vector<TrackedItem> displayed = {{7, "milk", B}};
    BoundingBox near = shifted(B, 0.01);
    ASSERT_GE(iou(B, near), STABILITY_IOU);
    auto out = merge_with_previous(displayed, {{"milk", near}});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, 7);
    EXPECT_EQ(out[0].label, "milk");
    EXPECT_DOUBLE_EQ(out[0].bbox.x, B.x);
    EXPECT_DOUBLE_EQ(out[0].bbox.width, B.width);
}

TEST(MergeTest, MovedBoxIsBlended) {
    std::vector<TrackedItem> displayed = {{1, "milk", B}};
    auto out = merge_with_previous(displayed, {{"milk", shifted(B, 0.05)}});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NEAR(out[0].bbox.x, 0.05 * MERGE_BLEND, 1e-12);
    EXPECT_DOUBLE_EQ(out[0].bbox.y, 0.0);
}

TEST(MergeTest, LabelUpgradesToSpecific) {
    BoundingBox b2 = shifted(B, 0.14);
    ASSERT_GT(iou(B, b2), MATCH_IOU_THRESHOLD);
    auto out = merge_with_previous({{0, "box", B}}, {{"canned tuna", b2}});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].label, "canned tuna");
    EXPECT_EQ(out[0].id, 0);
}

TEST(MergeTest, LabelNeverDowngrades) {
    auto out = merge_with_previous({{0, "canned tuna", B}}, {{"box", shifted(B, 0.14)}});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].label, "canned tuna");
}

TEST(MergeTest, BelowThresholdIsANewItem) {
    BoundingBox far = shifted(B, 0.16);
    ASSERT_LT(iou(B, far), MATCH_IOU_THRESHOLD);
    auto out = merge_with_previous({{5, "milk", B}}, {{"milk", far}});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, -1);
    EXPECT_DOUBLE_EQ(out[0].bbox.x, far.x);
}

TEST(MergeTest, OutputFollowsTargetOrderAndMatchesOnce) {
    std::vector<TrackedItem> displayed = {{0, "milk", B}, {1, "eggs", shifted(B, 0.6)}};
    std::vector<DetectedItem> target = {
        {"eggs", shifted(B, 0.6)},
        {"bread", shifted(B, 0.3)},
        {"milk", B},
        {"milk", B},  // second copy cannot reuse the same displayed item
    };
    auto out = merge_with_previous(displayed, target);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0].id, 1);
    EXPECT_EQ(out[1].id, -1);
    EXPECT_EQ(out[1].label, "bread");
    EXPECT_EQ(out[2].id, 0);
    EXPECT_EQ(out[3].id, -1);
}

TEST(StepTest, EasesTowardTargetAndAppendsUnmatched) {
    std::vector<TrackedItem> displayed = {{2, "milk", B}, {3, "eggs", shifted(B, 0.7)}};
    std::vector<DetectedItem> target = {{"bread", {0.5, 0.7, 0.1, 0.1}}, {"milk", shifted(B, 0.05)}};
    auto out = step_displayed_toward_target(displayed, target);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].id, 2);
    EXPECT_NEAR(out[0].bbox.x, 0.05 * STEP_BLEND, 1e-12);
    EXPECT_EQ(out[1].id, -1);
    EXPECT_EQ(out[1].label, "bread");
    EXPECT_DOUBLE_EQ(out[1].bbox.y, 0.7);
}

TEST(StepTest, UsesLooserMatchThreshold) {
    BoundingBox loose = shifted(B, 0.16);
    ASSERT_GT(iou(B, loose), STEP_MATCH_IOU_THRESHOLD);
    ASSERT_LT(iou(B, loose), MATCH_IOU_THRESHOLD);
    auto out = step_displayed_toward_target({{9, "box", B}}, {{"oatmeal box", loose}});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, 9);
    EXPECT_EQ(out[0].label, "oatmeal box");
}

TEST(DetectionTrackerTest, AssignsStableIds) {
    DetectionTracker tracker;
    tracker.on_detections({{"milk", B}, {"eggs", shifted(B, 0.5)}});
    ASSERT_EQ(tracker.displayed().size(), 2u);
    EXPECT_EQ(tracker.displayed()[0].id, 0);
    EXPECT_EQ(tracker.displayed()[1].id, 1);

    tracker.on_detections({{"bread", shifted(B, 0.25)}, {"eggs", shifted(B, 0.51)}});
    ASSERT_EQ(tracker.displayed().size(), 2u);
    EXPECT_EQ(tracker.displayed()[0].id, 2);
    EXPECT_EQ(tracker.displayed()[1].id, 1);
    EXPECT_EQ(tracker.target().size(), 2u);
}

TEST(DetectionTrackerTest, AnimationConvergesOnTarget) {
    DetectionTracker tracker;
    tracker.on_detections({{"milk", B}});
    tracker.on_detections({{"milk", shifted(B, 0.1)}});
    double before = tracker.displayed()[0].bbox.x;
    for (int i = 0; i < 10; ++i) tracker.on_animation_frame();
    ASSERT_EQ(tracker.displayed().size(), 1u);
    double after = tracker.displayed()[0].bbox.x;
    EXPECT_GT(after, before);
    EXPECT_LE(after, 0.1);
    EXPECT_EQ(tracker.displayed()[0].id, 0);
}

TEST(DetectionTrackerTest, FailureAndResetClearEverything) {
    DetectionTracker tracker;
    tracker.on_detections({{"milk", B}});
    tracker.on_detection_failed();
    EXPECT_TRUE(tracker.displayed().empty());
    EXPECT_TRUE(tracker.target().empty());
    tracker.on_animation_frame();
    EXPECT_TRUE(tracker.displayed().empty());

    tracker.on_detections({{"milk", B}});
    EXPECT_EQ(tracker.displayed()[0].id, 1);
    tracker.reset();
    EXPECT_TRUE(tracker.displayed().empty());
}
