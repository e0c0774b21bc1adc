#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include "base64.hpp"
#include "frame_encoder.hpp"
#include "visualizer.hpp"

TEST(FrameEncoderTest, DetectionSizeKeepsAspectRatio) {
    EXPECT_EQ(detection_size(cv::Size(1280, 720), 640), cv::Size(640, 360));
    EXPECT_EQ(detection_size(cv::Size(720, 1280), 640), cv::Size(360, 640));
    EXPECT_EQ(detection_size(cv::Size(320, 240), 640), cv::Size(320, 240));
}

TEST(FrameEncoderTest, EncodesJpeg) {
    cv::Mat frame(120, 160, CV_8UC3, cv::Scalar(30, 120, 200));
    auto jpeg = encode_jpeg(frame, 50);
    ASSERT_TRUE(jpeg.has_value());
    ASSERT_GT(jpeg->size(), 4u);
    EXPECT_EQ((*jpeg)[0], 0xFF);
    EXPECT_EQ((*jpeg)[1], 0xD8);

    auto b64 = encode_frame_jpeg_base64(frame);
    ASSERT_TRUE(b64.has_value());
    auto decoded = base64_decode(*b64);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ((*decoded)[0], 0xFF);
}

TEST(FrameEncoderTest, DetectionFrameIsDownscaled) {
    cv::Mat frame(720, 1280, CV_8UC3, cv::Scalar(0, 0, 0));
    auto jpeg = encode_frame_for_detection(frame);
    ASSERT_TRUE(jpeg.has_value());
    cv::Mat decoded = cv::imdecode(*jpeg, cv::IMREAD_COLOR);
    EXPECT_EQ(decoded.cols, 640);
    EXPECT_EQ(decoded.rows, 360);
}

TEST(FrameEncoderTest, EmptyFrameYieldsNothing) {
    cv::Mat empty;
    EXPECT_FALSE(encode_jpeg(empty, 50).has_value());
    EXPECT_FALSE(encode_frame_jpeg_base64(empty).has_value());
    EXPECT_FALSE(encode_frame_for_detection(empty).has_value());
}

TEST(VisualizerTest, ColorIsStablePerId) {
    EXPECT_TRUE(get_color(4) == get_color(4));
    EXPECT_TRUE(get_color(1) != get_color(2));
    EXPECT_TRUE(get_color(5) == cv::Scalar(61, 107, 189));
    // Large ids from a long session stay in range
    cv::Scalar big = get_color(2000000000);
    for (int c = 0; c < 3; ++c) {
        EXPECT_GE(big[c], 0.0);
        EXPECT_LT(big[c], 256.0);
    }
}

TEST(VisualizerTest, DrawsBoxesOntoFrame) {
    cv::Mat img(200, 200, CV_8UC3, cv::Scalar(255, 255, 255));
    draw_overlay(img, {{0, "olive oil", {0.25, 0.25, 0.5, 0.5}}});
    cv::Vec3b edge = img.at<cv::Vec3b>(100, 50);
    EXPECT_TRUE(edge != cv::Vec3b(255, 255, 255));
    cv::Vec3b inside = img.at<cv::Vec3b>(120, 100);
    EXPECT_TRUE(inside == cv::Vec3b(255, 255, 255));
}
