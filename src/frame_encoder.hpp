#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

std::optional<std::vector<uint8_t>> encode_jpeg(const cv::Mat& frame, int quality);

// Full-size frame for the live session.
std::optional<std::string> encode_frame_jpeg_base64(const cv::Mat& frame, int quality = 50);

// Smaller frame for the detection call: the longer side is at most max_size.
std::optional<std::vector<uint8_t>> encode_frame_for_detection(const cv::Mat& frame, int max_size = 640,
                                                               int quality = 40);
cv::Size detection_size(const cv::Size& frame, int max_size);
