#include "frame_encoder.hpp"
#include "base64.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

std::optional<std::vector<uint8_t>> encode_jpeg(const cv::Mat& frame, int quality) {
    if (frame.empty()) return std::nullopt;
    std::vector<uchar> buf;
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 1, 100)};
    try {
        if (!cv::imencode(".jpg", frame, buf, params)) return std::nullopt;
    } catch (const cv::Exception& e) {
        std::cerr << "[FrameEncoder] " << e.what() << std::endl;
        return std::nullopt;
    }
    return std::vector<uint8_t>(buf.begin(), buf.end());
}

std::optional<std::string> encode_frame_jpeg_base64(const cv::Mat& frame, int quality) {
    auto jpeg = encode_jpeg(frame, quality);
    if (!jpeg) return std::nullopt;
    return base64_encode(*jpeg);
}

cv::Size detection_size(const cv::Size& frame, int max_size) {
    int longest = std::max(frame.width, frame.height);
    if (longest <= 0) return frame;
    double scale = static_cast<double>(max_size) / longest;
    if (scale >= 1.0) return frame;
    return cv::Size(static_cast<int>(std::lround(frame.width * scale)),
                    static_cast<int>(std::lround(frame.height * scale)));
}

std::optional<std::vector<uint8_t>> encode_frame_for_detection(const cv::Mat& frame, int max_size, int quality) {
    if (frame.empty()) return std::nullopt;
    cv::Size target = detection_size(frame.size(), max_size);
    if (target == frame.size()) return encode_jpeg(frame, quality);
    cv::Mat small;
    cv::resize(frame, small, target, 0, 0, cv::INTER_AREA);
    return encode_jpeg(small, quality);
}
