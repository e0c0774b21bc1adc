// Overlay renderer for tracked items
// Requires OpenCV (install with: sudo apt-get install libopencv-dev)
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include "visualizer.hpp"

constexpr int RECT_THICKNESS = 2;
const cv::Scalar BG_COLOR(255, 255, 255); // White
const cv::Scalar TEXT_BG(0, 0, 0);

// Color derived from the track id; ids grow for the whole session
cv::Scalar get_color(int id) {
    long long n = id < 0 ? -static_cast<long long>(id) : id;
    int r = static_cast<int>((n * 77 + 60) % 256);
    int g = static_cast<int>((n * 151 + 120) % 256);
    int b = static_cast<int>((n * 211 + 30) % 256);
    return cv::Scalar(b, g, r);
}

void draw_overlay(cv::Mat& img, const std::vector<TrackedItem>& items) {
    for (const auto& item : items) {
        int x = static_cast<int>(item.bbox.x * img.cols);
        int y = static_cast<int>(item.bbox.y * img.rows);
        int w = static_cast<int>(item.bbox.width * img.cols);
        int h = static_cast<int>(item.bbox.height * img.rows);
        cv::Scalar color = get_color(item.id);
        cv::rectangle(img, cv::Rect(x, y, w, h), color, RECT_THICKNESS);
        int baseline = 0;
        cv::Size text = cv::getTextSize(item.label, cv::FONT_HERSHEY_SIMPLEX, 0.6, 1, &baseline);
        int ty = std::max(y - 6, text.height + 4);
        cv::rectangle(img, cv::Rect(x, ty - text.height - 4, text.width + 6, text.height + 8), TEXT_BG, cv::FILLED);
        cv::putText(img, item.label, cv::Point(x + 3, ty), cv::FONT_HERSHEY_SIMPLEX, 0.6, color, 1);
    }
}

void write_overlay_frame(const std::vector<TrackedItem>& items, const std::string& caption,
                         const std::string& path, int img_size) {
    cv::Mat img(img_size, img_size, CV_8UC3, BG_COLOR);
    draw_overlay(img, items);
    if (!caption.empty()) {
        cv::putText(img, caption, cv::Point(20, img_size - 20), cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(0, 0, 0), 2);
    }
    cv::imwrite(path, img);
}
