#pragma once
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "data_types.hpp"

cv::Scalar get_color(int id);

// Boxes and labels of the displayed items, drawn in place.
void draw_overlay(cv::Mat& img, const std::vector<TrackedItem>& items);

// One PNG per rendered frame on a blank canvas.
void write_overlay_frame(const std::vector<TrackedItem>& items, const std::string& caption,
                         const std::string& path, int img_size = 800);
