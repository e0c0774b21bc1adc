#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <filesystem>
#include <optional>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "data_types.hpp"
#include "detection_parser.hpp"
#include "event_loop.hpp"
#include "tracker.hpp"
#include "visualizer.hpp"

using json = nlohmann::json;

std::vector<DetectionBatch> load_batches(const std::string& filename) {
    std::vector<DetectionBatch> batches;
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open file: " << filename << std::endl;
        return batches;
    }
    json j = json::parse(file, nullptr, false);
    if (!j.is_array()) {
        std::cerr << "Recording is not a JSON array: " << filename << std::endl;
        return batches;
    }
    return batches_from_json(j);
}

json items_to_json(const std::vector<TrackedItem>& items) {
    json out = json::array();
    for (const auto& item : items) {
        out.push_back({{"id", item.id}, {"label", item.label}, {"bbox", bbox_to_json(item.bbox)}});
    }
    return out;
}

int main(int argc, char** argv) {
    std::string config_file = get_arg(argc, argv, "--config", "");
    std::string input_file = get_arg(argc, argv, "--input", "../test_data/data/recording.json");
    std::string output_file = get_arg(argc, argv, "--output", "output.json");
    std::string vis_dir = get_arg(argc, argv, "--vis-dir", "visualizations");
    std::string every_arg = get_arg(argc, argv, "--every", "5");
    std::optional<int> render_every_opt = parse_int(every_arg);
    if (!render_every_opt) {
        std::cerr << "--every expects an integer, got: " << every_arg << std::endl;
        return 1;
    }
    int render_every = *render_every_opt;

    AppConfig config;
    if (!config_file.empty()) {
        try {
            config = load_config(config_file);
        } catch (const std::runtime_error& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
    }
    auto batches = load_batches(input_file);
    if (batches.empty()) {
        std::cerr << "No detection batches in " << input_file << std::endl;
        return 1;
    }
    if (!vis_dir.empty()) std::filesystem::create_directories(vis_dir);

    EventLoop loop(true);
    DetectionTracker tracker(config.tracker.merge_blend, config.tracker.step_blend, true);
    auto start = loop.now();
    for (const auto& batch : batches) {
        loop.call_after(std::chrono::milliseconds(batch.timestamp_ms), [&tracker, &batch]() {
            std::cout << "[Replay] batch at " << batch.timestamp_ms << " ms with " << batch.detections.size()
                      << " detections" << std::endl;
            tracker.on_detections(batch.detections);
        });
    }

    json output_json = json::array();
    int frame_id = 0;
    loop.call_every(std::chrono::milliseconds(config.tracker.frame_interval_ms), [&]() {
        tracker.on_animation_frame();
        long long t = std::chrono::duration_cast<std::chrono::milliseconds>(loop.now() - start).count();
        output_json.push_back({{"frame_id", frame_id}, {"time_ms", t}, {"items", items_to_json(tracker.displayed())}});
        if (!vis_dir.empty() && render_every > 0 && frame_id % render_every == 0) {
            std::string path = vis_dir + "/frame_" + std::to_string(frame_id) + ".png";
            write_overlay_frame(tracker.displayed(), "t=" + std::to_string(t) + "ms", path);
        }
        ++frame_id;
    });

    // One more detection interval after the last batch so the easing settles
    long long end_ms = batches.back().timestamp_ms + config.tracker.detection_interval_ms;
    loop.advance(std::chrono::milliseconds(end_ms));

    std::ofstream out(output_file);
    if (!out.is_open()) {
        std::cerr << "Failed to write " << output_file << std::endl;
        return 1;
    }
    out << output_json.dump(2) << std::endl;
    std::cout << "Wrote " << frame_id << " frames to " << output_file << std::endl;
    return 0;
}
