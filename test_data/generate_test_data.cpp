#include <iostream>
#include <fstream>
#include <vector>
#include <random>
#include <cmath>
#include <iomanip>
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// A shelf product as the detector would report it
struct Product {
    std::string generic_label;
    std::string specific_label;
    double x, y;
    double width, height;
    int identified_from; // batch index from which the specific label is reported
};

static double dist(double x1, double y1, double x2, double y2) {
    return std::sqrt((x1 - x2) * (x1 - x2) + (y1 - y2) * (y1 - y2));
}

int main(int argc, char** argv) {
    std::string output_path = argc > 1 ? argv[1] : "test_data/data/recording.json";
    int num_batches = 12;
    long long batch_interval_ms = 4500;
    double min_product_distance = 0.22;
    double dropout_probability = 0.1;
    double noise_stddev_pos = 0.01;
    double noise_stddev_size = 0.005;
    double pan_per_batch = 0.01; // camera drift to the right

    const std::vector<std::pair<std::string, std::string>> catalog = {
        {"can", "canned tuna"},       {"bottle", "olive oil"},
        {"box", "oatmeal box"},       {"container", "greek yogurt"},
        {"bottle", "vitamin D bottle"}, {"item", "peanut butter jar"},
    };

    std::mt19937 rng(42);
    std::uniform_real_distribution<double> pos_dist(0.05, 0.75);
    std::uniform_real_distribution<double> size_dist(0.1, 0.2);
    std::uniform_int_distribution<int> reveal_dist(0, 3);
    std::normal_distribution<double> noise_pos(0.0, noise_stddev_pos);
    std::normal_distribution<double> noise_size(0.0, noise_stddev_size);
    std::uniform_real_distribution<double> drop_chance(0.0, 1.0);

    // 1. Place products apart from each other
    std::vector<Product> products;
    for (const auto& entry : catalog) {
        double x, y;
        int tries = 0;
        while (true) {
            x = pos_dist(rng);
            y = pos_dist(rng);
            bool ok = true;
            for (const auto& p : products) {
                if (dist(x, y, p.x, p.y) < min_product_distance) ok = false;
            }
            if (ok) break;
            if (++tries > 1000) throw std::runtime_error("Can't place products with given min distance");
        }
        products.push_back({entry.first, entry.second, x, y, size_dist(rng), size_dist(rng), reveal_dist(rng)});
    }

    // 2. One detection batch per cycle: noisy boxes, occasional misses,
    // generic labels until the product is recognized
    json batches = json::array();
    for (int b = 0; b < num_batches; ++b) {
        json detections = json::array();
        for (const auto& p : products) {
            if (drop_chance(rng) < dropout_probability) continue;
            double x = p.x - b * pan_per_batch + noise_pos(rng);
            double y = p.y + noise_pos(rng);
            if (x + p.width < 0.0) continue; // panned out of view
            detections.push_back({
                {"label", b >= p.identified_from ? p.specific_label : p.generic_label},
                {"bbox", {
                    {"x", x},
                    {"y", y},
                    {"width", p.width + noise_size(rng)},
                    {"height", p.height + noise_size(rng)},
                }},
            });
        }
        batches.push_back({{"timestamp_ms", b * batch_interval_ms}, {"detections", detections}});
    }

    // 3. Write to file
    std::filesystem::path out_path(output_path);
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());
    std::ofstream out(output_path);
    if (!out.is_open()) {
        std::cerr << "Failed to write " << output_path << std::endl;
        return 1;
    }
    out << std::setw(2) << batches << std::endl;
    std::cout << "Test recording written to " << output_path << std::endl;
    return 0;
}
