/**
 * @file config.cpp
 * @brief JSON settings load/save/merge
 */

#include "skyline/config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

using json = nlohmann::json;

namespace skyline {

namespace {

template <typename T>
void readIfPresent(const json& node, const char* key, T& value) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        value = it->get<T>();
    }
}

json toJson(const Config& config) {
    json j;
    j["canny_edge_params"] = {
        {"threshold1", config.detector.lower_threshold},
        {"threshold2", config.detector.upper_threshold},
        {"apertureSize", config.detector.aperture_size},
        {"L2gradient", config.detector.use_l2_gradient}
    };
    j["horizon_line_params"] = {
        {"line_jump_threshold", config.tracker.line_jump_threshold},
        {"algorithm", toString(config.tracker.variant)}
    };
    j["playback"] = {
        {"display_fps_cap", config.playback.display_fps_cap},
        {"processing_fps", config.playback.processing_fps}
    };
    j["verbose"] = config.verbose;
    return j;
}

} // namespace

TrackerVariant parseTrackerVariant(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "classic") {
        return TrackerVariant::CLASSIC;
    }
    if (lower == "vectorized") {
        return TrackerVariant::VECTORIZED;
    }
    throw std::invalid_argument("Unknown horizon algorithm: " + name);
}

void applySettings(Config& config, const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("Malformed settings JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::invalid_argument("Settings JSON must be an object");
    }

    // Work on a copy so a bad value leaves the caller's config untouched
    Config updated = config;
    try {
        auto canny = j.find("canny_edge_params");
        if (canny != j.end()) {
            readIfPresent(*canny, "threshold1", updated.detector.lower_threshold);
            readIfPresent(*canny, "threshold2", updated.detector.upper_threshold);
            readIfPresent(*canny, "apertureSize", updated.detector.aperture_size);
            readIfPresent(*canny, "L2gradient", updated.detector.use_l2_gradient);
        }

        auto horizon = j.find("horizon_line_params");
        if (horizon != j.end()) {
            readIfPresent(*horizon, "line_jump_threshold", updated.tracker.line_jump_threshold);
            auto algorithm = horizon->find("algorithm");
            if (algorithm != horizon->end()) {
                updated.tracker.variant = parseTrackerVariant(algorithm->get<std::string>());
            }
        }

        auto playback = j.find("playback");
        if (playback != j.end()) {
            readIfPresent(*playback, "display_fps_cap", updated.playback.display_fps_cap);
            readIfPresent(*playback, "processing_fps", updated.playback.processing_fps);
        }

        readIfPresent(j, "verbose", updated.verbose);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid settings value: ") + e.what());
    }

    config = updated;
}

std::string settingsToJson(const Config& config, int indent) {
    return toJson(config).dump(indent);
}

Config loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open settings file: " + path);
    }
    std::string text((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());

    Config config;
    applySettings(config, text);
    if (config.verbose) {
        std::cout << "[Config] Loaded settings from " << path << "\n";
    }
    return config;
}

void saveConfig(const Config& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write settings file: " + path);
    }
    file << settingsToJson(config) << "\n";
    if (!file) {
        throw std::runtime_error("Failed writing settings file: " + path);
    }
}

} // namespace skyline
