// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/core/config.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>

#include <nlohmann/json.hpp>

namespace hyperray::config {

namespace {

// Values below `minimum` or beyond the unsigned range are reported and leave `current` unchanged
unsigned read_count(const nlohmann::json& node, const char* key, unsigned current, unsigned minimum) {
    if (!node.contains(key)) {
        return current;
    }

    const double value = node[key].get<double>();
    if (value < minimum || value > static_cast<double>(std::numeric_limits<unsigned>::max())) {
        std::cerr << "Ignoring config value " << key << " = " << node[key].dump()
                  << " (expected at least " << minimum << ")\n";
        return current;
    }
    return static_cast<unsigned>(value);
}

} // namespace

spdlog::level::level_enum parse_log_level(const std::string& value) {
    const auto lowered = [&]() {
        std::string tmp = value;
        for (char& c : tmp) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return tmp;
    }();

    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical" || lowered == "fatal") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    return spdlog::level::info;
}

RenderConfig load_from_file(const std::filesystem::path& path) {
    RenderConfig config{};
    config.config_path = path;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return config; // defaults
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "Failed to open config file: " << path << "\n";
            return config;
        }

        nlohmann::json json;
        file >> json;

        if (auto output = json.find("output"); output != json.end()) {
            config.output_width = read_count(*output, "width", config.output_width, 1);
            config.output_height = read_count(*output, "height", config.output_height, 1);
            if (output->contains("path")) {
                config.output_path = (*output)["path"].get<std::string>();
            }
        }

        if (auto scene = json.find("scene"); scene != json.end()) {
            if (scene->contains("path")) {
                config.scene_path = (*scene)["path"].get<std::string>();
            }
        }

        if (auto logging = json.find("logging"); logging != json.end()) {
            if (logging->contains("level")) {
                config.log_level = parse_log_level((*logging)["level"].get<std::string>());
            }
        }

        if (auto renderer = json.find("renderer"); renderer != json.end()) {
            config.tile_size = read_count(*renderer, "tile_size", config.tile_size, 1);
            config.worker_count = read_count(*renderer, "worker_count", config.worker_count, 0);
        }

        if (auto bootstrap = json.find("bootstrap"); bootstrap != json.end()) {
            config.frame_limit = read_count(*bootstrap, "frame_limit", config.frame_limit, 1);
        }
    } catch (const std::exception& err) {
        std::cerr << "Error parsing config file: " << path << " -> " << err.what() << "\n";
    }

    return config;
}

} // namespace hyperray::config
