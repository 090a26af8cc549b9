#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

bool Config::detector_enabled(const std::string& id) const {
    return std::ranges::find(detectors, id) != detectors.end();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("summarizer")) {
            auto& s = j["summarizer"];
            if (s.contains("url")) cfg.summarizer.url = s["url"].get<std::string>();
            if (s.contains("api_format")) cfg.summarizer.api_format = s["api_format"].get<std::string>();
            if (s.contains("model")) cfg.summarizer.model = s["model"].get<std::string>();
            if (s.contains("api_key")) cfg.summarizer.api_key = s["api_key"].get<std::string>();
            if (s.contains("timeout_ms")) cfg.summarizer.timeout_ms = s["timeout_ms"].get<uint32_t>();
            if (s.contains("max_input_chars")) cfg.summarizer.max_input_chars = s["max_input_chars"].get<size_t>();
        }

        if (j.contains("naming")) {
            auto& n = j["naming"];
            if (n.contains("debounce_ms")) cfg.naming.debounce_ms = n["debounce_ms"].get<uint32_t>();
            if (n.contains("cooldown_ms")) cfg.naming.cooldown_ms = n["cooldown_ms"].get<uint32_t>();
            if (n.contains("min_output_chars")) cfg.naming.min_output_chars = n["min_output_chars"].get<size_t>();
            if (n.contains("max_buffer_chars")) cfg.naming.max_buffer_chars = n["max_buffer_chars"].get<size_t>();
        }

        if (j.contains("review")) {
            auto& r = j["review"];
            if (r.contains("max_buffer_chars")) cfg.review.max_buffer_chars = r["max_buffer_chars"].get<size_t>();
            if (r.contains("failure_tail_chars")) cfg.review.failure_tail_chars = r["failure_tail_chars"].get<size_t>();
        }

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("max_buffer_chars")) cfg.server.max_buffer_chars = s["max_buffer_chars"].get<size_t>();
        }

        if (j.contains("detectors")) {
            cfg.detectors = j["detectors"].get<std::vector<std::string>>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
