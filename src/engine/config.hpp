#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Summarizer {
        std::string url;                 // empty disables naming queries
        std::string api_format = "openai"; // "openai" or "llama.cpp"
        std::string model = "default";
        std::string api_key;
        uint32_t timeout_ms = 10000;
        size_t max_input_chars = 2000;
    } summarizer;

    struct Naming {
        uint32_t debounce_ms = 2000;
        uint32_t cooldown_ms = 30000;
        size_t min_output_chars = 100;
        size_t max_buffer_chars = 5000;
    } naming;

    struct Review {
        size_t max_buffer_chars = 500000;
        size_t failure_tail_chars = 2000;
    } review;

    struct Server {
        size_t max_buffer_chars = 5000;
    } server;

    std::vector<std::string> detectors = {
        "server-detector", "stream-json-detector", "codex-stream-detector",
        "review-detector", "auto-naming-detector",
    };

    bool detector_enabled(const std::string& id) const;

    static Config load(const std::string& path);
    static Config load_default();
};
