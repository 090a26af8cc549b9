#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "termstream_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.summarizer.url.empty());
        REQUIRE(cfg.summarizer.api_format == "openai");
        REQUIRE(cfg.summarizer.timeout_ms == 10000);
        REQUIRE(cfg.summarizer.max_input_chars == 2000);
        REQUIRE(cfg.naming.debounce_ms == 2000);
        REQUIRE(cfg.naming.cooldown_ms == 30000);
        REQUIRE(cfg.naming.min_output_chars == 100);
        REQUIRE(cfg.naming.max_buffer_chars == 5000);
        REQUIRE(cfg.review.max_buffer_chars == 500000);
        REQUIRE(cfg.review.failure_tail_chars == 2000);
        REQUIRE(cfg.server.max_buffer_chars == 5000);
        REQUIRE(cfg.detectors.size() == 5);
        REQUIRE(cfg.detector_enabled("codex-stream-detector"));
        REQUIRE_FALSE(cfg.detector_enabled("no-such-detector"));
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "summarizer": {
                "url": "http://10.0.0.1:8081",
                "api_format": "llama.cpp",
                "model": "qwen",
                "api_key": "secret",
                "timeout_ms": 3000,
                "max_input_chars": 500
            },
            "naming": { "debounce_ms": 500, "cooldown_ms": 1000, "min_output_chars": 10, "max_buffer_chars": 800 },
            "review": { "max_buffer_chars": 1000, "failure_tail_chars": 50 },
            "server": { "max_buffer_chars": 300 },
            "detectors": ["server-detector", "codex-stream-detector"]
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.summarizer.url == "http://10.0.0.1:8081");
        REQUIRE(cfg.summarizer.api_format == "llama.cpp");
        REQUIRE(cfg.summarizer.model == "qwen");
        REQUIRE(cfg.summarizer.api_key == "secret");
        REQUIRE(cfg.summarizer.timeout_ms == 3000);
        REQUIRE(cfg.summarizer.max_input_chars == 500);
        REQUIRE(cfg.naming.debounce_ms == 500);
        REQUIRE(cfg.naming.cooldown_ms == 1000);
        REQUIRE(cfg.naming.min_output_chars == 10);
        REQUIRE(cfg.naming.max_buffer_chars == 800);
        REQUIRE(cfg.review.max_buffer_chars == 1000);
        REQUIRE(cfg.review.failure_tail_chars == 50);
        REQUIRE(cfg.server.max_buffer_chars == 300);
        REQUIRE(cfg.detectors == std::vector<std::string>{"server-detector", "codex-stream-detector"});
        REQUIRE_FALSE(cfg.detector_enabled("review-detector"));
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "naming": { "debounce_ms": 750 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.naming.debounce_ms == 750);
        // Other fields retain defaults
        REQUIRE(cfg.naming.cooldown_ms == 30000);
        REQUIRE(cfg.summarizer.api_format == "openai");
        REQUIRE(cfg.review.max_buffer_chars == 500000);
        REQUIRE(cfg.detectors.size() == 5);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.summarizer.url.empty());
        REQUIRE(cfg.naming.debounce_ms == 2000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/termstream_test_nonexistent_config_file.json");
        REQUIRE(cfg.summarizer.url.empty());
        REQUIRE(cfg.server.max_buffer_chars == 5000);
    }
}
