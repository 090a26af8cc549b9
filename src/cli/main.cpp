#include "config.hpp"
#include "detector_manager.hpp"
#include "detectors/review_detector.hpp"
#include "summarizer/lan_summarizer.hpp"

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <thread>
#include <vector>

static void print_usage() {
    std::println("Usage: termstream [options] [FILE]");
    std::println("Replays a captured terminal transcript (FILE or stdin) through the detectors");
    std::println("and prints the detected events as JSON lines.");
    std::println("Options:");
    std::println("  -c, --config PATH     Config file path");
    std::println("  -s, --session ID      Session id to report events under (default term-1)");
    std::println("  -r, --review ID       Capture review findings under this review id");
    std::println("  -e, --exit-code N     Exit code reported at end of input (default 0)");
    std::println("  -b, --chunk-size N    Bytes per delivered chunk (default 4096)");
    std::println("  -w, --wait MS         Idle time before reporting exit (default 0)");
    std::println("  -v, --verbose         Enable verbose logging");
    std::println("  -h, --help            Show this help");
}

// Whole-string decimal integer within the int range.
static std::optional<int> parse_number(const std::string& text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string session_id = "term-1";
    std::string review_id;
    std::string input_path;
    int exit_code = 0;
    int chunk_size = 4096;
    int wait_ms = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 < argc) return std::string(argv[++i]);
            std::println(stderr, "termstream: {} needs a value", arg);
            return std::nullopt;
        };
        auto number = [&](int& out) {
            auto text = value();
            if (!text) return false;
            auto n = parse_number(*text);
            if (!n) {
                std::println(stderr, "termstream: {} expects an integer between {} and {}, got '{}'",
                             arg, std::numeric_limits<int>::min(),
                             std::numeric_limits<int>::max(), *text);
                return false;
            }
            out = *n;
            return true;
        };

        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            auto v = value();
            if (!v) return 2;
            config_path = *v;
        } else if (arg == "--session" || arg == "-s") {
            auto v = value();
            if (!v) return 2;
            session_id = *v;
        } else if (arg == "--review" || arg == "-r") {
            auto v = value();
            if (!v) return 2;
            review_id = *v;
        } else if (arg == "--exit-code" || arg == "-e") {
            if (!number(exit_code)) return 2;
        } else if (arg == "--chunk-size" || arg == "-b") {
            if (!number(chunk_size)) return 2;
        } else if (arg == "--wait" || arg == "-w") {
            if (!number(wait_ms)) return 2;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::println(stderr, "termstream: unknown option {}", arg);
            print_usage();
            return 2;
        } else {
            input_path = arg;
        }
    }
    if (chunk_size <= 0) {
        std::println(stderr, "termstream: chunk size must be positive");
        return 2;
    }

    // Load config
    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    std::shared_ptr<Summarizer> summarizer;
    if (!config.summarizer.url.empty()) {
        summarizer = std::make_shared<LanSummarizer>(config.summarizer, verbose);
    }

    if (verbose) {
        std::println(stderr, "[termstream] session {} (summarizer: {})", session_id,
                     config.summarizer.url.empty() ? "none" : config.summarizer.url);
    }

    DetectorManager manager(verbose);
    register_default_detectors(manager, config, summarizer, verbose);

    std::mutex out_mutex;
    auto unsubscribe = manager.subscribe([&](const DetectedEvent& event) {
        // Terminal output isn't guaranteed to be valid UTF-8.
        auto line = to_json(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        std::lock_guard lock(out_mutex);
        std::println("{}", line);
        std::fflush(stdout);
    });

    if (!review_id.empty()) {
        auto review = std::dynamic_pointer_cast<ReviewDetector>(manager.detector("review-detector"));
        if (review) {
            review->register_review(session_id, review_id);
        } else {
            std::println(stderr, "termstream: review-detector is disabled, ignoring --review");
        }
    }

    std::ifstream file;
    std::istream* in = &std::cin;
    if (!input_path.empty() && input_path != "-") {
        file.open(input_path, std::ios::binary);
        if (!file.is_open()) {
            std::println(stderr, "termstream: cannot open {}: {}", input_path, std::strerror(errno));
            return 1;
        }
        in = &file;
    }

    std::vector<char> chunk(static_cast<size_t>(chunk_size));
    while (*in) {
        in->read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        auto n = in->gcount();
        if (n <= 0) break;
        manager.process_output(session_id, std::string_view(chunk.data(), static_cast<size_t>(n)));
    }
    if (in->bad()) {
        std::println(stderr, "termstream: read error on {}",
                     input_path.empty() ? "stdin" : input_path);
    }

    if (wait_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
    }

    manager.handle_exit(session_id, exit_code);
    manager.cleanup_session(session_id);
    unsubscribe();
    return 0;
}
