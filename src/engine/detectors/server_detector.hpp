#pragma once

#include "config.hpp"
#include "output_detector.hpp"
#include "session_map.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

struct DetectedServer {
    std::string url;      // normalized scheme://host:port
    int port = 0;
    std::string protocol; // "http" or "https"
    std::string host;
    int64_t detected_at = 0;
};

nlohmann::json to_json(const DetectedServer& server);

// Parses an http(s) URL down to its endpoint. Fails for other schemes, a
// missing or non-numeric port, or a port outside 1024-65535.
std::optional<DetectedServer> parse_endpoint(std::string_view url);

// Watches dev-server output for "listening on ..." announcements and
// startup failures.
class ServerDetector : public OutputDetector {
public:
    explicit ServerDetector(Config::Server config = {}, bool verbose = false);

    const std::string& id() const override { return id_; }

    std::vector<DetectedEvent> process_output(const std::string& terminal_id,
                                              std::string_view data) override;
    std::vector<DetectedEvent> on_exit(const std::string& terminal_id, int exit_code) override;
    void cleanup(const std::string& terminal_id) override;

    // Endpoints currently known for the session, in discovery order.
    std::vector<DetectedServer> servers(const std::string& terminal_id);

    // Every distinct endpoint announced in text, in rule order.
    std::vector<DetectedServer> scan_servers(const std::string& text) const;
    bool scan_errors(const std::string& text) const;

private:
    struct SessionState {
        std::vector<DetectedServer> servers;
        std::string last_output;
        bool has_errors = false;
    };

    void log(const std::string& msg) const;

    std::string id_ = "server-detector";
    Config::Server config_;
    bool verbose_;
    std::vector<std::regex> url_patterns_;
    std::vector<std::regex> error_patterns_;
    SessionMap<SessionState> sessions_;
};
