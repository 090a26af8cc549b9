#include "detectors/server_detector.hpp"

#include "pty_json.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <print>
#include <unordered_set>

using json = nlohmann::json;

json to_json(const DetectedServer& server) {
    return {
        {"url", server.url},
        {"port", server.port},
        {"protocol", server.protocol},
        {"host", server.host},
        {"detectedAt", server.detected_at},
    };
}

static std::string lowercase(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

static bool all_digits(std::string_view s) {
    return !s.empty() && std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c); });
}

std::optional<DetectedServer> parse_endpoint(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) return std::nullopt;

    auto protocol = lowercase(url.substr(0, scheme_end));
    if (protocol != "http" && protocol != "https") return std::nullopt;

    auto authority = url.substr(scheme_end + 3);
    authority = authority.substr(0, authority.find_first_of("/?#"));
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view host;
    std::string_view port_text;
    if (authority.starts_with('[')) {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        host = authority.substr(0, close + 1);
        auto rest = authority.substr(close + 1);
        if (!rest.starts_with(':')) return std::nullopt;
        port_text = rest.substr(1);
    } else {
        auto colon = authority.rfind(':');
        if (colon == std::string_view::npos) return std::nullopt;
        host = authority.substr(0, colon);
        port_text = authority.substr(colon + 1);
        if (host.find(':') != std::string_view::npos) return std::nullopt;
    }
    if (host.empty() || !all_digits(port_text) || port_text.size() > 5) return std::nullopt;

    int port = 0;
    std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (port < 1024 || port > 65535) return std::nullopt;

    DetectedServer server{
        .port = port,
        .protocol = protocol,
        .host = lowercase(host),
        .detected_at = now_ms(),
    };
    server.url = std::format("{}://{}:{}", server.protocol, server.host, server.port);
    return server;
}

// Turn a pattern capture (full URL, host:port or bare port) into a URL.
static std::optional<std::string> candidate_url(const std::string& captured) {
    static const std::regex host_port(R"(^[a-zA-Z0-9._~:/?#\[\]@!$&'()*+,;=-]+:\d+)");

    auto lower = lowercase(captured);
    if (lower.starts_with("http://") || lower.starts_with("https://")) return captured;

    if (all_digits(captured) && captured.size() >= 2 && captured.size() <= 5) {
        return "http://localhost:" + captured;
    }
    if (std::regex_search(captured, host_port)) return "http://" + captured;
    return std::nullopt;
}

ServerDetector::ServerDetector(Config::Server config, bool verbose)
    : config_(config), verbose_(verbose) {
    constexpr auto flags = std::regex::ECMAScript | std::regex::icase;

    url_patterns_ = {
        // "Local: ...", "listening on ...", "running at ..." followed by host:port
        std::regex(R"((?:Local|Network|running at|running on|available at|listening on|server started at|started on)[\s:]+((?:https?://)?[a-zA-Z0-9._~:/?#\[\]@!$&'()*+,;=-]+:\d+))", flags),
        // bare port
        std::regex(R"((?:running on|listening on|started on|server.* on|port)[:\s]+(?:localhost:)?(\d{2,5}))", flags),
        // loopback and wildcard URLs anywhere
        std::regex(R"((https?://(?:localhost|127\.0\.0\.1|0\.0\.0\.0|[:a-fA-F0-9]+):\d+))", flags),
        // Next.js
        std::regex(R"((?:Local:|Network:)\s+(https?://[^\s]+))", flags),
        // Vite
        std::regex(R"(Local:\s+(https?://[^\s)]+))", flags),
    };

    error_patterns_ = {
        std::regex("EADDRINUSE", flags),
        std::regex("address already in use", flags),
        std::regex("port.*already in use", flags),
        std::regex("error.*starting server", flags),
        std::regex("failed to start", flags),
        std::regex("cannot start server", flags),
    };
}

std::vector<DetectedEvent> ServerDetector::process_output(const std::string& terminal_id,
                                                          std::string_view data) {
    return sessions_.with(terminal_id, [&](SessionState& state) {
        std::vector<DetectedEvent> events;
        auto clean = pty_json::strip_ansi(data);

        // An announcement can be split across writes; rescan the line in progress.
        auto line_start = state.last_output.rfind('\n');
        std::string text = line_start == std::string::npos
                               ? state.last_output
                               : state.last_output.substr(line_start + 1);
        text += clean;

        state.last_output += clean;
        pty_json::trim_front(state.last_output, config_.max_buffer_chars);

        for (auto& server : scan_servers(text)) {
            bool known = std::ranges::any_of(state.servers, [&](const DetectedServer& s) {
                return s.url == server.url;
            });
            if (known) continue;

            log(std::format("detected {} in {}", server.url, terminal_id));
            events.push_back(make_event(terminal_id, EventType::ServerDetected, to_json(server)));
            state.servers.push_back(std::move(server));
        }

        if (!state.has_errors && scan_errors(text)) {
            state.has_errors = true;
            log(std::format("server error in {}", terminal_id));
            events.push_back(make_event(terminal_id, EventType::ServerError,
                                        {{"message", "Server error detected"}}));
        }
        return events;
    });
}

std::vector<DetectedEvent> ServerDetector::on_exit(const std::string& terminal_id, int exit_code) {
    std::vector<DetectedEvent> events;

    sessions_.with_existing(terminal_id, [&](SessionState& state) {
        if (state.servers.empty()) return;

        json servers = json::array();
        for (const auto& s : state.servers) servers.push_back(to_json(s));

        log(std::format("{} exited with {} server(s) up", terminal_id, state.servers.size()));
        events.push_back(make_event(terminal_id, EventType::ServerCrashed, {
            {"exitCode", exit_code},
            {"servers", std::move(servers)},
        }));

        state.servers.clear();
        state.has_errors = false;
    });

    return events;
}

void ServerDetector::cleanup(const std::string& terminal_id) {
    sessions_.erase(terminal_id);
}

std::vector<DetectedServer> ServerDetector::servers(const std::string& terminal_id) {
    std::vector<DetectedServer> result;
    sessions_.with_existing(terminal_id, [&](SessionState& state) { result = state.servers; });
    return result;
}

std::vector<DetectedServer> ServerDetector::scan_servers(const std::string& text) const {
    std::vector<DetectedServer> found;
    std::unordered_set<std::string> seen;

    for (const auto& pattern : url_patterns_) {
        for (std::sregex_iterator it(text.begin(), text.end(), pattern), end; it != end; ++it) {
            if (!(*it)[1].matched) continue;

            auto url = candidate_url((*it)[1].str());
            if (!url) continue;

            auto server = parse_endpoint(*url);
            if (!server || !seen.insert(server->url).second) continue;
            found.push_back(std::move(*server));
        }
    }
    return found;
}

bool ServerDetector::scan_errors(const std::string& text) const {
    return std::ranges::any_of(error_patterns_, [&](const std::regex& pattern) {
        return std::regex_search(text, pattern);
    });
}

void ServerDetector::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[{}] {}", id_, msg);
    }
}
