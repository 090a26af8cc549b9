#include "detectors/review_detector.hpp"

#include "pty_json.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <print>
#include <regex>

using json = nlohmann::json;

json to_json(const ReviewFinding& finding) {
    json j = {
        {"file", finding.file},
        {"severity", finding.severity},
        {"category", finding.category},
        {"title", finding.title},
        {"description", finding.description},
    };
    if (finding.line) j["line"] = *finding.line;
    if (finding.end_line) j["endLine"] = *finding.end_line;
    if (finding.suggestion) j["suggestion"] = *finding.suggestion;
    return j;
}

static std::string trim_lower(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n\f\v");
    std::string out(s.substr(first, last - first + 1));
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

static const std::string* string_field(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) return nullptr;
    return it->get_ptr<const std::string*>();
}

// Line numbers arrive as numbers or as strings like "42" or " 42-45".
// 0, "", values outside the int range and anything without a leading integer
// read as absent.
static std::optional<int> line_number(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end()) return std::nullopt;

    if (it->is_number()) {
        double value = std::trunc(it->get<double>());
        if (!std::isfinite(value) || value == 0.0) return std::nullopt;
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(value);
    }
    if (!it->is_string()) return std::nullopt;

    const auto& text = it->get_ref<const std::string&>();
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;
    const char* begin = text.data() + first;
    if (*begin == '+') ++begin;

    int value = 0;
    auto [ptr, ec] = std::from_chars(begin, text.data() + text.size(), value);
    if (ec != std::errc{}) return std::nullopt;
    return value;
}

static bool is_template_example(const json& record, const std::string& file,
                                const std::string& severity, const std::string& title) {
    if (severity.find('|') != std::string::npos) return true;
    if (auto category = string_field(record, "category");
        category && category->find('|') != std::string::npos) {
        return true;
    }
    return file.find("relative/path") != std::string::npos ||
           title.find("Short title") != std::string::npos;
}

std::vector<ReviewFinding> validate_findings(const json& records, size_t* templates_dropped) {
    std::vector<ReviewFinding> findings;
    if (templates_dropped) *templates_dropped = 0;
    if (!records.is_array()) return findings;

    for (const auto& record : records) {
        if (!record.is_object()) continue;

        auto file = string_field(record, "file");
        auto severity = string_field(record, "severity");
        auto title = string_field(record, "title");
        auto description = string_field(record, "description");
        if (!file || !severity || !title || !description || file->empty() ||
            severity->empty() || title->empty() || description->empty()) {
            continue;
        }

        if (is_template_example(record, *file, *severity, *title)) {
            if (templates_dropped) ++*templates_dropped;
            continue;
        }

        auto normalized = trim_lower(*severity);
        if (normalized != "critical" && normalized != "warning" && normalized != "info" &&
            normalized != "suggestion") {
            continue;
        }

        ReviewFinding finding{
            .file = *file,
            .line = line_number(record, "line"),
            .end_line = line_number(record, "endLine"),
            .severity = normalized,
            .title = *title,
            .description = *description,
        };
        if (auto category = string_field(record, "category"); category && !category->empty()) {
            finding.category = *category;
        }
        if (auto suggestion = string_field(record, "suggestion")) {
            finding.suggestion = *suggestion;
        }
        findings.push_back(std::move(finding));
    }
    return findings;
}

// Validated findings for a parsed array, or nullopt when the array held
// nothing but template examples (the prompt echoed back, not an answer).
static std::optional<std::vector<ReviewFinding>> accept_array(const json& parsed) {
    size_t templates = 0;
    auto findings = validate_findings(parsed, &templates);
    if (findings.empty() && templates > 0 && templates == parsed.size()) return std::nullopt;
    return findings;
}

// Body of the first ```json fenced block, if one is closed.
static std::optional<std::string_view> fenced_json(std::string_view buffer) {
    for (size_t pos = buffer.find("```json"); pos != std::string_view::npos;
         pos = buffer.find("```json", pos + 1)) {
        size_t ws_begin = pos + 7;
        size_t ws_end = ws_begin;
        while (ws_end < buffer.size() && std::isspace(static_cast<unsigned char>(buffer[ws_end]))) {
            ++ws_end;
        }
        auto newline = buffer.substr(ws_begin, ws_end - ws_begin).rfind('\n');
        if (newline == std::string_view::npos) continue;

        size_t body = ws_begin + newline + 1;
        // An empty body closes right at the newline that opened it.
        size_t close = buffer.find("\n```", body - 1);
        if (close == std::string_view::npos) return std::nullopt;
        if (close < body) return buffer.substr(body, 0);
        return buffer.substr(body, close - body);
    }
    return std::nullopt;
}

std::optional<std::vector<ReviewFinding>> extract_findings(std::string_view buffer) {
    if (auto body = fenced_json(buffer)) {
        try {
            auto parsed = json::parse(*body);
            if (parsed.is_array()) {
                if (auto findings = accept_array(parsed)) return findings;
            }
        } catch (const json::exception&) {
            // Fall through to bracket matching.
        }
    }

    for (size_t start = buffer.find('['); start != std::string_view::npos;
         start = buffer.find('[', start + 1)) {
        int depth = 0;
        bool in_string = false;
        bool escape_next = false;

        for (size_t i = start; i < buffer.size(); ++i) {
            char c = buffer[i];
            if (escape_next) {
                escape_next = false;
                continue;
            }
            if (c == '\\' && in_string) {
                escape_next = true;
                continue;
            }
            if (c == '"') {
                in_string = !in_string;
                continue;
            }
            if (in_string) continue;

            if (c == '[') {
                ++depth;
            } else if (c == ']' && --depth == 0) {
                try {
                    auto parsed = json::parse(buffer.substr(start, i - start + 1));
                    if (parsed.is_array() && !parsed.empty()) {
                        if (auto findings = accept_array(parsed)) return findings;
                    }
                } catch (const json::exception&) {
                    // Not JSON; try the next '['.
                }
                break;
            }
        }
    }

    static const std::vector<std::regex> no_issues = [] {
        constexpr auto flags = std::regex::ECMAScript | std::regex::icase;
        return std::vector<std::regex>{
            std::regex(R"(no\s+issues?\s+found)", flags),
            std::regex(R"(code\s+looks?\s+good)", flags),
            std::regex(R"(no\s+problems?\s+(found|detected))", flags),
            std::regex(R"(everything\s+looks?\s+(good|fine|ok))", flags),
            std::regex(R"(\[\s*\])"),
        };
    }();

    std::string text(buffer);
    for (const auto& pattern : no_issues) {
        if (std::regex_search(text, pattern)) return std::vector<ReviewFinding>{};
    }
    return std::nullopt;
}

ReviewDetector::ReviewDetector(Config::Review config, bool verbose)
    : config_(config), verbose_(verbose) {}

void ReviewDetector::register_review(const std::string& terminal_id, const std::string& review_id) {
    sessions_.with(terminal_id, [&](SessionState& state) {
        state.review_id = review_id;
        state.capturing = true;
        state.emitted = false;
        state.buffer.clear();
    });
    log(std::format("registered review {} for {}", review_id, terminal_id));
}

std::vector<DetectedEvent> ReviewDetector::process_output(const std::string& terminal_id,
                                                          std::string_view data) {
    std::vector<DetectedEvent> events;

    sessions_.with_existing(terminal_id, [&](SessionState& state) {
        if (!state.capturing || !state.review_id) return;

        state.buffer += pty_json::strip_ansi(data);
        pty_json::trim_front(state.buffer, config_.max_buffer_chars);

        auto findings = extract_findings(state.buffer);
        if (!findings || state.emitted) return;

        state.emitted = true;
        state.capturing = false;
        keep_buffer(*state.review_id, state.buffer);

        log(std::format("{} finding(s) for review {}", findings->size(), *state.review_id));
        events.push_back(completed_event(terminal_id, *state.review_id, *findings));
    });

    return events;
}

std::vector<DetectedEvent> ReviewDetector::on_exit(const std::string& terminal_id, int exit_code) {
    std::vector<DetectedEvent> events;

    sessions_.with_existing(terminal_id, [&](SessionState& state) {
        if (!state.review_id) return;
        const auto& review_id = *state.review_id;

        keep_buffer(review_id, state.buffer);
        if (!state.capturing) return;
        state.capturing = false;

        if (exit_code == 0 && !state.emitted) {
            // A clean exit without a findings list means the review found nothing.
            auto findings = extract_findings(state.buffer).value_or(std::vector<ReviewFinding>{});
            state.emitted = true;
            log(std::format("{} finding(s) on exit for review {}", findings.size(), review_id));
            events.push_back(completed_event(terminal_id, review_id, findings));
        } else if (exit_code != 0) {
            auto tail = state.buffer.size() > config_.failure_tail_chars
                            ? state.buffer.substr(state.buffer.size() - config_.failure_tail_chars)
                            : state.buffer;
            log(std::format("review {} failed with exit code {}", review_id, exit_code));
            events.push_back(make_event(terminal_id, EventType::ReviewFailed, {
                {"reviewId", review_id},
                {"error", std::format("Review process exited with code {}", exit_code)},
                {"output", tail},
            }));
        }
    });

    return events;
}

void ReviewDetector::cleanup(const std::string& terminal_id) {
    sessions_.erase(terminal_id);
}

std::optional<std::string> ReviewDetector::buffer_for_review(const std::string& review_id) {
    std::optional<std::string> found;
    sessions_.for_each([&](const std::string&, SessionState& state) {
        if (!found && state.review_id == review_id) found = state.buffer;
    });
    if (found) return found;

    std::lock_guard lock(completed_mutex_);
    auto it = std::ranges::find(completed_, review_id, &std::pair<std::string, std::string>::first);
    if (it == completed_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> ReviewDetector::buffer_for_session(const std::string& terminal_id) {
    std::optional<std::string> found;
    sessions_.with_existing(terminal_id, [&](SessionState& state) {
        if (!state.buffer.empty()) found = state.buffer;
    });
    return found;
}

void ReviewDetector::clear_old_buffers() {
    std::lock_guard lock(completed_mutex_);
    if (completed_.size() > kKeptBuffers) {
        completed_.erase(completed_.begin(), completed_.end() - kKeptBuffers);
    }
}

size_t ReviewDetector::completed_buffer_count() const {
    std::lock_guard lock(completed_mutex_);
    return completed_.size();
}

DetectedEvent ReviewDetector::completed_event(const std::string& terminal_id,
                                              const std::string& review_id,
                                              const std::vector<ReviewFinding>& findings) const {
    json list = json::array();
    for (const auto& f : findings) list.push_back(to_json(f));
    return make_event(terminal_id, EventType::ReviewCompleted, {
        {"reviewId", review_id},
        {"findings", std::move(list)},
    });
}

void ReviewDetector::keep_buffer(const std::string& review_id, const std::string& buffer) {
    std::lock_guard lock(completed_mutex_);
    auto it = std::ranges::find(completed_, review_id, &std::pair<std::string, std::string>::first);
    if (it != completed_.end()) {
        it->second = buffer;
    } else {
        completed_.emplace_back(review_id, buffer);
    }
}

void ReviewDetector::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[{}] {}", id_, msg);
    }
}
