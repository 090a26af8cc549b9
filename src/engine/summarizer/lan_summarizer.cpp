#include "lan_summarizer.hpp"

#include <curl/curl.h>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <sstream>
#include <vector>

using json = nlohmann::json;

static constexpr const char* kSystemPrompt =
    "You are a terminal naming assistant. Given terminal output, respond with ONLY a short "
    "2-4 word descriptive name for this terminal session. No explanations, no quotes, just "
    "the name.";

static constexpr long kMaxTokens = 20;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

static std::string strip_quotes(std::string s) {
    if (!s.empty() && (s.front() == '"' || s.front() == '\'')) s.erase(0, 1);
    if (!s.empty() && (s.back() == '"' || s.back() == '\'')) s.pop_back();
    return s;
}

std::expected<std::string, std::string> clean_name(std::string_view reply) {
    auto name = strip_quotes(trim(reply));
    name = strip_quotes(trim(name.substr(0, name.find('\n'))));

    std::vector<std::string> words;
    std::istringstream in(name);
    for (std::string w; in >> w;) words.push_back(w);

    if (words.empty()) return std::unexpected("empty name");
    if (words.size() <= 5 && name.size() <= 50) return name;

    if (words.size() > 5) {
        return words[0] + " " + words[1] + " " + words[2] + " " + words[3];
    }
    return std::unexpected("name too long: " + name);
}

LanSummarizer::LanSummarizer(Config::Summarizer config, bool verbose)
    : config_(std::move(config)), verbose_(verbose) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanSummarizer::~LanSummarizer() {
    curl_global_cleanup();
}

std::string LanSummarizer::request_body(const std::string& text) const {
    auto input = text.substr(0, config_.max_input_chars);
    auto user_prompt = "Terminal output:\n" + input +
                       "\n\nGenerate a 2-4 word name for this terminal:";

    json body;
    if (config_.api_format == "llama.cpp") {
        body = {
            {"prompt", std::string(kSystemPrompt) + "\n\n" + user_prompt + "\n"},
            {"n_predict", kMaxTokens},
            {"temperature", 0.2},
            {"stop", json::array({"\n"})},
        };
    } else {
        body = {
            {"model", config_.model},
            {"messages", json::array({
                {{"role", "system"}, {"content", kSystemPrompt}},
                {{"role", "user"}, {"content", user_prompt}},
            })},
            {"max_tokens", kMaxTokens},
            {"temperature", 0.2},
        };
    }
    // Truncation can split a UTF-8 sequence; terminal output may hold invalid bytes anyway.
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::expected<std::string, std::string> LanSummarizer::parse_reply(const std::string& body) const {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            const auto& err = j["error"];
            if (err.is_object() && err.contains("message")) {
                return std::unexpected("server error: " + err["message"].get<std::string>());
            }
            return std::unexpected("server error: " + err.dump());
        }

        if (config_.api_format == "llama.cpp") {
            if (j.contains("content")) return j["content"].get<std::string>();
        } else if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty()) {
            return j["choices"][0]["message"]["content"].get<std::string>();
        }
        return std::unexpected("unexpected response: " + body);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::expected<std::string, std::string>
LanSummarizer::generate_short_name(const std::string& text) {
    if (config_.url.empty()) {
        return std::unexpected("no summarizer url configured");
    }
    if (text.empty()) {
        return std::unexpected("empty input");
    }

    std::string endpoint = config_.url +
        (config_.api_format == "llama.cpp" ? "/completion" : "/v1/chat/completions");
    std::string payload = request_body(text);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
    std::string auth;
    if (!config_.api_key.empty()) {
        auth = "Authorization: Bearer " + config_.api_key;
        headers = curl_slist_append(headers, auth.c_str());
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.timeout_ms));
    // Called from the timer thread; no SIGALRM-based resolver timeouts.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (status >= 400) {
        return std::unexpected(std::format("HTTP {}: {}", status, response_body));
    }

    auto reply = parse_reply(response_body);
    if (!reply) return std::unexpected(reply.error());

    if (verbose_) {
        std::println(stderr, "summarizer: reply \"{}\"", *reply);
    }
    return clean_name(*reply);
}
