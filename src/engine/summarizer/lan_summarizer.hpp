#pragma once

#include "backend.hpp"
#include "config.hpp"

#include <expected>
#include <string>
#include <string_view>

// Names terminal sessions with a language model served on the LAN.
class LanSummarizer : public Summarizer {
public:
    // config.api_format: "openai" (/v1/chat/completions) or "llama.cpp" (/completion)
    explicit LanSummarizer(Config::Summarizer config, bool verbose = false);
    ~LanSummarizer() override;

    std::expected<std::string, std::string>
        generate_short_name(const std::string& text) override;

    // Request body for the configured API format.
    std::string request_body(const std::string& text) const;

    // Pull the generated text out of a response body.
    std::expected<std::string, std::string> parse_reply(const std::string& body) const;

private:
    Config::Summarizer config_;
    bool verbose_;
};

// Reduce a model reply to a usable name: first line, quotes stripped,
// at most 5 words and 50 chars (longer replies are cut to 4 words).
std::expected<std::string, std::string> clean_name(std::string_view reply);
