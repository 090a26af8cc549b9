#pragma once

#include <expected>
#include <string>

// A language model that can label a chunk of terminal output.
class Summarizer {
public:
    virtual ~Summarizer() = default;

    // A 1-5 word name for the session that produced `text`. Must return
    // within a bounded time; failures come back as the error string.
    virtual std::expected<std::string, std::string>
        generate_short_name(const std::string& text) = 0;
};
