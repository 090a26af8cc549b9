#include "pty_json.hpp"

namespace pty_json {

namespace {

constexpr char ESC = '\x1b';
constexpr char BEL = '\x07';

// Returns the index just past the escape sequence starting at `i`, or npos
// if the sequence is not terminated inside `text`.
size_t skip_escape(std::string_view text, size_t i) {
    size_t j = i + 1;
    if (j >= text.size()) return std::string_view::npos;

    if (text[j] == '[') {
        // CSI: parameter bytes 0x30-0x3F, intermediates 0x20-0x2F, final 0x40-0x7E
        ++j;
        while (j < text.size() && text[j] >= 0x30 && text[j] <= 0x3F) ++j;
        while (j < text.size() && text[j] >= 0x20 && text[j] <= 0x2F) ++j;
        if (j >= text.size()) return std::string_view::npos;
        if (text[j] >= 0x40 && text[j] <= 0x7E) return j + 1;
        // Malformed; drop just the introducer.
        return j;
    }

    if (text[j] == ']') {
        // OSC: terminated by BEL or ST (ESC \)
        for (++j; j < text.size(); ++j) {
            if (text[j] == BEL) return j + 1;
            if (text[j] == ESC) {
                if (j + 1 >= text.size()) return std::string_view::npos;
                if (text[j + 1] == '\\') return j + 2;
            }
        }
        return std::string_view::npos;
    }

    return j + 1;
}

} // namespace

std::string strip_ansi(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != ESC) {
            out.push_back(text[i++]);
            continue;
        }
        size_t next = skip_escape(text, i);
        if (next == std::string_view::npos) break;
        i = next;
    }
    return out;
}

Extraction extract_objects(std::string_view buffer) {
    Extraction result;
    size_t i = 0;

    while (i < buffer.size()) {
        if (buffer[i] != '{') {
            ++i;
            continue;
        }

        size_t start = i;
        int depth = 0;
        bool in_string = false;
        bool escape_next = false;
        bool complete = false;

        size_t j = i;
        for (; j < buffer.size(); ++j) {
            char c = buffer[j];

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

            if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (--depth == 0) {
                    complete = true;
                    break;
                }
            }
        }

        if (!complete) {
            result.remaining.assign(buffer.substr(start));
            break;
        }

        std::string record;
        record.reserve(j + 1 - start);
        for (char c : buffer.substr(start, j + 1 - start)) {
            if (c != '\r' && c != '\n') record.push_back(c);
        }
        result.objects.push_back(std::move(record));
        i = j + 1;
    }

    return result;
}

void trim_front(std::string& buffer, size_t max_chars) {
    if (buffer.size() > max_chars) {
        buffer.erase(0, buffer.size() - max_chars);
    }
}

} // namespace pty_json
