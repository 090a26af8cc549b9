#pragma once

#include <string>
#include <string_view>
#include <vector>

// Helpers for pulling JSON records out of PTY output. PTYs re-wrap long lines,
// so a single record can arrive split across reads and with CR/LF inserted
// in the middle of it.
namespace pty_json {

// Remove terminal control sequences (CSI, OSC, two-byte ESC). A sequence cut
// off at the end of the input is dropped.
std::string strip_ansi(std::string_view text);

struct Extraction {
    std::vector<std::string> objects; // complete {...} records, CR/LF removed
    std::string remaining;            // unfinished record to prepend to the next chunk
};

// Brace-match complete JSON objects out of a buffer. Text between records is
// discarded; a record still open at the end of the buffer is returned in
// `remaining`.
Extraction extract_objects(std::string_view buffer);

// Keep only the last `max_chars` characters of `buffer`.
void trim_front(std::string& buffer, size_t max_chars);

} // namespace pty_json
