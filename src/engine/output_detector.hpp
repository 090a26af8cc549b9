#pragma once

#include "detected_event.hpp"

#include <string>
#include <string_view>
#include <vector>

// A detector watches the output of every terminal session and turns patterns
// it recognizes into events. Each detector keeps its own per-session state.
class OutputDetector {
public:
    virtual ~OutputDetector() = default;

    virtual const std::string& id() const = 0;

    // One chunk of raw PTY output (may contain ANSI codes).
    virtual std::vector<DetectedEvent> process_output(const std::string& terminal_id,
                                                      std::string_view data) = 0;

    // Called once when the process behind the session exits.
    virtual std::vector<DetectedEvent> on_exit(const std::string& terminal_id, int exit_code) = 0;

    // Drop all state for a session and cancel its timers. Safe to call twice.
    virtual void cleanup(const std::string& terminal_id) = 0;
};
