#pragma once

/**
 * Logging for the gateway.
 *
 * Debug lines are printed only when debug mode is enabled; info and error
 * lines always print. Request lines are buffered and written out by flush(),
 * which the server's maintenance loop calls once per second.
 */

#include <string>
#include <vector>
#include <mutex>
#include <iostream>

namespace relay {

class Logger {
public:
    // Creates a logger writing to the given stream.
    explicit Logger(std::ostream& out = std::cerr);

    // Process-wide logger used by the server.
    static Logger& instance();

    void set_debug(bool enabled);
    bool is_debug() const;

    // Enables ANSI colors (only sensible when writing to a terminal).
    void set_colors(bool enabled);

    void debug(const std::string& message);
    void info(const std::string& message);
    void error(const std::string& message);

    // Buffers "[ts] METHOD path -> target [status]". Empty target and
    // zero status are omitted from the line.
    void request(const std::string& method, const std::string& path,
                 const std::string& target = "", int status = 0);

    // Writes all buffered request lines.
    void flush();

    // Number of request lines waiting for flush().
    size_t pending() const;

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    bool debug_ = false;
    bool colors_ = false;
    std::vector<std::string> buffer_;

    void write(const char* color, const std::string& category, const std::string& message);
};

// Current time as an ISO-8601 UTC string with milliseconds.
std::string timestamp();

// Truncates long content for display.
std::string truncate(const std::string& s, size_t max_len = 200);

// Collapses whitespace outside of strings and truncates, for single-line logs.
std::string format_json_compact(const std::string& json_str, size_t max_len = 500);

} // namespace relay
