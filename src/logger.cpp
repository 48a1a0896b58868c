#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace relay {

namespace {
    constexpr const char* GREY = "\033[90m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* RESET = "\033[0m";
}

Logger::Logger(std::ostream& out) : out_(out) {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_debug(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    debug_ = enabled;
}

bool Logger::is_debug() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return debug_;
}

void Logger::set_colors(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    colors_ = enabled;
}

void Logger::debug(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!debug_) return;
    write(CYAN, "DEBUG", message);
}

void Logger::info(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    write(GREEN, "INFO", message);
}

void Logger::error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    write(RED, "ERROR", message);
}

void Logger::request(const std::string& method, const std::string& path,
                     const std::string& target, int status) {
    std::string line = "[" + timestamp() + "] " + method + " " + path;
    if (!target.empty()) {
        line += " -> " + target;
    }
    if (status != 0) {
        line += " [" + std::to_string(status) + "]";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.push_back(std::move(line));
}

void Logger::flush() {
    std::vector<std::string> lines;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines.swap(buffer_);
        for (const auto& line : lines) {
            out_ << line << '\n';
        }
        out_.flush();
    }
}

size_t Logger::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

// Caller holds mutex_.
void Logger::write(const char* color, const std::string& category, const std::string& message) {
    if (colors_) {
        out_ << GREY << "[" << timestamp() << "] " << color << "[" << category << "]" << RESET
             << " " << message << std::endl;
    } else {
        out_ << "[" << timestamp() << "] [" << category << "] " << message << std::endl;
    }
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    gmtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string truncate(const std::string& s, size_t max_len) {
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len) + "... (" + std::to_string(s.length()) + " bytes total)";
}

std::string format_json_compact(const std::string& json_str, size_t max_len) {
    std::string compact;
    compact.reserve(json_str.size());
    bool in_string = false;
    bool escaped = false;
    bool last_was_space = false;

    for (char c : json_str) {
        if (in_string) {
            compact += c;
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (c == '"') {
            in_string = true;
            compact += c;
            last_was_space = false;
        } else if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
            if (!last_was_space) {
                compact += ' ';
                last_was_space = true;
            }
        } else {
            compact += c;
            last_was_space = false;
        }
    }

    return truncate(compact, max_len);
}

} // namespace relay
