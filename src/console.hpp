#pragma once

#include <string>
#include <iostream>

namespace relay {

struct GatewaySettings;

// ========== ANSI Escape Codes ==========

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GREY = "\033[90m";
}

/**
 * Operator-facing output for startup and shutdown.
 *
 * Colors are used only when stdout is a terminal and TERM is not "dumb".
 * Request traffic goes through Logger, not through this class.
 */
class Console {
public:
    // Writes to `out`, detecting color support when it is std::cout.
    explicit Console(std::ostream& out = std::cout);

    bool colors_enabled() const { return colors_enabled_; }

    void println(const std::string& text = "") const;

    void print_error(const std::string& text) const;
    void print_warning(const std::string& text) const;
    void print_success(const std::string& text) const;
    void print_header(const std::string& text) const;

    // Prints "  label: value" with the label dimmed.
    void print_field(const std::string& label, const std::string& value) const;

    // Prints the startup summary for a server about to listen.
    void print_startup(const GatewaySettings& settings, size_t generic_services,
                       size_t special_services) const;

private:
    std::ostream& out_;
    bool colors_enabled_;

    void print_colored_line(const char* color, const std::string& text) const;
};

} // namespace relay
