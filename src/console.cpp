#include "console.hpp"
#include "settings.hpp"
#include <cstdlib>
#include <unistd.h>

namespace relay {

Console::Console(std::ostream& out) : out_(out), colors_enabled_(false) {
    const char* term = std::getenv("TERM");
    bool dumb = !term || std::string(term) == "dumb";
    colors_enabled_ = (&out == &std::cout) && isatty(STDOUT_FILENO) && !dumb;
}

void Console::print_colored_line(const char* color, const std::string& text) const {
    if (colors_enabled_) {
        out_ << color << text << ansi::RESET << std::endl;
    } else {
        out_ << text << std::endl;
    }
}

void Console::println(const std::string& text) const {
    out_ << text << std::endl;
}

void Console::print_error(const std::string& text) const {
    print_colored_line(ansi::RED, text);
}

void Console::print_warning(const std::string& text) const {
    print_colored_line(ansi::YELLOW, text);
}

void Console::print_success(const std::string& text) const {
    if (colors_enabled_) {
        out_ << ansi::GREEN << "✓" << ansi::RESET << " " << text << std::endl;
    } else {
        out_ << "* " << text << std::endl;
    }
}

void Console::print_header(const std::string& text) const {
    if (colors_enabled_) {
        out_ << ansi::BOLD << ansi::CYAN << text << ansi::RESET << std::endl;
    } else {
        out_ << text << std::endl;
    }
}

void Console::print_field(const std::string& label, const std::string& value) const {
    if (colors_enabled_) {
        out_ << "  " << ansi::GREY << label << ":" << ansi::RESET << " " << value << std::endl;
    } else {
        out_ << "  " << label << ": " << value << std::endl;
    }
}

void Console::print_startup(const GatewaySettings& settings, size_t generic_services,
                            size_t special_services) const {
    std::string base = "http://localhost:" + std::to_string(settings.port);

    print_header("=== relay gateway ===");
    print_field("Listening", settings.listen_address + ":" + std::to_string(settings.port));
    print_field("Health check", base + "/health");
    print_field("Metrics", base + "/metrics");
    print_field("Services", base + "/services");
    print_field("Debug mode", settings.debug_mode ? "on" : "off");
    print_field("Rate limiting", std::to_string(settings.max_requests_per_minute) + " requests/minute");
    print_field("Supported services", std::to_string(generic_services) + " generic, " +
                                      std::to_string(special_services) + " special");
    print_field("Upstream", settings.upstream_url_base);
    if (settings.production) {
        print_field("Environment", "production (error details sanitized)");
    }
    println();
}

} // namespace relay
