#pragma once

#include "utils.hpp"

#include <cstdint>
#include <ostream>
#include <source_location>
#include <sstream>
#include <string_view>

namespace ripple {

    using namespace std::string_view_literals;

    enum class log_level : uint8_t { debug, info, warn, error, off };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::debug:
                return "debug"sv;
            case log_level::info:
                return "info"sv;
            case log_level::warn:
                return "warn"sv;
            case log_level::error:
                return "error"sv;
            case log_level::off:
                return "off"sv;
        }
        return "info"sv;
    }

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        if (utils::str_case_eq(text, "debug"sv) || utils::str_case_eq(text, "trace"sv)) {
            out = log_level::debug;
            return true;
        }
        if (utils::str_case_eq(text, "info"sv)) {
            out = log_level::info;
            return true;
        }
        if (utils::str_case_eq(text, "warn"sv) || utils::str_case_eq(text, "warning"sv)) {
            out = log_level::warn;
            return true;
        }
        if (utils::str_case_eq(text, "error"sv)) {
            out = log_level::error;
            return true;
        }
        if (utils::str_case_eq(text, "off"sv) || utils::str_case_eq(text, "none"sv)) {
            out = log_level::off;
            return true;
        }
        return false;
    }

    /*
     * Leveled diagnostics, one line per record:
     *
     *      [graph.cpp:88] info: built graph for session 3f2a...: 12 units
     *
     * Records go to stderr unless a sink is installed; stdout belongs to the JSON-RPC stream.
     * The threshold is process-wide and may be changed at any time.
     */
    namespace logging {
        void set_level(log_level level);
        log_level level();
        bool enabled(log_level level);

        // nullptr restores stderr
        void set_sink(std::ostream* sink);

        void write(log_level level, const std::source_location& loc, std::string_view message);

        template <typename... Args>
        void emit(log_level level, const std::source_location& loc, Args&&... args) {
            if (!enabled(level)) {
                return;
            }
            std::ostringstream os{};
            (os << ... << std::forward<Args>(args));
            write(level, loc, os.str());
        }
    }  // namespace logging

    template <typename... Args>
    struct log_debug {
        explicit log_debug(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            logging::emit(log_level::debug, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_info {
        explicit log_info(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            logging::emit(log_level::info, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_warn {
        explicit log_warn(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            logging::emit(log_level::warn, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_error {
        explicit log_error(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            logging::emit(log_level::error, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    log_debug(Args&&...) -> log_debug<Args...>;
    template <typename... Args>
    log_info(Args&&...) -> log_info<Args...>;
    template <typename... Args>
    log_warn(Args&&...) -> log_warn<Args...>;
    template <typename... Args>
    log_error(Args&&...) -> log_error<Args...>;

}  // namespace ripple
