#pragma once

#include "log.hpp"
#include "utils.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ripple {

    using namespace std::string_view_literals;
    using namespace std::chrono_literals;

    inline constexpr auto version = "0.1.0"sv;

    /*
     * Ripple Startup Config Options
     *
     * Logging
     * - quiet/verbose: Coarse verbosity knobs; verbose forces debug, quiet forces error.
     * - log: Explicit threshold when neither knob is set (debug|info|warn|error|off).
     *
     * Change tracking
     * - quiescence_window: Debounce interval; a burst of file events is delivered as one
     *   batch once no new event has arrived for this long.
     * - watch_patterns: File-name globs that are tracked while a session is paused, and
     *   that select documents when a unit names a source directory.
     *
     * Sessions
     * - prewarm: Units compiled into the artifact cache when a session starts or is refreshed
     *   (none, leaf units only, or every unit in compilation order).
     * - session_idle_timeout: Sessions untouched for longer are disposed (0 disables).
     * - reaper_interval: How often idle sessions are looked for.
     *
     * Output
     * - result_list_limit: Max file/unit entries echoed in resume results.
     * - preview_file_limit: Max file entries echoed in pause previews.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    enum class prewarm_mode : uint8_t { none, leaves, all };

    inline constexpr std::string_view to_string(prewarm_mode mode) {
        switch (mode) {
            case prewarm_mode::none:
                return "none"sv;
            case prewarm_mode::leaves:
                return "leaves"sv;
            case prewarm_mode::all:
                return "all"sv;
        }
        return "leaves"sv;
    }

    inline constexpr bool try_parse_prewarm_mode(std::string_view text, prewarm_mode& out) {
        if (utils::str_case_eq(text, "none"sv) || utils::str_case_eq(text, "off"sv)) {
            out = prewarm_mode::none;
            return true;
        }
        if (utils::str_case_eq(text, "leaves"sv) || utils::str_case_eq(text, "leaf"sv)) {
            out = prewarm_mode::leaves;
            return true;
        }
        if (utils::str_case_eq(text, "all"sv)) {
            out = prewarm_mode::all;
            return true;
        }
        return false;
    }

    inline constexpr auto min_quiescence_window = 50ms;
    inline constexpr auto max_quiescence_window = 10'000ms;

    inline constexpr bool valid_quiescence_window(std::chrono::milliseconds window) {
        return window >= min_quiescence_window && window <= max_quiescence_window;
    }

    inline std::vector<std::string> default_watch_patterns() {
        return {"*.cpp", "*.cc", "*.cxx", "*.c", "*.hpp", "*.hh", "*.h", "*.ipp", "*.json"};
    }

    struct startup_config {
        std::optional<std::filesystem::path> config_file{};
        bool quiet{false};
        bool verbose{false};
        log_level log{log_level::info};

        std::chrono::milliseconds quiescence_window{500ms};
        std::vector<std::string> watch_patterns{default_watch_patterns()};

        prewarm_mode prewarm{prewarm_mode::leaves};
        std::chrono::seconds session_idle_timeout{6h};
        std::chrono::seconds reaper_interval{30min};

        std::size_t result_list_limit{10U};
        std::size_t preview_file_limit{20U};

        bool print_config{false};
    };

    inline constexpr log_level effective_log_level(const startup_config& cfg) {
        if (cfg.verbose) {
            return log_level::debug;
        }
        if (cfg.quiet) {
            return log_level::error;
        }
        return cfg.log;
    }

}  // namespace ripple
