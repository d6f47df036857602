#include "ripple/cli.hpp"

#include "ripple/error.hpp"
#include "ripple/format.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace ripple::literals;

namespace ripple::cli {

    namespace detail {

        using namespace std::string_view_literals;
        namespace fs = std::filesystem;

        // every key optional; unknown keys are an error
        struct config_file {
            std::optional<bool> quiet{};
            std::optional<bool> verbose{};
            std::optional<std::string> log{};
            std::optional<int64_t> quiescence_ms{};
            std::optional<std::vector<std::string>> watch_patterns{};
            std::optional<std::string> prewarm{};
            std::optional<int64_t> idle_timeout_s{};
            std::optional<int64_t> reaper_interval_s{};
            std::optional<size_t> result_list_limit{};
            std::optional<size_t> preview_file_limit{};
            struct glaze {
                using T = config_file;
                static constexpr auto value = glz::object(
                        &T::quiet,
                        &T::verbose,
                        &T::log,
                        &T::quiescence_ms,
                        &T::watch_patterns,
                        &T::prewarm,
                        &T::idle_timeout_s,
                        &T::reaper_interval_s,
                        &T::result_list_limit,
                        &T::preview_file_limit);
            };
        };

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw error{error_kind::invalid_argument, "failed to open config file {}"_format(path.string())};
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        static bool valid_patterns(const std::vector<std::string>& patterns) {
            return std::ranges::none_of(patterns, [](const auto& p) { return p.empty(); });
        }

    }  // namespace detail

    void load_config_file(const std::filesystem::path& path, startup_config& cfg) {
        detail::config_file file{};
        auto json = detail::read_text_file(path);
        if (auto ec = glz::read_json(file, json)) {
            throw error{
                    error_kind::invalid_argument,
                    "failed to parse config file {}: {}"_format(path.string(), glz::format_error(ec, json))};
        }

        auto invalid = [&](std::string_view key, const auto& value) {
            return error{error_kind::invalid_argument, "invalid {} in {}: {}"_format(key, path.string(), value)};
        };

        if (file.quiet) {
            cfg.quiet = *file.quiet;
        }
        if (file.verbose) {
            cfg.verbose = *file.verbose;
        }
        if (file.log && !try_parse_log_level(*file.log, cfg.log)) {
            throw invalid("log"sv, *file.log);
        }
        if (file.quiescence_ms) {
            std::chrono::milliseconds window{*file.quiescence_ms};
            if (!valid_quiescence_window(window)) {
                throw invalid("quiescence_ms"sv, *file.quiescence_ms);
            }
            cfg.quiescence_window = window;
        }
        if (file.watch_patterns) {
            if (file.watch_patterns->empty() || !detail::valid_patterns(*file.watch_patterns)) {
                throw invalid("watch_patterns"sv, "empty pattern"sv);
            }
            cfg.watch_patterns = *file.watch_patterns;
        }
        if (file.prewarm && !try_parse_prewarm_mode(*file.prewarm, cfg.prewarm)) {
            throw invalid("prewarm"sv, *file.prewarm);
        }
        if (file.idle_timeout_s) {
            if (*file.idle_timeout_s < 0) {
                throw invalid("idle_timeout_s"sv, *file.idle_timeout_s);
            }
            cfg.session_idle_timeout = std::chrono::seconds{*file.idle_timeout_s};
        }
        if (file.reaper_interval_s) {
            if (*file.reaper_interval_s <= 0) {
                throw invalid("reaper_interval_s"sv, *file.reaper_interval_s);
            }
            cfg.reaper_interval = std::chrono::seconds{*file.reaper_interval_s};
        }
        if (file.result_list_limit) {
            cfg.result_list_limit = *file.result_list_limit;
        }
        if (file.preview_file_limit) {
            cfg.preview_file_limit = *file.preview_file_limit;
        }
        cfg.config_file = path;
    }

    void print_config(const startup_config& cfg, std::ostream& os) {
        os << "config_file=" << (cfg.config_file ? cfg.config_file->string() : "<none>") << '\n';
        os << "log=" << to_string(effective_log_level(cfg)) << '\n';
        os << "quiescence_window=" << format_duration(cfg.quiescence_window) << '\n';
        os << "watch_patterns=" << utils::join_with_separator(cfg.watch_patterns, ","sv) << '\n';
        os << "prewarm=" << to_string(cfg.prewarm) << '\n';
        os << "session_idle_timeout=" << cfg.session_idle_timeout.count() << "s\n";
        os << "reaper_interval=" << cfg.reaper_interval.count() << "s\n";
        os << "result_list_limit=" << cfg.result_list_limit << '\n';
        os << "preview_file_limit=" << cfg.preview_file_limit << '\n';
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"ripple: incremental re-analysis MCP server"};

        bool show_version = false;
        std::string config_arg{};
        int64_t quiescence_arg{cfg.quiescence_window.count()};
        std::vector<std::string> pattern_args{};
        std::string prewarm_arg{std::string{to_string(cfg.prewarm)}};
        int64_t idle_timeout_arg{cfg.session_idle_timeout.count()};
        int64_t reaper_interval_arg{cfg.reaper_interval.count()};
        std::string log_arg{std::string{to_string(cfg.log)}};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-c,--config", config_arg, "JSON config file; command-line flags override it");
        app.add_option("--quiescence-ms", quiescence_arg, "Change batching window in milliseconds (50..10000)");
        app.add_option("--watch-pattern", pattern_args, "File-name glob to track while paused (repeatable)");
        app.add_option("--prewarm", prewarm_arg, "Units compiled on session start: none|leaves|all");
        app.add_option("--idle-timeout", idle_timeout_arg, "Dispose sessions idle for this many seconds (0 disables)");
        app.add_option("--reaper-interval", reaper_interval_arg, "Seconds between idle-session sweeps");
        app.add_option("--list-limit", cfg.result_list_limit, "Max files/units listed in resume results");
        app.add_option("--preview-limit", cfg.preview_file_limit, "Max files listed in pause previews");
        app.add_option("--log", log_arg, "Log level: debug|info|warn|error|off");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Only log errors");
        app.add_flag("--verbose", cfg.verbose, "Enable debug logging");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "ripple " << version << '\n';
            return std::optional<int>{0};
        }

        if (!config_arg.empty()) {
            // the file sits below the command line: reapply whatever was given explicitly afterwards
            auto cli_quiet = cfg.quiet;
            auto cli_verbose = cfg.verbose;
            auto cli_list_limit = cfg.result_list_limit;
            auto cli_preview_limit = cfg.preview_file_limit;
            try {
                load_config_file(config_arg, cfg);
            } catch (const error& e) {
                std::cerr << e.what() << '\n';
                return std::optional<int>{2};
            }
            // any log-level flag on the command line replaces every log-level knob from the file
            bool cli_sets_level = app.get_option("--quiet")->count() > 0U ||
                                  app.get_option("--verbose")->count() > 0U || app.get_option("--log")->count() > 0U;
            if (cli_sets_level) {
                cfg.quiet = cli_quiet;
                cfg.verbose = cli_verbose;
            }
            if (app.get_option("--list-limit")->count() > 0U) {
                cfg.result_list_limit = cli_list_limit;
            }
            if (app.get_option("--preview-limit")->count() > 0U) {
                cfg.preview_file_limit = cli_preview_limit;
            }
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (app.get_option("--log")->count() > 0U && !try_parse_log_level(log_arg, cfg.log)) {
            std::cerr << "invalid --log value: " << log_arg << " (expected debug|info|warn|error|off)\n";
            return std::optional<int>{2};
        }
        if (app.get_option("--prewarm")->count() > 0U && !try_parse_prewarm_mode(prewarm_arg, cfg.prewarm)) {
            std::cerr << "invalid --prewarm value: " << prewarm_arg << " (expected none|leaves|all)\n";
            return std::optional<int>{2};
        }
        if (app.get_option("--quiescence-ms")->count() > 0U) {
            std::chrono::milliseconds window{quiescence_arg};
            if (!valid_quiescence_window(window)) {
                std::cerr << "invalid --quiescence-ms value: " << quiescence_arg << " (expected 50..10000)\n";
                return std::optional<int>{2};
            }
            cfg.quiescence_window = window;
        }
        if (!pattern_args.empty()) {
            if (!detail::valid_patterns(pattern_args)) {
                std::cerr << "invalid --watch-pattern value: empty pattern\n";
                return std::optional<int>{2};
            }
            cfg.watch_patterns = pattern_args;
        }
        if (app.get_option("--idle-timeout")->count() > 0U) {
            if (idle_timeout_arg < 0) {
                std::cerr << "invalid --idle-timeout value: " << idle_timeout_arg << " (expected >= 0)\n";
                return std::optional<int>{2};
            }
            cfg.session_idle_timeout = std::chrono::seconds{idle_timeout_arg};
        }
        if (app.get_option("--reaper-interval")->count() > 0U) {
            if (reaper_interval_arg <= 0) {
                std::cerr << "invalid --reaper-interval value: " << reaper_interval_arg << " (expected > 0)\n";
                return std::optional<int>{2};
            }
            cfg.reaper_interval = std::chrono::seconds{reaper_interval_arg};
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace ripple::cli
