#include "utils.hpp"

#include <vector>

namespace ripple::test {

    namespace detail {
        std::vector<char*> to_argv(std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size());
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            return argv;
        }
    }  // namespace detail

    using namespace std::chrono_literals;

    TEST_CASE("002: parse_cli accepts startup options", "[002][cli]") {
        startup_config cfg{};
        std::vector<std::string> args{
                "ripple",
                "--quiescence-ms",
                "250",
                "--watch-pattern",
                "*.cpp",
                "--watch-pattern",
                "*.h",
                "--prewarm",
                "all",
                "--idle-timeout",
                "0",
                "--reaper-interval",
                "60",
                "--list-limit",
                "5",
                "--preview-limit",
                "7",
                "--log",
                "warn"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK(cfg.quiescence_window == 250ms);
        CHECK(cfg.watch_patterns == std::vector<std::string>{"*.cpp", "*.h"});
        CHECK(cfg.prewarm == prewarm_mode::all);
        CHECK(cfg.session_idle_timeout == 0s);
        CHECK(cfg.reaper_interval == 60s);
        CHECK(cfg.result_list_limit == 5U);
        CHECK(cfg.preview_file_limit == 7U);
        CHECK(cfg.log == log_level::warn);
        CHECK(effective_log_level(cfg) == log_level::warn);
    }

    TEST_CASE("002: parse_cli keeps defaults without options", "[002][cli]") {
        startup_config cfg{};
        std::vector<std::string> args{"ripple"};
        auto argv = detail::to_argv(args);

        CHECK(!cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg));
        CHECK(cfg.quiescence_window == 500ms);
        CHECK(cfg.watch_patterns == default_watch_patterns());
        CHECK(cfg.prewarm == prewarm_mode::leaves);
        CHECK_FALSE(cfg.config_file);
    }

    TEST_CASE("002: parse_cli rejects invalid values", "[002][cli]") {
        auto run = [](std::vector<std::string> args) {
            startup_config cfg{};
            auto argv = detail::to_argv(args);
            return cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        };

        auto quiet_verbose = run({"ripple", "--quiet", "--verbose"});
        REQUIRE(quiet_verbose);
        CHECK(*quiet_verbose == 2);

        auto window_low = run({"ripple", "--quiescence-ms", "10"});
        REQUIRE(window_low);
        CHECK(*window_low == 2);

        auto bad_prewarm = run({"ripple", "--prewarm", "sometimes"});
        REQUIRE(bad_prewarm);
        CHECK(*bad_prewarm == 2);

        auto bad_log = run({"ripple", "--log", "chatty"});
        REQUIRE(bad_log);
        CHECK(*bad_log == 2);

        auto negative_idle = run({"ripple", "--idle-timeout=-5"});
        REQUIRE(negative_idle);
        CHECK(*negative_idle == 2);

        auto missing_config = run({"ripple", "--config", "/nonexistent/ripple-config.json"});
        REQUIRE(missing_config);
        CHECK(*missing_config == 2);
    }

    TEST_CASE("002: parse_cli version exits zero", "[002][cli]") {
        startup_config cfg{};
        std::vector<std::string> args{"ripple", "--version"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        REQUIRE(result);
        CHECK(*result == 0);
    }

    TEST_CASE("002: config file values apply below command line flags", "[002][cli][config]") {
        detail::temp_dir temp{"ripple_cli_config"};
        auto path = temp.path / "config.json";
        detail::write_file(
                path,
                R"({"quiescence_ms": 1000, "prewarm": "none", "result_list_limit": 3, "watch_patterns": ["*.cc"]})");

        startup_config cfg{};
        std::vector<std::string> args{"ripple", "--config", path.string(), "--list-limit", "8"};
        auto argv = detail::to_argv(args);

        CHECK(!cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg));
        CHECK(cfg.quiescence_window == 1000ms);
        CHECK(cfg.prewarm == prewarm_mode::none);
        CHECK(cfg.watch_patterns == std::vector<std::string>{"*.cc"});
        CHECK(cfg.result_list_limit == 8U);
        REQUIRE(cfg.config_file);
        CHECK(*cfg.config_file == path);
    }

    TEST_CASE("002: command line log level overrides the config file", "[002][cli][config]") {
        detail::temp_dir temp{"ripple_cli_config_log"};
        auto path = temp.path / "config.json";
        detail::write_file(path, R"({"verbose": true})");

        SECTION("--quiet replaces a verbose file") {
            startup_config cfg{};
            std::vector<std::string> args{"ripple", "--config", path.string(), "--quiet"};
            auto argv = detail::to_argv(args);

            CHECK(!cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg));
            CHECK(cfg.quiet);
            CHECK_FALSE(cfg.verbose);
            CHECK(effective_log_level(cfg) == log_level::error);
        }
        SECTION("--log replaces a verbose file") {
            startup_config cfg{};
            std::vector<std::string> args{"ripple", "--config", path.string(), "--log", "warn"};
            auto argv = detail::to_argv(args);

            CHECK(!cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg));
            CHECK_FALSE(cfg.verbose);
            CHECK(effective_log_level(cfg) == log_level::warn);
        }
        SECTION("without level flags the file applies") {
            startup_config cfg{};
            std::vector<std::string> args{"ripple", "--config", path.string()};
            auto argv = detail::to_argv(args);

            CHECK(!cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg));
            CHECK(effective_log_level(cfg) == log_level::debug);
        }
    }

    TEST_CASE("002: config file rejects unknown keys and bad values", "[002][config]") {
        detail::temp_dir temp{"ripple_cli_config_bad"};

        auto unknown = temp.path / "unknown.json";
        detail::write_file(unknown, R"({"quiescence": 200})");
        startup_config cfg{};
        try {
            cli::load_config_file(unknown, cfg);
            FAIL("expected invalid_argument");
        } catch (const error& e) {
            CHECK(e.kind() == error_kind::invalid_argument);
        }

        auto bad_window = temp.path / "window.json";
        detail::write_file(bad_window, R"({"quiescence_ms": 20000})");
        try {
            cli::load_config_file(bad_window, cfg);
            FAIL("expected invalid_argument");
        } catch (const error& e) {
            CHECK(e.kind() == error_kind::invalid_argument);
        }
        CHECK(cfg.quiescence_window == 500ms);
    }

    TEST_CASE("002: print_config lists resolved values", "[002][config]") {
        startup_config cfg{};
        cfg.prewarm = prewarm_mode::all;
        std::ostringstream os{};
        cli::print_config(cfg, os);

        auto out = os.str();
        CHECK(out.find("prewarm=all") != std::string::npos);
        CHECK(out.find("quiescence_window=500ms") != std::string::npos);
        CHECK(out.find("watch_patterns=*.cpp,*.cc") != std::string::npos);
        CHECK(out.find("config_file=<none>") != std::string::npos);
    }
}  // namespace ripple::test
