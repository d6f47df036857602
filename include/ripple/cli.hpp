#pragma once

#include "config.hpp"

#include <filesystem>
#include <optional>
#include <ostream>

namespace ripple::cli {

    // nullopt to continue, otherwise the process exit code (0 for --version/--print-config, 2 for bad input)
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    // applies a JSON config file onto `cfg`; throws error(invalid_argument)
    void load_config_file(const std::filesystem::path& path, startup_config& cfg);

    void print_config(const startup_config& cfg, std::ostream& os);

}  // namespace ripple::cli
