#include "ripple/ripple.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        ripple::startup_config cfg{};
        if (auto cli_result = ripple::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        ripple::logging::set_level(ripple::effective_log_level(cfg));
        return ripple::mcp::run_mcp_server(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
