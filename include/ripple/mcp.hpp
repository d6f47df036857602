#pragma once

#include "config.hpp"
#include "orchestrator.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ripple::mcp {

    inline constexpr std::string_view protocol_version{"2024-11-05"};

    /*
     * JSON-RPC 2.0 dispatcher for the MCP tool surface.
     *
     * `handle` takes one request line and returns the response line, or nullopt for notifications.
     * Protocol faults become JSON-RPC errors. Operation failures come back as a tool result with
     * `isError` set and a body of the form
     *
     *      {"success": false, "error": "session not found: 3f2a...", "kind": "not_found"}
     */
    class server {
      public:
        explicit server(orchestrator& orch);

        std::optional<std::string> handle(const std::string& line);

      private:
        orchestrator& orch_;
    };

    // serves stdin/stdout until EOF
    int run_mcp_server(const startup_config& cfg);

}  // namespace ripple::mcp
