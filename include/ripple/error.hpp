#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ripple {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        not_found,
        invalid_state,
        graph_unavailable,
        graph_cycle,
        partial_mapping,
        watch_setup,
        cancelled,
        invalid_argument,
        workspace_load,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::not_found:
                return "not_found"sv;
            case error_kind::invalid_state:
                return "invalid_state"sv;
            case error_kind::graph_unavailable:
                return "graph_unavailable"sv;
            case error_kind::graph_cycle:
                return "graph_cycle"sv;
            case error_kind::partial_mapping:
                return "partial_mapping"sv;
            case error_kind::watch_setup:
                return "watch_setup"sv;
            case error_kind::cancelled:
                return "cancelled"sv;
            case error_kind::invalid_argument:
                return "invalid_argument"sv;
            case error_kind::workspace_load:
                return "workspace_load"sv;
        }
        return "internal"sv;
    }

    // graph_cycle is an invariant violation, everything else is an ordinary failure reported to the caller
    inline constexpr bool is_internal(error_kind kind) {
        return kind == error_kind::graph_cycle;
    }

    class error : public std::runtime_error {
      public:
        error(error_kind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

        error_kind kind() const noexcept { return kind_; }

      private:
        error_kind kind_;
    };

}  // namespace ripple
