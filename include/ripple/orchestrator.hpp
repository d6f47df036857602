#pragma once

#include "cache.hpp"
#include "config.hpp"
#include "graph.hpp"
#include "session.hpp"
#include "utils.hpp"
#include "watch.hpp"
#include "workspace.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace ripple {

    using namespace std::string_view_literals;

    enum class resume_mode : uint8_t { incremental, full_rebuild };

    inline constexpr std::string_view to_string(resume_mode mode) {
        switch (mode) {
            case resume_mode::incremental:
                return "incremental"sv;
            case resume_mode::full_rebuild:
                return "full_rebuild"sv;
        }
        return "incremental"sv;
    }

    enum class impact_level : uint8_t { low, medium, high };

    inline constexpr std::string_view to_string(impact_level level) {
        switch (level) {
            case impact_level::low:
                return "low"sv;
            case impact_level::medium:
                return "medium"sv;
            case impact_level::high:
                return "high"sv;
        }
        return "low"sv;
    }

    // by changed-file count: low <= 5 < medium <= 20 < high
    inline constexpr impact_level classify_impact(size_t changed_files) {
        if (changed_files <= 5U) {
            return impact_level::low;
        }
        if (changed_files <= 20U) {
            return impact_level::medium;
        }
        return impact_level::high;
    }

    struct start_result {
        session::session_record record{};
        size_t unit_count{};
        size_t prewarmed{};
    };

    struct session_summary {
        session::session_record record{};
        bool graph_available{};
        size_t cached_entries{};
    };

    struct pause_result {
        std::string session_id{};
        bool watching_files{};
        sys_time paused_at{};
        std::vector<std::string> warnings{};
    };

    struct resume_result {
        std::string session_id{};
        resume_mode mode{resume_mode::incremental};
        std::vector<std::filesystem::path> changed_files{};
        std::vector<std::string> affected_units{};
        size_t invalidated{};
        std::chrono::milliseconds paused_for{};
        std::vector<std::string> warnings{};
    };

    struct preview_result {
        std::string session_id{};
        sys_time paused_at{};
        std::chrono::milliseconds paused_for{};
        std::vector<std::filesystem::path> changed_files{};
        std::vector<std::string> affected_units{};
        impact_level impact{impact_level::low};
        std::vector<std::string> warnings{};
    };

    struct graph_report {
        graph::graph_stats stats{};
        std::vector<std::string> leaf_units{};
        std::vector<std::string> root_units{};
        std::vector<graph::unit_info> units{};
    };

    struct impact_report {
        graph::unit_info target{};
        std::vector<graph::unit_info> affected{};
    };

    struct unit_report {
        graph::unit_info unit{};
        std::vector<std::string> dependencies{};
        std::vector<std::string> dependents{};
    };

    /*
     * Composes the registry, graph service, artifact cache and change tracker into the session
     * operations.
     *
     * Every session-scoped operation holds that session's operation guard for its whole duration,
     * validates first and applies the state transition as its last step, so a failure leaves the
     * session exactly as it was. Failures are reported as `ripple::error`.
     */
    class orchestrator {
      public:
        orchestrator(
                startup_config cfg,
                const workspace::workspace_loader& loader,
                watch::watch_backend& backend,
                clock_fn clock = system_now);

        orchestrator(const orchestrator&) = delete;
        orchestrator& operator=(const orchestrator&) = delete;

        start_result start_session(const std::filesystem::path& path);
        session::session_record end_session(const std::string& session_id);
        std::vector<session_summary> list_sessions() const;
        session_summary session_status(const std::string& session_id);

        // reload, rebuild and swap the graph, drop every cached artifact, prewarm; rejected while paused
        start_result refresh_session(const std::string& session_id);

        // a watch that fails to start is reported as a warning; `stop` aborts watch setup with
        // error(cancelled) before anything changes
        pause_result pause(const std::string& session_id, bool watch_files, std::stop_token stop = {});

        resume_result resume(const std::string& session_id, bool force_full_rebuild);

        // what `resume(session_id, false)` would find, without touching tracker, cache or session
        preview_result preview_pause_changes(const std::string& session_id);

        graph_report dependency_graph(const std::string& session_id);
        impact_report impact_analysis(const std::string& session_id, const std::string& unit_id);
        std::vector<graph::unit_info> compilation_order(const std::string& session_id);
        unit_report unit_details(const std::string& session_id, const std::string& unit_id);

        // cached artifact for the unit, compiled on a miss
        cache::artifact_ptr artifact(const std::string& session_id, const std::string& unit_id);

        cache::cache_stats cache_stats() const;
        size_t clear_cache();

        // disposes unpaused sessions idle for longer than `max_idle`; returns their ids
        std::vector<std::string> reap_idle_sessions(std::chrono::seconds max_idle);

        const startup_config& config() const { return cfg_; }
        session::session_registry& registry() { return registry_; }
        graph::dependency_graph_service& graphs() { return graphs_; }
        cache::artifact_cache& artifacts() { return cache_; }
        watch::change_tracker& tracker() { return tracker_; }

      private:
        struct change_set {
            std::vector<std::filesystem::path> files{};
            std::vector<std::string> owners{};
            std::vector<std::string> affected{};
            std::vector<std::string> warnings{};
        };

        change_set collect_changes(
                const session::session_record& record, const graph::dependency_graph* graph, bool consume);

        size_t prewarm(
                const std::string& session_id,
                const workspace::workspace_snapshot& snapshot,
                const graph::graph_ptr& graph);

        session::session_record dispose(const std::string& session_id);

        graph::graph_ptr graph_for(const std::string& session_id);

        std::chrono::milliseconds elapsed_since(sys_time tp) const;

        startup_config cfg_;
        const workspace::workspace_loader& loader_;
        clock_fn clock_;
        session::session_registry registry_;
        graph::dependency_graph_service graphs_;
        cache::artifact_cache cache_;
        cache::unit_compiler compiler_;
        watch::change_tracker tracker_;
    };

}  // namespace ripple
