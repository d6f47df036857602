#pragma once

#include "utils.hpp"
#include "workspace.hpp"

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ripple::graph {

    struct unit_info {
        std::string id{};
        std::string name{};
        std::string language{};
        size_t document_count{};
        size_t reference_count{};
    };

    struct graph_stats {
        size_t total_units{};
        size_t edge_count{};
        size_t leaf_units{};
        size_t root_units{};
        size_t max_depth{};
        sys_time created_at{};
    };

    // `from` depends on `to`
    using dependency_edge = std::pair<std::string, std::string>;

    /*
     * Immutable compilation-unit dependency graph.
     *
     * forward_[i] holds the units unit i depends on, reverse_[i] the units depending on unit i;
     * both are sorted by enumeration index, deduplicated and free of self references.
     * A graph is never modified after construction; a workspace change produces a new one.
     */
    class dependency_graph {
      public:
        // references to unknown ids and self references are dropped (and logged)
        dependency_graph(
                std::vector<unit_info> units,
                const std::vector<dependency_edge>& edges,
                sys_time created_at = system_now());

        static std::shared_ptr<const dependency_graph> build(
                const workspace::workspace_snapshot& snapshot, sys_time created_at = system_now());

        size_t size() const { return units_.size(); }
        size_t edge_count() const { return edge_count_; }
        sys_time created_at() const { return created_at_; }

        const std::vector<unit_info>& units() const { return units_; }
        const unit_info* find(std::string_view id) const;
        bool contains(std::string_view id) const { return find(id) != nullptr; }

        // throw error(not_found) for ids outside the graph
        std::vector<std::string> direct_dependencies(std::string_view id) const;
        std::vector<std::string> direct_dependents(std::string_view id) const;

        // `changed` plus every transitive dependent, in enumeration order. Unknown ids are skipped and
        // reported through `skipped` when given.
        std::vector<std::string> affected_units(
                std::span<const std::string> changed, std::vector<std::string>* skipped = nullptr) const;

        // no outgoing / no incoming edges
        std::vector<std::string> leaf_units() const;
        std::vector<std::string> root_units() const;

        // dependencies first, ties broken by enumeration order; throws error(graph_cycle)
        std::vector<std::string> compilation_order() const;

        // units on the longest dependency chain; throws error(graph_cycle)
        size_t max_depth() const;

        graph_stats stats() const;

      private:
        std::vector<size_t> topological_indices() const;
        std::vector<std::string> ids_of(const std::vector<size_t>& indices) const;
        size_t index_of(std::string_view id) const;

        std::vector<unit_info> units_;
        std::unordered_map<std::string, size_t> index_;
        std::vector<std::vector<size_t>> forward_;
        std::vector<std::vector<size_t>> reverse_;
        size_t edge_count_{};
        sys_time created_at_{};
    };

    using graph_ptr = std::shared_ptr<const dependency_graph>;

    /*
     * Per-session graph slots. Readers copy the slot's pointer under a shared lock and keep the graph
     * alive for as long as they use it; a rebuild constructs the replacement outside the lock and swaps
     * the pointer, so a reader sees either the old graph or the new one, never a mix.
     */
    class dependency_graph_service {
      public:
        // builds a fresh graph and replaces whatever the session had
        graph_ptr rebuild(const std::string& session_id, const workspace::workspace_snapshot& snapshot);

        // returns the session's graph, building it on first request
        graph_ptr get_or_build(const std::string& session_id, const workspace::workspace_snapshot& snapshot);

        // nullptr when no graph was built
        graph_ptr find(const std::string& session_id) const;

        // throws error(graph_unavailable)
        graph_ptr require(const std::string& session_id) const;

        void drop(const std::string& session_id);

        size_t size() const;

      private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, graph_ptr> graphs_;
    };

}  // namespace ripple::graph
