#include "ripple/graph.hpp"

#include "ripple/error.hpp"
#include "ripple/format.hpp"
#include "ripple/log.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <mutex>
#include <queue>

using namespace ripple::literals;

namespace ripple::graph {

    namespace detail {

        static void sort_unique(std::vector<size_t>& values) {
            std::ranges::sort(values);
            auto [first, last] = std::ranges::unique(values);
            values.erase(first, last);
        }

    }  // namespace detail

    dependency_graph::dependency_graph(
            std::vector<unit_info> units, const std::vector<dependency_edge>& edges, sys_time created_at)
            : units_{std::move(units)}, created_at_{created_at} {
        index_.reserve(units_.size());
        for (size_t i = 0; i < units_.size(); ++i) {
            if (!index_.emplace(units_[i].id, i).second) {
                throw error{error_kind::invalid_argument, "duplicate unit id in graph: {}"_format(units_[i].id)};
            }
        }

        forward_.resize(units_.size());
        reverse_.resize(units_.size());

        for (const auto& [from, to] : edges) {
            auto from_it = index_.find(from);
            auto to_it = index_.find(to);
            if (from_it == index_.end() || to_it == index_.end()) {
                log_debug("dropping reference ", from, " -> ", to, ": unit not in workspace");
                continue;
            }
            if (from_it->second == to_it->second) {
                log_warn("dropping self reference of unit ", from);
                continue;
            }
            forward_[from_it->second].push_back(to_it->second);
            reverse_[to_it->second].push_back(from_it->second);
        }

        for (size_t i = 0; i < units_.size(); ++i) {
            detail::sort_unique(forward_[i]);
            detail::sort_unique(reverse_[i]);
            edge_count_ += forward_[i].size();
        }
    }

    graph_ptr dependency_graph::build(const workspace::workspace_snapshot& snapshot, sys_time created_at) {
        std::vector<unit_info> units{};
        std::vector<dependency_edge> edges{};
        units.reserve(snapshot.units().size());

        for (const auto& unit : snapshot.units()) {
            units.push_back(
                    unit_info{
                            .id = unit.id,
                            .name = unit.name,
                            .language = unit.language,
                            .document_count = unit.documents.size(),
                            .reference_count = unit.references.size()});
            for (const auto& ref : unit.references) {
                edges.emplace_back(unit.id, ref);
            }
        }

        return std::make_shared<const dependency_graph>(std::move(units), edges, created_at);
    }

    const unit_info* dependency_graph::find(std::string_view id) const {
        if (auto it = index_.find(std::string{id}); it != index_.end()) {
            return &units_[it->second];
        }
        return nullptr;
    }

    size_t dependency_graph::index_of(std::string_view id) const {
        auto it = index_.find(std::string{id});
        if (it == index_.end()) {
            throw error{error_kind::not_found, "unit not found in dependency graph: {}"_format(id)};
        }
        return it->second;
    }

    std::vector<std::string> dependency_graph::ids_of(const std::vector<size_t>& indices) const {
        std::vector<std::string> ids{};
        ids.reserve(indices.size());
        for (auto index : indices) {
            ids.push_back(units_[index].id);
        }
        return ids;
    }

    std::vector<std::string> dependency_graph::direct_dependencies(std::string_view id) const {
        return ids_of(forward_[index_of(id)]);
    }

    std::vector<std::string> dependency_graph::direct_dependents(std::string_view id) const {
        return ids_of(reverse_[index_of(id)]);
    }

    std::vector<std::string> dependency_graph::affected_units(
            std::span<const std::string> changed, std::vector<std::string>* skipped) const {
        std::vector<bool> visited(units_.size(), false);
        std::deque<size_t> queue{};

        for (const auto& id : changed) {
            auto it = index_.find(id);
            if (it == index_.end()) {
                log_warn("impact query skips unit ", id, ": not in dependency graph");
                if (skipped != nullptr) {
                    skipped->push_back(id);
                }
                continue;
            }
            if (!visited[it->second]) {
                visited[it->second] = true;
                queue.push_back(it->second);
            }
        }

        while (!queue.empty()) {
            auto current = queue.front();
            queue.pop_front();
            for (auto dependent : reverse_[current]) {
                if (!visited[dependent]) {
                    visited[dependent] = true;
                    queue.push_back(dependent);
                }
            }
        }

        std::vector<std::string> affected{};
        for (size_t i = 0; i < units_.size(); ++i) {
            if (visited[i]) {
                affected.push_back(units_[i].id);
            }
        }
        return affected;
    }

    std::vector<std::string> dependency_graph::leaf_units() const {
        std::vector<std::string> leaves{};
        for (size_t i = 0; i < units_.size(); ++i) {
            if (forward_[i].empty()) {
                leaves.push_back(units_[i].id);
            }
        }
        return leaves;
    }

    std::vector<std::string> dependency_graph::root_units() const {
        std::vector<std::string> roots{};
        for (size_t i = 0; i < units_.size(); ++i) {
            if (reverse_[i].empty()) {
                roots.push_back(units_[i].id);
            }
        }
        return roots;
    }

    // Kahn's algorithm; the ready set is a min-heap on enumeration index
    std::vector<size_t> dependency_graph::topological_indices() const {
        std::vector<size_t> pending(units_.size());
        std::priority_queue<size_t, std::vector<size_t>, std::greater<>> ready{};

        for (size_t i = 0; i < units_.size(); ++i) {
            pending[i] = forward_[i].size();
            if (pending[i] == 0) {
                ready.push(i);
            }
        }

        std::vector<size_t> order{};
        order.reserve(units_.size());
        while (!ready.empty()) {
            auto current = ready.top();
            ready.pop();
            order.push_back(current);
            for (auto dependent : reverse_[current]) {
                if (--pending[dependent] == 0) {
                    ready.push(dependent);
                }
            }
        }

        if (order.size() != units_.size()) {
            std::vector<std::string> stuck{};
            for (size_t i = 0; i < units_.size(); ++i) {
                if (pending[i] != 0) {
                    stuck.push_back(units_[i].id);
                }
            }
            auto message = "dependency cycle among units: {}"_format(utils::join_with_separator(stuck, ", "));
            log_error("invariant violation: ", message);
            throw error{error_kind::graph_cycle, message};
        }
        return order;
    }

    std::vector<std::string> dependency_graph::compilation_order() const {
        return ids_of(topological_indices());
    }

    size_t dependency_graph::max_depth() const {
        std::vector<size_t> depth(units_.size(), 0);
        size_t deepest{};
        for (auto index : topological_indices()) {
            size_t below{};
            for (auto dependency : forward_[index]) {
                below = std::max(below, depth[dependency]);
            }
            depth[index] = below + 1;
            deepest = std::max(deepest, depth[index]);
        }
        return deepest;
    }

    graph_stats dependency_graph::stats() const {
        return graph_stats{
                .total_units = units_.size(),
                .edge_count = edge_count_,
                .leaf_units = leaf_units().size(),
                .root_units = root_units().size(),
                .max_depth = max_depth(),
                .created_at = created_at_};
    }

    graph_ptr dependency_graph_service::rebuild(
            const std::string& session_id, const workspace::workspace_snapshot& snapshot) {
        auto fresh = dependency_graph::build(snapshot);
        {
            std::unique_lock lock{mutex_};
            graphs_[session_id] = fresh;
        }
        log_info(
                "built dependency graph for session ",
                session_id,
                ": ",
                fresh->size(),
                " units, ",
                fresh->edge_count(),
                " edges, ",
                fresh->leaf_units().size(),
                " leaf, ",
                fresh->root_units().size(),
                " root");
        return fresh;
    }

    graph_ptr dependency_graph_service::get_or_build(
            const std::string& session_id, const workspace::workspace_snapshot& snapshot) {
        if (auto existing = find(session_id)) {
            return existing;
        }

        auto fresh = dependency_graph::build(snapshot);
        std::unique_lock lock{mutex_};
        auto [it, inserted] = graphs_.try_emplace(session_id, fresh);
        if (inserted) {
            log_info("built dependency graph for session ", session_id, ": ", fresh->size(), " units");
        }
        return it->second;
    }

    graph_ptr dependency_graph_service::find(const std::string& session_id) const {
        std::shared_lock lock{mutex_};
        if (auto it = graphs_.find(session_id); it != graphs_.end()) {
            return it->second;
        }
        return nullptr;
    }

    graph_ptr dependency_graph_service::require(const std::string& session_id) const {
        auto found = find(session_id);
        if (!found) {
            throw error{
                    error_kind::graph_unavailable,
                    "no dependency graph has been built for session {}; refresh the session first"_format(
                            session_id)};
        }
        return found;
    }

    void dependency_graph_service::drop(const std::string& session_id) {
        std::unique_lock lock{mutex_};
        graphs_.erase(session_id);
    }

    size_t dependency_graph_service::size() const {
        std::shared_lock lock{mutex_};
        return graphs_.size();
    }

}  // namespace ripple::graph
