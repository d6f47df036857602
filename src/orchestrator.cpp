#include "ripple/orchestrator.hpp"

#include "ripple/error.hpp"
#include "ripple/format.hpp"
#include "ripple/log.hpp"

#include <algorithm>
#include <set>
#include <span>

namespace ripple {

    using namespace ripple::literals;

    namespace {
        using steady = std::chrono::steady_clock;

        long long millis_since(steady::time_point start) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(steady::now() - start).count();
        }

        std::vector<graph::unit_info> infos_of(const graph::dependency_graph& g, const std::vector<std::string>& ids) {
            std::vector<graph::unit_info> out{};
            out.reserve(ids.size());
            for (const auto& id : ids) {
                if (const auto* info = g.find(id)) {
                    out.push_back(*info);
                }
            }
            return out;
        }
    }  // namespace

    orchestrator::orchestrator(
            startup_config cfg,
            const workspace::workspace_loader& loader,
            watch::watch_backend& backend,
            clock_fn clock)
        : cfg_{std::move(cfg)},
          loader_{loader},
          clock_{std::move(clock)},
          registry_{clock_},
          compiler_{clock_},
          tracker_{backend, cfg_.quiescence_window, clock_} {}

    std::chrono::milliseconds orchestrator::elapsed_since(sys_time tp) const {
        return std::max(
                std::chrono::milliseconds{0}, std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - tp));
    }

    size_t orchestrator::prewarm(
            const std::string& session_id,
            const workspace::workspace_snapshot& snapshot,
            const graph::graph_ptr& graph) {
        if (cfg_.prewarm == prewarm_mode::none || !graph) {
            return 0;
        }
        auto units = cfg_.prewarm == prewarm_mode::all ? graph->compilation_order() : graph->leaf_units();

        size_t compiled{};
        for (const auto& unit_id : units) {
            const auto* unit = snapshot.find(unit_id);
            if (unit == nullptr) {
                continue;
            }
            cache_.get_or_compile(session_id, unit_id, [&] { return compiler_.compile(*unit); });
            ++compiled;
        }
        log_info("prewarmed ", compiled, " units (", to_string(cfg_.prewarm), ") for session ", session_id);
        return compiled;
    }

    start_result orchestrator::start_session(const std::filesystem::path& path) {
        auto started = steady::now();
        auto snapshot = loader_.load(path);
        auto record = registry_.create(workspace::normalize_path(path), snapshot);

        size_t prewarmed{};
        try {
            graph::graph_ptr g{};
            if (cfg_.prewarm != prewarm_mode::none) {
                g = graphs_.rebuild(record.id, *snapshot);
            }
            prewarmed = prewarm(record.id, *snapshot, g);
        } catch (...) {
            graphs_.drop(record.id);
            cache_.invalidate_all(record.id);
            registry_.dispose(record.id);
            throw;
        }

        record = registry_.activate(record.id);
        log_info(
                "started session ",
                record.id,
                " with ",
                snapshot->units().size(),
                " units in ",
                millis_since(started),
                "ms");
        return start_result{.record = record, .unit_count = snapshot->units().size(), .prewarmed = prewarmed};
    }

    session::session_record orchestrator::dispose(const std::string& session_id) {
        tracker_.stop_watching(session_id);
        graphs_.drop(session_id);
        cache_.invalidate_all(session_id);
        return registry_.dispose(session_id);
    }

    session::session_record orchestrator::end_session(const std::string& session_id) {
        auto guard = registry_.acquire(session_id);
        return dispose(session_id);
    }

    std::vector<session_summary> orchestrator::list_sessions() const {
        std::vector<session_summary> out{};
        for (auto& record : registry_.list()) {
            auto id = record.id;
            out.push_back(session_summary{
                    .record = std::move(record),
                    .graph_available = graphs_.find(id) != nullptr,
                    .cached_entries = cache_.size(id)});
        }
        return out;
    }

    session_summary orchestrator::session_status(const std::string& session_id) {
        registry_.touch(session_id);
        return session_summary{
                .record = registry_.get(session_id),
                .graph_available = graphs_.find(session_id) != nullptr,
                .cached_entries = cache_.size(session_id)};
    }

    start_result orchestrator::refresh_session(const std::string& session_id) {
        auto started = steady::now();
        auto guard = registry_.acquire(session_id);
        auto record = registry_.get(session_id);
        if (record.is_paused()) {
            throw error{
                    error_kind::invalid_state, "session {} is paused; resume it before refreshing"_format(session_id)};
        }

        auto snapshot = loader_.load(record.workspace_path);
        auto g = graphs_.rebuild(session_id, *snapshot);
        cache_.invalidate_all(session_id);
        registry_.replace_snapshot(session_id, snapshot);
        auto prewarmed = prewarm(session_id, *snapshot, g);

        log_info("refreshed session ", session_id, " in ", millis_since(started), "ms");
        return start_result{
                .record = registry_.get(session_id), .unit_count = snapshot->units().size(), .prewarmed = prewarmed};
    }

    pause_result orchestrator::pause(const std::string& session_id, bool watch_files, std::stop_token stop) {
        auto started = steady::now();
        auto guard = registry_.acquire(session_id);
        auto record = registry_.get(session_id);
        log_info("pausing session ", session_id, " (watch files: ", watch_files ? "yes" : "no", ")");

        if (record.is_paused()) {
            throw error{
                    error_kind::invalid_state,
                    "session {} is already paused (since {})"_format(session_id, format_timestamp(*record.paused_at))};
        }
        if (record.state != session::session_state::active) {
            throw error{
                    error_kind::invalid_state,
                    "session {} cannot be paused from state {}"_format(session_id, to_string(record.state))};
        }

        auto paused_at = clock_();
        pause_result result{.session_id = session_id};

        if (watch_files) {
            try {
                tracker_.start_watching(session_id, record.snapshot->root(), cfg_.watch_patterns, stop);
                result.watching_files = true;
            } catch (const error& e) {
                if (e.kind() != error_kind::watch_setup) {
                    throw;
                }
                log_warn("pausing session ", session_id, " without file watching: ", e.what());
                result.warnings.push_back("{}: {}"_format(to_string(e.kind()), e.what()));
            }
        }

        try {
            record = registry_.pause(session_id, paused_at, result.watching_files);
        } catch (...) {
            tracker_.stop_watching(session_id);
            throw;
        }

        result.paused_at = *record.paused_at;
        log_info(
                "paused session ",
                session_id,
                ", watching files: ",
                result.watching_files ? "yes" : "no",
                " in ",
                millis_since(started),
                "ms");
        return result;
    }

    orchestrator::change_set orchestrator::collect_changes(
            const session::session_record& record, const graph::dependency_graph* graph, bool consume) {
        change_set out{};
        auto since = record.paused_at.value_or(record.created_at);

        std::set<std::filesystem::path> files{};
        for (auto& path : tracker_.changes_since(record.id, since)) {
            files.insert(std::move(path));
        }
        if (consume) {
            if (auto channel = tracker_.channel(record.id)) {
                for (const auto& notification : channel->drain()) {
                    auto changes = watch::normalize(notification);
                    log_debug("session ", record.id, ": consumed notification of ", changes.size(), " changes");
                    for (auto& change : changes) {
                        if (change.timestamp >= since) {
                            files.insert(std::move(change.path));
                        }
                    }
                }
            }
        }
        out.files.assign(files.begin(), files.end());

        std::vector<std::string> unmapped{};
        for (const auto& file : out.files) {
            auto owners = record.snapshot->units_containing(file);
            if (owners.empty()) {
                log_debug("changed file ", file.string(), " belongs to no unit");
                unmapped.push_back(file.string());
                continue;
            }
            out.owners.insert(out.owners.end(), owners.begin(), owners.end());
        }
        utils::sort_unique(out.owners);

        if (!unmapped.empty()) {
            log_warn(unmapped.size(), " changed files in session ", record.id, " map to no unit; skipped");
            out.warnings.push_back("{}: {} changed files belong to no unit: {}"_format(
                    to_string(error_kind::partial_mapping),
                    unmapped.size(),
                    utils::join_with_separator(utils::take_front(unmapped, cfg_.result_list_limit), ", ")));
        }

        if (graph != nullptr) {
            out.affected = graph->affected_units(out.owners);
        }
        for (const auto& owner : out.owners) {
            if (std::ranges::find(out.affected, owner) == out.affected.end()) {
                out.affected.push_back(owner);
            }
        }
        return out;
    }

    resume_result orchestrator::resume(const std::string& session_id, bool force_full_rebuild) {
        auto started = steady::now();
        auto guard = registry_.acquire(session_id);
        auto record = registry_.get(session_id);
        log_info("resuming session ", session_id, " (force full rebuild: ", force_full_rebuild ? "yes" : "no", ")");

        if (!record.is_paused()) {
            throw error{
                    error_kind::invalid_state,
                    "session {} is not paused ({})"_format(session_id, to_string(record.state))};
        }

        auto g = force_full_rebuild ? graphs_.find(session_id) : graphs_.require(session_id);
        auto changes = collect_changes(record, g.get(), true);

        resume_result result{
                .session_id = session_id,
                .mode = force_full_rebuild ? resume_mode::full_rebuild : resume_mode::incremental,
                .changed_files = std::move(changes.files),
                .paused_for = elapsed_since(*record.paused_at),
                .warnings = std::move(changes.warnings)};

        if (force_full_rebuild) {
            for (const auto& unit : record.snapshot->units()) {
                result.affected_units.push_back(unit.id);
            }
            result.invalidated = cache_.invalidate_all(session_id);
        }
        else {
            result.affected_units = std::move(changes.affected);
            for (const auto& unit_id : result.affected_units) {
                if (cache_.invalidate_unit(session_id, unit_id)) {
                    ++result.invalidated;
                }
            }
        }

        tracker_.stop_watching(session_id);
        registry_.resume(session_id);

        log_info(
                "resumed session ",
                session_id,
                ": ",
                result.changed_files.size(),
                " files changed, ",
                result.affected_units.size(),
                " units affected, ",
                result.invalidated,
                " artifacts invalidated, mode ",
                to_string(result.mode),
                " in ",
                millis_since(started),
                "ms");
        return result;
    }

    preview_result orchestrator::preview_pause_changes(const std::string& session_id) {
        auto guard = registry_.acquire(session_id);
        auto record = registry_.get(session_id);
        if (!record.is_paused()) {
            throw error{
                    error_kind::invalid_state,
                    "session {} is not paused ({})"_format(session_id, to_string(record.state))};
        }
        auto g = graphs_.get_or_build(session_id, *record.snapshot);
        registry_.touch(session_id);

        auto changes = collect_changes(record, g.get(), false);
        auto impact = classify_impact(changes.files.size());
        return preview_result{
                .session_id = session_id,
                .paused_at = *record.paused_at,
                .paused_for = elapsed_since(*record.paused_at),
                .changed_files = std::move(changes.files),
                .affected_units = std::move(changes.affected),
                .impact = impact,
                .warnings = std::move(changes.warnings)};
    }

    graph::graph_ptr orchestrator::graph_for(const std::string& session_id) {
        auto record = registry_.get(session_id);
        registry_.touch(session_id);
        return graphs_.get_or_build(session_id, *record.snapshot);
    }

    graph_report orchestrator::dependency_graph(const std::string& session_id) {
        auto guard = registry_.acquire(session_id);
        auto g = graph_for(session_id);
        return graph_report{
                .stats = g->stats(), .leaf_units = g->leaf_units(), .root_units = g->root_units(), .units = g->units()};
    }

    impact_report orchestrator::impact_analysis(const std::string& session_id, const std::string& unit_id) {
        auto guard = registry_.acquire(session_id);
        auto g = graph_for(session_id);
        const auto* target = g->find(unit_id);
        if (target == nullptr) {
            throw error{error_kind::not_found, "unit {} not found in session {}"_format(unit_id, session_id)};
        }
        auto affected = g->affected_units(std::span{&unit_id, 1});
        return impact_report{.target = *target, .affected = infos_of(*g, affected)};
    }

    std::vector<graph::unit_info> orchestrator::compilation_order(const std::string& session_id) {
        auto guard = registry_.acquire(session_id);
        auto g = graph_for(session_id);
        return infos_of(*g, g->compilation_order());
    }

    unit_report orchestrator::unit_details(const std::string& session_id, const std::string& unit_id) {
        auto guard = registry_.acquire(session_id);
        auto g = graph_for(session_id);
        const auto* unit = g->find(unit_id);
        if (unit == nullptr) {
            throw error{error_kind::not_found, "unit {} not found in session {}"_format(unit_id, session_id)};
        }
        return unit_report{
                .unit = *unit,
                .dependencies = g->direct_dependencies(unit_id),
                .dependents = g->direct_dependents(unit_id)};
    }

    cache::artifact_ptr orchestrator::artifact(const std::string& session_id, const std::string& unit_id) {
        auto guard = registry_.acquire(session_id);
        auto record = registry_.get(session_id);
        const auto* unit = record.snapshot->find(unit_id);
        if (unit == nullptr) {
            throw error{error_kind::not_found, "unit {} not found in session {}"_format(unit_id, session_id)};
        }
        registry_.touch(session_id);
        return cache_.get_or_compile(session_id, unit_id, [&] { return compiler_.compile(*unit); });
    }

    cache::cache_stats orchestrator::cache_stats() const {
        return cache_.stats();
    }

    size_t orchestrator::clear_cache() {
        return cache_.clear();
    }

    std::vector<std::string> orchestrator::reap_idle_sessions(std::chrono::seconds max_idle) {
        std::vector<std::string> reaped{};
        if (max_idle <= std::chrono::seconds{0}) {
            return reaped;
        }

        for (const auto& id : registry_.idle_sessions(max_idle)) {
            try {
                auto guard = registry_.acquire(id);
                auto record = registry_.get(id);
                if (record.is_paused() || record.last_accessed_at >= clock_() - max_idle) {
                    continue;
                }
                dispose(id);
                reaped.push_back(id);
            } catch (const error& e) {
                if (e.kind() != error_kind::not_found) {
                    throw;
                }
            }
        }

        if (!reaped.empty()) {
            log_info("reaped ", reaped.size(), " idle sessions");
        }
        return reaped;
    }

}  // namespace ripple
