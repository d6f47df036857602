#include "ripple/mcp.hpp"

#include "ripple/error.hpp"
#include "ripple/format.hpp"
#include "ripple/log.hpp"
#include "ripple/workspace.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <csignal>

#include <algorithm>
#include <array>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace ripple::literals;
using namespace std::string_view_literals;

namespace ripple::mcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct client_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::string protocolVersion{};
            client_info clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value =
                        glz::object("protocolVersion", &T::protocolVersion, "clientInfo", &T::clientInfo);
            };
        };

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct tools_capability {
            struct glaze {
                using T = tools_capability;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            tools_capability tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo);
            };
        };

        struct empty_result {
            struct glaze {
                using T = empty_result;
                static constexpr auto value = glz::object();
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            glz::raw_json arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        // ── Tool argument types ─────────────────────────────────────────

        struct start_args {
            std::string path{};
            struct glaze {
                using T = start_args;
                static constexpr auto value = glz::object(&T::path);
            };
        };

        struct session_args {
            std::string sessionId{};
            struct glaze {
                using T = session_args;
                static constexpr auto value = glz::object("sessionId", &T::sessionId);
            };
        };

        struct pause_args {
            std::string sessionId{};
            std::optional<bool> watchFiles{};
            struct glaze {
                using T = pause_args;
                static constexpr auto value = glz::object("sessionId", &T::sessionId, "watchFiles", &T::watchFiles);
            };
        };

        struct resume_args {
            std::string sessionId{};
            std::optional<bool> forceFullRebuild{};
            struct glaze {
                using T = resume_args;
                static constexpr auto value =
                        glz::object("sessionId", &T::sessionId, "forceFullRebuild", &T::forceFullRebuild);
            };
        };

        struct unit_args {
            std::string sessionId{};
            std::string unitId{};
            struct glaze {
                using T = unit_args;
                static constexpr auto value = glz::object("sessionId", &T::sessionId, "unitId", &T::unitId);
            };
        };

        // ── Tool result types ───────────────────────────────────────────

        struct failure_body {
            bool success{false};
            std::string error{};
            std::string kind{};
            struct glaze {
                using T = failure_body;
                static constexpr auto value = glz::object(&T::success, &T::error, &T::kind);
            };
        };

        struct session_row {
            std::string id{};
            std::string workspace{};
            std::string createdAt{};
            std::string lastAccessedAt{};
            size_t unitCount{};
            std::string state{};
            bool isPaused{};
            std::optional<std::string> pausedAt{};
            bool watchingFiles{};
            struct glaze {
                using T = session_row;
                static constexpr auto value = glz::object(
                        &T::id,
                        &T::workspace,
                        "createdAt",
                        &T::createdAt,
                        "lastAccessedAt",
                        &T::lastAccessedAt,
                        "unitCount",
                        &T::unitCount,
                        &T::state,
                        "isPaused",
                        &T::isPaused,
                        "pausedAt",
                        &T::pausedAt,
                        "watchingFiles",
                        &T::watchingFiles);
            };
        };

        struct unit_row {
            std::string id{};
            std::string name{};
            std::string language{};
            size_t documentCount{};
            size_t referenceCount{};
            struct glaze {
                using T = unit_row;
                static constexpr auto value = glz::object(
                        &T::id,
                        &T::name,
                        &T::language,
                        "documentCount",
                        &T::documentCount,
                        "referenceCount",
                        &T::referenceCount);
            };
        };

        struct start_body {
            bool success{true};
            std::string sessionId{};
            size_t unitCount{};
            size_t prewarmed{};
            struct glaze {
                using T = start_body;
                static constexpr auto value = glz::object(
                        &T::success, "sessionId", &T::sessionId, "unitCount", &T::unitCount, &T::prewarmed);
            };
        };

        struct end_body {
            bool success{true};
            std::string sessionId{};
            std::string message{};
            struct glaze {
                using T = end_body;
                static constexpr auto value = glz::object(&T::success, "sessionId", &T::sessionId, &T::message);
            };
        };

        struct list_body {
            bool success{true};
            size_t count{};
            std::vector<session_row> sessions{};
            struct glaze {
                using T = list_body;
                static constexpr auto value = glz::object(&T::success, &T::count, &T::sessions);
            };
        };

        struct status_body {
            bool success{true};
            session_row session{};
            bool graphAvailable{};
            size_t cachedEntries{};
            struct glaze {
                using T = status_body;
                static constexpr auto value = glz::object(
                        &T::success,
                        &T::session,
                        "graphAvailable",
                        &T::graphAvailable,
                        "cachedEntries",
                        &T::cachedEntries);
            };
        };

        struct pause_body {
            bool success{true};
            std::string sessionId{};
            std::string message{"Session paused successfully"};
            bool watchingFiles{};
            std::string pausedAt{};
            std::string instruction{
                    "External changes will be tracked. Use resume_session to rebuild only affected units."};
            std::vector<std::string> warnings{};
            struct glaze {
                using T = pause_body;
                static constexpr auto value = glz::object(
                        &T::success,
                        "sessionId",
                        &T::sessionId,
                        &T::message,
                        "watchingFiles",
                        &T::watchingFiles,
                        "pausedAt",
                        &T::pausedAt,
                        &T::instruction,
                        &T::warnings);
            };
        };

        struct rebuild_stats {
            bool fullRebuild{};
            bool incrementalChanges{};
            bool noChangesDetected{};
            struct glaze {
                using T = rebuild_stats;
                static constexpr auto value = glz::object(
                        "fullRebuild",
                        &T::fullRebuild,
                        "incrementalChanges",
                        &T::incrementalChanges,
                        "noChangesDetected",
                        &T::noChangesDetected);
            };
        };

        struct resume_body {
            bool success{true};
            std::string sessionId{};
            std::string message{"Session resumed successfully"};
            std::string resumeType{};
            size_t changedFiles{};
            size_t affectedProjects{};
            std::vector<std::string> fileList{};
            std::vector<std::string> projectList{};
            size_t invalidatedEntries{};
            int64_t pausedDurationMs{};
            rebuild_stats rebuildStats{};
            std::vector<std::string> warnings{};
            struct glaze {
                using T = resume_body;
                static constexpr auto value = glz::object(
                        &T::success,
                        "sessionId",
                        &T::sessionId,
                        &T::message,
                        "resumeType",
                        &T::resumeType,
                        "changedFiles",
                        &T::changedFiles,
                        "affectedProjects",
                        &T::affectedProjects,
                        "fileList",
                        &T::fileList,
                        "projectList",
                        &T::projectList,
                        "invalidatedEntries",
                        &T::invalidatedEntries,
                        "pausedDurationMs",
                        &T::pausedDurationMs,
                        "rebuildStats",
                        &T::rebuildStats,
                        &T::warnings);
            };
        };

        struct changed_files_summary {
            size_t count{};
            std::vector<std::string> files{};
            struct glaze {
                using T = changed_files_summary;
                static constexpr auto value = glz::object(&T::count, &T::files);
            };
        };

        struct affected_units_summary {
            size_t count{};
            std::vector<std::string> projects{};
            struct glaze {
                using T = affected_units_summary;
                static constexpr auto value = glz::object(&T::count, &T::projects);
            };
        };

        struct impact_flags {
            bool low{};
            bool medium{};
            bool high{};
            struct glaze {
                using T = impact_flags;
                static constexpr auto value = glz::object(&T::low, &T::medium, &T::high);
            };
        };

        struct preview_body {
            bool success{true};
            std::string sessionId{};
            bool isPaused{true};
            std::string pausedAt{};
            double pausedDurationMinutes{};
            changed_files_summary changedFiles{};
            affected_units_summary affectedProjects{};
            impact_flags impact{};
            std::string impactLevel{};
            std::vector<std::string> warnings{};
            struct glaze {
                using T = preview_body;
                static constexpr auto value = glz::object(
                        &T::success,
                        "sessionId",
                        &T::sessionId,
                        "isPaused",
                        &T::isPaused,
                        "pausedAt",
                        &T::pausedAt,
                        "pausedDurationMinutes",
                        &T::pausedDurationMinutes,
                        "changedFiles",
                        &T::changedFiles,
                        "affectedProjects",
                        &T::affectedProjects,
                        &T::impact,
                        "impactLevel",
                        &T::impactLevel,
                        &T::warnings);
            };
        };

        struct graph_stats_row {
            size_t totalUnits{};
            size_t edgeCount{};
            size_t leafUnits{};
            size_t rootUnits{};
            size_t maxDepth{};
            std::string createdAt{};
            struct glaze {
                using T = graph_stats_row;
                static constexpr auto value = glz::object(
                        "totalUnits",
                        &T::totalUnits,
                        "edgeCount",
                        &T::edgeCount,
                        "leafUnits",
                        &T::leafUnits,
                        "rootUnits",
                        &T::rootUnits,
                        "maxDepth",
                        &T::maxDepth,
                        "createdAt",
                        &T::createdAt);
            };
        };

        struct graph_body {
            bool success{true};
            graph_stats_row stats{};
            std::vector<std::string> leafUnitIds{};
            std::vector<std::string> rootUnitIds{};
            std::vector<unit_row> unitInfo{};
            struct glaze {
                using T = graph_body;
                static constexpr auto value = glz::object(
                        &T::success,
                        &T::stats,
                        "leafUnitIds",
                        &T::leafUnitIds,
                        "rootUnitIds",
                        &T::rootUnitIds,
                        "unitInfo",
                        &T::unitInfo);
            };
        };

        struct impact_body {
            bool success{true};
            unit_row targetUnit{};
            size_t affectedUnitCount{};
            std::vector<unit_row> affectedUnits{};
            struct glaze {
                using T = impact_body;
                static constexpr auto value = glz::object(
                        &T::success,
                        "targetUnit",
                        &T::targetUnit,
                        "affectedUnitCount",
                        &T::affectedUnitCount,
                        "affectedUnits",
                        &T::affectedUnits);
            };
        };

        struct order_body {
            bool success{true};
            size_t count{};
            std::vector<std::string> compilationOrder{};
            std::vector<unit_row> units{};
            struct glaze {
                using T = order_body;
                static constexpr auto value = glz::object(
                        &T::success, &T::count, "compilationOrder", &T::compilationOrder, &T::units);
            };
        };

        struct unit_details_body {
            bool success{true};
            unit_row unit{};
            std::vector<std::string> directDependencies{};
            std::vector<std::string> directDependents{};
            struct glaze {
                using T = unit_details_body;
                static constexpr auto value = glz::object(
                        &T::success,
                        &T::unit,
                        "directDependencies",
                        &T::directDependencies,
                        "directDependents",
                        &T::directDependents);
            };
        };

        struct cache_stats_body {
            bool success{true};
            size_t entries{};
            size_t hits{};
            size_t misses{};
            double hitRate{};
            size_t sessions{};
            std::map<std::string, size_t> sessionBreakdown{};
            struct glaze {
                using T = cache_stats_body;
                static constexpr auto value = glz::object(
                        &T::success,
                        &T::entries,
                        &T::hits,
                        &T::misses,
                        "hitRate",
                        &T::hitRate,
                        &T::sessions,
                        "sessionBreakdown",
                        &T::sessionBreakdown);
            };
        };

        struct clear_cache_body {
            bool success{true};
            size_t cleared{};
            struct glaze {
                using T = clear_cache_body;
                static constexpr auto value = glz::object(&T::success, &T::cleared);
            };
        };

        // ── Tool schemas ────────────────────────────────────────────────

        static constexpr auto no_args_schema = R"json({"type": "object","properties": {}})json"sv;

        static constexpr auto session_schema =
                R"json({"type": "object","properties": {"sessionId": {"type": "string","description": "Session id returned by start_session"}},"required": ["sessionId"]})json"sv;

        static constexpr auto start_schema =
                R"json({"type": "object","properties": {"path": {"type": "string","description": "Workspace manifest (ripple.json) or the directory containing it"}},"required": ["path"]})json"sv;

        static constexpr auto pause_schema =
                R"json({"type": "object","properties": {"sessionId": {"type": "string"},"watchFiles": {"type": "boolean","description": "Track file changes while paused. Default true.","default": true}},"required": ["sessionId"]})json"sv;

        static constexpr auto resume_schema =
                R"json({"type": "object","properties": {"sessionId": {"type": "string"},"forceFullRebuild": {"type": "boolean","description": "Invalidate every cached artifact instead of only the affected units. Default false.","default": false}},"required": ["sessionId"]})json"sv;

        static constexpr auto unit_schema =
                R"json({"type": "object","properties": {"sessionId": {"type": "string"},"unitId": {"type": "string","description": "Compilation unit id"}},"required": ["sessionId", "unitId"]})json"sv;

        // ── Conversions ─────────────────────────────────────────────────

        struct bad_arguments : std::runtime_error {
            using std::runtime_error::runtime_error;
        };

        template <typename T>
        static T parse_arguments(const glz::raw_json& raw, std::string_view tool) {
            T args{};
            std::string_view text = raw.str.empty() ? "{}"sv : std::string_view{raw.str};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(args, text);
            if (ec) {
                throw bad_arguments{"Failed to parse {} arguments"_format(tool)};
            }
            return args;
        }

        static void require_field(const std::string& value, std::string_view field, std::string_view tool) {
            if (value.empty()) {
                throw bad_arguments{"{} requires {}"_format(tool, field)};
            }
        }

        template <typename T>
        static std::string to_json(const T& value) {
            std::string json{};
            (void)glz::write_json(value, json);
            return json;
        }

        static std::vector<std::string> path_strings(
                const std::vector<std::filesystem::path>& paths, size_t limit) {
            std::vector<std::string> out{};
            for (const auto& p : utils::take_front(paths, limit)) {
                out.push_back(p.string());
            }
            return out;
        }

        static unit_row to_row(const graph::unit_info& info) {
            return unit_row{
                    .id = info.id,
                    .name = info.name,
                    .language = info.language,
                    .documentCount = info.document_count,
                    .referenceCount = info.reference_count};
        }

        static std::vector<unit_row> to_rows(const std::vector<graph::unit_info>& infos) {
            std::vector<unit_row> out{};
            out.reserve(infos.size());
            std::ranges::transform(infos, std::back_inserter(out), [](const auto& info) { return to_row(info); });
            return out;
        }

        static session_row to_row(const session::session_record& rec) {
            return session_row{
                    .id = rec.id,
                    .workspace = rec.workspace_path.string(),
                    .createdAt = format_timestamp(rec.created_at),
                    .lastAccessedAt = format_timestamp(rec.last_accessed_at),
                    .unitCount = rec.snapshot ? rec.snapshot->units().size() : 0U,
                    .state = std::string{to_string(rec.state)},
                    .isPaused = rec.is_paused(),
                    .pausedAt = rec.paused_at ? std::optional{format_timestamp(*rec.paused_at)} : std::nullopt,
                    .watchingFiles = rec.watching_files};
        }

        // ── Tools ───────────────────────────────────────────────────────

        static std::string tool_start_session(orchestrator& orch, const glz::raw_json& raw) {
            auto args = parse_arguments<start_args>(raw, "start_session"sv);
            require_field(args.path, "path"sv, "start_session"sv);
            auto started = orch.start_session(args.path);
            return to_json(start_body{
                    .sessionId = started.record.id, .unitCount = started.unit_count, .prewarmed = started.prewarmed});
        }

        static std::string tool_end_session(orchestrator& orch, const glz::raw_json& raw) {
            auto args = parse_arguments<session_args>(raw, "end_session"sv);
            require_field(args.sessionId, "sessionId"sv, "end_session"sv);
            auto ended = orch.end_session(args.sessionId);
            return to_json(end_body{.sessionId = ended.id, .message = "Session ended"});
        }

        static std::string tool_list_sessions(orchestrator& orch, const glz::raw_json&) {
            list_body body{};
            for (const auto& summary : orch.list_sessions()) {
                body.sessions.push_back(to_row(summary.record));
            }
            body.count = body.sessions.size();
            return to_json(body);
        }

        static std::string tool_session_status(orchestrator& orch, const glz::raw_json& raw) {
            auto args = parse_arguments<session_args>(raw, "session_status"sv);
            require_field(args.sessionId, "sessionId"sv, "session_status"sv);
            auto summary = orch.session_status(args.sessionId);
            return to_json(status_body{
                    .session = to_row(summary.record),
                    .graphAvailable = summary.graph_available,
                    .cachedEntries = summary.cached_entries});
        }

        static std::string tool_refresh_session(orchestrator& orch, const glz::raw_json& raw) {
            auto args = parse_arguments<session_args>(raw, "refresh_session"sv);
            require_field(args.sessionId, "sessionId"sv, "refresh_session"sv);
            auto refreshed = orch.refresh_session(args.sessionId);
            return to_json(start_body{
                    .sessionId = refreshed.record.id,
                    .unitCount = refreshed.unit_count,
                    .prewarmed = refreshed.prewarmed});
        }

        static std::string tool_pause_session(orchestrator& orch, const glz::raw_json& raw) {
            auto args = parse_arguments<pause_args>(raw, "pause_session"sv);
            require_field(args.sessionId, "sessionId"sv, "pause_session"sv);
            auto paused = orch.pause(args.sessionId, args.watchFiles.value_or(true));
            pause_body body{};
            body.sessionId = paused.session_id;
            body.watchingFiles = paused.watching_files;
            body.pausedAt = format_timestamp(paused.paused_at);
            body.warnings = std::move(paused.warnings);
            return to_json(body);
        }

        static std::string tool_resume_session(orchestrator& orch, const glz::raw_json& raw) {
            auto args = parse_arguments<resume_args>(raw, "resume_session"sv);
            require_field(args.sessionId, "sessionId"sv, "resume_session"sv);
            auto resumed = orch.resume(args.sessionId, args.forceFullRebuild.value_or(false));

            auto limit = orch.config().result_list_limit;
            bool full = resumed.mode == resume_mode::full_rebuild;
            resume_body body{};
            body.sessionId = resumed.session_id;
            body.resumeType = std::string{to_string(resumed.mode)};
            body.changedFiles = resumed.changed_files.size();
            body.affectedProjects = resumed.affected_units.size();
            body.fileList = path_strings(resumed.changed_files, limit);
            body.projectList = utils::take_front(resumed.affected_units, limit);
            body.invalidatedEntries = resumed.invalidated;
            body.pausedDurationMs = resumed.paused_for.count();
            body.rebuildStats = rebuild_stats{
                    .fullRebuild = full,
                    .incrementalChanges = !full && !resumed.changed_files.empty(),
                    .noChangesDetected = !full && resumed.changed_files.empty()};
            body.warnings = std::move(resumed.warnings);
            return to_json(body);
        }

        static std::string tool_preview_pause_changes(orchestrator& orch, const glz::raw_json& raw) {
            auto args = parse_arguments<session_args>(raw, "preview_pause_changes"sv);
            require_field(args.sessionId, "sessionId"sv, "preview_pause_changes"sv);
            auto preview = orch.preview_pause_changes(args.sessionId);

            const auto& cfg = orch.config();
            preview_body body{};
            body.sessionId = preview.session_id;
            body.pausedAt = format_timestamp(preview.paused_at);
            body.pausedDurationMinutes = static_cast<double>(preview.paused_for.count()) / 60'000.0;
            body.changedFiles = changed_files_summary{
                    .count = preview.changed_files.size(),
                    .files = path_strings(preview.changed_files, cfg.preview_file_limit)};
            body.affectedProjects = affected_units_summary{
                    .count = preview.affected_units.size(),
                    .projects = utils::take_front(preview.affected_units, cfg.result_list_limit)};
            body.impact = impact_flags{
                    .low = preview.impact == impact_level::low,
                    .medium = preview.impact == impact_level::medium,
                    .high = preview.impact == impact_level::high};
            body.impactLevel = std::string{to_string(preview.impact)};
            body.warnings = std::move(preview.warnings);
            return to_json(body);
        }

        static std::string tool_dependency_graph(orchestrator& orch, const glz::raw_json& raw) {
            auto args = parse_arguments<session_args>(raw, "dependency_graph"sv);
            require_field(args.sessionId, "sessionId"sv, "dependency_graph"sv);
            auto report = orch.dependency_graph(args.sessionId);
            return to_json(graph_body{
                    .stats =
                            graph_stats_row{
                                    .totalUnits = report.stats.total_units,
                                    .edgeCount = report.stats.edge_count,
                                    .leafUnits = report.stats.leaf_units,
                                    .rootUnits = report.stats.root_units,
                                    .maxDepth = report.stats.max_depth,
                                    .createdAt = format_timestamp(report.stats.created_at)},
                    .leafUnitIds = std::move(report.leaf_units),
                    .rootUnitIds = std::move(report.root_units),
                    .unitInfo = to_rows(report.units)});
        }

        static std::string tool_impact_analysis(orchestrator& orch, const glz::raw_json& raw) {
            auto args = parse_arguments<unit_args>(raw, "impact_analysis"sv);
            require_field(args.sessionId, "sessionId"sv, "impact_analysis"sv);
            require_field(args.unitId, "unitId"sv, "impact_analysis"sv);
            auto report = orch.impact_analysis(args.sessionId, args.unitId);
            return to_json(impact_body{
                    .targetUnit = to_row(report.target),
                    .affectedUnitCount = report.affected.size(),
                    .affectedUnits = to_rows(report.affected)});
        }

        static std::string tool_compilation_order(orchestrator& orch, const glz::raw_json& raw) {
            auto args = parse_arguments<session_args>(raw, "compilation_order"sv);
            require_field(args.sessionId, "sessionId"sv, "compilation_order"sv);
            auto order = orch.compilation_order(args.sessionId);
            order_body body{};
            body.count = order.size();
            for (const auto& info : order) {
                body.compilationOrder.push_back(info.id);
            }
            body.units = to_rows(order);
            return to_json(body);
        }

        static std::string tool_unit_details(orchestrator& orch, const glz::raw_json& raw) {
            auto args = parse_arguments<unit_args>(raw, "unit_details"sv);
            require_field(args.sessionId, "sessionId"sv, "unit_details"sv);
            require_field(args.unitId, "unitId"sv, "unit_details"sv);
            auto report = orch.unit_details(args.sessionId, args.unitId);
            return to_json(unit_details_body{
                    .unit = to_row(report.unit),
                    .directDependencies = std::move(report.dependencies),
                    .directDependents = std::move(report.dependents)});
        }

        static std::string tool_cache_stats(orchestrator& orch, const glz::raw_json&) {
            auto stats = orch.cache_stats();
            auto lookups = stats.hits + stats.misses;
            return to_json(cache_stats_body{
                    .entries = stats.entries,
                    .hits = stats.hits,
                    .misses = stats.misses,
                    .hitRate = lookups == 0 ? 0.0 : static_cast<double>(stats.hits) / static_cast<double>(lookups),
                    .sessions = stats.sessions,
                    .sessionBreakdown = std::move(stats.session_breakdown)});
        }

        static std::string tool_clear_cache(orchestrator& orch, const glz::raw_json&) {
            return to_json(clear_cache_body{.cleared = orch.clear_cache()});
        }

        struct tool_entry {
            std::string_view name;
            std::string_view description;
            std::string_view schema;
            std::string (*run)(orchestrator&, const glz::raw_json&);
        };

        static constexpr std::array tools{
                tool_entry{
                        "start_session"sv,
                        "Load a workspace manifest and open an analysis session over it."sv,
                        start_schema,
                        tool_start_session},
                tool_entry{
                        "end_session"sv,
                        "Close a session, dropping its dependency graph and cached artifacts."sv,
                        session_schema,
                        tool_end_session},
                tool_entry{"list_sessions"sv, "List open sessions and their state."sv, no_args_schema, tool_list_sessions},
                tool_entry{
                        "session_status"sv,
                        "Report one session's state, graph availability and cached artifact count."sv,
                        session_schema,
                        tool_session_status},
                tool_entry{
                        "refresh_session"sv,
                        "Reload the workspace from disk, rebuild the dependency graph and drop every cached artifact of the session. Rejected while paused."sv,
                        session_schema,
                        tool_refresh_session},
                tool_entry{
                        "pause_session"sv,
                        "Pause a session so files can be edited externally. With watchFiles, changes under the workspace root are tracked until resume."sv,
                        pause_schema,
                        tool_pause_session},
                tool_entry{
                        "resume_session"sv,
                        "Resume a paused session, invalidating cached artifacts of the units affected by the tracked changes (or all of them with forceFullRebuild)."sv,
                        resume_schema,
                        tool_resume_session},
                tool_entry{
                        "preview_pause_changes"sv,
                        "Show what resuming a paused session would invalidate, without changing anything."sv,
                        session_schema,
                        tool_preview_pause_changes},
                tool_entry{
                        "dependency_graph"sv,
                        "Dependency graph statistics with leaf units, root units and per-unit details."sv,
                        session_schema,
                        tool_dependency_graph},
                tool_entry{
                        "impact_analysis"sv,
                        "Units affected by a change to the given unit: the unit itself and every transitive dependent."sv,
                        unit_schema,
                        tool_impact_analysis},
                tool_entry{
                        "compilation_order"sv,
                        "Units in dependency order; every unit follows the units it depends on."sv,
                        session_schema,
                        tool_compilation_order},
                tool_entry{
                        "unit_details"sv,
                        "Direct dependencies and direct dependents of one unit."sv,
                        unit_schema,
                        tool_unit_details},
                tool_entry{"cache_stats"sv, "Artifact cache entry, hit and miss counts."sv, no_args_schema, tool_cache_stats},
                tool_entry{"clear_cache"sv, "Drop every cached artifact of every session."sv, no_args_schema, tool_clear_cache},
        };

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static void send(const std::string& json) {
            std::cout << json << '\n';
            std::cout.flush();
        }

        static tool_call_result failure(std::string message, std::string_view kind) {
            tool_call_result result{};
            result.content.push_back(
                    text_content{.text = to_json(failure_body{.error = std::move(message), .kind = std::string{kind}})});
            result.isError = true;
            return result;
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            initialize_params params{};
            (void)glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);
            if (!params.clientInfo.name.empty()) {
                log_info("client: ", params.clientInfo.name, " ", params.clientInfo.version);
            }

            initialize_result result{};
            result.protocolVersion = std::string{protocol_version};
            result.capabilities = server_capabilities{};
            result.serverInfo = server_info{.name = "ripple", .version = std::string{version}};

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id) {
            tools_list_result result{};
            for (const auto& tool : tools) {
                result.tools.push_back(
                        tool_definition{
                                .name = std::string{tool.name},
                                .description = std::string{tool.description},
                                .inputSchema = glz::raw_json{std::string{tool.schema}},
                        });
            }
            return make_response(id, std::move(result));
        }

        static std::string handle_tools_call(
                const glz::rpc::id_t& id, glz::raw_json_view raw_params, orchestrator& orch) {
            tool_call_params params{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params");
            }

            auto tool = std::ranges::find(tools, std::string_view{params.name}, &tool_entry::name);
            if (tool == tools.end()) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "Unknown tool: {}"_format(params.name));
            }

            tool_call_result result{};
            try {
                result.content.push_back(text_content{.text = tool->run(orch, params.arguments)});
            } catch (const bad_arguments& e) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, e.what());
            } catch (const error& e) {
                if (is_internal(e.kind())) {
                    log_error(params.name, " failed with internal error: ", e.what());
                }
                else {
                    log_info(params.name, " failed: ", e.what());
                }
                result = failure(e.what(), to_string(e.kind()));
            } catch (const std::exception& e) {
                log_error(params.name, " failed unexpectedly: ", e.what());
                result = failure(e.what(), "internal"sv);
            }
            return make_response(id, std::move(result));
        }

    }  // namespace detail

    server::server(orchestrator& orch) : orch_{orch} {}

    std::optional<std::string> server::handle(const std::string& line) {
        glz::rpc::generic_request_t request{};
        auto ec = glz::read_json(request, line);
        if (ec) {
            return detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error");
        }

        bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);

        if (request.method == "initialize"sv) {
            return detail::handle_initialize(request.id, request.params);
        }
        if (request.method == "notifications/initialized"sv) {
            // notification, no response
            return std::nullopt;
        }
        if (request.method == "ping"sv) {
            return detail::make_response(request.id, detail::empty_result{});
        }
        if (request.method == "tools/list"sv) {
            return detail::handle_tools_list(request.id);
        }
        if (request.method == "tools/call"sv) {
            return detail::handle_tools_call(request.id, request.params, orch_);
        }
        if (is_notification) {
            return std::nullopt;
        }
        return detail::make_error_response(
                request.id,
                glz::rpc::error_e::method_not_found,
                "Unknown method: {}"_format(std::string{request.method}));
    }

    // ── Server entry point ──────────────────────────────────────────

    int run_mcp_server(const startup_config& cfg) {
        ::signal(SIGPIPE, SIG_IGN);

        workspace::manifest_loader loader{cfg.watch_patterns};
        auto backend = watch::make_platform_backend();
        orchestrator orch{cfg, loader, *backend};
        server srv{orch};

        std::jthread reaper{};
        if (cfg.session_idle_timeout > std::chrono::seconds{0}) {
            reaper = std::jthread{[&orch, &cfg](std::stop_token stop) {
                std::mutex mutex{};
                std::condition_variable_any cv{};
                std::unique_lock lock{mutex};
                while (!cv.wait_for(lock, stop, cfg.reaper_interval, [] { return false; })) {
                    if (stop.stop_requested()) {
                        break;
                    }
                    try {
                        orch.reap_idle_sessions(cfg.session_idle_timeout);
                    } catch (const std::exception& e) {
                        log_error("idle session reaping failed: ", e.what());
                    }
                }
            }};
        }

        log_info("ripple ", version, " serving MCP on stdio");

        std::string line{};
        while (std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }
            if (auto reply = srv.handle(line)) {
                detail::send(*reply);
            }
        }

        reaper.request_stop();
        log_info("stdin closed, shutting down");
        return 0;
    }

}  // namespace ripple::mcp
