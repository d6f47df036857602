#include "utils.hpp"

namespace ripple::test {

    namespace detail {
        struct text_item {
            std::string type{};
            std::string text{};
        };

        struct call_result {
            std::vector<text_item> content{};
            bool isError{false};
        };

        struct call_envelope {
            std::optional<call_result> result{};
        };

        struct tool_reply {
            std::string body{};
            bool is_error{};
        };

        struct failure_reply {
            bool success{true};
            std::string error{};
            std::string kind{};
        };

        struct start_reply {
            bool success{};
            std::string sessionId{};
            size_t unitCount{};
            size_t prewarmed{};
        };

        struct pause_reply {
            bool success{};
            bool watchingFiles{};
            std::string pausedAt{};
            std::vector<std::string> warnings{};
        };

        struct resume_reply {
            bool success{};
            std::string resumeType{};
            size_t changedFiles{};
            size_t affectedProjects{};
            std::vector<std::string> fileList{};
            std::vector<std::string> projectList{};
            size_t invalidatedEntries{};
            int64_t pausedDurationMs{};
        };

        struct count_reply {
            size_t count{};
        };

        struct preview_reply {
            bool isPaused{};
            count_reply changedFiles{};
            count_reply affectedProjects{};
            std::string impactLevel{};
        };

        template <typename T>
        T read_body(std::string_view body) {
            T out{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(out, body);
            INFO(body);
            REQUIRE_FALSE(ec);
            return out;
        }

        // in-process server over the chain workspace, with injected file events and clock
        struct server_fixture {
            chain_workspace ws{"ripple_010"};
            manual_clock clock{};
            memory_loader loader{};
            watch::manual_backend backend{};
            orchestrator orch{server_config(), loader, backend, clock.fn()};
            mcp::server srv{orch};
            int next_id{1};

            server_fixture() { loader.set(ws.manifest, ws.snapshot()); }

            static startup_config server_config() {
                startup_config cfg{};
                cfg.prewarm = prewarm_mode::all;
                cfg.quiescence_window = 50ms;
                return cfg;
            }

            std::string request(std::string_view method, std::string_view params = "{}") {
                auto line = R"({"jsonrpc":"2.0","id":)" + std::to_string(next_id++) + R"(,"method":")" +
                            std::string{method} + R"(","params":)" + std::string{params} + "}";
                auto reply = srv.handle(line);
                REQUIRE(reply.has_value());
                return *reply;
            }

            tool_reply call(std::string_view tool, std::string_view arguments = "{}") {
                auto raw = request(
                        "tools/call",
                        R"({"name":")" + std::string{tool} + R"(","arguments":)" + std::string{arguments} + "}");
                auto envelope = read_body<call_envelope>(raw);
                INFO(raw);
                REQUIRE(envelope.result.has_value());
                REQUIRE(envelope.result->content.size() == 1U);
                CHECK(envelope.result->content[0].type == "text");
                return tool_reply{envelope.result->content[0].text, envelope.result->isError};
            }

            std::string start() {
                auto reply = call("start_session", R"({"path":")" + ws.manifest.string() + R"("})");
                REQUIRE_FALSE(reply.is_error);
                return read_body<start_reply>(reply.body).sessionId;
            }

            static std::string session_args(const std::string& id, std::string_view extra = "") {
                return R"({"sessionId":")" + id + "\"" + std::string{extra} + "}";
            }
        };
    }  // namespace detail

    TEST_CASE("010: initialize reports protocol version and server info", "[010][mcp]") {
        detail::server_fixture f{};
        auto resp = f.request(
                "initialize",
                R"({"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"test","version":"0.1"}})");

        CHECK(resp.find("\"protocolVersion\":\"2024-11-05\"") != std::string::npos);
        CHECK(resp.find("\"name\":\"ripple\"") != std::string::npos);
        CHECK(resp.find("\"version\":\"0.1.0\"") != std::string::npos);
        CHECK(resp.find("\"capabilities\"") != std::string::npos);
    }

    TEST_CASE("010: notifications get no response", "[010][mcp]") {
        detail::server_fixture f{};
        CHECK_FALSE(f.srv.handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
        CHECK_FALSE(f.srv.handle(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{}})").has_value());
    }

    TEST_CASE("010: ping, unknown methods and bad json", "[010][mcp]") {
        detail::server_fixture f{};

        CHECK(f.request("ping").find("\"result\":{}") != std::string::npos);

        auto unknown = f.request("bogus/method");
        CHECK(unknown.find("\"error\"") != std::string::npos);
        CHECK(unknown.find("Unknown method") != std::string::npos);

        auto bad = f.srv.handle("this is not json");
        REQUIRE(bad.has_value());
        CHECK(bad->find("JSON parse error") != std::string::npos);
    }

    TEST_CASE("010: tools/list names every tool with a schema", "[010][mcp]") {
        detail::server_fixture f{};
        auto resp = f.request("tools/list");

        for (const auto* name :
             {"start_session",
              "end_session",
              "list_sessions",
              "session_status",
              "refresh_session",
              "pause_session",
              "resume_session",
              "preview_pause_changes",
              "dependency_graph",
              "impact_analysis",
              "compilation_order",
              "unit_details",
              "cache_stats",
              "clear_cache"}) {
            INFO(name);
            CHECK(resp.find("\"name\":\"" + std::string{name} + "\"") != std::string::npos);
        }
        CHECK(resp.find("\"inputSchema\":{\"type\": \"object\"") != std::string::npos);
    }

    TEST_CASE("010: protocol faults in tool calls are JSON-RPC errors", "[010][mcp]") {
        detail::server_fixture f{};

        auto unknown_tool = f.request("tools/call", R"({"name":"bogus_tool","arguments":{}})");
        CHECK(unknown_tool.find("\"error\"") != std::string::npos);
        CHECK(unknown_tool.find("Unknown tool: bogus_tool") != std::string::npos);

        auto missing = f.request("tools/call", R"({"name":"start_session","arguments":{}})");
        CHECK(missing.find("start_session requires path") != std::string::npos);

        auto malformed = f.request("tools/call", R"({"name":"session_status","arguments":{"sessionId":42}})");
        CHECK(malformed.find("Failed to parse session_status arguments") != std::string::npos);
    }

    TEST_CASE("010: operation failures come back as tool errors", "[010][mcp]") {
        detail::server_fixture f{};

        auto missing = f.call("session_status", R"({"sessionId":"nope"})");
        CHECK(missing.is_error);
        auto failure = detail::read_body<detail::failure_reply>(missing.body);
        CHECK_FALSE(failure.success);
        CHECK(failure.kind == "not_found");
        CHECK(failure.error.find("nope") != std::string::npos);

        auto id = f.start();
        auto not_paused = f.call("resume_session", detail::server_fixture::session_args(id));
        CHECK(not_paused.is_error);
        CHECK(detail::read_body<detail::failure_reply>(not_paused.body).kind == "invalid_state");

        auto no_workspace = f.call("start_session", R"({"path":"/no/such/place"})");
        CHECK(no_workspace.is_error);
        CHECK(detail::read_body<detail::failure_reply>(no_workspace.body).kind == "workspace_load");
    }

    TEST_CASE("010: pause, edit, preview and resume", "[010][mcp][flow]") {
        detail::server_fixture f{};
        auto id = f.start();
        auto args = detail::server_fixture::session_args(id);

        auto paused = f.call("pause_session", args);
        REQUIRE_FALSE(paused.is_error);
        auto pause_body = detail::read_body<detail::pause_reply>(paused.body);
        CHECK(pause_body.success);
        CHECK(pause_body.watchingFiles);
        CHECK(pause_body.pausedAt == "2026-01-01T00:00:00.000Z");

        auto again = f.call("pause_session", args);
        CHECK(again.is_error);
        CHECK(detail::read_body<detail::failure_reply>(again.body).error.find("2026-01-01T00:00:00.000Z") !=
              std::string::npos);

        f.clock.advance(2min);
        f.backend.emit(f.ws.file_b);

        auto preview = detail::read_body<detail::preview_reply>(f.call("preview_pause_changes", args).body);
        CHECK(preview.isPaused);
        CHECK(preview.changedFiles.count == 1U);
        CHECK(preview.affectedProjects.count == 2U);
        CHECK(preview.impactLevel == "low");

        auto resumed = f.call("resume_session", args);
        REQUIRE_FALSE(resumed.is_error);
        auto body = detail::read_body<detail::resume_reply>(resumed.body);
        CHECK(body.resumeType == "incremental");
        CHECK(body.changedFiles == 1U);
        CHECK(body.fileList == std::vector<std::string>{f.ws.file_b.string()});
        CHECK(body.affectedProjects == 2U);
        CHECK(body.projectList == std::vector<std::string>{"B", "C"});
        CHECK(body.invalidatedEntries == 2U);
        CHECK(body.pausedDurationMs == 120'000);
        CHECK(resumed.body.find("\"noChangesDetected\":false") != std::string::npos);
    }

    TEST_CASE("010: forced resume and pause without watching", "[010][mcp][flow]") {
        detail::server_fixture f{};
        auto id = f.start();

        auto paused = f.call("pause_session", detail::server_fixture::session_args(id, R"(,"watchFiles":false)"));
        CHECK_FALSE(detail::read_body<detail::pause_reply>(paused.body).watchingFiles);

        auto resumed = f.call("resume_session", detail::server_fixture::session_args(id, R"(,"forceFullRebuild":true)"));
        auto body = detail::read_body<detail::resume_reply>(resumed.body);
        CHECK(body.resumeType == "full_rebuild");
        CHECK(body.changedFiles == 0U);
        CHECK(body.invalidatedEntries == 3U);
        CHECK(resumed.body.find("\"fullRebuild\":true") != std::string::npos);
    }

    TEST_CASE("010: session listing, graph tools and cache tools", "[010][mcp]") {
        detail::server_fixture f{};
        auto id = f.start();
        auto args = detail::server_fixture::session_args(id);

        auto list = f.call("list_sessions").body;
        CHECK(list.find("\"count\":1") != std::string::npos);
        CHECK(list.find("\"state\":\"active\"") != std::string::npos);

        auto status = f.call("session_status", args).body;
        CHECK(status.find("\"graphAvailable\":true") != std::string::npos);
        CHECK(status.find("\"cachedEntries\":3") != std::string::npos);

        auto graph = f.call("dependency_graph", args).body;
        CHECK(graph.find("\"totalUnits\":3") != std::string::npos);
        CHECK(graph.find("\"leafUnitIds\":[\"A\"]") != std::string::npos);
        CHECK(graph.find("\"rootUnitIds\":[\"C\"]") != std::string::npos);

        auto impact = f.call("impact_analysis", detail::server_fixture::session_args(id, R"(,"unitId":"A")")).body;
        CHECK(impact.find("\"affectedUnitCount\":3") != std::string::npos);

        auto order = f.call("compilation_order", args).body;
        CHECK(order.find("\"compilationOrder\":[\"A\",\"B\",\"C\"]") != std::string::npos);

        auto details = f.call("unit_details", detail::server_fixture::session_args(id, R"(,"unitId":"B")")).body;
        CHECK(details.find("\"directDependencies\":[\"A\"]") != std::string::npos);
        CHECK(details.find("\"directDependents\":[\"C\"]") != std::string::npos);

        auto unknown_unit = f.call("unit_details", detail::server_fixture::session_args(id, R"(,"unitId":"Z")"));
        CHECK(unknown_unit.is_error);

        auto stats = f.call("cache_stats").body;
        CHECK(stats.find("\"entries\":3") != std::string::npos);
        CHECK(stats.find("\"sessionBreakdown\":{\"" + id + "\":3}") != std::string::npos);

        CHECK(f.call("clear_cache").body.find("\"cleared\":3") != std::string::npos);

        auto ended = f.call("end_session", args);
        CHECK_FALSE(ended.is_error);
        CHECK(f.call("list_sessions").body.find("\"count\":0") != std::string::npos);
    }
}  // namespace ripple::test
