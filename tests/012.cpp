#include "utils.hpp"

#include "internal/platform.hpp"

namespace ripple::test {

    namespace detail {

        struct ripple_process {
            pid_t pid{-1};
            int stdin_fd{-1};
            int stdout_fd{-1};
            int stderr_fd{-1};
            std::string read_buf{};

            ripple_process(const ripple_process&) = delete;
            ripple_process& operator=(const ripple_process&) = delete;

            explicit ripple_process(std::vector<std::string> args = {"--quiet"}) {
                int in_pipe[2]{};
                int out_pipe[2]{};
                int err_pipe[2]{};
                REQUIRE(::pipe(in_pipe) == 0);
                REQUIRE(::pipe(out_pipe) == 0);
                REQUIRE(::pipe(err_pipe) == 0);

                std::vector<char*> argv{};
                argv.push_back(const_cast<char*>(RIPPLE_CLI_PATH));
                for (auto& arg : args) {
                    argv.push_back(arg.data());
                }
                argv.push_back(nullptr);

                pid = ::fork();
                REQUIRE(pid >= 0);

                if (pid == 0) {
                    ::close(in_pipe[1]);
                    ::close(out_pipe[0]);
                    ::close(err_pipe[0]);
                    ::dup2(in_pipe[0], STDIN_FILENO);
                    ::dup2(out_pipe[1], STDOUT_FILENO);
                    ::dup2(err_pipe[1], STDERR_FILENO);
                    ::close(in_pipe[0]);
                    ::close(out_pipe[1]);
                    ::close(err_pipe[1]);

                    ::execvp(argv[0], argv.data());
                    _exit(127);
                }

                ::close(in_pipe[0]);
                ::close(out_pipe[1]);
                ::close(err_pipe[1]);
                stdin_fd = in_pipe[1];
                stdout_fd = out_pipe[0];
                stderr_fd = err_pipe[0];
            }

            ~ripple_process() {
                if (stdin_fd >= 0)
                    ::close(stdin_fd);
                if (pid > 0) {
                    ::kill(pid, SIGTERM);
                    ::waitpid(pid, nullptr, 0);
                }
                if (stdout_fd >= 0)
                    ::close(stdout_fd);
                if (stderr_fd >= 0)
                    ::close(stderr_fd);
            }

            void send_line(std::string_view line) {
                std::string msg{line};
                msg.push_back('\n');
                auto written = ::write(stdin_fd, msg.data(), msg.size());
                REQUIRE(written == static_cast<ssize_t>(msg.size()));
            }

            // false on EOF
            bool fill(std::chrono::steady_clock::time_point deadline) {
                for (;;) {
                    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                             deadline - std::chrono::steady_clock::now())
                                             .count();
                    if (remaining <= 0) {
                        FAIL("ripple read timed out");
                    }

                    int poll_ms = remaining > 1000 ? 1000 : static_cast<int>(remaining);
                    pollfd pfd{.fd = stdout_fd, .events = POLLIN, .revents = 0};
                    int ret = ::poll(&pfd, 1, poll_ms);
                    if (ret < 0 && errno == EINTR)
                        continue;
                    if (ret == 0)
                        continue;
                    REQUIRE(ret > 0);

                    char chunk[4096]{};
                    auto n = ::read(stdout_fd, chunk, sizeof(chunk));
                    REQUIRE(n >= 0);
                    if (n == 0) {
                        return false;
                    }
                    read_buf.append(chunk, static_cast<size_t>(n));
                    return true;
                }
            }

            std::string recv_line(int timeout_ms = 15000) {
                auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
                for (;;) {
                    auto pos = read_buf.find('\n');
                    if (pos != std::string::npos) {
                        auto line = read_buf.substr(0, pos);
                        read_buf.erase(0, pos + 1);
                        return line;
                    }
                    if (!fill(deadline)) {
                        FAIL("ripple closed stdout");
                    }
                }
            }

            // closes stdin, collects the rest of stdout and returns the exit code
            int finish(std::string* rest = nullptr, int timeout_ms = 15000) {
                ::close(stdin_fd);
                stdin_fd = -1;
                auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
                while (fill(deadline)) {}
                if (rest != nullptr) {
                    *rest = std::exchange(read_buf, {});
                }

                int status{};
                REQUIRE(::waitpid(pid, &status, 0) == pid);
                pid = -1;
                REQUIRE(WIFEXITED(status));
                return WEXITSTATUS(status);
            }

            std::string handshake() {
                send_line(
                        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"test","version":"0.1"}}})");
                auto resp = recv_line();
                send_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
                return resp;
            }

            std::string call(int id, std::string_view tool, std::string_view arguments) {
                send_line(
                        R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":"tools/call","params":{"name":")" +
                        std::string{tool} + R"(","arguments":)" + std::string{arguments} + "}}");
                return recv_line();
            }
        };

        // pulls `"<key>":"<value>"` out of a tool result, where the body arrives as an escaped JSON string
        inline std::string escaped_field(const std::string& resp, std::string_view key) {
            auto marker = "\\\"" + std::string{key} + "\\\":\\\"";
            auto start = resp.find(marker);
            REQUIRE(start != std::string::npos);
            start += marker.size();
            auto end = resp.find("\\\"", start);
            REQUIRE(end != std::string::npos);
            return resp.substr(start, end - start);
        }

    }  // namespace detail

    TEST_CASE("012: version flag prints the version and exits", "[012][cli]") {
        detail::ripple_process proc{std::vector<std::string>{"--version"}};
        std::string out{};
        CHECK(proc.finish(&out) == 0);
        CHECK(out.find("0.1.0") != std::string::npos);
    }

    TEST_CASE("012: print-config shows resolved options", "[012][cli]") {
        detail::ripple_process proc{std::vector<std::string>{"--print-config", "--quiescence-ms", "750", "--prewarm", "all"}};
        std::string out{};
        CHECK(proc.finish(&out) == 0);
        CHECK(out.find("quiescence_window=750ms") != std::string::npos);
        CHECK(out.find("prewarm=all") != std::string::npos);
    }

    TEST_CASE("012: invalid option exits with usage error", "[012][cli]") {
        detail::ripple_process proc{std::vector<std::string>{"--quiescence-ms", "1"}};
        CHECK(proc.finish() == 2);
    }

    TEST_CASE("012: mcp initialize returns protocol version and server info", "[012][mcp]") {
        detail::ripple_process mcp{};
        auto resp = mcp.handshake();

        CHECK(resp.find("\"protocolVersion\":\"2024-11-05\"") != std::string::npos);
        CHECK(resp.find("\"name\":\"ripple\"") != std::string::npos);
        CHECK(resp.find("\"version\":\"0.1.0\"") != std::string::npos);
    }

    TEST_CASE("012: mcp tools list and unknown method", "[012][mcp]") {
        detail::ripple_process mcp{};
        mcp.handshake();

        mcp.send_line(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
        auto tools = mcp.recv_line();
        CHECK(tools.find("\"name\":\"pause_session\"") != std::string::npos);
        CHECK(tools.find("\"name\":\"resume_session\"") != std::string::npos);

        mcp.send_line(R"({"jsonrpc":"2.0","id":3,"method":"bogus/method"})");
        auto unknown = mcp.recv_line();
        CHECK(unknown.find("Unknown method") != std::string::npos);
    }

    TEST_CASE("012: mcp server exits cleanly on stdin EOF", "[012][mcp]") {
        detail::ripple_process mcp{};
        mcp.handshake();
        CHECK(mcp.finish() == 0);
    }

    TEST_CASE("012: pause, external edit and resume over stdio", "[012][mcp][flow]") {
        if constexpr (!internal::platform::is_linux) {
            SKIP("no native watch backend on this platform");
        }

        detail::chain_workspace ws{"ripple_012"};
        detail::write_file(
                ws.manifest,
                R"({"name": "chain", "units": [
                    {"id": "A", "directory": "a"},
                    {"id": "B", "directory": "b", "references": ["A"]},
                    {"id": "C", "directory": "c", "references": ["B"]}
                ]})");

        detail::ripple_process mcp{std::vector<std::string>{"--quiet", "--prewarm", "all", "--quiescence-ms", "50"}};
        mcp.handshake();

        auto started = mcp.call(2, "start_session", R"({"path":")" + ws.dir.path.string() + R"("})");
        CHECK(started.find("\"isError\":false") != std::string::npos);
        auto id = detail::escaped_field(started, "sessionId");
        auto args = R"({"sessionId":")" + id + R"("})";

        auto paused = mcp.call(3, "pause_session", args);
        CHECK(paused.find("\\\"watchingFiles\\\":true") != std::string::npos);

        detail::write_file(ws.file_b, "int b() { return 2000; }\n");

        // wait until the change shows up in a preview
        auto deadline = std::chrono::steady_clock::now() + 5s;
        int next_id = 4;
        std::string preview{};
        while (std::chrono::steady_clock::now() < deadline) {
            preview = mcp.call(next_id++, "preview_pause_changes", args);
            if (preview.find("\\\"count\\\":1") != std::string::npos) {
                break;
            }
            std::this_thread::sleep_for(50ms);
        }
        CHECK(preview.find("\\\"count\\\":1") != std::string::npos);

        auto resumed = mcp.call(next_id++, "resume_session", args);
        CHECK(resumed.find("\"isError\":false") != std::string::npos);
        CHECK(resumed.find("\\\"changedFiles\\\":1") != std::string::npos);
        CHECK(resumed.find("\\\"projectList\\\":[\\\"B\\\",\\\"C\\\"]") != std::string::npos);
        CHECK(resumed.find("\\\"invalidatedEntries\\\":2") != std::string::npos);

        auto again = mcp.call(next_id++, "resume_session", args);
        CHECK(again.find("\"isError\":true") != std::string::npos);
        CHECK(again.find("invalid_state") != std::string::npos);

        auto ended = mcp.call(next_id++, "end_session", args);
        CHECK(ended.find("\"isError\":false") != std::string::npos);
        CHECK(mcp.finish() == 0);
    }
}  // namespace ripple::test
