#pragma once

#include "ripple/ripple.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace ripple::test {
    using namespace std::chrono_literals;
}  // namespace ripple::test

namespace ripple::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            static std::atomic<int> counter{0};
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_" << counter++;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
            path = workspace::normalize_path(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        fs::create_directories(p.parent_path());
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    // starts at a fixed instant and only moves when told to
    struct manual_clock {
        std::shared_ptr<std::atomic<int64_t>> ms =
                std::make_shared<std::atomic<int64_t>>(int64_t{1'767'225'600'000});  // 2026-01-01T00:00:00Z

        sys_time now() const { return sys_time{std::chrono::milliseconds{ms->load()}}; }

        void advance(std::chrono::milliseconds d) { ms->fetch_add(d.count()); }

        clock_fn fn() const {
            return [counter = ms] { return sys_time{std::chrono::milliseconds{counter->load()}}; };
        }
    };

    inline workspace::unit_descriptor make_unit(
            std::string id, std::vector<std::string> references = {}, std::vector<fs::path> documents = {}) {
        workspace::unit_descriptor unit{};
        unit.name = id;
        unit.id = std::move(id);
        unit.language = "c++";
        unit.references = std::move(references);
        unit.documents = std::move(documents);
        return unit;
    }

    inline workspace::snapshot_ptr make_snapshot(
            std::vector<workspace::unit_descriptor> units, fs::path source = "/virtual/ripple.json") {
        return std::make_shared<const workspace::workspace_snapshot>("test", std::move(source), std::move(units));
    }

    // workspace loader serving prepared snapshots by path
    class memory_loader final : public workspace::workspace_loader {
      public:
        void set(const fs::path& path, workspace::snapshot_ptr snapshot) {
            std::lock_guard lock{mutex_};
            snapshots_[workspace::normalize_path(path)] = std::move(snapshot);
        }

        workspace::snapshot_ptr load(const fs::path& path) const override {
            std::lock_guard lock{mutex_};
            ++loads_;
            auto it = snapshots_.find(workspace::normalize_path(path));
            if (it == snapshots_.end()) {
                throw error{error_kind::workspace_load, "no workspace at " + path.string()};
            }
            return it->second;
        }

        int loads() const {
            std::lock_guard lock{mutex_};
            return loads_;
        }

      private:
        mutable std::mutex mutex_;
        std::map<fs::path, workspace::snapshot_ptr> snapshots_;
        mutable int loads_{0};
    };

    // A (no deps), B -> A, C -> B; each unit owns `<root>/<id>/<id>.cpp`
    struct chain_workspace {
        temp_dir dir;
        fs::path manifest;
        fs::path file_a;
        fs::path file_b;
        fs::path file_c;

        explicit chain_workspace(std::string_view prefix)
            : dir{prefix},
              manifest{dir.path / "ripple.json"},
              file_a{dir.path / "a" / "a.cpp"},
              file_b{dir.path / "b" / "b.cpp"},
              file_c{dir.path / "c" / "c.cpp"} {
            write_file(file_a, "int a() { return 1; }\n");
            write_file(file_b, "int b() { return 2; }\n");
            write_file(file_c, "int c() { return 3; }\n");
        }

        workspace::snapshot_ptr snapshot() const {
            return make_snapshot(
                    {make_unit("A", {}, {file_a}), make_unit("B", {"A"}, {file_b}), make_unit("C", {"B"}, {file_c})},
                    manifest);
        }
    };

    // runs `f` and checks it throws ripple::error of the given kind
    template <typename F>
    void check_error(error_kind expected, F&& f) {
        try {
            std::forward<F>(f)();
        } catch (const error& e) {
            CHECK(to_string(e.kind()) == to_string(expected));
            return;
        }
        FAIL("expected error of kind " << to_string(expected));
    }

    inline bool contains(const std::vector<std::string>& values, std::string_view value) {
        return std::ranges::find(values, value) != values.end();
    }

    inline bool contains_path(const std::vector<fs::path>& values, const fs::path& value) {
        return std::ranges::find(values, value) != values.end();
    }

}  // namespace ripple::test::detail
