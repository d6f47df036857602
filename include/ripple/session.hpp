#pragma once

#include "utils.hpp"
#include "workspace.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ripple::session {

    using namespace std::string_view_literals;

    // created -> active <-> paused -> disposed
    enum class session_state : uint8_t { created, active, paused, disposed };

    inline constexpr std::string_view to_string(session_state state) {
        switch (state) {
            case session_state::created:
                return "created"sv;
            case session_state::active:
                return "active"sv;
            case session_state::paused:
                return "paused"sv;
            case session_state::disposed:
                return "disposed"sv;
        }
        return "disposed"sv;
    }

    struct session_record {
        std::string id{};
        std::filesystem::path workspace_path{};
        workspace::snapshot_ptr snapshot{};
        sys_time created_at{};
        sys_time last_accessed_at{};
        session_state state{session_state::created};
        std::optional<sys_time> paused_at{};
        bool watching_files{false};

        bool is_paused() const { return state == session_state::paused; }
    };

    // Holds a session's operation guard; operations on one session run one at a time
    class session_lock {
      public:
        session_lock(std::string id, std::shared_ptr<std::mutex> mutex);

        const std::string& id() const { return id_; }

      private:
        std::string id_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    /*
     * Owns every session and is the only place session state changes.
     *
     * Lock discipline: a session's operation guard (see `acquire`) is always taken before the
     * registry's own mutex, never while holding it; the registry mutex only protects the map and is
     * never held across a call into another component. Records handed out are copies.
     *
     * Lookups throw error(not_found) for unknown ids; transitions throw error(invalid_state) when the
     * session is in the wrong state and leave the record untouched.
     */
    class session_registry {
      public:
        explicit session_registry(clock_fn clock = system_now);

        // new session in `created` state
        session_record create(std::filesystem::path workspace_path, workspace::snapshot_ptr snapshot);

        // created -> active
        session_record activate(const std::string& id);

        session_record get(const std::string& id) const;
        bool contains(const std::string& id) const;

        // ordered by creation time
        std::vector<session_record> list() const;

        void touch(const std::string& id);

        // active -> paused; a paused session keeps its original pause time
        session_record pause(const std::string& id, sys_time at, bool watching_files);

        // paused -> active
        session_record resume(const std::string& id);

        void replace_snapshot(const std::string& id, workspace::snapshot_ptr snapshot);

        // removes the session; the returned record is in `disposed` state
        session_record dispose(const std::string& id);

        // sessions idle for longer than `max_idle`; paused sessions are never idle
        std::vector<std::string> idle_sessions(std::chrono::seconds max_idle) const;

        // blocks until the session's operation guard is free; throws error(not_found) when the
        // session is unknown or was disposed while waiting
        session_lock acquire(const std::string& id);

        size_t size() const;

        sys_time now() const { return clock_(); }

      private:
        struct slot {
            session_record record{};
            std::shared_ptr<std::mutex> op_mutex{std::make_shared<std::mutex>()};
        };

        slot& find_slot(const std::string& id);
        const slot& find_slot(const std::string& id) const;

        std::string next_id();

        clock_fn clock_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, slot> sessions_;
    };

}  // namespace ripple::session
