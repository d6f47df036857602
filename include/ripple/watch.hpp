#pragma once

#include "utils.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

namespace ripple::watch {

    using namespace std::string_view_literals;

    enum class event_kind : uint8_t { modified, created, deleted, renamed_from, renamed_to };

    inline constexpr std::string_view to_string(event_kind kind) {
        switch (kind) {
            case event_kind::modified:
                return "modified"sv;
            case event_kind::created:
                return "created"sv;
            case event_kind::deleted:
                return "deleted"sv;
            case event_kind::renamed_from:
                return "renamed_from"sv;
            case event_kind::renamed_to:
                return "renamed_to"sv;
        }
        return "modified"sv;
    }

    struct file_event {
        std::filesystem::path path{};
        event_kind kind{event_kind::modified};
    };

    using event_callback = std::function<void(const file_event&)>;

    /*
     * Filesystem watch collaborator. A subscription delivers raw events for files under `root`
     * whose names match `patterns`; debouncing is the tracker's job. Callbacks may run on any
     * thread, and none runs after `unsubscribe` returns.
     */
    class watch_backend {
      public:
        virtual ~watch_backend() = default;

        // throws error(watch_setup)
        virtual void subscribe(
                const std::string& key,
                const std::filesystem::path& root,
                const std::vector<std::string>& patterns,
                event_callback callback) = 0;

        // idempotent
        virtual void unsubscribe(const std::string& key) = 0;
    };

    // inotify on Linux; elsewhere every subscription fails with watch_setup
    std::unique_ptr<watch_backend> make_platform_backend();

    /*
     * In-process backend: events are injected with `emit`. Used by tests and by embedders that
     * receive change notifications from elsewhere.
     */
    class manual_backend final : public watch_backend {
      public:
        void subscribe(
                const std::string& key,
                const std::filesystem::path& root,
                const std::vector<std::string>& patterns,
                event_callback callback) override;

        void unsubscribe(const std::string& key) override;

        // delivers to every subscription whose root contains `path` and whose patterns match;
        // returns the number of subscriptions notified
        size_t emit(const std::filesystem::path& path, event_kind kind = event_kind::modified);

        bool subscribed(const std::string& key) const;

        // the next subscribe call throws watch_setup
        void fail_next_subscribe(bool fail = true);

      private:
        struct subscription {
            std::filesystem::path root{};
            std::vector<std::string> patterns{};
            event_callback callback{};
        };

        mutable std::mutex mutex_;
        std::unordered_map<std::string, subscription> subscriptions_;
        bool fail_next_{false};
    };

    struct change_record {
        std::filesystem::path path{};
        sys_time timestamp{};
    };

    struct single_change {
        change_record change{};
    };

    struct batch_change {
        std::vector<change_record> changes{};
    };

    using change_notification = std::variant<single_change, batch_change>;

    // flattens either notification shape into one list of records
    std::vector<change_record> normalize(const change_notification& notification);

    /*
     * Per-session queue of change notifications. Delivery is at-least-once per burst; consumers
     * treat the contents as set membership only.
     */
    class change_channel {
      public:
        void push(change_notification notification);

        std::optional<change_notification> try_pop();

        // nullopt on timeout
        std::optional<change_notification> wait_pop(std::chrono::milliseconds timeout);

        std::vector<change_notification> drain();

        size_t size() const;

      private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<change_notification> queue_;
    };

    using channel_ptr = std::shared_ptr<change_channel>;

    /*
     * Records file changes for paused sessions.
     *
     * Raw events are appended to the session's change log as they arrive. A background flusher
     * publishes a notification on the session's channel once no event has arrived for the
     * quiescence window: a `single_change` when the burst touched one path, a `batch_change`
     * otherwise. Renames are recorded on both the old and the new path.
     */
    class change_tracker {
      public:
        change_tracker(watch_backend& backend, std::chrono::milliseconds window, clock_fn clock = system_now);
        ~change_tracker();

        change_tracker(const change_tracker&) = delete;
        change_tracker& operator=(const change_tracker&) = delete;

        // replaces any previous watch for the session. throws error(watch_setup) when the backend
        // fails, error(cancelled) when `stop` is triggered; both leave the session unwatched
        void start_watching(
                const std::string& session_id,
                const std::filesystem::path& root,
                const std::vector<std::string>& patterns,
                std::stop_token stop = {});

        // idempotent; discards the session's change log and channel
        void stop_watching(const std::string& session_id);

        bool is_watching(const std::string& session_id) const;

        // deduplicated, sorted by path; empty for unwatched sessions
        std::vector<std::filesystem::path> recent_changes(
                const std::string& session_id, std::chrono::milliseconds since) const;
        std::vector<std::filesystem::path> changes_since(const std::string& session_id, sys_time since) const;

        // nullptr for unwatched sessions
        channel_ptr channel(const std::string& session_id) const;

        // publishes pending bursts immediately, regardless of the quiescence window
        void flush();

        // entry point for backend callbacks
        void record(const std::string& session_id, const file_event& event);

        std::chrono::milliseconds window() const { return window_; }

      private:
        struct watch_entry {
            std::filesystem::path root{};
            std::vector<change_record> log{};
            std::vector<change_record> pending{};
            std::chrono::steady_clock::time_point last_event{};
            channel_ptr channel{};
        };

        void flusher_loop(std::stop_token stop);
        void publish(watch_entry& entry);

        watch_backend& backend_;
        std::chrono::milliseconds window_;
        clock_fn clock_;

        mutable std::mutex mutex_;
        std::condition_variable_any cv_;
        std::unordered_map<std::string, watch_entry> entries_;
        std::jthread flusher_;
    };

}  // namespace ripple::watch
