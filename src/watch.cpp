#include "ripple/watch.hpp"

#include "ripple/error.hpp"
#include "ripple/format.hpp"
#include "ripple/log.hpp"
#include "ripple/workspace.hpp"

#include <algorithm>
#include <set>

namespace ripple::watch {

    using namespace ripple::literals;

    namespace {
        // repeated events on one path closer together than this collapse into one record
        constexpr auto rapid_repeat = std::chrono::milliseconds{100};

        bool is_under(const std::filesystem::path& root, const std::filesystem::path& path) {
            auto rel = path.lexically_relative(root);
            return !rel.empty() && *rel.begin() != "..";
        }
    }  // namespace

    void manual_backend::subscribe(
            const std::string& key,
            const std::filesystem::path& root,
            const std::vector<std::string>& patterns,
            event_callback callback) {
        std::lock_guard lock{mutex_};
        if (fail_next_) {
            fail_next_ = false;
            throw error{error_kind::watch_setup, "cannot watch {}: subscription refused"_format(root.string())};
        }
        subscriptions_.insert_or_assign(
                key, subscription{workspace::normalize_path(root), patterns, std::move(callback)});
    }

    void manual_backend::unsubscribe(const std::string& key) {
        std::lock_guard lock{mutex_};
        subscriptions_.erase(key);
    }

    size_t manual_backend::emit(const std::filesystem::path& path, event_kind kind) {
        auto normal = workspace::normalize_path(path);

        std::vector<event_callback> targets{};
        {
            std::lock_guard lock{mutex_};
            for (const auto& [_, sub] : subscriptions_) {
                if (is_under(sub.root, normal) && workspace::matches_patterns(normal, sub.patterns)) {
                    targets.push_back(sub.callback);
                }
            }
        }

        for (const auto& cb : targets) {
            cb(file_event{normal, kind});
        }
        return targets.size();
    }

    bool manual_backend::subscribed(const std::string& key) const {
        std::lock_guard lock{mutex_};
        return subscriptions_.contains(key);
    }

    void manual_backend::fail_next_subscribe(bool fail) {
        std::lock_guard lock{mutex_};
        fail_next_ = fail;
    }

    std::vector<change_record> normalize(const change_notification& notification) {
        if (const auto* single = std::get_if<single_change>(&notification)) {
            return {single->change};
        }
        return std::get<batch_change>(notification).changes;
    }

    void change_channel::push(change_notification notification) {
        {
            std::lock_guard lock{mutex_};
            queue_.push_back(std::move(notification));
        }
        cv_.notify_all();
    }

    std::optional<change_notification> change_channel::try_pop() {
        std::lock_guard lock{mutex_};
        if (queue_.empty()) {
            return std::nullopt;
        }
        auto front = std::move(queue_.front());
        queue_.pop_front();
        return front;
    }

    std::optional<change_notification> change_channel::wait_pop(std::chrono::milliseconds timeout) {
        std::unique_lock lock{mutex_};
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        auto front = std::move(queue_.front());
        queue_.pop_front();
        return front;
    }

    std::vector<change_notification> change_channel::drain() {
        std::lock_guard lock{mutex_};
        std::vector<change_notification> out{std::make_move_iterator(queue_.begin()),
                                             std::make_move_iterator(queue_.end())};
        queue_.clear();
        return out;
    }

    size_t change_channel::size() const {
        std::lock_guard lock{mutex_};
        return queue_.size();
    }

    change_tracker::change_tracker(watch_backend& backend, std::chrono::milliseconds window, clock_fn clock)
        : backend_{backend},
          window_{window},
          clock_{std::move(clock)},
          flusher_{[this](std::stop_token stop) { flusher_loop(std::move(stop)); }} {}

    change_tracker::~change_tracker() {
        std::vector<std::string> keys{};
        {
            std::lock_guard lock{mutex_};
            for (const auto& [key, _] : entries_) {
                keys.push_back(key);
            }
        }
        for (const auto& key : keys) {
            backend_.unsubscribe(key);
        }
        flusher_.request_stop();
        cv_.notify_all();
    }

    void change_tracker::start_watching(
            const std::string& session_id,
            const std::filesystem::path& root,
            const std::vector<std::string>& patterns,
            std::stop_token stop) {
        if (stop.stop_requested()) {
            throw error{error_kind::cancelled, "watch setup for session {} was cancelled"_format(session_id)};
        }

        stop_watching(session_id);

        auto normal_root = workspace::normalize_path(root);
        {
            std::lock_guard lock{mutex_};
            entries_.insert_or_assign(
                    session_id,
                    watch_entry{.root = normal_root, .channel = std::make_shared<change_channel>()});
        }

        auto discard = [&] {
            backend_.unsubscribe(session_id);
            std::lock_guard lock{mutex_};
            entries_.erase(session_id);
        };

        try {
            backend_.subscribe(session_id, normal_root, patterns, [this, session_id](const file_event& ev) {
                record(session_id, ev);
            });
        } catch (...) {
            discard();
            throw;
        }

        if (stop.stop_requested()) {
            discard();
            throw error{error_kind::cancelled, "watch setup for session {} was cancelled"_format(session_id)};
        }

        log_info("watching ", normal_root.string(), " for session ", session_id, " (", patterns.size(), " patterns)");
    }

    void change_tracker::stop_watching(const std::string& session_id) {
        backend_.unsubscribe(session_id);
        std::lock_guard lock{mutex_};
        if (entries_.erase(session_id) != 0) {
            log_info("stopped watching for session ", session_id);
        }
    }

    bool change_tracker::is_watching(const std::string& session_id) const {
        std::lock_guard lock{mutex_};
        return entries_.contains(session_id);
    }

    std::vector<std::filesystem::path> change_tracker::recent_changes(
            const std::string& session_id, std::chrono::milliseconds since) const {
        return changes_since(session_id, clock_() - since);
    }

    std::vector<std::filesystem::path> change_tracker::changes_since(
            const std::string& session_id, sys_time since) const {
        std::set<std::filesystem::path> paths{};
        {
            std::lock_guard lock{mutex_};
            auto it = entries_.find(session_id);
            if (it == entries_.end()) {
                return {};
            }
            for (const auto& rec : it->second.log) {
                if (rec.timestamp >= since) {
                    paths.insert(rec.path);
                }
            }
        }
        return {paths.begin(), paths.end()};
    }

    channel_ptr change_tracker::channel(const std::string& session_id) const {
        std::lock_guard lock{mutex_};
        if (auto it = entries_.find(session_id); it != entries_.end()) {
            return it->second.channel;
        }
        return nullptr;
    }

    void change_tracker::flush() {
        std::lock_guard lock{mutex_};
        for (auto& [_, entry] : entries_) {
            publish(entry);
        }
    }

    void change_tracker::record(const std::string& session_id, const file_event& event) {
        auto now = clock_();
        {
            std::lock_guard lock{mutex_};
            auto it = entries_.find(session_id);
            if (it == entries_.end()) {
                return;
            }
            auto& entry = it->second;

            auto last = std::ranges::find_if(
                    entry.log.rbegin(), entry.log.rend(), [&](const auto& rec) { return rec.path == event.path; });
            if (last != entry.log.rend() && now - last->timestamp < rapid_repeat) {
                last->timestamp = now;
            }
            else {
                entry.log.push_back(change_record{event.path, now});
            }

            auto pending = std::ranges::find_if(entry.pending, [&](const auto& rec) { return rec.path == event.path; });
            if (pending != entry.pending.end()) {
                pending->timestamp = now;
            }
            else {
                entry.pending.push_back(change_record{event.path, now});
            }
            entry.last_event = std::chrono::steady_clock::now();
        }
        log_debug("session ", session_id, ": ", to_string(event.kind), " ", event.path.string());
        cv_.notify_all();
    }

    void change_tracker::publish(watch_entry& entry) {
        if (entry.pending.empty()) {
            return;
        }
        if (entry.pending.size() == 1) {
            entry.channel->push(single_change{entry.pending.front()});
        }
        else {
            entry.channel->push(batch_change{std::move(entry.pending)});
        }
        entry.pending.clear();
    }

    void change_tracker::flusher_loop(std::stop_token stop) {
        std::unique_lock lock{mutex_};
        while (!stop.stop_requested()) {
            auto now = std::chrono::steady_clock::now();
            std::optional<std::chrono::steady_clock::time_point> next_deadline{};

            for (auto& [_, entry] : entries_) {
                if (entry.pending.empty()) {
                    continue;
                }
                auto deadline = entry.last_event + window_;
                if (deadline <= now) {
                    publish(entry);
                }
                else if (!next_deadline || deadline < *next_deadline) {
                    next_deadline = deadline;
                }
            }

            if (next_deadline) {
                cv_.wait_until(lock, stop, *next_deadline, [] { return false; });
            }
            else {
                cv_.wait(lock, stop, [this] {
                    return std::ranges::any_of(entries_, [](const auto& e) { return !e.second.pending.empty(); });
                });
            }
        }
    }

}  // namespace ripple::watch
