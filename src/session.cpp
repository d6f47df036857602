#include "ripple/session.hpp"

#include "ripple/error.hpp"
#include "ripple/format.hpp"
#include "ripple/log.hpp"

#include <algorithm>
#include <random>

namespace ripple::session {

    using namespace ripple::literals;

    session_lock::session_lock(std::string id, std::shared_ptr<std::mutex> mutex)
        : id_{std::move(id)}, mutex_{std::move(mutex)}, lock_{*mutex_} {}

    session_registry::session_registry(clock_fn clock) : clock_{std::move(clock)} {}

    std::string session_registry::next_id() {
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        for (;;) {
            auto id = "{:016x}{:016x}"_format(rng(), rng());
            if (!sessions_.contains(id)) {
                return id;
            }
        }
    }

    session_registry::slot& session_registry::find_slot(const std::string& id) {
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            throw error{error_kind::not_found, "session not found: {}"_format(id)};
        }
        return it->second;
    }

    const session_registry::slot& session_registry::find_slot(const std::string& id) const {
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            throw error{error_kind::not_found, "session not found: {}"_format(id)};
        }
        return it->second;
    }

    session_record session_registry::create(std::filesystem::path workspace_path, workspace::snapshot_ptr snapshot) {
        auto now = clock_();
        std::lock_guard lock{mutex_};
        auto id = next_id();
        slot s{};
        s.record = session_record{
                .id = id,
                .workspace_path = std::move(workspace_path),
                .snapshot = std::move(snapshot),
                .created_at = now,
                .last_accessed_at = now};
        auto& inserted = sessions_.emplace(id, std::move(s)).first->second;
        log_info("created session ", id, " for ", inserted.record.workspace_path.string());
        return inserted.record;
    }

    session_record session_registry::activate(const std::string& id) {
        std::lock_guard lock{mutex_};
        auto& s = find_slot(id);
        if (s.record.state != session_state::created) {
            throw error{
                    error_kind::invalid_state,
                    "session {} cannot be activated from state {}"_format(id, to_string(s.record.state))};
        }
        s.record.state = session_state::active;
        return s.record;
    }

    session_record session_registry::get(const std::string& id) const {
        std::lock_guard lock{mutex_};
        return find_slot(id).record;
    }

    bool session_registry::contains(const std::string& id) const {
        std::lock_guard lock{mutex_};
        return sessions_.contains(id);
    }

    std::vector<session_record> session_registry::list() const {
        std::vector<session_record> out{};
        {
            std::lock_guard lock{mutex_};
            out.reserve(sessions_.size());
            for (const auto& [_, s] : sessions_) {
                out.push_back(s.record);
            }
        }
        std::ranges::sort(out, [](const auto& a, const auto& b) {
            return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
        });
        return out;
    }

    void session_registry::touch(const std::string& id) {
        auto now = clock_();
        std::lock_guard lock{mutex_};
        find_slot(id).record.last_accessed_at = now;
    }

    session_record session_registry::pause(const std::string& id, sys_time at, bool watching_files) {
        std::lock_guard lock{mutex_};
        auto& rec = find_slot(id).record;
        if (rec.state == session_state::paused) {
            throw error{
                    error_kind::invalid_state,
                    "session {} is already paused (since {})"_format(id, format_timestamp(*rec.paused_at))};
        }
        if (rec.state != session_state::active) {
            throw error{
                    error_kind::invalid_state, "session {} cannot be paused from state {}"_format(id, to_string(rec.state))};
        }
        rec.state = session_state::paused;
        rec.paused_at = at;
        rec.watching_files = watching_files;
        rec.last_accessed_at = at;
        log_info("paused session ", id, watching_files ? " (watching files)" : "");
        return rec;
    }

    session_record session_registry::resume(const std::string& id) {
        auto now = clock_();
        std::lock_guard lock{mutex_};
        auto& rec = find_slot(id).record;
        if (rec.state != session_state::paused) {
            throw error{error_kind::invalid_state, "session {} is not paused ({})"_format(id, to_string(rec.state))};
        }
        rec.state = session_state::active;
        rec.paused_at.reset();
        rec.watching_files = false;
        rec.last_accessed_at = now;
        log_info("resumed session ", id);
        return rec;
    }

    void session_registry::replace_snapshot(const std::string& id, workspace::snapshot_ptr snapshot) {
        auto now = clock_();
        std::lock_guard lock{mutex_};
        auto& rec = find_slot(id).record;
        rec.snapshot = std::move(snapshot);
        rec.last_accessed_at = now;
    }

    session_record session_registry::dispose(const std::string& id) {
        std::lock_guard lock{mutex_};
        auto node = sessions_.extract(id);
        if (!node) {
            throw error{error_kind::not_found, "session not found: {}"_format(id)};
        }
        auto rec = std::move(node.mapped().record);
        rec.state = session_state::disposed;
        rec.paused_at.reset();
        rec.watching_files = false;
        log_info("disposed session ", id);
        return rec;
    }

    std::vector<std::string> session_registry::idle_sessions(std::chrono::seconds max_idle) const {
        auto cutoff = clock_() - max_idle;
        std::vector<std::string> out{};
        {
            std::lock_guard lock{mutex_};
            for (const auto& [id, s] : sessions_) {
                if (!s.record.is_paused() && s.record.last_accessed_at < cutoff) {
                    out.push_back(id);
                }
            }
        }
        std::ranges::sort(out);
        return out;
    }

    session_lock session_registry::acquire(const std::string& id) {
        std::shared_ptr<std::mutex> op_mutex{};
        {
            std::lock_guard lock{mutex_};
            op_mutex = find_slot(id).op_mutex;
        }

        session_lock guard{id, std::move(op_mutex)};
        if (!contains(id)) {
            throw error{error_kind::not_found, "session not found: {}"_format(id)};
        }
        return guard;
    }

    size_t session_registry::size() const {
        std::lock_guard lock{mutex_};
        return sessions_.size();
    }

}  // namespace ripple::session
