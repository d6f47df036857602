#include "ripple/cache.hpp"

#include "internal/fingerprint.hpp"

#include "ripple/log.hpp"

#include <fstream>
#include <functional>
#include <iterator>
#include <set>
#include <string_view>

namespace ripple::cache {

    size_t artifact_cache::cache_key_hash::operator()(const cache_key& key) const noexcept {
        auto h = std::hash<std::string>{}(key.session_id);
        return h ^ (std::hash<std::string>{}(key.unit_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }

    artifact_ptr artifact_cache::get(const std::string& session_id, const std::string& unit_id) const {
        std::shared_lock lock{mutex_};
        auto it = entries_.find(cache_key{session_id, unit_id});
        if (it == entries_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second;
    }

    bool artifact_cache::contains(const std::string& session_id, const std::string& unit_id) const {
        std::shared_lock lock{mutex_};
        return entries_.contains(cache_key{session_id, unit_id});
    }

    void artifact_cache::put(const std::string& session_id, const std::string& unit_id, artifact_ptr artifact) {
        std::unique_lock lock{mutex_};
        entries_.insert_or_assign(cache_key{session_id, unit_id}, std::move(artifact));
    }

    bool artifact_cache::invalidate_unit(const std::string& session_id, const std::string& unit_id) {
        size_t removed{};
        {
            std::unique_lock lock{mutex_};
            removed = entries_.erase(cache_key{session_id, unit_id});
        }
        if (removed != 0) {
            log_debug("invalidated cached artifact for unit ", unit_id, " in session ", session_id);
        }
        return removed != 0;
    }

    size_t artifact_cache::invalidate_all(const std::string& session_id) {
        size_t removed{};
        {
            std::unique_lock lock{mutex_};
            removed = std::erase_if(entries_, [&](const auto& entry) { return entry.first.session_id == session_id; });
        }
        log_info("invalidated all ", removed, " cached artifacts for session ", session_id);
        return removed;
    }

    size_t artifact_cache::clear() {
        size_t removed{};
        {
            std::unique_lock lock{mutex_};
            removed = entries_.size();
            entries_.clear();
        }
        log_warn("cleared entire artifact cache (", removed, " entries)");
        return removed;
    }

    size_t artifact_cache::size() const {
        std::shared_lock lock{mutex_};
        return entries_.size();
    }

    size_t artifact_cache::size(const std::string& session_id) const {
        std::shared_lock lock{mutex_};
        return static_cast<size_t>(std::ranges::count_if(
                entries_, [&](const auto& entry) { return entry.first.session_id == session_id; }));
    }

    cache_stats artifact_cache::stats() const {
        cache_stats result{};
        {
            std::shared_lock lock{mutex_};
            result.entries = entries_.size();
            for (const auto& [key, _] : entries_) {
                ++result.session_breakdown[key.session_id];
            }
        }
        result.sessions = result.session_breakdown.size();
        result.hits = hits_.load(std::memory_order_relaxed);
        result.misses = misses_.load(std::memory_order_relaxed);
        return result;
    }

    unit_compiler::unit_compiler(clock_fn clock) : clock_{std::move(clock)} {}

    compiled_artifact unit_compiler::compile(const workspace::unit_descriptor& unit) const {
        auto fingerprint = internal::fnv1a(unit.id);
        size_t bytes{};

        for (const auto& doc : unit.documents) {
            auto path = doc.string();
            fingerprint = internal::fingerprint_combine(fingerprint, internal::fnv1a(path));

            std::ifstream in{doc, std::ios::binary};
            if (!in) {
                log_debug("document ", path, " of unit ", unit.id, " is unreadable");
                continue;
            }
            std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
            bytes += content.size();
            fingerprint = internal::fingerprint_combine(fingerprint, internal::fnv1a(content));
        }

        log_debug("compiled unit ", unit.id, " (", unit.documents.size(), " documents, ", bytes, " bytes)");
        return compiled_artifact{
                .unit_id = unit.id,
                .fingerprint = fingerprint,
                .document_count = unit.documents.size(),
                .byte_count = bytes,
                .compiled_at = clock_()};
    }

}  // namespace ripple::cache
