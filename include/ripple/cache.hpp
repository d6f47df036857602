#pragma once

#include "utils.hpp"
#include "workspace.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace ripple::cache {

    struct compiled_artifact {
        std::string unit_id{};
        uint64_t fingerprint{};
        size_t document_count{};
        size_t byte_count{};
        sys_time compiled_at{};
    };

    using artifact_ptr = std::shared_ptr<const compiled_artifact>;

    struct cache_stats {
        size_t entries{};
        size_t hits{};
        size_t misses{};
        size_t sessions{};
        std::map<std::string, size_t> session_breakdown{};
    };

    /*
     * Compiled artifacts keyed by (session, unit).
     *
     * Invalidation removes entries rather than recomputing them; a missing entry means "compile on next
     * access". Each key is updated atomically and nothing stronger is promised: a lookup racing an
     * invalidation returns either the old artifact or a miss.
     */
    class artifact_cache {
      public:
        // counts a hit or a miss
        artifact_ptr get(const std::string& session_id, const std::string& unit_id) const;

        bool contains(const std::string& session_id, const std::string& unit_id) const;

        void put(const std::string& session_id, const std::string& unit_id, artifact_ptr artifact);

        // on a miss `compile` runs without the lock held; concurrent misses may both compile
        template <typename Compile>
        artifact_ptr get_or_compile(const std::string& session_id, const std::string& unit_id, Compile&& compile) {
            if (auto cached = get(session_id, unit_id)) {
                return cached;
            }
            auto fresh = std::make_shared<const compiled_artifact>(std::forward<Compile>(compile)());
            put(session_id, unit_id, fresh);
            return fresh;
        }

        // idempotent; returns whether an entry was removed
        bool invalidate_unit(const std::string& session_id, const std::string& unit_id);

        // returns the number of entries removed
        size_t invalidate_all(const std::string& session_id);
        size_t clear();

        size_t size() const;
        size_t size(const std::string& session_id) const;

        cache_stats stats() const;

      private:
        struct cache_key {
            std::string session_id{};
            std::string unit_id{};
            bool operator==(const cache_key&) const = default;
        };

        struct cache_key_hash {
            size_t operator()(const cache_key& key) const noexcept;
        };

        mutable std::shared_mutex mutex_;
        std::unordered_map<cache_key, artifact_ptr, cache_key_hash> entries_;
        mutable std::atomic<size_t> hits_{0};
        mutable std::atomic<size_t> misses_{0};
    };

    /*
     * Stand-in for the external compiler: an artifact is the FNV-1a fingerprint of the unit's
     * documents in order. A document that cannot be read contributes its path only.
     */
    class unit_compiler {
      public:
        explicit unit_compiler(clock_fn clock = system_now);

        compiled_artifact compile(const workspace::unit_descriptor& unit) const;

      private:
        clock_fn clock_;
    };

}  // namespace ripple::cache
