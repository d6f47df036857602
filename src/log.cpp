#include "ripple/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace ripple::logging {

    namespace detail {
        static std::atomic<log_level> threshold{log_level::info};
        static std::atomic<std::ostream*> installed_sink{nullptr};
        static std::mutex write_mutex{};
    }  // namespace detail

    void set_level(log_level level) {
        detail::threshold.store(level, std::memory_order_relaxed);
    }

    log_level level() {
        return detail::threshold.load(std::memory_order_relaxed);
    }

    bool enabled(log_level lvl) {
        return lvl != log_level::off && lvl >= level();
    }

    void set_sink(std::ostream* sink) {
        std::lock_guard lock{detail::write_mutex};
        detail::installed_sink.store(sink, std::memory_order_relaxed);
    }

    void write(log_level lvl, const std::source_location& loc, std::string_view message) {
        std::lock_guard lock{detail::write_mutex};
        auto* sink = detail::installed_sink.load(std::memory_order_relaxed);
        auto& os = sink != nullptr ? *sink : std::cerr;
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] " << to_string(lvl) << ": " << message << '\n';
        os.flush();
    }

}  // namespace ripple::logging
