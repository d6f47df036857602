#include "platform.hpp"

#include "ripple/error.hpp"
#include "ripple/format.hpp"
#include "ripple/log.hpp"
#include "ripple/watch.hpp"
#include "ripple/workspace.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

#if RIPPLE_PLATFORM_LINUX
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#endif

namespace ripple::watch {

    using namespace ripple::literals;

    namespace {

#if RIPPLE_PLATFORM_LINUX
        constexpr uint32_t watch_mask =
                IN_MODIFY | IN_CLOSE_WRITE | IN_CREATE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO;

        std::string errno_message() {
            return std::error_code{errno, std::generic_category()}.message();
        }

        std::optional<event_kind> kind_of(uint32_t mask) {
            if ((mask & IN_MOVED_FROM) != 0) {
                return event_kind::renamed_from;
            }
            if ((mask & IN_MOVED_TO) != 0) {
                return event_kind::renamed_to;
            }
            if ((mask & IN_CREATE) != 0) {
                return event_kind::created;
            }
            if ((mask & IN_DELETE) != 0) {
                return event_kind::deleted;
            }
            if ((mask & (IN_MODIFY | IN_CLOSE_WRITE)) != 0) {
                return event_kind::modified;
            }
            return std::nullopt;
        }

        /*
         * One inotify instance per subscription, with a watch on every directory below the root.
         * Directories created (or moved in) later get a watch as their events arrive. A reader thread
         * polls the inotify fd together with a wake pipe; writing to the pipe ends the thread.
         */
        class inotify_subscription {
          public:
            inotify_subscription(
                    std::filesystem::path root, std::vector<std::string> patterns, event_callback callback)
                : root_{std::move(root)}, patterns_{std::move(patterns)}, callback_{std::move(callback)} {
                std::error_code ec{};
                if (!std::filesystem::is_directory(root_, ec)) {
                    throw error{error_kind::watch_setup, "cannot watch {}: not a directory"_format(root_.string())};
                }

                fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
                if (fd_ < 0) {
                    throw error{error_kind::watch_setup, "inotify_init1 failed: {}"_format(errno_message())};
                }
                if (::pipe2(wake_, O_NONBLOCK | O_CLOEXEC) != 0) {
                    auto message = errno_message();
                    ::close(fd_);
                    throw error{error_kind::watch_setup, "pipe2 failed: {}"_format(message)};
                }

                try {
                    add_tree(root_, true);
                } catch (...) {
                    close_fds();
                    throw;
                }

                reader_ = std::jthread{[this](std::stop_token stop) { run(std::move(stop)); }};
            }

            ~inotify_subscription() {
                reader_.request_stop();
                char byte{'x'};
                [[maybe_unused]] auto n = ::write(wake_[1], &byte, 1);
                if (reader_.joinable()) {
                    reader_.join();
                }
                close_fds();
            }

            inotify_subscription(const inotify_subscription&) = delete;
            inotify_subscription& operator=(const inotify_subscription&) = delete;

          private:
            void close_fds() {
                ::close(fd_);
                ::close(wake_[0]);
                ::close(wake_[1]);
            }

            // the root must be watchable; failures below it are logged and skipped
            void add_tree(const std::filesystem::path& dir, bool required) {
                add_directory(dir, required);

                std::error_code ec{};
                auto it = std::filesystem::recursive_directory_iterator{
                        dir, std::filesystem::directory_options::skip_permission_denied, ec};
                for (; !ec && it != std::filesystem::recursive_directory_iterator{}; it.increment(ec)) {
                    if (it->is_directory(ec) && !it->is_symlink(ec)) {
                        add_directory(it->path(), false);
                    }
                }
                if (ec) {
                    log_warn("incomplete scan of ", dir.string(), ": ", ec.message());
                }
            }

            void add_directory(const std::filesystem::path& dir, bool required) {
                auto wd = ::inotify_add_watch(fd_, dir.c_str(), watch_mask | IN_ONLYDIR);
                if (wd < 0) {
                    auto message = "inotify_add_watch({}) failed: {}"_format(dir.string(), errno_message());
                    if (required) {
                        throw error{error_kind::watch_setup, message};
                    }
                    log_warn("skipping directory: ", message);
                    return;
                }
                directories_.insert_or_assign(wd, dir);
            }

            void run(std::stop_token stop) {
                pollfd fds[2]{};
                fds[0] = {.fd = fd_, .events = POLLIN, .revents = 0};
                fds[1] = {.fd = wake_[0], .events = POLLIN, .revents = 0};

                while (!stop.stop_requested()) {
                    int ret = ::poll(fds, 2, -1);
                    if (ret < 0) {
                        if (errno == EINTR) {
                            continue;
                        }
                        log_error("poll on inotify fd failed: ", errno_message());
                        return;
                    }
                    if ((fds[1].revents & POLLIN) != 0) {
                        return;
                    }
                    if ((fds[0].revents & POLLIN) != 0) {
                        drain();
                    }
                }
            }

            void drain() {
                alignas(inotify_event) char buf[4096];
                for (;;) {
                    auto n = ::read(fd_, buf, sizeof(buf));
                    if (n <= 0) {
                        if (n < 0 && errno != EAGAIN && errno != EINTR) {
                            log_warn("read on inotify fd failed: ", errno_message());
                        }
                        return;
                    }
                    for (char* p = buf; p < buf + n;) {
                        const auto* ev = reinterpret_cast<const inotify_event*>(p);
                        dispatch(*ev);
                        p += sizeof(inotify_event) + ev->len;
                    }
                }
            }

            void dispatch(const inotify_event& ev) {
                if ((ev.mask & IN_Q_OVERFLOW) != 0) {
                    log_warn("inotify queue overflowed under ", root_.string(), "; some changes were lost");
                    return;
                }
                auto dir = directories_.find(ev.wd);
                if (dir == directories_.end()) {
                    return;
                }
                if ((ev.mask & IN_IGNORED) != 0) {
                    directories_.erase(dir);
                    return;
                }
                if (ev.len == 0) {
                    return;
                }

                auto path = dir->second / ev.name;
                if ((ev.mask & IN_ISDIR) != 0) {
                    if ((ev.mask & (IN_CREATE | IN_MOVED_TO)) != 0) {
                        add_tree(path, false);
                    }
                    return;
                }

                auto kind = kind_of(ev.mask);
                if (!kind || !workspace::matches_patterns(path, patterns_)) {
                    return;
                }
                callback_(file_event{path, *kind});
            }

            std::filesystem::path root_;
            std::vector<std::string> patterns_;
            event_callback callback_;
            int fd_{-1};
            int wake_[2]{-1, -1};
            std::unordered_map<int, std::filesystem::path> directories_;
            std::jthread reader_;
        };

        class inotify_backend final : public watch_backend {
          public:
            void subscribe(
                    const std::string& key,
                    const std::filesystem::path& root,
                    const std::vector<std::string>& patterns,
                    event_callback callback) override {
                auto sub = std::make_unique<inotify_subscription>(
                        workspace::normalize_path(root), patterns, std::move(callback));
                std::unique_ptr<inotify_subscription> previous{};
                {
                    std::lock_guard lock{mutex_};
                    auto& slot = subscriptions_[key];
                    previous = std::exchange(slot, std::move(sub));
                }
            }

            void unsubscribe(const std::string& key) override {
                std::unique_ptr<inotify_subscription> sub{};
                {
                    std::lock_guard lock{mutex_};
                    if (auto node = subscriptions_.extract(key)) {
                        sub = std::move(node.mapped());
                    }
                }
            }

          private:
            std::mutex mutex_;
            std::unordered_map<std::string, std::unique_ptr<inotify_subscription>> subscriptions_;
        };
#else
        class unsupported_backend final : public watch_backend {
          public:
            void subscribe(
                    const std::string&,
                    const std::filesystem::path& root,
                    const std::vector<std::string>&,
                    event_callback) override {
                throw error{
                        error_kind::watch_setup,
                        "cannot watch {}: no filesystem watch support on this platform"_format(root.string())};
            }

            void unsubscribe(const std::string&) override {}
        };
#endif

    }  // namespace

    std::unique_ptr<watch_backend> make_platform_backend() {
        log_debug("watch backend: ", internal::platform::watch_backend_name);
#if RIPPLE_PLATFORM_LINUX
        return std::make_unique<inotify_backend>();
#else
        return std::make_unique<unsupported_backend>();
#endif
    }

}  // namespace ripple::watch
