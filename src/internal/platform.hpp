#pragma once

#include <string_view>

namespace ripple::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = RIPPLE_PLATFORM_LINUX != 0;
    inline constexpr bool is_macos = RIPPLE_PLATFORM_MACOS != 0;

    // name of the backend `make_platform_backend()` returns
    inline constexpr auto watch_backend_name = is_linux ? "inotify"sv : "unsupported"sv;

}  // namespace ripple::internal::platform
