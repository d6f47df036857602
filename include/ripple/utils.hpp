#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace ripple {

    using sys_time = std::chrono::system_clock::time_point;

    // Injectable wall clock; tests substitute a manual one
    using clock_fn = std::function<sys_time()>;

    inline sys_time system_now() {
        return std::chrono::system_clock::now();
    }

    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        // sorts and removes duplicates in place
        inline void sort_unique(std::vector<std::string>& values) {
            std::ranges::sort(values);
            auto [first, last] = std::ranges::unique(values);
            values.erase(first, last);
        }

        template <typename T>
        std::vector<T> take_front(const std::vector<T>& values, std::size_t limit) {
            if (values.size() <= limit) {
                return values;
            }
            return {values.begin(), values.begin() + static_cast<std::ptrdiff_t>(limit)};
        }

    }  // namespace utils

}  // namespace ripple
