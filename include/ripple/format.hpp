#pragma once

#include "utils.hpp"

#include <array>
#include <chrono>
#include <format>
#include <string>

namespace ripple {
    namespace detail {
        template <size_t N>
        struct string_literal {
            std::array<char, N> str;

            consteval string_literal(const char (&s)[N]) { std::ranges::copy(s, s + N, str.begin()); }
            constexpr std::string_view sv() const { return {str.data(), N - 1}; }
        };

        template <string_literal Format>
        struct format_wrapper {
            consteval format_wrapper() = default;

            template <typename... T>
            constexpr auto operator()(T&&... args) && {
                return std::format(Format.sv(), std::forward<T>(args)...);
            }
        };
    }  // namespace detail

    namespace literals {
        template <detail::string_literal Format>
        inline consteval auto operator""_format() {
            return detail::format_wrapper<Format>{};
        }
    }  // namespace literals

    // UTC, millisecond precision: 2026-01-31T12:00:00.250Z
    inline std::string format_timestamp(sys_time tp) {
        return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::milliseconds>(tp));
    }

    inline std::string format_duration(std::chrono::milliseconds ms) {
        if (ms.count() % 1000 == 0) {
            return std::format("{}s", ms.count() / 1000);
        }
        return std::format("{}ms", ms.count());
    }
}  // namespace ripple

