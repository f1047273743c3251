#pragma once

#include "utils.hpp"

#include <array>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace runway {
    using namespace std::string_view_literals;

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

    // Terminal tones used for operator-facing status lines
    enum class tone : uint8_t {
        plain,
        heading,
        info,
        success,
        warning,
        error,
    };

    namespace ansi {
        inline constexpr auto red = "\x1b[0;31m"sv;
        inline constexpr auto green = "\x1b[0;32m"sv;
        inline constexpr auto yellow = "\x1b[1;33m"sv;
        inline constexpr auto blue = "\x1b[0;34m"sv;
        inline constexpr auto reset = "\x1b[0m"sv;

        inline constexpr std::string_view for_tone(tone t) {
            switch (t) {
                case tone::heading:
                    return blue;
                case tone::info:
                case tone::warning:
                    return yellow;
                case tone::success:
                    return green;
                case tone::error:
                    return red;
                case tone::plain:
                    return {};
            }
            return {};
        }
    }  // namespace ansi

    struct console_style {
        bool color{false};

        std::string paint(tone t, std::string_view text) const {
            auto code = ansi::for_tone(t);
            if (!color || code.empty()) {
                return std::string{text};
            }
            std::string painted{};
            painted.reserve(code.size() + text.size() + ansi::reset.size());
            painted.append(code);
            painted.append(text);
            painted.append(ansi::reset);
            return painted;
        }
    };

}  // namespace runway
