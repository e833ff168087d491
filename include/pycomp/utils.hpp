#pragma once

#include <algorithm>
#include <charconv>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace pycomp {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

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

        constexpr bool is_space(char c) {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
        }

        constexpr std::string_view trim_view(std::string_view value) {
            while (!value.empty() && is_space(value.front())) {
                value.remove_prefix(1U);
            }
            while (!value.empty() && is_space(value.back())) {
                value.remove_suffix(1U);
            }
            return value;
        }

        constexpr std::string_view trim_chars(std::string_view value, char c) {
            while (!value.empty() && value.front() == c) {
                value.remove_prefix(1U);
            }
            while (!value.empty() && value.back() == c) {
                value.remove_suffix(1U);
            }
            return value;
        }

        constexpr size_t leading_whitespace(std::string_view line) {
            size_t n = 0U;
            while (n < line.size() && (line[n] == ' ' || line[n] == '\t' || line[n] == '\f')) {
                ++n;
            }
            return n;
        }

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        inline std::string replace_all(std::string_view text, std::string_view from, std::string_view to) {
            std::string out{};
            if (from.empty()) {
                return std::string{text};
            }
            size_t cursor = 0U;
            while (true) {
                auto pos = text.find(from, cursor);
                if (pos == std::string_view::npos) {
                    out.append(text.substr(cursor));
                    break;
                }
                out.append(text.substr(cursor, pos - cursor));
                out.append(to);
                cursor = pos + from.size();
            }
            return out;
        }

        // Splits on '\n'; each returned line keeps its terminating newline.
        inline std::vector<std::string> split_lines_keepends(std::string_view text) {
            std::vector<std::string> lines{};
            size_t cursor = 0U;
            while (cursor < text.size()) {
                auto end = text.find('\n', cursor);
                if (end == std::string_view::npos) {
                    lines.emplace_back(text.substr(cursor));
                    break;
                }
                lines.emplace_back(text.substr(cursor, end - cursor + 1U));
                cursor = end + 1U;
            }
            return lines;
        }

        inline void append_unique(std::vector<std::string>& values, std::string value) {
            if (value.empty()) {
                return;
            }
            if (std::ranges::find(values, value) != values.end()) {
                return;
            }
            values.push_back(std::move(value));
        }

    }  // namespace utils

}  // namespace pycomp
