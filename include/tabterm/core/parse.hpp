// parse.hpp - noexcept string parsing helpers for config values and key chords
//
// Usage:
//   int v = tabterm::parse::parse_int("1", -1);                // 1
//   auto n = tabterm::parse::try_parse<unsigned>("12");        // std::optional{12u}
//   auto t = tabterm::parse::trim("  ctrl+t \r");              // "ctrl+t"
//   bool same = tabterm::parse::iequals("Ctrl", "ctrl");       // true
//
// All parse functions are noexcept. Bad input returns the default or nullopt.
#pragma once

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <concepts>
#include <optional>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace tabterm::parse {

    // Integral types that we can parse (excludes bool and all char-like types)
    template<typename T>
    concept parseable_integral = std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char> &&
                                 !std::is_same_v<T, wchar_t> && !std::is_same_v<T, char8_t> &&
                                 !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t>;

    // Whole-string parse. Trailing garbage ("12x") is a failure.
    template<parseable_integral T>
    [[nodiscard]]
    constexpr std::optional<T> try_parse(const std::string_view sv) noexcept {
        if (sv.empty()) return std::nullopt;
        T result{};
        auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
        if (ec == std::errc{} && ptr == sv.data() + sv.size()) return result;
        return std::nullopt;
    }

    template<parseable_integral T>
    [[nodiscard]]
    constexpr T parse_value(const std::string_view sv, const T default_val = T{}) noexcept {
        return try_parse<T>(sv).value_or(default_val);
    }

    [[nodiscard]]
    constexpr int parse_int(const std::string_view sv, const int default_val = 0) noexcept {
        return parse_value<int>(sv, default_val);
    }

    [[nodiscard]]
    constexpr std::optional<int> try_parse_int(const std::string_view sv) noexcept {
        return try_parse<int>(sv);
    }

    [[nodiscard]]
    constexpr std::string_view trim(std::string_view sv) noexcept {
        const auto start = sv.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos) return {};
        return sv.substr(start, sv.find_last_not_of(" \t\r\n") - start + 1);
    }

    [[nodiscard]]
    constexpr char ascii_lower(const char c) noexcept {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    [[nodiscard]]
    constexpr bool iequals(const std::string_view a, const std::string_view b) noexcept {
        return std::ranges::equal(a, b, [](const char x, const char y) { return ascii_lower(x) == ascii_lower(y); });
    }

    // Split "key=value" at the first '='. Both halves are trimmed.
    [[nodiscard]]
    constexpr std::optional<std::pair<std::string_view, std::string_view>>
    split_assignment(const std::string_view line) noexcept {
        const std::size_t eq = line.find('=');
        if (eq == std::string_view::npos) return std::nullopt;
        return std::pair{trim(line.substr(0, eq)), trim(line.substr(eq + 1))};
    }

} // namespace tabterm::parse
