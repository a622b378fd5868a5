// error.hpp - tab container error types with std::expected integration
//
// Usage:
//   auto pane = view.pop();
//   if (!pane) Log::error("TabView", pane.error().message().sv());
//
//   tabterm::tab_expected_void close_tab() override;
//   return tabterm::make_tab_error(tab_error_code::last_tab, "cannot close the only tab");
#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "tabterm/core/text_buf.hpp"

namespace tabterm {

    enum class tab_error_code : std::uint8_t {
        no_tabs,
        last_tab,
        index_out_of_range,
        tab_names_mismatch,
        pane_failed,
        file_open_failed,
        file_write_failed,
        file_malformed,
        duplicate_binding
    };

    [[nodiscard]] constexpr std::string_view to_string(const tab_error_code code) noexcept {
        using enum tab_error_code;
        switch (code) {
            case no_tabs:
                return "No tabs open";
            case last_tab:
                return "Cannot close the last tab";
            case index_out_of_range:
                return "Tab index out of range";
            case tab_names_mismatch:
                return "Tab names do not match tab count";
            case pane_failed:
                return "Pane operation failed";
            case file_open_failed:
                return "Could not open file";
            case file_write_failed:
                return "Failed to write file";
            case file_malformed:
                return "File contains invalid data";
            case duplicate_binding:
                return "Key bound to more than one action";
        }
        return "Unknown tab error";
    }

    struct tab_error {
        tab_error_code code;
        std::string    detail;

        explicit constexpr tab_error(const tab_error_code c) noexcept : code{c} {}
        explicit constexpr tab_error(const tab_error_code c, std::string d) : code{c}, detail{std::move(d)} {}

        [[nodiscard]] constexpr text_buf<256> message() const {
            const auto base = to_string(code);
            if (detail.empty()) return text_buf<256>("{}", base);
            return text_buf<256>("{}: {}", base, detail);
        }

        [[nodiscard]] constexpr std::string_view code_name() const noexcept { return to_string(code); }

        [[nodiscard]] constexpr bool operator==(const tab_error &other) const noexcept {
            return code == other.code && detail == other.detail;
        }

        friend std::ostream &operator<<(std::ostream &os, const tab_error &err) { return os << err.message().sv(); }
    };

    inline std::ostream &operator<<(std::ostream &os, const tab_error_code code) {
        return os << to_string(code);
    }

    template<typename T>
    using tab_expected      = std::expected<T, tab_error>;
    using tab_expected_void = std::expected<void, tab_error>;

    [[nodiscard]] constexpr std::unexpected<tab_error> make_tab_error(const tab_error_code code) {
        return std::unexpected{tab_error{code}};
    }

    // Not constexpr: the two-arg ctor takes std::string by value.
    [[nodiscard]] inline std::unexpected<tab_error> make_tab_error(const tab_error_code code, std::string detail) {
        return std::unexpected{tab_error{code, std::move(detail)}};
    }

} // namespace tabterm

template<>
struct std::hash<tabterm::tab_error_code> {
    constexpr std::size_t operator()(const tabterm::tab_error_code c) const noexcept { return std::to_underlying(c); }
};

template<>
struct std::formatter<tabterm::tab_error_code> {
    static constexpr auto parse(const std::format_parse_context &ctx) { return ctx.begin(); }

    static constexpr auto format(const tabterm::tab_error_code code, std::format_context &ctx) {
        return std::format_to(ctx.out(), "{}", tabterm::to_string(code));
    }
};

template<>
struct std::formatter<tabterm::tab_error> {
    static constexpr auto parse(const std::format_parse_context &ctx) { return ctx.begin(); }

    static constexpr auto format(const tabterm::tab_error &err, std::format_context &ctx) {
        if (err.detail.empty()) return std::format_to(ctx.out(), "{}", tabterm::to_string(err.code));
        return std::format_to(ctx.out(), "{}: {}", tabterm::to_string(err.code), err.detail);
    }
};
