// escape.hpp - ANSI escape primitives used to compose header strings
//
// Usage:
//   std::string s = std::string(tabterm::term::invert()) + "0:home" + std::string(tabterm::term::reset());
//   s += tabterm::term::goto_xy(10, 1).sv();
//   std::size_t w = tabterm::term::printable_width(s); // escapes don't count
//
// Cursor coordinates are 1-based, as in the terminal's own CUP sequence.
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "tabterm/core/text_buf.hpp"

namespace tabterm::term {

    enum class ansi_color : std::uint8_t {
        default_color,
        black,
        red,
        green,
        yellow,
        blue,
        magenta,
        cyan,
        white,
        bright_black,
        bright_red,
        bright_green,
        bright_yellow,
        bright_blue,
        bright_magenta,
        bright_cyan,
        bright_white
    };

    [[nodiscard]] std::string_view          to_string(ansi_color color) noexcept;
    [[nodiscard]] std::optional<ansi_color> parse_color(std::string_view name) noexcept;

    [[nodiscard]] constexpr std::string_view invert() noexcept { return "\x1b[7m"; }
    [[nodiscard]] constexpr std::string_view reset() noexcept { return "\x1b[0m"; }
    [[nodiscard]] constexpr std::string_view bold() noexcept { return "\x1b[1m"; }

    /// @brief SGR foreground sequence for a color ("\x1b[39m" for default_color).
    [[nodiscard]] text_buf<16> fg(ansi_color color);

    /// @brief Attribute run used as the base style of header lines (bold + foreground).
    [[nodiscard]] std::string header_color(ansi_color color = ansi_color::blue);

    /// @brief Cursor position sequence; x and y are 1-based.
    [[nodiscard]] text_buf<32> goto_xy(std::size_t x, std::size_t y);

    /**
     * @brief Count the columns a string occupies once painted.
     *
     * CSI sequences (ESC '[' ... final byte) and two-byte ESC sequences are skipped.
     * Each UTF-8 code point counts as one column.
     */
    [[nodiscard]] std::size_t printable_width(std::string_view s) noexcept;

    /// @brief Longest prefix of a plain (escape-free) string that fits in max_width columns.
    [[nodiscard]] std::string_view truncate_to_width(std::string_view s, std::size_t max_width) noexcept;

} // namespace tabterm::term
