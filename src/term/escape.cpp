#include "tabterm/term/escape.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "tabterm/core/parse.hpp"

namespace tabterm::term {

    namespace {

        struct color_entry {
            ansi_color       color;
            std::string_view name;
            int              sgr;
        };

        constexpr std::array color_table{
            color_entry{ansi_color::default_color, "default", 39},
            color_entry{ansi_color::black, "black", 30},
            color_entry{ansi_color::red, "red", 31},
            color_entry{ansi_color::green, "green", 32},
            color_entry{ansi_color::yellow, "yellow", 33},
            color_entry{ansi_color::blue, "blue", 34},
            color_entry{ansi_color::magenta, "magenta", 35},
            color_entry{ansi_color::cyan, "cyan", 36},
            color_entry{ansi_color::white, "white", 37},
            color_entry{ansi_color::bright_black, "bright_black", 90},
            color_entry{ansi_color::bright_red, "bright_red", 91},
            color_entry{ansi_color::bright_green, "bright_green", 92},
            color_entry{ansi_color::bright_yellow, "bright_yellow", 93},
            color_entry{ansi_color::bright_blue, "bright_blue", 94},
            color_entry{ansi_color::bright_magenta, "bright_magenta", 95},
            color_entry{ansi_color::bright_cyan, "bright_cyan", 96},
            color_entry{ansi_color::bright_white, "bright_white", 97},
        };

        static_assert(color_table.size() == std::to_underlying(ansi_color::bright_white) + 1,
                      "color_table must cover every ansi_color");

        [[nodiscard]] constexpr const color_entry &entry_for(const ansi_color color) noexcept {
            return color_table[std::to_underlying(color)];
        }

        [[nodiscard]] constexpr bool is_continuation_byte(const char c) noexcept {
            return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
        }

        // Length of the escape sequence starting at s[pos] (s[pos] == ESC).
        [[nodiscard]] std::size_t escape_length(const std::string_view s, const std::size_t pos) noexcept {
            if (pos + 1 >= s.size()) return 1;
            if (s[pos + 1] != '[') return 2;
            std::size_t i = pos + 2;
            while (i < s.size()) {
                const auto c = static_cast<unsigned char>(s[i++]);
                if (c >= 0x40 && c <= 0x7E) break;
            }
            return i - pos;
        }

    } // namespace

    std::string_view to_string(const ansi_color color) noexcept {
        return entry_for(color).name;
    }

    std::optional<ansi_color> parse_color(const std::string_view name) noexcept {
        const auto it = std::ranges::find_if(
            color_table, [&](const color_entry &e) { return parse::iequals(e.name, parse::trim(name)); });
        if (it == color_table.end()) return std::nullopt;
        return it->color;
    }

    text_buf<16> fg(const ansi_color color) {
        return text_buf<16>("\x1b[{}m", entry_for(color).sgr);
    }

    std::string header_color(const ansi_color color) {
        std::string out{bold()};
        out += fg(color).sv();
        return out;
    }

    text_buf<32> goto_xy(const std::size_t x, const std::size_t y) {
        return text_buf<32>("\x1b[{};{}H", y, x);
    }

    std::size_t printable_width(const std::string_view s) noexcept {
        std::size_t width = 0;
        std::size_t i     = 0;
        while (i < s.size()) {
            if (s[i] == '\x1b') {
                i += escape_length(s, i);
                continue;
            }
            if (!is_continuation_byte(s[i])) ++width;
            ++i;
        }
        return width;
    }

    std::string_view truncate_to_width(const std::string_view s, const std::size_t max_width) noexcept {
        std::size_t width = 0;
        std::size_t i     = 0;
        while (i < s.size()) {
            if (s[i] == '\x1b') {
                i += escape_length(s, i);
                continue;
            }
            if (!is_continuation_byte(s[i])) {
                if (width == max_width) return s.substr(0, i);
                ++width;
            }
            ++i;
        }
        return s;
    }

} // namespace tabterm::term
