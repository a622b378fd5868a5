/// @file key.hpp
/// @brief Key-event value, its text form, and decoding from raw terminal input.
///
/// Usage:
/// @code
///   const auto k = tabterm::key::ctrl('t');
///   auto text = tabterm::to_string(k);                 // "ctrl+t"
///   auto same = tabterm::parse_key("Ctrl+T");          // std::optional{key::ctrl('t')}
///
///   for (const key &k : tabterm::decode_keys(bytes_read_from_tty)) {
///       if (auto r = view.on_key(k); !r) report(r.error());
///   }
/// @endcode
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "tabterm/core/text_buf.hpp"

namespace tabterm {

    enum class key_kind : std::uint8_t {
        null,
        character,
        ctrl,
        alt,
        backspace,
        left,
        right,
        up,
        down,
        home,
        end,
        page_up,
        page_down,
        back_tab,
        delete_key,
        insert,
        function,
        esc,
        unknown
    };

    /// @brief A single key press. ch holds the code point (character/ctrl/alt) or the F-key number.
    struct key {
        key_kind kind = key_kind::null;
        char32_t ch   = 0;

        [[nodiscard]] static constexpr key character(const char32_t c) noexcept { return {key_kind::character, c}; }
        /// Letters are stored lowercase; terminals can't tell ctrl+T from ctrl+t.
        [[nodiscard]] static constexpr key ctrl(const char32_t c) noexcept {
            return {key_kind::ctrl, (c >= U'A' && c <= U'Z') ? c - U'A' + U'a' : c};
        }
        [[nodiscard]] static constexpr key alt(const char32_t c) noexcept { return {key_kind::alt, c}; }
        [[nodiscard]] static constexpr key function(const std::uint8_t n) noexcept { return {key_kind::function, n}; }
        [[nodiscard]] static constexpr key named(const key_kind k) noexcept { return {k, 0}; }

        [[nodiscard]] constexpr bool operator==(const key &) const noexcept = default;
    };

    inline constexpr key tab_key   = key::character(U'\t');
    inline constexpr key enter_key = key::character(U'\n');

    /// @brief Format a key as config text ("ctrl+t", "alt+x", "alt+space", "tab", "f5", "left", "a").
    [[nodiscard]] text_buf<32> to_string(const key &k);

    /// @brief Inverse of to_string. Case-insensitive for names and modifiers.
    [[nodiscard]] std::optional<key> parse_key(std::string_view text) noexcept;

    struct decoded_key {
        key         value;
        std::size_t consumed = 0; ///< Bytes of input used.
    };

    /**
     * @brief Decode the first key in a buffer of raw terminal input.
     *
     * Handles printable UTF-8, control bytes, DEL, ESC-prefixed alt chords, and the
     * common CSI / SS3 sequences (arrows, home/end, paging, insert/delete, F1-F12,
     * back-tab). Unrecognized sequences come back as key_kind::unknown so the caller
     * can skip them.
     * @return nullopt only for empty input.
     */
    [[nodiscard]] std::optional<decoded_key> decode_key(std::string_view bytes) noexcept;

    /// @brief Decode every key in a buffer, dropping unknown sequences.
    [[nodiscard]] std::vector<key> decode_keys(std::string_view bytes);

} // namespace tabterm
