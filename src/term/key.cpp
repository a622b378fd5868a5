#include "tabterm/term/key.hpp"

#include <algorithm>
#include <array>

#include "tabterm/core/parse.hpp"

namespace tabterm {

    namespace {

        struct named_key {
            std::string_view name;
            key              value;
        };

        // First entry wins when formatting, so canonical names come first.
        constexpr std::array named_keys{
            named_key{"tab", tab_key},
            named_key{"enter", enter_key},
            named_key{"space", key::character(U' ')},
            named_key{"esc", key::named(key_kind::esc)},
            named_key{"escape", key::named(key_kind::esc)},
            named_key{"backspace", key::named(key_kind::backspace)},
            named_key{"left", key::named(key_kind::left)},
            named_key{"right", key::named(key_kind::right)},
            named_key{"up", key::named(key_kind::up)},
            named_key{"down", key::named(key_kind::down)},
            named_key{"home", key::named(key_kind::home)},
            named_key{"end", key::named(key_kind::end)},
            named_key{"pageup", key::named(key_kind::page_up)},
            named_key{"pagedown", key::named(key_kind::page_down)},
            named_key{"backtab", key::named(key_kind::back_tab)},
            named_key{"delete", key::named(key_kind::delete_key)},
            named_key{"insert", key::named(key_kind::insert)},
            named_key{"null", key::named(key_kind::null)},
        };

        struct utf8_char {
            char32_t    cp  = 0;
            std::size_t len = 0;
        };

        constexpr char32_t replacement_char = 0xFFFD;

        [[nodiscard]] utf8_char decode_utf8(const std::string_view s) noexcept {
            if (s.empty()) return {};
            const auto  lead = static_cast<unsigned char>(s[0]);
            std::size_t len  = 0;
            char32_t    cp   = 0;
            if (lead < 0x80) return {lead, 1};
            if ((lead & 0xE0) == 0xC0) {
                len = 2;
                cp  = lead & 0x1F;
            } else if ((lead & 0xF0) == 0xE0) {
                len = 3;
                cp  = lead & 0x0F;
            } else if ((lead & 0xF8) == 0xF0) {
                len = 4;
                cp  = lead & 0x07;
            } else {
                return {replacement_char, 1};
            }
            if (s.size() < len) return {replacement_char, 1};
            for (std::size_t i = 1; i < len; ++i) {
                const auto c = static_cast<unsigned char>(s[i]);
                if ((c & 0xC0) != 0x80) return {replacement_char, 1};
                cp = (cp << 6) | (c & 0x3F);
            }
            return {cp, len};
        }

        template<std::size_t N>
        void append_utf8(text_buf<N> &out, const char32_t cp) {
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        // Character after a modifier: "space" and friends by name, anything else as UTF-8.
        template<std::size_t N>
        void append_chord_char(text_buf<N> &out, const char32_t cp) {
            const auto it = std::ranges::find(named_keys, key::character(cp), &named_key::value);
            if (it != named_keys.end()) {
                out.append("{}", it->name);
            } else {
                append_utf8(out, cp);
            }
        }

        // Single code point, or nullopt if the text is empty or longer than one.
        [[nodiscard]] std::optional<char32_t> single_code_point(const std::string_view s) noexcept {
            const auto [cp, len] = decode_utf8(s);
            if (len == 0 || len != s.size()) return std::nullopt;
            return cp;
        }

        [[nodiscard]] decoded_key decode_control_byte(const unsigned char b) noexcept {
            switch (b) {
                case 0x00:
                    return {key::named(key_kind::null), 1};
                case '\t':
                    return {tab_key, 1};
                case '\n':
                case '\r':
                    return {enter_key, 1};
                case 0x7F:
                    return {key::named(key_kind::backspace), 1};
                default:
                    break;
            }
            if (b >= 0x01 && b <= 0x1A) return {key::ctrl(U'a' + (b - 0x01)), 1};
            // 0x1C..0x1F are reported as ctrl+4..ctrl+7
            return {key::ctrl(U'4' + (b - 0x1C)), 1};
        }

        [[nodiscard]] key tilde_key(const int param) noexcept {
            switch (param) {
                case 1:
                case 7:
                    return key::named(key_kind::home);
                case 2:
                    return key::named(key_kind::insert);
                case 3:
                    return key::named(key_kind::delete_key);
                case 4:
                case 8:
                    return key::named(key_kind::end);
                case 5:
                    return key::named(key_kind::page_up);
                case 6:
                    return key::named(key_kind::page_down);
                default:
                    break;
            }
            if (param >= 11 && param <= 15) return key::function(static_cast<std::uint8_t>(param - 10));
            if (param >= 17 && param <= 21) return key::function(static_cast<std::uint8_t>(param - 11));
            if (param == 23 || param == 24) return key::function(static_cast<std::uint8_t>(param - 12));
            return key::named(key_kind::unknown);
        }

        [[nodiscard]] key final_byte_key(const char final_byte) noexcept {
            switch (final_byte) {
                case 'A':
                    return key::named(key_kind::up);
                case 'B':
                    return key::named(key_kind::down);
                case 'C':
                    return key::named(key_kind::right);
                case 'D':
                    return key::named(key_kind::left);
                case 'H':
                    return key::named(key_kind::home);
                case 'F':
                    return key::named(key_kind::end);
                case 'Z':
                    return key::named(key_kind::back_tab);
                case 'P':
                    return key::function(1);
                case 'Q':
                    return key::function(2);
                case 'R':
                    return key::function(3);
                case 'S':
                    return key::function(4);
                default:
                    return key::named(key_kind::unknown);
            }
        }

        // bytes starts with ESC '['
        [[nodiscard]] decoded_key decode_csi(const std::string_view bytes) noexcept {
            std::size_t i = 2;
            while (i < bytes.size()) {
                const auto c = static_cast<unsigned char>(bytes[i]);
                if (c >= 0x40 && c <= 0x7E) break;
                ++i;
            }
            if (i >= bytes.size()) return {key::named(key_kind::unknown), bytes.size()};

            const char             final_byte = bytes[i];
            const std::string_view params     = bytes.substr(2, i - 2);
            if (final_byte == '~') {
                // Only the first parameter selects the key; modifiers after ';' are ignored.
                const auto first = params.substr(0, params.find(';'));
                return {tilde_key(parse::parse_int(first, -1)), i + 1};
            }
            return {final_byte_key(final_byte), i + 1};
        }

    } // namespace

    text_buf<32> to_string(const key &k) {
        if (const auto it = std::ranges::find(named_keys, k, &named_key::value); it != named_keys.end()) {
            return text_buf<32>("{}", it->name);
        }

        text_buf<32> out;
        switch (k.kind) {
            case key_kind::character:
                append_utf8(out, k.ch);
                break;
            case key_kind::ctrl:
                out.append("ctrl+");
                append_chord_char(out, k.ch);
                break;
            case key_kind::alt:
                out.append("alt+");
                append_chord_char(out, k.ch);
                break;
            case key_kind::function:
                out.append("f{}", static_cast<unsigned>(k.ch));
                break;
            default:
                out.append("unknown");
                break;
        }
        return out;
    }

    std::optional<key> parse_key(std::string_view text) noexcept {
        text = parse::trim(text);
        if (text.empty()) return std::nullopt;

        for (const auto &[name, value]: named_keys) {
            if (parse::iequals(name, text)) return value;
        }

        const auto with_modifier = [&](const std::string_view prefix) -> std::optional<char32_t> {
            if (text.size() <= prefix.size() || !parse::iequals(text.substr(0, prefix.size()), prefix)) {
                return std::nullopt;
            }
            const auto rest = text.substr(prefix.size());
            for (const auto &[name, value]: named_keys) {
                if (value.kind == key_kind::character && parse::iequals(name, rest)) return value.ch;
            }
            return single_code_point(rest);
        };

        if (const auto c = with_modifier("ctrl+")) return key::ctrl(*c);
        if (const auto c = with_modifier("alt+")) return key::alt(*c);

        if (text.size() > 1 && (text[0] == 'f' || text[0] == 'F')) {
            if (const auto n = parse::try_parse_int(text.substr(1)); n && *n >= 1 && *n <= 24) {
                return key::function(static_cast<std::uint8_t>(*n));
            }
            return std::nullopt;
        }

        if (const auto c = single_code_point(text)) return key::character(*c);
        return std::nullopt;
    }

    std::optional<decoded_key> decode_key(const std::string_view bytes) noexcept {
        if (bytes.empty()) return std::nullopt;

        const auto lead = static_cast<unsigned char>(bytes[0]);
        if (lead == 0x1B) {
            if (bytes.size() == 1) return decoded_key{key::named(key_kind::esc), 1};
            if (bytes[1] == '[') return decode_csi(bytes);
            if (bytes[1] == 'O') {
                if (bytes.size() < 3) return decoded_key{key::named(key_kind::unknown), bytes.size()};
                return decoded_key{final_byte_key(bytes[2]), 3};
            }
            const auto [cp, len] = decode_utf8(bytes.substr(1));
            return decoded_key{key::alt(cp), 1 + len};
        }
        if (lead < 0x20 || lead == 0x7F) return decode_control_byte(lead);

        const auto [cp, len] = decode_utf8(bytes);
        return decoded_key{key::character(cp), len};
    }

    std::vector<key> decode_keys(std::string_view bytes) {
        std::vector<key> keys;
        while (const auto decoded = decode_key(bytes)) {
            if (decoded->value.kind != key_kind::unknown) keys.push_back(decoded->value);
            bytes.remove_prefix(decoded->consumed);
        }
        return keys;
    }

} // namespace tabterm
