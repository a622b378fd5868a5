// text_buf.hpp - Stack-allocated formatted text buffer for labels and key names
//
// Usage:
//   tabterm::text_buf label{" {}:{}", index, name};
//   strip += label.sv();
//
//   tabterm::text_buf<16> chord;
//   chord.append("ctrl+");
//   chord.push_back('t');
//
// No heap allocation. Default capacity is 64 chars. Truncates silently on overflow.
#pragma once

#include <array>
#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace tabterm {

    // N = buffer capacity in bytes (including null terminator). Must be >= 2.
    template<std::size_t N = 64>
        requires(N >= 2)
    struct text_buf {
        std::array<char, N> buf{};
        char               *end_ptr = buf.data(); // points past the last written char

        constexpr text_buf() noexcept { buf[0] = '\0'; } // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)

        template<typename... Args>
        constexpr explicit text_buf(std::format_string<Args...> fmt, Args &&...args) {
            auto result = std::format_to_n(buf.data(), N - 1, fmt, std::forward<Args>(args)...);
            end_ptr     = result.out;
            *end_ptr    = '\0';
        }

        // end_ptr is an interior pointer and has to be rebased on copy/move
        constexpr text_buf(const text_buf &o) noexcept : buf(o.buf), end_ptr(buf.data() + o.size()) {}
        constexpr text_buf &operator=(const text_buf &o) noexcept {
            if (this != &o) {
                buf     = o.buf;
                end_ptr = buf.data() + o.size();
            }
            return *this;
        }
        constexpr text_buf(text_buf &&o) noexcept : text_buf(static_cast<const text_buf &>(o)) { o.reset(); }
        constexpr text_buf &operator=(text_buf &&o) noexcept {
            if (this != &o) {
                *this = static_cast<const text_buf &>(o);
                o.reset();
            }
            return *this;
        }

        [[nodiscard]] constexpr const char      *c_str() const noexcept { return buf.data(); }
        [[nodiscard]] constexpr std::string_view sv() const noexcept { return {buf.data(), end_ptr}; }
        [[nodiscard]] constexpr std::size_t      size() const noexcept {
            return static_cast<std::size_t>(end_ptr - buf.data());
        }
        [[nodiscard]] constexpr bool empty() const noexcept { return end_ptr == buf.data(); }
        [[nodiscard]] static constexpr std::size_t capacity() noexcept { return N - 1; }

        constexpr void reset() noexcept {
            end_ptr  = buf.data();
            *end_ptr = '\0';
        }

        // Append formatted text (truncates on overflow)
        template<typename... Args>
        constexpr void append(std::format_string<Args...> fmt, Args &&...args) {
            const auto remaining = static_cast<std::ptrdiff_t>((buf.data() + N - 1) - end_ptr);
            if (remaining <= 0) return;
            auto result = std::format_to_n(end_ptr, remaining, fmt, std::forward<Args>(args)...);
            end_ptr     = result.out;
            *end_ptr    = '\0';
        }

        constexpr void push_back(const char c) noexcept {
            if (size() >= capacity()) return;
            *end_ptr++ = c;
            *end_ptr   = '\0';
        }

        [[nodiscard]] std::string str() const { return std::string{sv()}; }

        [[nodiscard]] constexpr bool operator==(const text_buf &other) const noexcept { return sv() == other.sv(); }
        [[nodiscard]] constexpr bool operator==(const std::string_view other) const noexcept { return sv() == other; }
    };

} // namespace tabterm
