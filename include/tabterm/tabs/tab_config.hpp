/// @file tab_config.hpp
/// @brief Reserved-chord keymap and header style, with versioned key=value persistence.
///
/// Usage:
/// @code
///   auto cfg = tabterm::load_tab_config("tabs.conf");
///   if (!cfg) Log::warning("App", cfg.error().message().sv());
///   view.set_config(cfg.value_or(tabterm::tab_config{}));
///
///   // File format:
///   //   version=1
///   //   new_tab=ctrl+t
///   //   close_tab=ctrl+w
///   //   next_tab=tab
///   //   header_color=blue
/// @endcode
#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>

#include "tabterm/core/error.hpp"
#include "tabterm/term/escape.hpp"
#include "tabterm/term/key.hpp"

namespace tabterm {

    enum class tab_action : std::uint8_t { new_tab, close_tab, next_tab };

    [[nodiscard]] constexpr std::string_view to_string(const tab_action action) noexcept {
        switch (action) {
            case tab_action::new_tab:
                return "new_tab";
            case tab_action::close_tab:
                return "close_tab";
            case tab_action::next_tab:
                return "next_tab";
        }
        return "unknown";
    }

    /// @brief Chords intercepted before a key reaches the host's on_key_sub.
    struct key_map {
        key new_tab   = key::ctrl(U't');
        key close_tab = key::ctrl(U'w');
        key next_tab  = tab_key;

        /// @brief The reserved chords as a lookup table, in check order.
        [[nodiscard]] constexpr std::array<std::pair<key, tab_action>, 3> table() const noexcept {
            return {{
                {new_tab, tab_action::new_tab},
                {close_tab, tab_action::close_tab},
                {next_tab, tab_action::next_tab},
            }};
        }

        [[nodiscard]] constexpr std::optional<tab_action> find(const key &k) const noexcept {
            for (const auto &[chord, action]: table()) {
                if (chord == k) return action;
            }
            return std::nullopt;
        }

        [[nodiscard]] constexpr key &binding(const tab_action action) noexcept {
            switch (action) {
                case tab_action::new_tab:
                    return new_tab;
                case tab_action::close_tab:
                    return close_tab;
                case tab_action::next_tab:
                    break;
            }
            return next_tab;
        }

        [[nodiscard]] constexpr bool operator==(const key_map &) const noexcept = default;
    };

    struct tab_config {
        static constexpr int file_version = 1; ///< Bumped on breaking format changes.

        key_map          keys{};
        term::ansi_color header_color = term::ansi_color::blue;

        [[nodiscard]] constexpr bool operator==(const tab_config &) const noexcept = default;
    };

    /// @brief Reject configs where two actions share a chord (duplicate_binding).
    [[nodiscard]] tab_expected_void validate(const tab_config &cfg);

    /**
     * @brief Load a config file.
     *
     * Unknown keys are logged and skipped. A missing version line is logged and version 1
     * is assumed.
     * @return file_open_failed if the file can't be read, file_malformed for a bad chord,
     *         color, or duplicate binding.
     */
    [[nodiscard]] tab_expected<tab_config> load_tab_config(const std::filesystem::path &path);

    /// @brief Write cfg in the format load_tab_config reads. Refuses an invalid config before touching the file.
    [[nodiscard]] tab_expected_void save_tab_config(const tab_config &cfg, const std::filesystem::path &path);

} // namespace tabterm
