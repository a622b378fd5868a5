// tab_strip.hpp - right-aligned tab label run overlaid on a header line
//
// Usage:
//   auto strip = tabterm::compose_tab_strip(names, view.tab_count(), view.active_index(), 80,
//                                           term::ansi_color::blue);
//   if (strip) out = tabterm::compose_header(pane_header, *strip, coords, term::ansi_color::blue);
//
// Labels render as " i:name" (" i" when the name is absent). The active label is wrapped in
// invert ... reset + header color. The run is right-justified: its last column is the
// header's last column. When the run is wider than the header, labels left of the active
// tab are dropped first, then labels right of it, and finally the active label is cut.
#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "tabterm/core/error.hpp"
#include "tabterm/term/escape.hpp"
#include "tabterm/widget/geometry.hpp"

namespace tabterm {

    struct tab_strip {
        std::string text;          ///< Labels with highlight escapes, no cursor movement.
        std::size_t width     = 0; ///< Printable columns of text.
        std::size_t offset    = 0; ///< 0-based column where the strip starts within the header.
        std::size_t first_tab = 0; ///< First visible tab index.
        std::size_t last_tab  = 0; ///< One past the last visible tab index.
    };

    /// @brief Plain label for tab i, without highlight escapes.
    [[nodiscard]] std::string tab_label(std::size_t index, const std::optional<std::string> &name);

    /**
     * @brief Build the tab strip for a header of the given width.
     * @param names      One entry per tab, in tab order. Extra entries are ignored.
     * @param tab_count  Number of tabs to render.
     * @param active     Active tab index.
     * @param width      Header width in columns.
     * @return tab_names_mismatch if names has fewer than tab_count entries,
     *         index_out_of_range if active is not a valid tab.
     */
    [[nodiscard]] tab_expected<tab_strip> compose_tab_strip(std::span<const std::optional<std::string>> names,
                                                            std::size_t tab_count, std::size_t active,
                                                            std::size_t width, term::ansi_color header_color);

    /// @brief pane_header + header color + cursor move + strip.
    [[nodiscard]] std::string compose_header(std::string_view pane_header, const tab_strip &strip,
                                             const coordinates &coords, term::ansi_color header_color);

} // namespace tabterm
