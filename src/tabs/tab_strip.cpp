#include "tabterm/tabs/tab_strip.hpp"

#include <format>
#include <vector>

namespace tabterm {

    std::string tab_label(const std::size_t index, const std::optional<std::string> &name) {
        if (!name) return std::format(" {}", index);
        return std::format(" {}:{}", index, *name);
    }

    tab_expected<tab_strip> compose_tab_strip(const std::span<const std::optional<std::string>> names,
                                              const std::size_t tab_count, const std::size_t active,
                                              const std::size_t width, const term::ansi_color header_color) {
        if (names.size() < tab_count) {
            return make_tab_error(tab_error_code::tab_names_mismatch,
                                  std::format("{} names for {} tabs", names.size(), tab_count));
        }
        tab_strip strip;
        strip.offset = width;
        if (tab_count == 0) return strip;
        if (active >= tab_count) {
            return make_tab_error(tab_error_code::index_out_of_range, std::format("active tab {}", active));
        }

        std::vector<std::string> labels;
        labels.reserve(tab_count);
        std::size_t run = 0;
        for (std::size_t i = 0; i < tab_count; ++i) {
            labels.push_back(tab_label(i, names[i]));
            run += term::printable_width(labels.back());
        }

        // Shed labels until the run fits, keeping the active one.
        std::size_t first = 0;
        std::size_t last  = tab_count;
        while (run > width && first < active) {
            run -= term::printable_width(labels[first++]);
        }
        while (run > width && last - 1 > active) {
            run -= term::printable_width(labels[--last]);
        }
        if (run > width) {
            labels[active] = std::string{term::truncate_to_width(labels[active], width)};
            run            = term::printable_width(labels[active]);
        }

        const std::string base = term::header_color(header_color);
        for (std::size_t i = first; i < last; ++i) {
            if (i == active) {
                strip.text += term::invert();
                strip.text += labels[i];
                strip.text += term::reset();
                strip.text += base;
            } else {
                strip.text += labels[i];
            }
        }

        strip.width     = run;
        strip.offset    = width - run;
        strip.first_tab = first;
        strip.last_tab  = last;
        return strip;
    }

    std::string compose_header(const std::string_view pane_header, const tab_strip &strip,
                               const coordinates &coords, const term::ansi_color header_color) {
        std::string out{pane_header};
        out += term::header_color(header_color);
        out += term::goto_xy(coords.xpos() + strip.offset, coords.ypos()).sv();
        out += strip.text;
        return out;
    }

} // namespace tabterm
