/// @file widget.hpp
/// @brief Rendering and input contract shared by panes and by the tab container itself.
///
/// Usage:
/// @code
///   class log_pane : public tabterm::widget {
///   public:
///       const widget_core &get_core() const override { return core_; }
///       widget_core       &get_core_mut() override { return core_; }
///       tab_expected<std::string> render_header() const override { return "log"; }
///       ...
///   };
/// @endcode
///
/// Every fallible operation returns std::expected; errors propagate to the caller.
#pragma once

#include <string>

#include "tabterm/core/error.hpp"
#include "tabterm/term/key.hpp"
#include "tabterm/widget/geometry.hpp"

namespace tabterm {

    class widget {
    public:
        widget()                          = default;
        widget(const widget &)            = default;
        widget(widget &&)                 = default;
        widget &operator=(const widget &) = default;
        widget &operator=(widget &&)      = default;
        virtual ~widget()                 = default;

        [[nodiscard]] virtual const widget_core &get_core() const = 0;
        [[nodiscard]] virtual widget_core       &get_core_mut()   = 0;

        /// @brief Text for the header line (may contain escapes).
        [[nodiscard]] virtual tab_expected<std::string> render_header() const = 0;
        /// @brief Text for the footer line (may contain escapes).
        [[nodiscard]] virtual tab_expected<std::string> render_footer() const = 0;
        /// @brief Ready-to-paint body of the widget.
        [[nodiscard]] virtual tab_expected<std::string> get_drawlist() const = 0;

        /// @brief Re-derive cached display state from geometry and content. Idempotent.
        virtual tab_expected_void refresh() = 0;
        virtual tab_expected_void on_key(const key &k) = 0;

        [[nodiscard]] const coordinates &get_coordinates() const { return get_core().coords; }
        void                             set_coordinates(const coordinates &coords) { get_core_mut().coords = coords; }
    };

} // namespace tabterm
