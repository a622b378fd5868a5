/// @file tabbable.hpp
/// @brief Tab-level behavior a host application supplies on top of a tab container.
///
/// Key routing is two-stage: dispatch_key() first checks the reserved-chord table
/// (new tab, close tab, next tab) and calls the matching method; every other key goes
/// to on_key_sub() exactly once.
///
/// Usage:
/// @code
///   class editor_tabs : public tabterm::tab_view<editor_pane> {
///   public:
///       tab_expected_void new_tab() override { return push(editor_pane{get_core()}); }
///       tab_expected_void close_tab() override { return close_tab_(); }
///       tab_expected_void next_tab() override { next_tab_(); return {}; }
///       std::vector<std::optional<std::string>> get_tab_names() const override;
///       tab_expected_void on_key_sub(const key &k) override;
///   };
/// @endcode
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "tabterm/core/error.hpp"
#include "tabterm/tabs/tab_config.hpp"
#include "tabterm/term/key.hpp"
#include "tabterm/widget/widget.hpp"

namespace tabterm {

    class tabbable {
    public:
        tabbable()                            = default;
        tabbable(const tabbable &)            = default;
        tabbable(tabbable &&)                 = default;
        tabbable &operator=(const tabbable &) = default;
        tabbable &operator=(tabbable &&)      = default;
        virtual ~tabbable()                   = default;

        /// @brief Create and attach a new pane.
        virtual tab_expected_void new_tab() = 0;
        /// @brief Remove the current pane. Closing the only pane fails with tab_error_code::last_tab.
        virtual tab_expected_void close_tab() = 0;
        /// @brief Advance to the next pane, wrapping after the last.
        virtual tab_expected_void next_tab() = 0;
        /// @brief Hook run after a switch. Callers log and discard its failure.
        virtual tab_expected_void on_next_tab() { return {}; }

        /// @brief One label per pane, in pane order. A fresh sequence on every call.
        [[nodiscard]] virtual std::vector<std::optional<std::string>> get_tab_names() const = 0;

        [[nodiscard]] virtual tab_expected<std::reference_wrapper<const widget>> active_tab() const = 0;
        [[nodiscard]] virtual tab_expected<std::reference_wrapper<widget>>       active_tab_mut()   = 0;

        /// @brief Receives every key that is not a reserved chord.
        virtual tab_expected_void on_key_sub(const key &k) = 0;

        /// @brief Chords checked by dispatch_key() before falling through to on_key_sub().
        [[nodiscard]] virtual key_map reserved_keys() const { return {}; }

        tab_expected_void dispatch_key(const key &k);
        tab_expected_void run_action(tab_action action);
    };

} // namespace tabterm
