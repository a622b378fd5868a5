/// @file tab_view.hpp
/// @brief Generic tab container: owns panes of one type, tracks the active one, and
///        renders a header with a right-aligned tab strip.
///
/// Usage:
/// @code
///   class shell_tabs : public tabterm::tab_view<shell_pane> {
///   public:
///       using tab_view::tab_view;
///       tab_expected_void new_tab() override {
///           if (auto r = push(shell_pane{get_core()}); !r) return r;
///           return select_tab_(tab_count() - 1);
///       }
///       tab_expected_void close_tab() override { return close_tab_(); }
///       tab_expected_void next_tab() override { next_tab_(); return {}; }
///       std::vector<std::optional<std::string>> get_tab_names() const override;
///       tab_expected_void on_key_sub(const key &k) override {
///           auto pane = active_tab_mut();
///           if (!pane) return std::unexpected{pane.error()};
///           return pane->get().on_key(k);
///       }
///   };
///
///   shell_tabs tabs{core};
///   tabs.push(shell_pane{core});
///   tabs.on_key(tabterm::key::ctrl('t')); // new_tab(), then refresh
///   draw(tabs.render_header().value_or(""));
/// @endcode
///
/// Invariant: 0 <= active_index() < tab_count() whenever tab_count() > 0.
#pragma once

#include <concepts>
#include <cstddef>
#include <format>
#include <functional>
#include <log.h>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "tabterm/core/error.hpp"
#include "tabterm/tabs/tab_config.hpp"
#include "tabterm/tabs/tab_strip.hpp"
#include "tabterm/tabs/tabbable.hpp"
#include "tabterm/widget/widget.hpp"

namespace tabterm {

    template<typename T>
    concept pane = std::derived_from<T, widget> && std::movable<T>;

    /**
     * @brief Tab container over panes of type T.
     *
     * The host derives from tab_view<T> and implements the remaining tabbable methods
     * (new_tab, close_tab, next_tab, get_tab_names, on_key_sub), usually in terms of
     * push(), close_tab_() and next_tab_().
     * @tparam T Concrete pane type deriving from widget.
     */
    template<pane T>
    class tab_view : public widget, public tabbable {
    public:
        explicit tab_view(const widget_core &core, tab_config config = {}) : core_(core), config_(config) {}

        // --- storage ---

        /**
         * @brief Append a pane, then refresh the active one. Becomes active only if the view was empty.
         *
         * If the refresh fails the pane is dropped again and the view is left as it was.
         */
        tab_expected_void push(T pane) {
            panes_.push_back(std::move(pane));
            if (auto r = refresh(); !r) {
                panes_.pop_back();
                return r;
            }
            Log::debug("TabView", "pushed tab ", panes_.size() - 1, " (", panes_.size(), " open)");
            return {};
        }

        /**
         * @brief Remove and return the last pane.
         *
         * The active index is only touched if it would point past the end; it is then
         * clamped to the new last pane. The remaining active pane is refreshed; a refresh
         * failure puts the pane back where it was and is returned instead.
         */
        tab_expected<T> pop() {
            if (panes_.empty()) return make_tab_error(tab_error_code::no_tabs, "pop on empty tab view");

            const std::size_t previous = active_;
            T                 pane     = std::move(panes_.back());
            panes_.pop_back();
            clamp_active();

            if (auto r = refresh(); !r) {
                panes_.push_back(std::move(pane));
                active_ = previous;
                return std::unexpected{std::move(r.error())};
            }
            Log::debug("TabView", "popped tab ", panes_.size(), " (", panes_.size(), " open)");
            return pane;
        }

        /**
         * @brief Close the active pane.
         *
         * The pane that followed the closed one becomes active, or the new last pane if
         * the closed one was last.
         * @return last_tab when only one pane is open (nothing changes), no_tabs when empty.
         */
        tab_expected_void close_tab_() {
            if (panes_.empty()) return make_tab_error(tab_error_code::no_tabs);
            if (panes_.size() == 1) return make_tab_error(tab_error_code::last_tab);

            const std::size_t closed = active_;
            panes_.erase(panes_.begin() + static_cast<std::ptrdiff_t>(closed));
            clamp_active();
            Log::debug("TabView", "closed tab ", closed, ", active is now ", active_);
            return refresh();
        }

        /// @brief Advance with wraparound, then run on_next_tab(). A hook failure is logged, not returned.
        void next_tab_() {
            if (panes_.empty()) return;
            active_ = (active_ + 1) % panes_.size();
            notify_switched();
        }

        /// @brief Make tab index active and run on_next_tab(). Selecting the active tab does nothing.
        tab_expected_void select_tab_(const std::size_t index) {
            if (index >= panes_.size()) {
                return make_tab_error(tab_error_code::index_out_of_range,
                                      std::format("tab {} of {}", index, panes_.size()));
            }
            if (index == active_) return {};
            active_ = index;
            notify_switched();
            return {};
        }

        /// @brief Set the geometry of the view and of every pane, then refresh.
        tab_expected_void resize(const coordinates &coords) {
            core_.coords = coords;
            for (T &p: panes_) p.set_coordinates(coords);
            return refresh();
        }

        // --- access ---

        [[nodiscard]] tab_expected<std::reference_wrapper<const T>> active_tab_() const {
            if (panes_.empty()) return make_tab_error(tab_error_code::no_tabs);
            return std::cref(panes_[active_]);
        }

        [[nodiscard]] tab_expected<std::reference_wrapper<T>> active_tab_mut_() {
            if (panes_.empty()) return make_tab_error(tab_error_code::no_tabs);
            return std::ref(panes_[active_]);
        }

        [[nodiscard]] std::size_t      tab_count() const noexcept { return panes_.size(); }
        [[nodiscard]] std::size_t      active_index() const noexcept { return active_; }
        [[nodiscard]] bool             empty() const noexcept { return panes_.empty(); }
        [[nodiscard]] std::span<T>       panes() noexcept { return panes_; }
        [[nodiscard]] std::span<const T> panes() const noexcept { return panes_; }

        [[nodiscard]] const tab_config &config() const noexcept { return config_; }

        tab_expected_void set_config(const tab_config &config) {
            if (auto valid = validate(config); !valid) return valid;
            config_ = config;
            return {};
        }

        // --- tabbable ---

        [[nodiscard]] tab_expected<std::reference_wrapper<const widget>> active_tab() const override {
            auto t = active_tab_();
            if (!t) return std::unexpected{t.error()};
            return std::cref(static_cast<const widget &>(t->get()));
        }

        [[nodiscard]] tab_expected<std::reference_wrapper<widget>> active_tab_mut() override {
            auto t = active_tab_mut_();
            if (!t) return std::unexpected{t.error()};
            return std::ref(static_cast<widget &>(t->get()));
        }

        [[nodiscard]] key_map reserved_keys() const override { return config_.keys; }

        // --- widget ---

        [[nodiscard]] const widget_core &get_core() const override { return core_; }
        [[nodiscard]] widget_core       &get_core_mut() override { return core_; }

        [[nodiscard]] tab_expected<std::string> render_header() const override {
            auto t = active_tab();
            if (!t) return std::unexpected{t.error()};
            auto header = t->get().render_header();
            if (!header) return header;

            const auto names = get_tab_names();
            auto strip = compose_tab_strip(names, panes_.size(), active_, get_coordinates().xsize(),
                                           config_.header_color);
            if (!strip) return std::unexpected{std::move(strip.error())};
            return compose_header(*header, *strip, get_coordinates(), config_.header_color);
        }

        [[nodiscard]] tab_expected<std::string> render_footer() const override {
            auto t = active_tab();
            if (!t) return std::unexpected{t.error()};
            return t->get().render_footer();
        }

        [[nodiscard]] tab_expected<std::string> get_drawlist() const override {
            auto t = active_tab();
            if (!t) return std::unexpected{t.error()};
            return t->get().get_drawlist();
        }

        /// @brief Refresh the active pane. Nothing to do while the view is empty.
        tab_expected_void refresh() override {
            if (panes_.empty()) return {};
            return panes_[active_].refresh();
        }

        /// @brief Reserved-chord dispatch, then an unconditional refresh. The dispatch error wins.
        tab_expected_void on_key(const key &k) override {
            auto dispatched = dispatch_key(k);
            auto refreshed  = refresh();
            if (!dispatched) return dispatched;
            return refreshed;
        }

    private:
        void clamp_active() noexcept {
            if (panes_.empty()) {
                active_ = 0;
            } else if (active_ >= panes_.size()) {
                active_ = panes_.size() - 1;
            }
        }

        void notify_switched() {
            // The switch has already happened; the hook can't undo it.
            if (auto hook = on_next_tab(); !hook) {
                Log::warning("TabView", "on_next_tab failed after switching to tab ", active_, ": ",
                             hook.error().message().sv());
            }
        }

        std::vector<T> panes_;
        std::size_t    active_ = 0;
        widget_core    core_;
        tab_config     config_;
    };

} // namespace tabterm
