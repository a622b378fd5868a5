#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <tabterm/tabs/tab_view.hpp>
#include <tabterm/term/escape.hpp>
#include <utility>
#include <vector>

using namespace tabterm;

namespace {

    // Pane that records what the container asked of it.
    class recording_pane : public widget {
    public:
        recording_pane(const widget_core &core, std::string name) : core_(core), name_(std::move(name)) {}

        const widget_core &get_core() const override { return core_; }
        widget_core       &get_core_mut() override { return core_; }

        tab_expected<std::string> render_header() const override { return "hdr:" + name_; }
        tab_expected<std::string> render_footer() const override { return "ftr:" + name_; }
        tab_expected<std::string> get_drawlist() const override { return "body:" + name_; }

        tab_expected_void refresh() override {
            ++refreshes;
            if (fail_refresh) return make_tab_error(tab_error_code::pane_failed, name_);
            return {};
        }

        tab_expected_void on_key(const key &k) override {
            keys.push_back(k);
            return {};
        }

        [[nodiscard]] const std::string &name() const { return name_; }

        int              refreshes    = 0;
        bool             fail_refresh = false;
        std::vector<key> keys;

    private:
        widget_core core_;
        std::string name_;
    };

    struct call_log {
        int              new_tab    = 0;
        int              close_tab  = 0;
        int              next_tab   = 0;
        int              hook       = 0;
        std::vector<key> sub_keys;
    };

    class recording_tabs : public tab_view<recording_pane> {
    public:
        explicit recording_tabs(const widget_core &core) : tab_view(core) {}

        tab_expected_void new_tab() override {
            ++calls.new_tab;
            return push(recording_pane{get_core(), "tab" + std::to_string(tab_count())});
        }

        tab_expected_void close_tab() override {
            ++calls.close_tab;
            return close_tab_();
        }

        tab_expected_void next_tab() override {
            ++calls.next_tab;
            next_tab_();
            return {};
        }

        tab_expected_void on_next_tab() override {
            ++calls.hook;
            if (fail_hook) return make_tab_error(tab_error_code::pane_failed, "hook");
            return {};
        }

        std::vector<std::optional<std::string>> get_tab_names() const override {
            if (names_override) return *names_override;
            std::vector<std::optional<std::string>> names;
            for (const auto &p: panes()) names.emplace_back(p.name());
            return names;
        }

        tab_expected_void on_key_sub(const key &k) override {
            calls.sub_keys.push_back(k);
            auto pane = active_tab_mut();
            if (!pane) return std::unexpected{pane.error()};
            return pane->get().on_key(k);
        }

        call_log                                               calls;
        bool                                                   fail_hook = false;
        std::optional<std::vector<std::optional<std::string>>> names_override;
    };

    widget_core make_core(const std::size_t width = 40) {
        return widget_core{{.size = {width, 10}, .position = {1, 1}}};
    }

    recording_tabs make_tabs(const std::size_t count, const std::size_t width = 40) {
        recording_tabs tabs{make_core(width)};
        for (std::size_t i = 0; i < count; ++i) {
            EXPECT_TRUE(tabs.push(recording_pane{tabs.get_core(), std::string(1, static_cast<char>('a' + i))}));
        }
        return tabs;
    }

} // namespace

// --- push / pop ---

TEST(TabViewStorage, PushAppendsInOrder) {
    auto tabs = make_tabs(3);
    ASSERT_EQ(tabs.tab_count(), 3u);
    EXPECT_EQ(tabs.panes()[0].name(), "a");
    EXPECT_EQ(tabs.panes()[1].name(), "b");
    EXPECT_EQ(tabs.panes()[2].name(), "c");
}

TEST(TabViewStorage, PushKeepsActiveUnlessEmpty) {
    recording_tabs tabs{make_core()};
    EXPECT_TRUE(tabs.empty());
    ASSERT_TRUE(tabs.push(recording_pane{tabs.get_core(), "a"}));
    EXPECT_EQ(tabs.active_index(), 0u);
    ASSERT_TRUE(tabs.push(recording_pane{tabs.get_core(), "b"}));
    EXPECT_EQ(tabs.active_index(), 0u);
}

TEST(TabViewStorage, PushRefreshesActivePane) {
    auto tabs = make_tabs(2);
    // "a" was refreshed by both pushes, "b" by none
    EXPECT_EQ(tabs.panes()[0].refreshes, 2);
    EXPECT_EQ(tabs.panes()[1].refreshes, 0);
}

TEST(TabViewStorage, PushPropagatesRefreshFailure) {
    recording_tabs tabs{make_core()};
    recording_pane pane{tabs.get_core(), "a"};
    pane.fail_refresh = true;
    const auto r      = tabs.push(std::move(pane));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, tab_error_code::pane_failed);
    EXPECT_TRUE(tabs.empty());
}

TEST(TabViewStorage, FailedPushLeavesTabsUnchanged) {
    auto tabs                    = make_tabs(1);
    tabs.panes()[0].fail_refresh = true;
    const auto r                 = tabs.push(recording_pane{tabs.get_core(), "x"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, tab_error_code::pane_failed);
    ASSERT_EQ(tabs.tab_count(), 1u);
    EXPECT_EQ(tabs.panes()[0].name(), "a");
    EXPECT_EQ(tabs.active_index(), 0u);
}

TEST(TabViewStorage, PopRemovesTail) {
    auto tabs = make_tabs(3);
    auto p    = tabs.pop();
    ASSERT_TRUE(p);
    EXPECT_EQ(p->name(), "c");
    EXPECT_EQ(tabs.tab_count(), 2u);
    EXPECT_EQ(tabs.panes()[1].name(), "b");
}

TEST(TabViewStorage, PopLeavesActiveAloneWhenInRange) {
    auto tabs = make_tabs(3);
    ASSERT_TRUE(tabs.select_tab_(1));
    ASSERT_TRUE(tabs.pop());
    EXPECT_EQ(tabs.active_index(), 1u);
}

TEST(TabViewStorage, PopClampsActiveTail) {
    auto tabs = make_tabs(3);
    ASSERT_TRUE(tabs.select_tab_(2));
    ASSERT_TRUE(tabs.pop());
    EXPECT_EQ(tabs.active_index(), 1u);
}

TEST(TabViewStorage, FailedPopKeepsTail) {
    auto tabs                    = make_tabs(2);
    tabs.panes()[0].fail_refresh = true;
    const auto p                 = tabs.pop();
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error().code, tab_error_code::pane_failed);
    ASSERT_EQ(tabs.tab_count(), 2u);
    EXPECT_EQ(tabs.panes()[1].name(), "b");
    EXPECT_EQ(tabs.active_index(), 0u);
}

TEST(TabViewStorage, FailedPopRestoresClampedActive) {
    auto tabs = make_tabs(3);
    ASSERT_TRUE(tabs.select_tab_(2));
    tabs.panes()[1].fail_refresh = true;
    ASSERT_FALSE(tabs.pop());
    ASSERT_EQ(tabs.tab_count(), 3u);
    EXPECT_EQ(tabs.panes()[2].name(), "c");
    EXPECT_EQ(tabs.active_index(), 2u);
}

TEST(TabViewStorage, PopEmptyFails) {
    recording_tabs tabs{make_core()};
    const auto     p = tabs.pop();
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error().code, tab_error_code::no_tabs);
    EXPECT_TRUE(tabs.empty());
}

TEST(TabViewStorage, PopToEmptyThenRefreshIsNoop) {
    auto tabs = make_tabs(1);
    ASSERT_TRUE(tabs.pop());
    EXPECT_TRUE(tabs.empty());
    EXPECT_EQ(tabs.active_index(), 0u);
    EXPECT_TRUE(tabs.refresh());
}

// --- switching ---

TEST(TabViewSwitch, NextTabAdvances) {
    auto tabs = make_tabs(3);
    tabs.next_tab_();
    EXPECT_EQ(tabs.active_index(), 1u);
    tabs.next_tab_();
    EXPECT_EQ(tabs.active_index(), 2u);
}

TEST(TabViewSwitch, NextTabWrapsToFirst) {
    auto tabs = make_tabs(3);
    ASSERT_TRUE(tabs.select_tab_(2));
    tabs.next_tab_();
    EXPECT_EQ(tabs.active_index(), 0u);
}

TEST(TabViewSwitch, NextTabOnEmptyIsNoop) {
    recording_tabs tabs{make_core()};
    tabs.next_tab_();
    EXPECT_EQ(tabs.active_index(), 0u);
    EXPECT_EQ(tabs.calls.hook, 0);
}

TEST(TabViewSwitch, HookRunsAfterSwitch) {
    auto tabs = make_tabs(2);
    tabs.next_tab_();
    EXPECT_EQ(tabs.calls.hook, 1);
}

TEST(TabViewSwitch, HookFailureDoesNotBlockSwitch) {
    auto tabs      = make_tabs(3);
    tabs.fail_hook = true;
    tabs.next_tab_();
    EXPECT_EQ(tabs.active_index(), 1u);
    EXPECT_EQ(tabs.calls.hook, 1);
    EXPECT_TRUE(tabs.on_key(tab_key));
    EXPECT_EQ(tabs.active_index(), 2u);
}

TEST(TabViewSwitch, SelectActiveTabSkipsHook) {
    auto tabs = make_tabs(3);
    ASSERT_TRUE(tabs.select_tab_(tabs.active_index()));
    EXPECT_EQ(tabs.active_index(), 0u);
    EXPECT_EQ(tabs.calls.hook, 0);
    ASSERT_TRUE(tabs.select_tab_(1));
    EXPECT_EQ(tabs.calls.hook, 1);
}

TEST(TabViewSwitch, SelectOutOfRangeFails) {
    auto       tabs = make_tabs(2);
    const auto r    = tabs.select_tab_(2);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, tab_error_code::index_out_of_range);
    EXPECT_EQ(tabs.active_index(), 0u);
}

TEST(TabViewSwitch, InvariantHoldsThroughMixedOperations) {
    auto tabs = make_tabs(1);
    for (int i = 0; i < 20; ++i) {
        if (i % 3 == 0) ASSERT_TRUE(tabs.new_tab());
        if (i % 4 == 0) tabs.next_tab_();
        if (i % 5 == 0 && tabs.tab_count() > 1) ASSERT_TRUE(tabs.close_tab_());
        if (i % 7 == 0 && tabs.tab_count() > 1) ASSERT_TRUE(tabs.pop());
        ASSERT_GT(tabs.tab_count(), 0u);
        ASSERT_LT(tabs.active_index(), tabs.tab_count());
    }
}

// --- closing ---

TEST(TabViewClose, ClosesActiveNotTail) {
    auto tabs = make_tabs(3);
    ASSERT_TRUE(tabs.select_tab_(0));
    ASSERT_TRUE(tabs.close_tab_());
    ASSERT_EQ(tabs.tab_count(), 2u);
    EXPECT_EQ(tabs.panes()[0].name(), "b");
    EXPECT_EQ(tabs.panes()[1].name(), "c");
    EXPECT_EQ(tabs.active_index(), 0u);
}

TEST(TabViewClose, ClosingTailActivatesNewTail) {
    auto tabs = make_tabs(3);
    ASSERT_TRUE(tabs.select_tab_(2));
    ASSERT_TRUE(tabs.close_tab_());
    EXPECT_EQ(tabs.tab_count(), 2u);
    EXPECT_EQ(tabs.active_index(), 1u);
    EXPECT_EQ(tabs.panes()[1].name(), "b");
}

TEST(TabViewClose, LastTabFailsIdempotently) {
    auto tabs = make_tabs(1);
    for (int i = 0; i < 3; ++i) {
        const auto r = tabs.close_tab_();
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, tab_error_code::last_tab);
        EXPECT_EQ(tabs.tab_count(), 1u);
        EXPECT_EQ(tabs.active_index(), 0u);
    }
}

TEST(TabViewClose, EmptyFailsWithNoTabs) {
    recording_tabs tabs{make_core()};
    const auto     r = tabs.close_tab_();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, tab_error_code::no_tabs);
}

// --- key routing ---

TEST(TabViewKeys, CtrlTCallsNewTabOnly) {
    auto tabs = make_tabs(1);
    ASSERT_TRUE(tabs.on_key(key::ctrl(U't')));
    EXPECT_EQ(tabs.calls.new_tab, 1);
    EXPECT_EQ(tabs.calls.close_tab, 0);
    EXPECT_EQ(tabs.calls.next_tab, 0);
    EXPECT_TRUE(tabs.calls.sub_keys.empty());
    EXPECT_EQ(tabs.tab_count(), 2u);
}

TEST(TabViewKeys, CtrlWCallsCloseTab) {
    auto tabs = make_tabs(2);
    ASSERT_TRUE(tabs.on_key(key::ctrl(U'w')));
    EXPECT_EQ(tabs.calls.close_tab, 1);
    EXPECT_EQ(tabs.calls.new_tab, 0);
    EXPECT_TRUE(tabs.calls.sub_keys.empty());
    EXPECT_EQ(tabs.tab_count(), 1u);
}

TEST(TabViewKeys, TabCharacterCallsNextTab) {
    auto tabs = make_tabs(2);
    ASSERT_TRUE(tabs.on_key(tab_key));
    EXPECT_EQ(tabs.calls.next_tab, 1);
    EXPECT_TRUE(tabs.calls.sub_keys.empty());
    EXPECT_EQ(tabs.active_index(), 1u);
}

TEST(TabViewKeys, OtherKeysGoToSubHandlerOnce) {
    auto tabs = make_tabs(2);
    ASSERT_TRUE(tabs.on_key(key::character(U'x')));
    ASSERT_EQ(tabs.calls.sub_keys.size(), 1u);
    EXPECT_EQ(tabs.calls.sub_keys[0], key::character(U'x'));
    EXPECT_EQ(tabs.calls.new_tab + tabs.calls.close_tab + tabs.calls.next_tab, 0);
    ASSERT_EQ(tabs.panes()[0].keys.size(), 1u);
    EXPECT_EQ(tabs.panes()[0].keys[0], key::character(U'x'));
}

TEST(TabViewKeys, OnKeyRefreshesAfterDispatch) {
    auto      tabs   = make_tabs(1);
    const int before = tabs.panes()[0].refreshes;
    ASSERT_TRUE(tabs.on_key(key::character(U'q')));
    EXPECT_EQ(tabs.panes()[0].refreshes, before + 1);
}

TEST(TabViewKeys, OnKeyRefreshesEvenWhenDispatchFails) {
    auto      tabs   = make_tabs(1);
    const int before = tabs.panes()[0].refreshes;
    const auto r     = tabs.on_key(key::ctrl(U'w'));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, tab_error_code::last_tab);
    EXPECT_EQ(tabs.panes()[0].refreshes, before + 1);
}

TEST(TabViewKeys, RemappedChords) {
    auto       tabs = make_tabs(2);
    tab_config cfg;
    cfg.keys.next_tab = key::named(key_kind::right);
    ASSERT_TRUE(tabs.set_config(cfg));

    ASSERT_TRUE(tabs.on_key(tab_key));
    EXPECT_EQ(tabs.calls.next_tab, 0);
    EXPECT_EQ(tabs.calls.sub_keys.size(), 1u);

    ASSERT_TRUE(tabs.on_key(key::named(key_kind::right)));
    EXPECT_EQ(tabs.calls.next_tab, 1);
    EXPECT_EQ(tabs.active_index(), 1u);
}

TEST(TabViewKeys, SetConfigRejectsDuplicateChords) {
    auto       tabs = make_tabs(1);
    tab_config cfg;
    cfg.keys.close_tab = cfg.keys.new_tab;
    const auto r       = tabs.set_config(cfg);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, tab_error_code::duplicate_binding);
    EXPECT_EQ(tabs.config(), tab_config{});
}

// --- rendering ---

TEST(TabViewRender, FooterAndDrawlistDelegateToActive) {
    auto tabs = make_tabs(2);
    tabs.next_tab_();
    EXPECT_EQ(tabs.render_footer().value(), "ftr:b");
    EXPECT_EQ(tabs.get_drawlist().value(), "body:b");
}

TEST(TabViewRender, ActiveTabSeenThroughWidget) {
    auto tabs = make_tabs(2);
    auto w    = tabs.active_tab();
    ASSERT_TRUE(w);
    EXPECT_EQ(w->get().render_header().value(), "hdr:a");
}

TEST(TabViewRender, EmptyViewReportsNoTabs) {
    recording_tabs tabs{make_core()};
    EXPECT_EQ(tabs.render_header().error().code, tab_error_code::no_tabs);
    EXPECT_EQ(tabs.render_footer().error().code, tab_error_code::no_tabs);
    EXPECT_EQ(tabs.get_drawlist().error().code, tab_error_code::no_tabs);
    EXPECT_FALSE(tabs.active_tab());
    EXPECT_FALSE(tabs.active_tab_mut());
}

TEST(TabViewRender, HeaderRightAlignsStripWithActiveHighlighted) {
    constexpr std::size_t width = 40;
    auto                  tabs  = make_tabs(3, width);
    ASSERT_TRUE(tabs.select_tab_(1));

    const auto header = tabs.render_header();
    ASSERT_TRUE(header);

    const std::string base     = term::header_color(term::ansi_color::blue);
    const std::string expected = "hdr:b" + base + "\x1b[1;29H" + " 0:a" + std::string(term::invert()) + " 1:b" +
                                 std::string(term::reset()) + base + " 2:c";
    EXPECT_EQ(*header, expected);

    // strip starts at column 29 and is 12 columns wide, so it ends at column 40
    const std::string strip = header->substr(header->find("\x1b[1;29H") + 7);
    EXPECT_EQ(29 + term::printable_width(strip) - 1, width);
}

TEST(TabViewRender, HeaderFollowsConfiguredColor) {
    auto       tabs = make_tabs(1, 20);
    tab_config cfg;
    cfg.header_color = term::ansi_color::green;
    ASSERT_TRUE(tabs.set_config(cfg));
    const auto header = tabs.render_header();
    ASSERT_TRUE(header);
    EXPECT_NE(header->find(term::header_color(term::ansi_color::green)), std::string::npos);
}

TEST(TabViewRender, ShortNameListIsAnError) {
    auto tabs           = make_tabs(3);
    tabs.names_override = std::vector<std::optional<std::string>>{"a", "b"};
    const auto header   = tabs.render_header();
    ASSERT_FALSE(header);
    EXPECT_EQ(header.error().code, tab_error_code::tab_names_mismatch);
}

TEST(TabViewRender, MissingNameRendersIndexOnly) {
    auto tabs           = make_tabs(2, 30);
    tabs.names_override = std::vector<std::optional<std::string>>{"a", std::nullopt};
    const auto header   = tabs.render_header();
    ASSERT_TRUE(header);
    EXPECT_TRUE(header->ends_with(" 1"));
}

TEST(TabViewRender, ResizeUpdatesPanesAndHeader) {
    auto tabs = make_tabs(2, 40);
    ASSERT_TRUE(tabs.resize(coordinates{.size = {20, 5}, .position = {1, 1}}));
    EXPECT_EQ(tabs.get_coordinates().xsize(), 20u);
    EXPECT_EQ(tabs.panes()[1].get_coordinates().xsize(), 20u);
    const auto header = tabs.render_header();
    ASSERT_TRUE(header);
    // " 0:a 1:b" is 8 wide, so the strip starts at column 13
    EXPECT_NE(header->find("\x1b[1;13H"), std::string::npos);
}
