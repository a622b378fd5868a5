#include <cstdio>
#include <filesystem>
#include <log.h>
#include <optional>
#include <string>
#include <string_view>
#include <tabterm/tabs/tab_config.hpp>
#include <tabterm/tabs/tab_view.hpp>
#include <tabterm/term/escape.hpp>
#include <tabterm/term/key.hpp>
#include <utility>
#include <vector>

namespace tt = tabterm;

// ---------------------------------------------------------------------------
// A scratch-pad pane: typed characters accumulate, backspace deletes
// ---------------------------------------------------------------------------

class scratch_pane : public tt::widget {
public:
    scratch_pane(const tt::widget_core &core, std::string title) : core_(core), title_(std::move(title)) {}

    const tt::widget_core &get_core() const override { return core_; }
    tt::widget_core       &get_core_mut() override { return core_; }

    tt::tab_expected<std::string> render_header() const override { return title_; }

    tt::tab_expected<std::string> render_footer() const override {
        return std::to_string(text_.size()) + " chars";
    }

    tt::tab_expected<std::string> get_drawlist() const override { return visible_; }

    tt::tab_expected_void refresh() override {
        const std::size_t width = get_coordinates().xsize();
        visible_ = text_.size() > width ? text_.substr(text_.size() - width) : text_;
        return {};
    }

    tt::tab_expected_void on_key(const tt::key &k) override {
        if (k.kind == tt::key_kind::backspace) {
            if (!text_.empty()) text_.pop_back();
        } else if (k.kind == tt::key_kind::character && k.ch < 0x80) {
            text_.push_back(static_cast<char>(k.ch));
        }
        return {};
    }

    [[nodiscard]] const std::string &title() const { return title_; }

private:
    tt::widget_core core_;
    std::string     title_;
    std::string     text_;
    std::string     visible_;
};

// ---------------------------------------------------------------------------
// Host: new tabs open at the end and become active
// ---------------------------------------------------------------------------

class scratch_tabs : public tt::tab_view<scratch_pane> {
public:
    using tab_view::tab_view;

    tt::tab_expected_void new_tab() override {
        if (auto r = push(scratch_pane{get_core(), "scratch " + std::to_string(++opened_)}); !r) return r;
        return select_tab_(tab_count() - 1);
    }

    tt::tab_expected_void close_tab() override { return close_tab_(); }

    tt::tab_expected_void next_tab() override {
        next_tab_();
        return {};
    }

    tt::tab_expected_void on_next_tab() override {
        Log::debug("Demo", "switched to tab ", active_index());
        return {};
    }

    std::vector<std::optional<std::string>> get_tab_names() const override {
        std::vector<std::optional<std::string>> names;
        for (const auto &p: panes()) names.emplace_back(p.title());
        return names;
    }

    tt::tab_expected_void on_key_sub(const tt::key &k) override {
        auto pane = active_tab_mut();
        if (!pane) return std::unexpected{pane.error()};
        return pane->get().on_key(k);
    }

private:
    int opened_ = 0;
};

static void print_frame(const scratch_tabs &tabs) {
    const auto header = tabs.render_header();
    const auto body   = tabs.get_drawlist();
    const auto footer = tabs.render_footer();
    if (!header || !body || !footer) {
        Log::error("Demo", "render failed");
        return;
    }
    std::printf("%s%s\n%s\n%s\n\n", header->c_str(), std::string(tt::term::reset()).c_str(), body->c_str(),
                footer->c_str());
}

int main(int argc, char **argv) {
    tt::tab_config config;
    if (argc > 1) {
        if (auto loaded = tt::load_tab_config(std::filesystem::path{argv[1]})) {
            config = *loaded;
        } else {
            Log::warning("Demo", "using default keys: ", loaded.error().message().sv());
        }
    }

    const tt::widget_core core{{.size = {60, 20}, .position = {1, 1}}};
    scratch_tabs          tabs{core, config};
    if (auto r = tabs.new_tab(); !r) {
        Log::error("Demo", r.error().message().sv());
        return 1;
    }

    // Scripted input as it would arrive from a raw-mode terminal.
    const std::string_view script = "hello\x14world\x14tabs\t\t\x17\x7f\x17\x17";
    for (const tt::key &k: tt::decode_keys(script)) {
        if (auto r = tabs.on_key(k); !r) {
            Log::warning("Demo", tt::to_string(k).sv(), ": ", r.error().message().sv());
        }
        if (k.kind != tt::key_kind::character) print_frame(tabs);
    }
    print_frame(tabs);
    return 0;
}
