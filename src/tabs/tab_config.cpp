#include "tabterm/tabs/tab_config.hpp"

#include <format>
#include <fstream>
#include <log.h>
#include <string>

#include "tabterm/core/parse.hpp"

namespace tabterm {

    namespace {

        constexpr std::array all_actions{tab_action::new_tab, tab_action::close_tab, tab_action::next_tab};

        [[nodiscard]] std::optional<tab_action> action_for(const std::string_view name) noexcept {
            for (const tab_action action: all_actions) {
                if (to_string(action) == name) return action;
            }
            return std::nullopt;
        }

    } // namespace

    tab_expected_void validate(const tab_config &cfg) {
        const auto table = cfg.keys.table();
        for (std::size_t i = 0; i < table.size(); ++i) {
            for (std::size_t j = i + 1; j < table.size(); ++j) {
                if (table[i].first == table[j].first) {
                    return make_tab_error(tab_error_code::duplicate_binding,
                                          std::format("{} and {} are both bound to {}", to_string(table[i].second),
                                                      to_string(table[j].second), to_string(table[i].first).sv()));
                }
            }
        }
        return {};
    }

    tab_expected<tab_config> load_tab_config(const std::filesystem::path &path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            Log::error("TabConfig", "load failed: could not open ", path.c_str());
            return make_tab_error(tab_error_code::file_open_failed, path.string());
        }

        tab_config  cfg;
        std::string line;
        bool        version_found = false;
        int         line_no       = 0;
        while (std::getline(file, line)) {
            ++line_no;
            const std::string_view trimmed = parse::trim(line);
            if (trimmed.empty() || trimmed.starts_with('#')) continue;

            const auto assignment = parse::split_assignment(trimmed);
            if (!assignment) {
                Log::warning("TabConfig", path.c_str(), ":", line_no, ": ignoring line without '='");
                continue;
            }
            const auto &[name, value] = *assignment;

            if (name == "version") {
                version_found = true;
                if (const int v = parse::parse_int(value, -1); v != tab_config::file_version) {
                    Log::warning("TabConfig", "file version ", v, " differs from expected ", tab_config::file_version);
                }
                continue;
            }

            if (name == "header_color") {
                const auto color = term::parse_color(value);
                if (!color) {
                    return make_tab_error(tab_error_code::file_malformed,
                                          std::format("line {}: unknown color '{}'", line_no, value));
                }
                cfg.header_color = *color;
                continue;
            }

            if (const auto action = action_for(name)) {
                const auto chord = parse_key(value);
                if (!chord) {
                    return make_tab_error(tab_error_code::file_malformed,
                                          std::format("line {}: unknown key '{}'", line_no, value));
                }
                cfg.keys.binding(*action) = *chord;
                continue;
            }

            Log::warning("TabConfig", path.c_str(), ":", line_no, ": unknown key '", name, "'");
        }

        if (!version_found) {
            Log::warning("TabConfig", "no version line in ", path.c_str(), "; assuming version ",
                         tab_config::file_version);
        }

        if (auto valid = validate(cfg); !valid) {
            return make_tab_error(tab_error_code::file_malformed,
                                  std::format("{}: {}", path.string(), valid.error().detail));
        }

        Log::info("TabConfig", "loaded ", path.c_str());
        return cfg;
    }

    tab_expected_void save_tab_config(const tab_config &cfg, const std::filesystem::path &path) {
        if (auto valid = validate(cfg); !valid) return valid;

        std::ofstream file(path);
        if (!file.is_open()) {
            Log::error("TabConfig", "save failed: could not open ", path.c_str());
            return make_tab_error(tab_error_code::file_write_failed, path.string());
        }

        file << "version=" << tab_config::file_version << "\n";
        for (const auto &[chord, action]: cfg.keys.table()) {
            file << to_string(action) << "=" << to_string(chord).sv() << "\n";
        }
        file << "header_color=" << term::to_string(cfg.header_color) << "\n";

        if (!file.flush()) {
            Log::error("TabConfig", "save failed: write error on ", path.c_str());
            return make_tab_error(tab_error_code::file_write_failed, path.string());
        }

        Log::info("TabConfig", "saved ", path.c_str());
        return {};
    }

} // namespace tabterm
