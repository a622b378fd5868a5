#include "tabterm/tabs/tabbable.hpp"

namespace tabterm {

    tab_expected_void tabbable::dispatch_key(const key &k) {
        if (const auto action = reserved_keys().find(k)) return run_action(*action);
        return on_key_sub(k);
    }

    tab_expected_void tabbable::run_action(const tab_action action) {
        switch (action) {
            case tab_action::new_tab:
                return new_tab();
            case tab_action::close_tab:
                return close_tab();
            case tab_action::next_tab:
                return next_tab();
        }
        return {};
    }

} // namespace tabterm
