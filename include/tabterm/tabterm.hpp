// tabterm.hpp - umbrella header: core utilities, terminal primitives, widget contract, tab container
//
// Usage:
//   #include <tabterm/tabterm.hpp>
// NOLINTBEGIN(misc-include-cleaner)
#pragma once
#include "tabterm/core/error.hpp"
#include "tabterm/core/parse.hpp"
#include "tabterm/core/text_buf.hpp"
#include "tabterm/tabs/tab_config.hpp"
#include "tabterm/tabs/tab_strip.hpp"
#include "tabterm/tabs/tab_view.hpp"
#include "tabterm/tabs/tabbable.hpp"
#include "tabterm/term/escape.hpp"
#include "tabterm/term/key.hpp"
#include "tabterm/widget/geometry.hpp"
#include "tabterm/widget/widget.hpp"
// NOLINTEND(misc-include-cleaner)
