// geometry.hpp - pane coordinates and the shared core state every widget carries
//
// Usage:
//   tabterm::widget_core core{{.size = {80, 24}, .position = {1, 1}}};
//   auto width = core.coords.xsize();
#pragma once

#include <cstddef>

namespace tabterm {

    struct extent {
        std::size_t x = 0;
        std::size_t y = 0;

        [[nodiscard]] constexpr bool operator==(const extent &) const noexcept = default;
    };

    // position is 1-based, matching terminal cursor addressing
    struct coordinates {
        extent size{};
        extent position{1, 1};

        [[nodiscard]] constexpr std::size_t xsize() const noexcept { return size.x; }
        [[nodiscard]] constexpr std::size_t ysize() const noexcept { return size.y; }
        [[nodiscard]] constexpr std::size_t xpos() const noexcept { return position.x; }
        [[nodiscard]] constexpr std::size_t ypos() const noexcept { return position.y; }

        [[nodiscard]] constexpr bool operator==(const coordinates &) const noexcept = default;
    };

    struct widget_core {
        coordinates coords{};

        [[nodiscard]] constexpr bool operator==(const widget_core &) const noexcept = default;
    };

} // namespace tabterm
