#pragma once

#include <array>
#include <compare>
#include <string>

namespace cadence::geometry {

    // stage position of one imaging tile
    struct xy_position_t {
        std::array<double, 2> center = { {0, 0} };

        // tile footprint with and without the overlap with its neighbours, in pixels
        std::array<size_t, 2> tile_size = { {0, 0} };
        std::array<size_t, 2> full_tile_size = { {0, 0} };

        size_t grid_row = 0, grid_column = 0;

        std::string pixel_size_config;

        auto& x() { return center[0]; }
        const auto& x() const { return center[0]; }
        auto& y() { return center[1]; }
        const auto& y() const { return center[1]; }

        auto operator<=>(const xy_position_t&) const = default;
    };

}
