#include <cadence/acquire/config.hpp>

#include <cmath>

using namespace cadence::acquire;

std::string cadence::acquire::to_string(space_mode_t mode) {
    switch (mode) {
    case space_mode_t::none:
        return "none";
    case space_mode_t::region_2d:
        return "region 2D";
    case space_mode_t::simple_z_stack:
        return "simple Z-stack";
    case space_mode_t::surface_fixed_distance:
        return "fixed distance from surface";
    case space_mode_t::volume_between_surfaces:
        return "volume between surfaces";
    default:
        return fmt::format("unknown ({})", cast(mode));
    }
}

void experiment_config_t::validate() const {
    auto fail = [&](const std::string& msg) {
        throw traced<std::invalid_argument>(fmt::format("invalid configuration for experiment \"{}\": {}", name, msg));
    };

    switch (space_mode) {
    case space_mode_t::none:
        break;
    case space_mode_t::region_2d:
    case space_mode_t::simple_z_stack:
        if (!footprint) {
            fail(fmt::format("{} mode requires a footprint", to_string(space_mode)));
        }
        break;
    case space_mode_t::surface_fixed_distance:
        if (!fixed_surface) {
            fail("fixed distance mode requires a surface");
        }
        break;
    case space_mode_t::volume_between_surfaces:
        if (!top_surface || !bottom_surface) {
            fail("volume between surfaces mode requires top and bottom surfaces");
        }
        break;
    default:
        fail(fmt::format("unknown space mode {}", cast(space_mode)));
    }

    if (volumetric()) {
        if (z_step == 0 || !std::isfinite(z_step)) {
            fail(fmt::format("Z step must be finite and non-zero: {}", z_step));
        }
        if (max_slices_per_position == 0 || max_slices_skipped_above == 0) {
            fail("maximum slices per position must be positive");
        }
    }
    if (space_mode == space_mode_t::simple_z_stack && (z_end - z_start) * z_step < 0) {
        fail(fmt::format("Z end {} is not reachable from Z start {} with step {}", z_end, z_start, z_step));
    }

    if (time_enabled && time_points == 0) {
        fail("time lapse requires at least one time point");
    }
    if (time_interval < 0 || !std::isfinite(time_interval)) {
        fail(fmt::format("time interval must be finite and non-negative: {}", time_interval));
    }

    if (tile_overlap < 0 || tile_overlap >= 100) {
        fail(fmt::format("tile overlap must be within [0, 100) percent: {}", tile_overlap));
    }
}
