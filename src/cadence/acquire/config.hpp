#pragma once

#include <memory>
#include <string>
#include <vector>

#include <cadence/core.hpp>

#include <cadence/acquire/instruction.hpp>

#include <cadence/geometry/surface.hpp>

#include <cadence/util/cast.hpp>

namespace cadence::acquire {

    enum class space_mode_t {
        none,
        region_2d,
        simple_z_stack,
        surface_fixed_distance,
        volume_between_surfaces,
    };

    enum class interval_unit_t {
        milliseconds = 0,
        seconds = 1,
        minutes = 2,
    };

    enum class footprint_source_t {
        top,
        bottom,
    };

    using cadence::to_string;
    std::string to_string(space_mode_t mode);

    struct experiment_config_t {

        std::string name = "experiment";

        space_mode_t space_mode = space_mode_t::none;

        std::shared_ptr<const geometry::surface_t> fixed_surface, top_surface, bottom_surface;
        std::shared_ptr<const geometry::footprint_t> footprint;
        footprint_source_t footprint_from = footprint_source_t::top;

        double distance_above_fixed_surface = 0, distance_below_fixed_surface = 0;
        double distance_above_top_surface = 0, distance_below_bottom_surface = 0;

        double z_start = 0, z_end = 0, z_step = 1;

        // percent of the frame shared with neighbouring tiles
        double tile_overlap = 0;

        bool time_enabled = false;
        size_t time_points = 1;
        double time_interval = 0;
        interval_unit_t time_interval_unit = interval_unit_t::milliseconds;

        bool autofocus_enabled = false;
        std::string autofocus_device;
        bool set_initial_autofocus_position = false;
        double initial_autofocus_position = 0;

        property_pairings_t property_pairings;

        // only a single channel is emitted per slice at present
        std::vector<std::string> channels;

        // slices walked at one position from the first slice inside the volume
        size_t max_slices_per_position = 10'000;
        // slices skipped above the volume before the first slice inside it
        size_t max_slices_skipped_above = 1'000'000;

        bool volumetric() const {
            return space_mode == space_mode_t::simple_z_stack
                || space_mode == space_mode_t::surface_fixed_distance
                || space_mode == space_mode_t::volume_between_surfaces;
        }

        size_t time_point_count() const {
            return time_enabled ? time_points : 1;
        }

        double time_interval_ms() const {
            switch (time_interval_unit) {
            case interval_unit_t::seconds:
                return time_interval * 1000;
            case interval_unit_t::minutes:
                return time_interval * 60'000;
            default:
                return time_interval;
            }
        }

        void validate() const;

    };

}
