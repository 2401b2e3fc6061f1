/** \rst

    volume policies that bound the focal slice walk at each tile

    Each policy answers three questions for the event generator: where the
    walk starts (the top coordinate), whether a focal position is still
    above the imaged volume at a tile (skip the slice and keep walking), and
    whether it has passed below the volume (stop walking).  Surface-relative
    policies consult the surface collaborator at every slice because the
    volume boundaries vary from tile to tile.

    "Above" and "below" are relative to the walk direction given by the
    sign of the slice step.

 \endrst */

#pragma once

#include <cmath>
#include <memory>
#include <variant>

#include <cadence/geometry/position.hpp>
#include <cadence/geometry/surface.hpp>

namespace cadence::geometry {

    namespace volume {

        // single focal plane at a fixed origin
        struct planar_t {
            double origin = 0;

            planar_t() {}
            planar_t(double origin_) : planar_t() { origin = origin_; }

            bool planar() const { return true; }

            double top() const { return origin; }
            bool above(const xy_position_t&, double) const { return false; }
            bool below(const xy_position_t&, double) const { return false; }
        };

        // fixed distance on either side of one surface
        struct surface_offset_t {
            std::shared_ptr<const surface_t> surface;
            double distance_above = 0, distance_below = 0;

            bool planar() const { return false; }

            double top() const {
                return surface->reference_z() - distance_above;
            }
            bool above(const xy_position_t& position, double z) const {
                return surface->is_completely_above(position, z + distance_above);
            }
            bool below(const xy_position_t& position, double z) const {
                return surface->is_completely_below(position, z - distance_below);
            }
        };

        // from above a top surface to below a bottom surface
        struct between_surfaces_t {
            std::shared_ptr<const surface_t> top_surface, bottom_surface;
            double distance_above_top = 0, distance_below_bottom = 0;

            bool planar() const { return false; }

            double top() const {
                return top_surface->reference_z() - distance_above_top;
            }
            bool above(const xy_position_t& position, double z) const {
                return top_surface->is_completely_above(position, z + distance_above_top);
            }
            bool below(const xy_position_t& position, double z) const {
                return bottom_surface->is_completely_below(position, z - distance_below_bottom);
            }
        };

        // explicit start and end focal positions
        struct explicit_range_t {
            double start = 0, end = 0, step = 1;

            bool planar() const { return false; }

            double top() const { return start; }
            bool above(const xy_position_t&, double z) const {
                return step >= 0 ? z < start - _tolerance() : z > start + _tolerance();
            }
            bool below(const xy_position_t&, double z) const {
                return step >= 0 ? z > end + _tolerance() : z < end - _tolerance();
            }

        protected:

            // absorb rounding in start + n * step so the end slice is not lost
            double _tolerance() const { return 1e-6 * std::abs(step); }
        };

    }

    using volume_policy_t = std::variant<
        volume::planar_t,
        volume::surface_offset_t,
        volume::between_surfaces_t,
        volume::explicit_range_t
    >;

}
