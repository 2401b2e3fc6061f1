/** \rst

    interfaces to the spatial geometry collaborators

    Surfaces and footprints are computed outside of this library, usually
    by interpolating user-marked points.  The event generator only asks
    them for tile positions and for whether a tile lies entirely above or
    below a surface at a particular focal position.

 \endrst */

#pragma once

#include <vector>

#include <cadence/geometry/position.hpp>

namespace cadence::geometry {

    class footprint_t {
    public:

        virtual ~footprint_t() {}

        // tile positions covering the footprint, in acquisition order
        virtual std::vector<xy_position_t> positions(double tile_overlap) const = 0;

    };

    class surface_t : public footprint_t {
    public:

        // focal position of the first interpolation point
        virtual double reference_z() const = 0;

        virtual bool is_completely_above(const xy_position_t& position, double z) const = 0;
        virtual bool is_completely_below(const xy_position_t& position, double z) const = 0;

    };

}
