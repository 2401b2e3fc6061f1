#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include <cadence/geometry/volume.hpp>
#include <cadence/util/variant.hpp>

#include <fakes/collaborators.hpp>

namespace geo = cadence::geometry;
using cadence::test::tilted_surface_t;

// walk slices the way the event generator does
static std::vector<double> walk(const geo::volume_policy_t& policy, const geo::xy_position_t& position, double step, size_t limit = 1000) {
    std::vector<double> out;
    double top = CALL_CONST(policy, top);
    for (size_t i = 0; i < limit; i++) {
        double z = top + i * step;
        if (CALL_CONST(policy, planar)) {
            if (i > 0) {
                break;
            }
        } else {
            if (CALL_CONST(policy, above, position, z)) {
                continue;
            }
            if (CALL_CONST(policy, below, position, z)) {
                break;
            }
        }
        out.push_back(z);
    }
    return out;
}

TEST(volume, planar_has_one_slice) {
    geo::volume_policy_t policy = geo::volume::planar_t{ 3.5 };
    EXPECT_EQ(walk(policy, {}, 1), std::vector<double>{ 3.5 });
}

TEST(volume, explicit_range_ascending) {
    geo::volume_policy_t policy = geo::volume::explicit_range_t{ 0, 3, 1 };
    EXPECT_EQ(walk(policy, {}, 1), (std::vector<double>{ 0, 1, 2, 3 }));
}

TEST(volume, explicit_range_descending) {
    geo::volume_policy_t policy = geo::volume::explicit_range_t{ 0, -10, -2 };
    EXPECT_EQ(walk(policy, {}, -2), (std::vector<double>{ 0, -2, -4, -6, -8, -10 }));
}

TEST(volume, explicit_range_keeps_inexact_end) {
    geo::volume_policy_t policy = geo::volume::explicit_range_t{ 0, 0.3, 0.1 };
    EXPECT_EQ(walk(policy, {}, 0.1).size(), 4u);
}

TEST(volume, explicit_range_single_slice) {
    geo::volume_policy_t policy = geo::volume::explicit_range_t{ 5, 5, 1 };
    EXPECT_EQ(walk(policy, {}, 1), std::vector<double>{ 5 });
}

TEST(volume, surface_offset_brackets_flat_surface) {
    auto surface = std::make_shared<tilted_surface_t>(10, 0);
    geo::volume_policy_t policy = geo::volume::surface_offset_t{ surface, 2, 3 };

    EXPECT_DOUBLE_EQ(CALL_CONST(policy, top), 8);
    EXPECT_EQ(walk(policy, {}, 1), (std::vector<double>{ 8, 9, 10, 11, 12, 13 }));
}

TEST(volume, surface_offset_skips_slices_above_tilted_surface) {
    auto surface = std::make_shared<tilted_surface_t>(10, 0.01);
    geo::volume_policy_t policy = geo::volume::surface_offset_t{ surface, 1, 1 };

    // surface lies 2 deeper at this tile than at the reference point
    geo::xy_position_t position;
    position.center = { 200, 0 };

    EXPECT_EQ(walk(policy, position, 1), (std::vector<double>{ 11, 12, 13 }));
}

TEST(volume, between_surfaces) {
    auto top = std::make_shared<tilted_surface_t>(0, 0);
    auto bottom = std::make_shared<tilted_surface_t>(4, 0);
    geo::volume_policy_t policy = geo::volume::between_surfaces_t{ top, bottom, 1, 1 };

    EXPECT_DOUBLE_EQ(CALL_CONST(policy, top), -1);
    EXPECT_EQ(walk(policy, {}, 1), (std::vector<double>{ -1, 0, 1, 2, 3, 4, 5 }));
}

TEST(volume, between_surfaces_empty_when_crossed) {
    auto top = std::make_shared<tilted_surface_t>(5, 0);
    auto bottom = std::make_shared<tilted_surface_t>(0, 0);
    geo::volume_policy_t policy = geo::volume::between_surfaces_t{ top, bottom, 0, 0 };

    EXPECT_TRUE(walk(policy, {}, 1).empty());
}
