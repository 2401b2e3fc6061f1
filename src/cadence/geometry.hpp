#pragma once

#include <cadence/geometry/position.hpp>
#include <cadence/geometry/surface.hpp>
#include <cadence/geometry/volume.hpp>
