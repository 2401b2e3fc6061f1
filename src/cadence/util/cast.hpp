#pragma once

#include <cmath>
#include <limits>
#include <stdexcept>
#include <type_traits>

#include <fmt/format.h>

#include <cadence/util/exception.hpp>

namespace cadence {

    // convert a floating point value to an integer type, rejecting values it cannot hold
    template<typename T, typename U, typename = std::enable_if_t<std::is_integral_v<T> && std::is_floating_point_v<U>>>
    T downcast(U o) {
        if (!std::isfinite(o)) {
            throw traced<std::out_of_range>(fmt::format("cannot convert non-finite value {} to an integer", o));
        }
        if (o < static_cast<U>(std::numeric_limits<T>::lowest()) || o > static_cast<U>(std::numeric_limits<T>::max())) {
            throw traced<std::out_of_range>(fmt::format("value {} is outside of [{}, {}]", o, std::numeric_limits<T>::lowest(), std::numeric_limits<T>::max()));
        }
        return static_cast<T>(o);
    }

    template<typename T, typename = std::enable_if_t<std::is_enum_v<T>>>
    constexpr auto cast(T v) {
        return static_cast<std::underlying_type_t<T>>(v);
    }

}
