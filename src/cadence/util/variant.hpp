#pragma once

#include <variant>

namespace cadence {

    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };

    // dispatch a const member function or read a member shared by all alternatives
#define CALL_CONST(obj, function, ...) std::visit([&](const auto& c) { return c.function(__VA_ARGS__); }, obj)
#define ACCESS_CONST(obj, attribute) std::visit([](const auto& c) { return c.attribute; }, obj)

}
