#pragma once

#include <chrono>
#include <array>
#include <limits>
#include <cmath>
#include <exception>
#include <memory>
#include <string>
#include <stdexcept>

#include <fmt/format.h>

#include <cadence/util/exception.hpp>

namespace cadence {

    using clock_t = std::chrono::steady_clock;
    using time_t = clock_t::time_point;

    // closed interval, unbounded unless set
    template<typename T>
    struct range_t {
        std::array<T, 2> val = {
            -std::numeric_limits<T>::infinity(),
            std::numeric_limits<T>::infinity()
        };

        range_t() {}
        range_t(T lower, T upper) : val{ { lower, upper } } {}

        T& min() { return val[0]; }
        const T& min() const { return val[0]; }
        T& max() { return val[1]; }
        const T& max() const { return val[1]; }
    };

    std::string to_string(const std::exception& e, size_t level = 0);
    std::string to_string(const std::exception_ptr& error);

    template<typename logger_t, typename... args_t>
    [[ noreturn ]] void raise(std::shared_ptr<logger_t> logger, const std::string& msg, args_t... args) {
#if FMT_VERSION >= 80000
        auto error_msg = fmt::format(fmt::runtime(msg), args...);
#else
        auto error_msg = fmt::format(msg, args...);
#endif
        if (logger) {
            logger->error(error_msg);
            logger->dump_backtrace();
            logger->flush();
        }
        throw traced<std::runtime_error>(error_msg);
    }
    template<typename logger_t>
    [[ noreturn ]] void raise(std::shared_ptr<logger_t> logger, std::exception_ptr e = {}) {
        if (!e) {
            e = std::current_exception();
        }
        if (!e) {
            try {
                throw traced<std::invalid_argument>("raise called with no exception");
            } catch (const std::invalid_argument&) {
                e = std::current_exception();
            }
        }
        if (logger) {
            logger->error(to_string(e));
            logger->dump_backtrace();
            logger->flush();
        }
        std::rethrow_exception(e);
    }

    using seconds = std::chrono::duration<double>;
    using milliseconds = std::chrono::duration<double, std::milli>;

}
