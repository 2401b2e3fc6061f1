#pragma once

#include <string>
#include <thread>

#if defined(CADENCE_ENABLE_BACKWARD)
#  include <backward.hpp>
#endif

namespace cadence {

    // records where an exception was constructed
    class tracer {
    public:

        tracer();

        std::thread::id thread() const { return _thread; }
        std::string format() const;

    protected:

        std::thread::id _thread;

#if defined(CADENCE_ENABLE_BACKWARD)
        backward::StackTrace _stack;
#endif

    };

    template<typename T>
    struct traced : T, tracer {
        using T::T;
    };

    template<typename T>
    std::string check_trace(const T& e) {
        if (auto tr = dynamic_cast<const tracer*>(&e)) {
            return tr->format();
        }
        return "(untraced exception)";
    }

}
