#include <cadence/util/exception.hpp>

#include <iterator>
#include <sstream>

#include <fmt/format.h>

using namespace cadence;

tracer::tracer()
    : _thread(std::this_thread::get_id()) {
#if defined(CADENCE_ENABLE_BACKWARD)
    _stack.load_here(32);
#endif
}

std::string tracer::format() const {
    std::ostringstream id;
    id << _thread;

    std::string out = fmt::format("thrown on thread {}", id.str());

#if defined(CADENCE_ENABLE_BACKWARD)
    backward::TraceResolver resolver;
    resolver.load_stacktrace(_stack);

    for (size_t i = 0; i < _stack.size(); i++) {
        auto frame = resolver.resolve(_stack[i]);
        fmt::format_to(std::back_inserter(out), "\n  #{:<2} {} ({})", i, frame.object_function, frame.object_filename);
    }
#endif

    return out;
}
