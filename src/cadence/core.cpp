#include <cadence/core.hpp>

static std::string _describe_nested(const std::exception& e, size_t level) {
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& cause) {
        return fmt::format("\n{:{}}caused by: {}", "", 2 * level, cadence::to_string(cause, level));
    } catch (...) {
        return fmt::format("\n{:{}}caused by: non-standard exception", "", 2 * level);
    }
    return {};
}

std::string cadence::to_string(const std::exception& e, size_t level) {
    return e.what() + _describe_nested(e, level + 1);
}

std::string cadence::to_string(const std::exception_ptr& error) {
    if (!error) {
        return {};
    }

    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return to_string(e);
    } catch (...) {
        return "non-standard exception";
    }
}
