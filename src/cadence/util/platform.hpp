#pragma once

#include <optional>
#include <string>

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
#  define CADENCE_PLATFORM_WINDOWS
#elif __linux__
#  define CADENCE_PLATFORM_LINUX
#else
#  error "Unsupported platform"
#endif

namespace cadence {

    // Ctrl-C only raises a flag that the main loop polls
    void setup_keyboard_interrupt();
    bool check_keyboard_interrupt();

    void set_thread_name(const std::string& name);

    std::optional<std::string> envvar(const std::string& name);

}
