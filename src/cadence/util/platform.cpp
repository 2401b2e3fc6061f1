#define _CRT_SECURE_NO_WARNINGS

#include <cadence/util/platform.hpp>

#include <cstdlib>
#include <stdexcept>

#if defined(CADENCE_PLATFORM_WINDOWS)
#  include <Windows.h>
#else
#  include <pthread.h>
#endif

#include <errno.h>
#include <signal.h>
#include <string.h>

#include <fmt/format.h>

namespace cadence {

    static volatile sig_atomic_t _keyboard_interrupt = 0;

    bool check_keyboard_interrupt() {
        bool flag = (_keyboard_interrupt != 0);
        _keyboard_interrupt = 0;
        return flag;
    }

#if defined(CADENCE_PLATFORM_WINDOWS)

    static BOOL WINAPI _console_handler(DWORD type) {
        if (type == CTRL_C_EVENT) {
            _keyboard_interrupt = 1;
            return TRUE;
        }
        return FALSE;
    }

    void setup_keyboard_interrupt() {
        if (!SetConsoleCtrlHandler(&_console_handler, TRUE)) {
            throw std::runtime_error(fmt::format("unable to install console handler: 0x{:08x}", ::GetLastError()));
        }
    }

    void set_thread_name(const std::string& name) {
        std::wstring wide(name.begin(), name.end());
        ::SetThreadDescription(::GetCurrentThread(), wide.c_str());
    }

#elif defined(CADENCE_PLATFORM_LINUX)

    static void _signal_handler(int sig) {
        if (sig == SIGINT) {
            _keyboard_interrupt = 1;
        }
    }

    void setup_keyboard_interrupt() {
        struct sigaction action = {};
        action.sa_handler = &_signal_handler;
        sigemptyset(&action.sa_mask);

        if (::sigaction(SIGINT, &action, nullptr) != 0) {
            throw std::runtime_error(fmt::format("unable to install interrupt handler: {} ({})", ::strerror(errno), errno));
        }
    }

    void set_thread_name(const std::string& name) {
        // NOTE: linux limits thread names to 15 characters
        ::pthread_setname_np(::pthread_self(), name.substr(0, 15).c_str());
    }

#endif

    std::optional<std::string> envvar(const std::string& name) {
        if (auto value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        return {};
    }

}
