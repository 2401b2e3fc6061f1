#pragma once

#include <thread>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include <cadence/core.hpp>

#include <cadence/util/sync.hpp>
#include <cadence/util/platform.hpp>

namespace cadence::util {

    class worker_pool_t {
    public:

        using task_t = std::function<void()>;

        worker_pool_t() {}
        worker_pool_t(const std::string& name, size_t n = 0, std::shared_ptr<spdlog::logger> log = nullptr)
            : _log(std::move(log)) {

            if (n == 0) {
                n = std::thread::hardware_concurrency();
            }

            _threads.resize(n);
            for (size_t i = 0; i < n; i++) {
                _threads[i] = std::thread(&worker_pool_t::_loop, this, n == 1 ? name : fmt::format("{} {}", name, i));
            }
        }

        ~worker_pool_t() {
            wait_finish();
        }

        void post(task_t&& task) {
            _tasks.push(std::forward<task_t>(task));
        }

        void wait_finish() {
            _tasks.finish();

            for (auto& thread : _threads) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
        }

    protected:

        void _loop(std::string name) {
            set_thread_name(name);

            if (_log) { _log->debug("{} thread entered", name); }

#if defined(CADENCE_EXCEPTION_GUARDS)
            try {
#endif
                task_t task;
                while (_tasks.pop(task)) {
                    std::invoke(task);
                }
#if defined(CADENCE_EXCEPTION_GUARDS)
            } catch (const std::exception& e) {
                if (_log) { _log->critical("unhandled exception in {} thread: {}\n{}", name, to_string(e), check_trace(e)); }
            }
#endif

            if (_log) { _log->debug("{} thread exited", name); }
        }

        std::shared_ptr<spdlog::logger> _log;

        std::vector<std::thread> _threads;
        sync::queue_t<task_t> _tasks;

    };

}
