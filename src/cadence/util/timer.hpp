#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include <spdlog/logger.h>

#include <cadence/core.hpp>

#include <cadence/util/sync.hpp>
#include <cadence/util/thread.hpp>

namespace cadence::util {

    // runs delayed tasks one at a time on a dedicated thread
    template<typename result_t>
    class timer_t {
    public:

        using task_t = std::function<result_t()>;

        struct job_t {
            time_t deadline;
            task_t task;

            std::optional<result_t> result;
            std::exception_ptr error;

            sync::event_t done;
        };
        using job_ptr_t = std::shared_ptr<job_t>;

        timer_t(const std::string& name, std::shared_ptr<spdlog::logger> log = nullptr)
            : _log(log), _pool(name, 1, std::move(log)) {}

        ~timer_t() {
            _pool.wait_finish();
        }

        // NOTE: the task is skipped if the token fires before the deadline
        job_ptr_t schedule(time_t deadline, task_t&& task, std::stop_token token = {}) {
            auto job = std::make_shared<job_t>();
            job->deadline = deadline;
            job->task = std::forward<task_t>(task);

            _pool.post([this, job, token]() {
                sync::event_t::scoped_set_t set_on_exit(job->done);

                if (!sync::sleep_until(job->deadline, token)) {
                    if (_log) { _log->debug("delayed task cancelled before deadline"); }
                    return;
                }

                try {
                    job->result = std::invoke(job->task);
                } catch (const std::exception& e) {
                    if (_log) { _log->error("error during delayed task: {}", to_string(e)); }
                    job->error = std::current_exception();
                }
            });

            return job;
        }

        void finish() {
            _pool.wait_finish();
        }

    protected:

        std::shared_ptr<spdlog::logger> _log;

        worker_pool_t _pool;

    };

}
