#pragma once

#include <memory>
#include <stop_token>

#include <spdlog/logger.h>

#include <cadence/core.hpp>

#include <cadence/acquire/instruction.hpp>

#include <cadence/util/sync.hpp>

namespace cadence::acquire {

    struct instruction_queue_config_t {
        size_t capacity = 200;

        void validate() const {
            if (capacity == 0) {
                throw traced<std::invalid_argument>("instruction queue capacity must be positive");
            }
        }
    };

    // bounded queue shared by all concurrently running experiments with a single consumer
    class instruction_queue_t {
    public:

        using config_t = instruction_queue_config_t;

        struct purge_result_t {
            size_t removed = 0;
            bool terminal = false;
        };

        instruction_queue_t(std::shared_ptr<spdlog::logger> log = nullptr)
            : _log(std::move(log)) {
            _config.validate();
        }

        instruction_queue_t(config_t config, std::shared_ptr<spdlog::logger> log = nullptr)
            : instruction_queue_t(std::move(log)) {
            initialize(std::move(config));
        }

        void initialize(config_t config) {
            config.validate();
            std::swap(_config, config);
        }

        const auto& config() const {
            return _config;
        }

        // blocks while the queue is full; returns false if cancelled without inserting
        bool push(instruction_t o, std::stop_token token = {}) {
            if (token.stop_requested()) {
                return false;
            }
            if (_log) { _log->trace("push instruction {} for experiment {} ({} queued)", o.index(), owner(o), _queue.size()); }
            return _queue.push(std::move(o), _config.capacity, token);
        }

        // insert regardless of capacity so that stream termination never waits on other experiments
        bool push_unbounded(instruction_t o) {
            if (_log) { _log->trace("push unbounded instruction {} for experiment {}", o.index(), owner(o)); }
            return _queue.push(std::move(o));
        }

        bool pop(instruction_t& o, bool wait = true, std::stop_token token = {}) {
            return _queue.pop(o, wait, token);
        }

        // remove all pending instructions of one experiment, leaving other experiments untouched
        purge_result_t purge(experiment_id_t id) {
            purge_result_t result;
            result.removed = _queue.erase_if([&](const instruction_t& o) {
                if (owner(o) != id) {
                    return false;
                }
                if (is_terminal(o)) {
                    result.terminal = true;
                }
                return true;
            });

            if (_log) { _log->debug("purged {} pending instructions of experiment {}", result.removed, id); }
            return result;
        }

        size_t size() const {
            return _queue.size();
        }

        void finish() {
            _queue.finish();
        }

    protected:

        std::shared_ptr<spdlog::logger> _log;

        config_t _config;

        sync::queue_t<instruction_t> _queue;

    };

}
