/** \rst

    event generation and timing for one multi-dimensional experiment

    An experiment owns a dedicated generator thread that walks time points,
    tile positions and focal slices and places one capture instruction per
    accepted (position, slice) pair on the shared instruction queue.  Each
    time point is gated twice.  Before emission, the generator waits until
    the scheduled start time has passed and the coordinating group agrees
    to start (the time point gate).  After emission, it waits until the
    write sink confirms that the time point has been written (the write
    gate).  Autofocus then runs synchronously on the generator thread.

    Cancellation is cooperative.  A stop token is passed into every
    blocking call made on behalf of the experiment, including the arrivals
    of the group and the write sink, so that an abort releases every party.
    Exactly one experiment finished instruction reaches the queue, as the
    last instruction of the experiment, whether the experiment completes,
    fails or is aborted.

 \endrst */

#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

#include <cadence/core.hpp>

#include <cadence/acquire/collaborators.hpp>
#include <cadence/acquire/config.hpp>
#include <cadence/acquire/instruction.hpp>
#include <cadence/acquire/queue.hpp>

#include <cadence/geometry/position.hpp>
#include <cadence/geometry/volume.hpp>

#include <cadence/util/sync.hpp>
#include <cadence/util/timer.hpp>

namespace cadence::acquire {

    enum class state_t : uint8_t {
        init = 0,    // settings read and positions computed
        await_gate,  // waiting for the start time and the group
        emitting,    // placing the time point's instructions on the queue
        await_write, // waiting for the write sink to finish the time point
        autofocus,   // running autofocus after the time point was written
        finished,    // all time points generated and written
        aborted      // cancelled or failed
    };
    const char* to_string(state_t state);

    using state_callback_t = std::function<void(state_t, std::exception_ptr)>;

    struct experiment_status_t {
        state_t state;
        size_t time_index, time_points;
        size_t emitted, timers_armed;
        size_t max_slice_index;
        bool paused;

        auto progress() const {
            if (time_points > 0) {
                return time_index / double(time_points);
            } else {
                return 0.0;
            }
        }
    };

    class experiment_t {
    public:

        using config_t = experiment_config_t;
        using arrival_t = sync::rendezvous_t::arrival_t;

        experiment_t(
            config_t config,
            std::shared_ptr<instruction_queue_t> queue,
            std::shared_ptr<group_t> group,
            std::shared_ptr<hardware_t> hardware,
            std::shared_ptr<autofocus_t> autofocus = nullptr,
            state_callback_t callback = {},
            std::shared_ptr<spdlog::logger> log = nullptr
        );

        ~experiment_t();

        experiment_t(const experiment_t&) = delete;
        experiment_t& operator=(const experiment_t&) = delete;

        //
        // coordinating group
        //

        // rendezvous with the generator before a time point starts
        arrival_t ready_for_next_timepoint();

        time_t next_start_time() const;

        //
        // write sink
        //

        // rendezvous with the generator once a time point's images are written
        arrival_t timepoint_written();

        // the sink has written the final image or drained after an abort
        void all_writes_finished();

        //
        // control
        //

        // stop generation and terminate the instruction stream; blocks until complete
        void abort();

        void pause();
        void resume();
        bool paused() const;

        //
        // status
        //

        experiment_id_t id() const { return _id; }
        const std::string& name() const { return _config.name; }
        const config_t& config() const { return _config; }

        state_t state() const { return _state; }
        experiment_status_t status() const;
        size_t max_slice_index() const { return _max_slice_index; }
        std::exception_ptr error() const;

        bool done() const;
        void wait() const;
        bool wait_for(const std::chrono::steady_clock::duration& timeout) const;

        //
        // geometry
        //

        const std::vector<geometry::xy_position_t>& positions() const { return _positions; }
        size_t num_rows() const;
        size_t num_columns() const;

        double time_interval() const { return _config.time_interval_ms(); }

        double z_top() const;
        double z_of_slice(size_t slice) const;
        ptrdiff_t slice_of_z(double z) const;

    protected:

        void _setup_positions();
        void _setup_policy();

        void _generate_loop();

        bool _hold_while_paused(std::stop_token& token);
        bool _await_gate(size_t time_index, std::stop_token& token);
        bool _emit_timepoint(size_t time_index, std::stop_token& token);
        bool _emit_slices(size_t time_index, size_t position_index, std::stop_token& token);
        bool _await_write(size_t time_index, std::stop_token& token);
        void _run_autofocus(size_t time_index);

        bool _push(instruction_t o, std::stop_token& token);
        void _terminate_stream();

        void _transition(state_t state, std::exception_ptr error = {});

        config_t _config;
        size_t _time_points;

        std::shared_ptr<instruction_queue_t> _queue;
        std::shared_ptr<group_t> _group;
        std::shared_ptr<hardware_t> _hardware;
        std::shared_ptr<autofocus_t> _autofocus;
        state_callback_t _callback;

        std::shared_ptr<spdlog::logger> _log;

        experiment_id_t _id;

        std::vector<geometry::xy_position_t> _positions;
        geometry::volume_policy_t _policy;
        std::optional<range_t<double>> _limits;
        std::shared_ptr<const property_pairings_t> _properties;

        std::atomic<state_t> _state = state_t::init;
        std::atomic<time_t> _next_start;
        std::atomic<size_t> _max_slice_index = 0, _time_index = 0, _emitted = 0, _timers_armed = 0;
        std::atomic_bool _finished = false, _terminal_emitted = false;

        sync::rendezvous_t _timepoint_gate, _write_gate;
        sync::event_t _running, _all_written, _complete;

        std::stop_source _stop;
        std::mutex _abort_mutex, _stream_mutex;
        mutable std::mutex _error_mutex;
        std::exception_ptr _error;

        util::timer_t<arrival_t> _timer;
        std::thread _worker;

    };

}
