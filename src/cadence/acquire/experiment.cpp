#include <cadence/acquire/experiment.hpp>

#include <algorithm>
#include <cmath>

#include <cadence/util/cast.hpp>
#include <cadence/util/platform.hpp>
#include <cadence/util/variant.hpp>

using namespace cadence;
using namespace cadence::acquire;

static std::atomic<experiment_id_t> _next_experiment_id = 1;

const char* cadence::acquire::to_string(state_t state) {
    switch (state) {
    case state_t::init:
        return "init";
    case state_t::await_gate:
        return "await gate";
    case state_t::emitting:
        return "emitting";
    case state_t::await_write:
        return "await write";
    case state_t::autofocus:
        return "autofocus";
    case state_t::finished:
        return "finished";
    case state_t::aborted:
        return "aborted";
    default:
        return "unknown";
    }
}

experiment_t::experiment_t(config_t config, std::shared_ptr<instruction_queue_t> queue, std::shared_ptr<group_t> group, std::shared_ptr<hardware_t> hardware, std::shared_ptr<autofocus_t> autofocus, state_callback_t callback, std::shared_ptr<spdlog::logger> log)
    : _config(std::move(config)), _queue(std::move(queue)), _group(std::move(group)), _hardware(std::move(hardware)), _autofocus(std::move(autofocus)),
      _callback(std::move(callback)), _log(std::move(log)), _id(_next_experiment_id++),
      _running(true), _timer(_config.name + " Timer", _log) {

    try {
        _config.validate();
    } catch (const std::invalid_argument&) {
        raise(_log);
    }

    if (!_queue) {
        raise(_log, "experiment \"{}\" requires an instruction queue", _config.name);
    }
    if (!_group) {
        raise(_log, "experiment \"{}\" requires a coordinating group", _config.name);
    }
    if (_config.autofocus_enabled && !_autofocus) {
        raise(_log, "experiment \"{}\" has autofocus enabled without an autofocus controller", _config.name);
    }
    if (!_config.autofocus_enabled && _autofocus) {
        if (_log) { _log->debug("ignoring autofocus controller for experiment \"{}\" with autofocus disabled", _config.name); }
        _autofocus.reset();
    }

    _time_points = _config.time_point_count();
    _properties = std::make_shared<const property_pairings_t>(_config.property_pairings);

    _setup_positions();
    _setup_policy();

    if (_log) { _log->info("experiment \"{}\" ({}) prepared with {} time points at {} positions in {} mode", _config.name, _id, _time_points, _positions.size(), to_string(_config.space_mode)); }

    _worker = std::thread(&experiment_t::_generate_loop, this);
}

experiment_t::~experiment_t() {
    _stop.request_stop();
    _timepoint_gate.finish();
    _write_gate.finish();

    if (_worker.joinable()) {
        _worker.join();
    }

    _timer.finish();
}

void experiment_t::_setup_positions() {
    try {
        switch (_config.space_mode) {
        case space_mode_t::surface_fixed_distance:
            _positions = _config.fixed_surface->positions(_config.tile_overlap);
            break;
        case space_mode_t::volume_between_surfaces:
            if (_config.footprint_from == footprint_source_t::top) {
                _positions = _config.top_surface->positions(_config.tile_overlap);
            } else {
                _positions = _config.bottom_surface->positions(_config.tile_overlap);
            }
            break;
        case space_mode_t::simple_z_stack:
        case space_mode_t::region_2d:
            _positions = _config.footprint->positions(_config.tile_overlap);
            break;
        default: {
            // no spatial mode so image at the current stage position
            if (!_hardware) {
                throw traced<std::invalid_argument>("no hardware available to locate the current stage position");
            }

            size_t width = _hardware->image_width();
            size_t height = _hardware->image_height();
            auto overlap_x = size_t(width * _config.tile_overlap / 100);
            auto overlap_y = size_t(height * _config.tile_overlap / 100);

            geometry::xy_position_t position;
            position.center = _hardware->xy_stage_position();
            position.tile_size = { width - overlap_x, height - overlap_y };
            position.full_tile_size = { width, height };
            position.pixel_size_config = _hardware->pixel_size_config();
            _positions.push_back(std::move(position));
            break;
        }
        }
    } catch (const std::exception& e) {
        if (_log) { _log->error("problem with XY positions of experiment \"{}\": {}", _config.name, to_string(e)); }
        std::throw_with_nested(traced<std::runtime_error>(fmt::format("problem with XY positions of experiment \"{}\"; check acquisition settings", _config.name)));
    }

    if (_positions.empty()) {
        if (_log) { _log->warn("experiment \"{}\" has no XY positions", _config.name); }
    }
}

void experiment_t::_setup_policy() {
    double z_origin = 0;
    if (_hardware) {
        z_origin = _hardware->focus_position();
        _limits = _hardware->focus_limits();
    }

    switch (_config.space_mode) {
    case space_mode_t::surface_fixed_distance:
        _policy = geometry::volume::surface_offset_t{ _config.fixed_surface, _config.distance_above_fixed_surface, _config.distance_below_fixed_surface };
        break;
    case space_mode_t::volume_between_surfaces:
        _policy = geometry::volume::between_surfaces_t{ _config.top_surface, _config.bottom_surface, _config.distance_above_top_surface, _config.distance_below_bottom_surface };
        break;
    case space_mode_t::simple_z_stack:
        _policy = geometry::volume::explicit_range_t{ _config.z_start, _config.z_end, _config.z_step };
        break;
    default:
        _policy = geometry::volume::planar_t{ z_origin };
        break;
    }

    if (_limits && _log) { _log->debug("focus travel limited to [{}, {}]", _limits->min(), _limits->max()); }
}

//
// coordinating group and write sink
//

experiment_t::arrival_t experiment_t::ready_for_next_timepoint() {
    return _timepoint_gate.arrive(_stop.get_token());
}

cadence::time_t experiment_t::next_start_time() const {
    return _next_start;
}

experiment_t::arrival_t experiment_t::timepoint_written() {
    auto arrival = _write_gate.arrive(_stop.get_token());
    if (arrival != arrival_t::released) {
        if (_log) { _log->warn("write completion for experiment \"{}\" was {}", _config.name, sync::to_string(arrival)); }
    }
    return arrival;
}

void experiment_t::all_writes_finished() {
    if (_log) { _log->debug("all writes finished for experiment \"{}\"", _config.name); }

    // NOTE: set the flag before releasing the write gate so the generator recognizes completion
    _all_written.set();
    _write_gate.finish();

    _finished = true;
}

//
// control
//

void experiment_t::abort() {
    std::unique_lock<std::mutex> lock(_abort_mutex);

    if (_finished) {
        if (_log) { _log->debug("experiment \"{}\" already finished", _config.name); }
        return;
    }

    if (_log) { _log->warn("abort requested for experiment \"{}\" in {} state", _config.name, to_string(_state)); }

    // interrupt any wait in progress and wait for the generator to exit
    _stop.request_stop();
    if (_worker.joinable() && _worker.get_id() != std::this_thread::get_id()) {
        _worker.join();
    }
    if (error()) {
        // the generator failed and already terminated the stream and notified the group
        if (_log) { _log->debug("experiment \"{}\" already terminated by its generator", _config.name); }
        return;
    }

    // clear this experiment's pending instructions and terminate its stream
    _terminate_stream();

    std::exception_ptr group_error;
    try {
        _group->aborted(*this);
    } catch (const std::exception& e) {
        if (_log) { _log->error("error while notifying group of abort for experiment \"{}\": {}", _config.name, to_string(e)); }
        group_error = std::current_exception();
    }

    // NOTE: no party may remain waiting on this experiment
    _timepoint_gate.finish();
    _write_gate.finish();

    _finished = true;
    if (_state != state_t::aborted || group_error) {
        _transition(state_t::aborted, group_error);
    }

    if (_log) { _log->info("experiment \"{}\" aborted", _config.name); }

    if (group_error) {
        raise(_log, group_error);
    }
}

void experiment_t::pause() {
    if (_log) { _log->info("pausing experiment \"{}\"", _config.name); }
    _running.unset();
}

void experiment_t::resume() {
    if (_log) { _log->info("resuming experiment \"{}\"", _config.name); }
    _running.set();
}

bool experiment_t::paused() const {
    return !_running.status();
}

//
// status
//

experiment_status_t experiment_t::status() const {
    return experiment_status_t{
        _state, _time_index, _time_points,
        _emitted, _timers_armed,
        _max_slice_index,
        paused()
    };
}

std::exception_ptr experiment_t::error() const {
    std::unique_lock<std::mutex> lock(_error_mutex);
    return _error;
}

bool experiment_t::done() const {
    return _complete.status();
}

void experiment_t::wait() const {
    _complete.wait();
}

bool experiment_t::wait_for(const std::chrono::steady_clock::duration& timeout) const {
    return _complete.wait_for(timeout);
}

size_t experiment_t::num_rows() const {
    size_t n = 0;
    for (auto& p : _positions) {
        n = std::max(n, p.grid_row);
    }
    return n + 1;
}

size_t experiment_t::num_columns() const {
    size_t n = 0;
    for (auto& p : _positions) {
        n = std::max(n, p.grid_column);
    }
    return n + 1;
}

double experiment_t::z_top() const {
    return CALL_CONST(_policy, top);
}

double experiment_t::z_of_slice(size_t slice) const {
    return z_top() + slice * _config.z_step;
}

ptrdiff_t experiment_t::slice_of_z(double z) const {
    return downcast<ptrdiff_t>(std::round((z - z_top()) / _config.z_step));
}

//
// generator thread
//

void experiment_t::_generate_loop() {
    set_thread_name(_config.name + " Generator");
    if (_log) { _log->debug("event generator for experiment \"{}\" entered", _config.name); }

    auto token = _stop.get_token();

    try {
        _next_start = time_t{};

        bool completed = true;
        for (size_t time_index = 0; time_index < _time_points; time_index++) {
            _time_index = time_index;

            if (token.stop_requested() || !_hold_while_paused(token) || !_await_gate(time_index, token)) {
                completed = false;
                break;
            }

            _transition(state_t::emitting);
            if (!_emit_timepoint(time_index, token)) {
                completed = false;
                break;
            }

            _transition(state_t::await_write);
            if (!_await_write(time_index, token)) {
                completed = false;
                break;
            }

            // let sibling experiments proceed before the potentially slow autofocus
            _group->timepoint_generation_finished(*this);

            if (_autofocus) {
                _transition(state_t::autofocus);
                _run_autofocus(time_index);
            }
        }

        if (completed) {
            if (_log) { _log->info("experiment \"{}\" generated all {} time points", _config.name, _time_points); }
            _time_index = _time_points;
            _transition(state_t::finished);

            // release a group waiting for a time point that will never come
            _timepoint_gate.finish();
        } else {
            if (_log) { _log->warn("event generation for experiment \"{}\" cancelled at time point {}", _config.name, _time_index.load()); }

            // the consumer must see the end of this stream even if no abort follows
            _terminate_stream();
            _transition(state_t::aborted);
        }

    } catch (const std::exception& e) {
        if (_log) { _log->critical("unhandled exception in event generator for experiment \"{}\": {}\n{}", _config.name, to_string(e), check_trace(e)); }

        std::exception_ptr error = std::current_exception();
        {
            std::unique_lock<std::mutex> lock(_error_mutex);
            _error = error;
        }

        // best-effort cleanup so that downstream consumers and the group terminate
        _terminate_stream();
        _timepoint_gate.finish();
        _write_gate.finish();

        try {
            _group->aborted(*this);
        } catch (const std::exception& e) {
            if (_log) { _log->error("error while notifying group of failure of experiment \"{}\": {}", _config.name, to_string(e)); }
        }

        _finished = true;
        _transition(state_t::aborted, error);
    }

    _complete.set();
    if (_log) { _log->debug("event generator for experiment \"{}\" exited", _config.name); }
}

bool experiment_t::_hold_while_paused(std::stop_token& token) {
    if (_running.status()) {
        return true;
    }

    if (_log) { _log->info("experiment \"{}\" paused before time point {}", _config.name, _time_index.load()); }
    return _running.wait(token);
}

bool experiment_t::_await_gate(size_t time_index, std::stop_token& token) {
    _transition(state_t::await_gate);

    arrival_t arrival;
    auto deadline = _next_start.load();
    if (deadline <= clock_t::now()) {
        // start time already passed so only the group's consent is needed
        arrival = _timepoint_gate.arrive(token);
    } else {
        _timers_armed++;
        if (_log) { _log->debug("time point {} of experiment \"{}\" waits {:.1f} ms for its start time", time_index, _config.name, milliseconds(deadline - clock_t::now()).count()); }

        auto job = _timer.schedule(deadline, [this, token]() { return _timepoint_gate.arrive(token); }, token);
        if (!job->done.wait(token) || !job->result) {
            if (_log) { _log->warn("time point {} of experiment \"{}\" cancelled before its start time", time_index, _config.name); }
            return false;
        }
        arrival = *job->result;
    }

    if (arrival != arrival_t::released) {
        if (_log) { _log->warn("time point gate of experiment \"{}\" was {} at time point {}", _config.name, sync::to_string(arrival), time_index); }
        return false;
    }

    if (_log) { _log->info("experiment \"{}\" starting time point {}/{}", _config.name, time_index + 1, _time_points); }
    return true;
}

bool experiment_t::_emit_timepoint(size_t time_index, std::stop_token& token) {
    // focus correction must precede the captures of this time point
    if (_autofocus) {
        std::optional<double> position;
        if (time_index > 1) {
            try {
                position = _autofocus->position();
            } catch (const std::exception& e) {
                if (_log) { _log->error("unable to read autofocus position for experiment \"{}\": {}", _config.name, to_string(e)); }
            }
        } else if (_config.set_initial_autofocus_position) {
            position = _config.initial_autofocus_position;
        }

        if (position) {
            instruction::autofocus_adjust o;
            o.owner = _id;
            o.time_index = time_index;
            o.device = _config.autofocus_device;
            o.position = *position;
            if (!_push(std::move(o), token)) {
                return false;
            }
        }
    }

    // publish the next deadline before walking positions so that the group sees it early
    _next_start = clock_t::now() + std::chrono::duration_cast<clock_t::duration>(milliseconds(_config.time_interval_ms()));

    for (size_t position_index = 0; position_index < _positions.size(); position_index++) {
        if (!_emit_slices(time_index, position_index, token)) {
            return false;
        }
    }

    if (time_index + 1 == _time_points) {
        instruction::experiment_finished o;
        o.owner = _id;
        if (!_push(std::move(o), token)) {
            return false;
        }
        _terminal_emitted = true;
    } else {
        instruction::timepoint_finished o;
        o.owner = _id;
        o.time_index = time_index;
        if (!_push(std::move(o), token)) {
            return false;
        }
    }

    return true;
}

bool experiment_t::_emit_slices(size_t time_index, size_t position_index, std::stop_token& token) {
    const auto& position = _positions[position_index];
    bool planar = CALL_CONST(_policy, planar);
    double step = _config.z_step;

    // NOTE: top is looked up per position since surface-relative volumes vary by position
    double z_top = CALL_CONST(_policy, top);

    std::optional<size_t> first_accepted;
    for (size_t slice_index = 0; ; slice_index++) {
        double z = z_top + slice_index * step;

        if (planar) {
            if (slice_index > 0) {
                break;
            }
        } else {
            if (!first_accepted && slice_index >= _config.max_slices_skipped_above) {
                raise(_log, "slice walk of experiment \"{}\" at position {} skipped {} slices without reaching the top of the volume", _config.name, position_index, _config.max_slices_skipped_above);
            }
            if (first_accepted && slice_index - *first_accepted >= _config.max_slices_per_position) {
                raise(_log, "slice walk of experiment \"{}\" at position {} exceeded {} slices without reaching the bottom of the volume", _config.name, position_index, _config.max_slices_per_position);
            }

            // the above test precedes the below test so that a position-dependent top is honored
            bool behind_limit = _limits && (step >= 0 ? z < _limits->min() : z > _limits->max());
            if (CALL_CONST(_policy, above, position, z) || behind_limit) {
                continue;
            }
            bool beyond_limit = _limits && (step >= 0 ? z > _limits->max() : z < _limits->min());
            if (CALL_CONST(_policy, below, position, z) || beyond_limit) {
                break;
            }

            if (!first_accepted) {
                first_accepted = slice_index;
            }
        }

        instruction::capture o;
        o.owner = _id;
        o.time_index = time_index;
        o.channel_index = 0;
        o.slice_index = slice_index;
        o.position_index = position_index;
        o.z = z;
        o.position = position;
        o.properties = _properties;

        if (slice_index > _max_slice_index) {
            _max_slice_index = slice_index;
        }

        if (_log) { _log->trace("capture t={} p={} s={} z={}", time_index, position_index, slice_index, z); }
        if (!_push(std::move(o), token)) {
            return false;
        }
        _emitted++;
    }

    return true;
}

bool experiment_t::_await_write(size_t time_index, std::stop_token& token) {
    if (_all_written.status()) {
        return true;
    }

    auto arrival = _write_gate.arrive(token);
    if (arrival == arrival_t::released || _all_written.status()) {
        if (_log) { _log->debug("time point {} of experiment \"{}\" written", time_index, _config.name); }
        return true;
    }

    if (_log) { _log->warn("write gate of experiment \"{}\" was {} at time point {}", _config.name, sync::to_string(arrival), time_index); }
    return false;
}

void experiment_t::_run_autofocus(size_t time_index) {
    try {
        _autofocus->run(time_index);
    } catch (const std::exception& e) {
        if (_log) { _log->error("problem running autofocus for experiment \"{}\" at time point {}: {}", _config.name, time_index, to_string(e)); }
    }
}

bool experiment_t::_push(instruction_t o, std::stop_token& token) {
    // NOTE: checked before every potentially blocking insertion
    if (token.stop_requested()) {
        return false;
    }
    return _queue->push(std::move(o), token);
}

void experiment_t::_terminate_stream() {
    std::unique_lock<std::mutex> lock(_stream_mutex);

    auto purged = _queue->purge(_id);
    if (_terminal_emitted && !purged.terminal) {
        // the consumer already received the end of this stream
        if (_log) { _log->debug("experiment \"{}\" stream already terminated", _config.name); }
        return;
    }

    instruction::experiment_finished o;
    o.owner = _id;
    if (!_queue->push_unbounded(std::move(o))) {
        if (_log) { _log->warn("instruction queue finished before experiment \"{}\" could terminate its stream", _config.name); }
    }
    _terminal_emitted = true;
}

void experiment_t::_transition(state_t state, std::exception_ptr error) {
    _state = state;
    if (_log) { _log->debug("experiment \"{}\" entering {} state", _config.name, to_string(state)); }

    if (_callback) {
        try {
            std::invoke(_callback, state, error);
        } catch (const std::exception& e) {
            if (_log) { _log->error("error during state callback: {}", to_string(e)); }
        }
    }
}
