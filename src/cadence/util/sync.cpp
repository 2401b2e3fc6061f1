#include <cadence/util/sync.hpp>

using namespace cadence::sync;

event_t::event_t(bool set)
    : _set(set), _finished(false) {
}

void event_t::set() {
    std::unique_lock<std::mutex> lock(_mutex);
    _set = true;
    _cv.notify_all();
}

void event_t::unset() {
    std::unique_lock<std::mutex> lock(_mutex);
    _set = false;
}

bool event_t::wait(std::stop_token token) const {
    if (!_set && !_finished) {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, token, [&]() { return _set || _finished; });
    }

    return _set;
}

bool event_t::wait_for(const std::chrono::steady_clock::duration& timeout, std::stop_token token) const {
    if (!_set && !_finished) {
        std::unique_lock<std::mutex> lock(_mutex);
        if (!_cv.wait_for(lock, token, timeout, [&]() { return _set || _finished; })) {
            return false;
        }
    }

    return _set;
}

bool event_t::status() const {
    return _set;
}

void event_t::finish() {
    std::unique_lock<std::mutex> lock(_mutex);
    _finished = true;
    _cv.notify_all();
}


rendezvous_t::rendezvous_t(size_t parties)
    : _parties(parties), _generation(std::make_shared<generation_t>()) {
}

rendezvous_t::arrival_t rendezvous_t::arrive(std::stop_token token) {
    return _arrive(token, [&](auto& lock, auto& predicate) {
        _cv.wait(lock, token, predicate);
        return true;
    });
}

rendezvous_t::arrival_t rendezvous_t::arrive_until(clock_t::time_point deadline, std::stop_token token) {
    return _arrive(token, [&](auto& lock, auto& predicate) {
        return _cv.wait_until(lock, token, deadline, predicate) || token.stop_requested();
    });
}

template<typename wait_t>
rendezvous_t::arrival_t rendezvous_t::_arrive(std::stop_token& token, wait_t&& wait) {
    std::unique_lock<std::mutex> lock(_mutex);

    auto generation = _generation;
    if (_finished || generation->broken) {
        return arrival_t::broken;
    }
    if (token.stop_requested()) {
        return arrival_t::cancelled;
    }

    if (++_arrived == _parties) {
        // last party trips the barrier
        generation->tripped = true;
        _released = true;
        _next();
        _cv.notify_all();
        return arrival_t::released;
    }

    auto predicate = [&]() { return generation->tripped || generation->broken; };
    bool in_time = wait(lock, predicate);

    if (generation->tripped) {
        return arrival_t::released;
    } else if (generation->broken) {
        return arrival_t::broken;
    }

    // NOTE: abandoning a rendezvous breaks it so the other parties cannot wait forever
    if (generation == _generation) {
        _break();
    }
    if (token.stop_requested() || in_time) {
        return arrival_t::cancelled;
    } else {
        return arrival_t::timeout;
    }
}

void rendezvous_t::reset() {
    std::unique_lock<std::mutex> lock(_mutex);
    _break();
    _next();
}

void rendezvous_t::finish() {
    std::unique_lock<std::mutex> lock(_mutex);
    _finished = true;
    _break();
}

rendezvous_t::state_t rendezvous_t::state() const {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_finished || _generation->broken) {
        return state_t::broken;
    } else if (_released && _arrived == 0) {
        return state_t::released;
    } else {
        return state_t::armed;
    }
}

size_t rendezvous_t::waiting() const {
    std::unique_lock<std::mutex> lock(_mutex);
    return _arrived;
}

size_t rendezvous_t::parties() const {
    return _parties;
}

void rendezvous_t::_break() {
    _generation->broken = true;
    _arrived = 0;
    _released = false;
    _cv.notify_all();
}

void rendezvous_t::_next() {
    _arrived = 0;
    _generation = std::make_shared<generation_t>();
}

bool cadence::sync::sleep_until(std::chrono::steady_clock::time_point deadline, std::stop_token token) {
    std::mutex mutex;
    std::condition_variable_any cv;

    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_until(lock, token, deadline, []() { return false; });

    return !token.stop_requested();
}

const char* cadence::sync::to_string(rendezvous_t::arrival_t arrival) {
    switch (arrival) {
    case rendezvous_t::arrival_t::released:
        return "released";
    case rendezvous_t::arrival_t::broken:
        return "broken";
    case rendezvous_t::arrival_t::cancelled:
        return "cancelled";
    case rendezvous_t::arrival_t::timeout:
        return "timeout";
    default:
        return "unknown";
    }
}
