#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <algorithm>
#include <functional>
#include <chrono>
#include <stop_token>

namespace cadence::sync {

    template<typename T>
    class queue_t {
    public:

        // NOTE: returns false without inserting if cancelled or finished while waiting for space
        bool push(T o, size_t limit = 0, std::stop_token token = {}) {
            std::unique_lock<std::mutex> lock(_mutex);

            if (limit > 0 && _queue.size() >= limit) {
                _pop_cv.wait(lock, token, [&]() { return _queue.size() < limit || _finished; });
            }
            if (_finished || token.stop_requested()) {
                return false;
            }

            _queue.emplace_back(std::move(o));
            _push_cv.notify_one();
            return true;
        }

        bool pop(T& o, bool wait = true, std::stop_token token = {}) {
            std::unique_lock<std::mutex> lock(_mutex);
            if (wait && _queue.empty() && !_finished) {
                _push_cv.wait(lock, token, [&]() { return !_queue.empty() || _finished; });
            }

            if (_queue.empty()) {
                return false;
            } else {
                o = std::move(_queue.front());
                _queue.pop_front();
                _pop_cv.notify_all();
                return true;
            }
        }

        template<typename predicate_t>
        size_t erase_if(predicate_t&& predicate) {
            std::unique_lock<std::mutex> lock(_mutex);
            auto n = std::erase_if(_queue, std::forward<predicate_t>(predicate));
            if (n > 0) {
                _pop_cv.notify_all();
            }
            return n;
        }

        size_t size() const {
            std::unique_lock<std::mutex> lock(_mutex);
            return _queue.size();
        }

        void clear() {
            std::unique_lock<std::mutex> lock(_mutex);
            _queue.clear();
            _pop_cv.notify_all();
        }

        void finish() {
            std::unique_lock<std::mutex> lock(_mutex);
            _finished = true;
            _push_cv.notify_all();
            _pop_cv.notify_all();
        }

    protected:

        bool _finished = false;

        std::condition_variable_any _push_cv, _pop_cv;
        mutable std::mutex _mutex;
        std::deque<T> _queue;

    };

    class event_t {
    public:

        event_t(bool s = false);

        void set();
        void unset();

        bool status() const;
        bool wait(std::stop_token token = {}) const;
        bool wait_for(const std::chrono::steady_clock::duration& timeout, std::stop_token token = {}) const;

        void finish();

        struct scoped_set_t {
            scoped_set_t(event_t& event_)
                : event(event_) {}
            ~scoped_set_t() {
                event.set();
            }

            event_t& event;
        };

    protected:

        std::atomic_bool _set;
        std::atomic_bool _finished;

        mutable std::mutex _mutex;
        mutable std::condition_variable_any _cv;

    };

    // two-party (or n-party) cyclic rendezvous with explicit broken state
    class rendezvous_t {
    public:

        using clock_t = std::chrono::steady_clock;

        enum class arrival_t {
            released,   // all parties arrived
            broken,     // barrier was reset or finished while waiting or before arrival
            cancelled,  // the caller's stop token fired
            timeout,    // the deadline passed before the other parties arrived
        };

        enum class state_t {
            armed,
            released,
            broken,
        };

        rendezvous_t(size_t parties = 2);

        arrival_t arrive(std::stop_token token = {});
        arrival_t arrive_until(clock_t::time_point deadline, std::stop_token token = {});

        // break the current generation and re-arm for the next
        void reset();
        // break permanently so that all present and future arrivals observe a broken barrier
        void finish();

        state_t state() const;
        size_t waiting() const;
        size_t parties() const;

    protected:

        struct generation_t {
            bool tripped = false;
            bool broken = false;
        };

        template<typename wait_t>
        arrival_t _arrive(std::stop_token& token, wait_t&& wait);

        void _break();
        void _next();

        size_t _parties, _arrived = 0;
        bool _finished = false, _released = false;
        std::shared_ptr<generation_t> _generation;

        mutable std::mutex _mutex;
        std::condition_variable_any _cv;

    };

    // returns false if cancelled before the deadline
    bool sleep_until(std::chrono::steady_clock::time_point deadline, std::stop_token token = {});

    const char* to_string(rendezvous_t::arrival_t arrival);

}
