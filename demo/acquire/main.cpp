#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <fmt/format.h>

#include <lyra/lyra.hpp>

#include <cadence/acquire.hpp>
#include <cadence/geometry.hpp>

#include <cadence/util/exception.hpp>
#include <cadence/util/variant.hpp>
#include <cadence/util/platform.hpp>

using sink_t = spdlog::sinks::stderr_color_sink_mt;
#if defined(NDEBUG)
#   define make_logger(name) spdlog::create_async<sink_t>(name)
#else
#   define make_logger(name) spdlog::create<sink_t>(name)
#endif

static auto logger            = make_logger("main");
static auto experiment_logger = make_logger("experiment");
static auto queue_logger      = make_logger("queue");
static auto timer_logger      = make_logger("timer");
static auto group_logger      = make_logger("group");
static auto sink_logger       = make_logger("sink");

namespace acq = cadence::acquire;
namespace geo = cadence::geometry;

// stage and camera reporting fixed values
class simulated_hardware_t : public acq::hardware_t {
public:

    std::array<double, 2> xy_stage_position() const override { return { 0, 0 }; }
    double focus_position() const override { return 0; }
    size_t image_width() const override { return 2048; }
    size_t image_height() const override { return 2048; }
    std::string pixel_size_config() const override { return "Res10x"; }

};

// raster of tiles over a rectangular region
class raster_footprint_t : public geo::footprint_t {
public:

    raster_footprint_t(size_t rows, size_t columns, double tile_width)
        : _rows(rows), _columns(columns), _tile_width(tile_width) {}

    std::vector<geo::xy_position_t> positions(double tile_overlap) const override {
        double pitch = _tile_width * (1 - tile_overlap / 100);

        std::vector<geo::xy_position_t> out;
        for (size_t r = 0; r < _rows; r++) {
            for (size_t c = 0; c < _columns; c++) {
                // serpentine order keeps stage moves short
                auto column = (r % 2 == 0) ? c : _columns - c - 1;

                geo::xy_position_t p;
                p.center = { column * pitch, r * pitch };
                p.grid_row = r;
                p.grid_column = column;
                out.push_back(std::move(p));
            }
        }
        return out;
    }

protected:

    size_t _rows, _columns;
    double _tile_width;

};

// consumes the shared queue and pretends to write each frame
class writer_t {
public:

    writer_t(std::shared_ptr<acq::instruction_queue_t> queue, std::shared_ptr<spdlog::logger> log)
        : _queue(std::move(queue)), _log(std::move(log)) {}

    void run(const std::map<acq::experiment_id_t, acq::experiment_t*>& experiments, std::chrono::milliseconds exposure) {
        cadence::set_thread_name("Writer");

        auto remaining = experiments.size();
        acq::instruction_t o;
        while (remaining > 0 && _queue->pop(o)) {
            auto it = experiments.find(acq::owner(o));
            if (it == experiments.end()) {
                if (_log) { _log->warn("dropping instruction for unknown experiment {}", acq::owner(o)); }
                continue;
            }
            auto& experiment = *it->second;

            std::visit(cadence::overloaded{
                [&](const acq::instruction::capture& c) {
                    std::this_thread::sleep_for(exposure);
                    _frames++;
                    if (_log) { _log->trace("{}: t={} p={} s={} z={:.2f}", experiment.name(), c.time_index, c.position_index, c.slice_index, c.z); }
                },
                [&](const acq::instruction::autofocus_adjust& a) {
                    if (_log) { _log->info("{}: move {} to {:.2f}", experiment.name(), a.device, a.position); }
                },
                [&](const acq::instruction::timepoint_finished& t) {
                    if (_log) { _log->info("{}: time point {} written", experiment.name(), t.time_index); }
                    experiment.timepoint_written();
                },
                [&](const acq::instruction::experiment_finished&) {
                    if (_log) { _log->info("{}: all images written", experiment.name()); }
                    experiment.all_writes_finished();
                    _mark_drained(experiment.id());
                    remaining--;
                }
            }, o);
        }

        std::unique_lock<std::mutex> lock(_mutex);
        _exited = true;
        _cv.notify_all();
    }

    // block until the writer has consumed the end of an experiment's stream
    void wait_drained(acq::experiment_id_t id) {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, [&]() { return _exited || _drained.count(id) > 0; });
    }

    size_t frames() const { return _frames; }

protected:

    std::shared_ptr<acq::instruction_queue_t> _queue;
    std::shared_ptr<spdlog::logger> _log;

    size_t _frames = 0;

    void _mark_drained(acq::experiment_id_t id) {
        std::unique_lock<std::mutex> lock(_mutex);
        _drained.insert(id);
        _cv.notify_all();
    }

    std::mutex _mutex;
    std::condition_variable _cv;
    std::set<acq::experiment_id_t> _drained;
    bool _exited = false;

};

// lets one experiment at a time use the camera
class lockstep_group_t : public acq::group_t {
public:

    lockstep_group_t(std::shared_ptr<writer_t> writer, std::shared_ptr<spdlog::logger> log)
        : _writer(std::move(writer)), _log(std::move(log)) {}

    void drive(acq::experiment_t& experiment) {
        cadence::set_thread_name(experiment.name() + " Group");

        while (true) {
            {
                std::unique_lock<std::mutex> lock(_mutex);
                _cv.wait(lock, [&]() { return _owner == nullptr; });
                _owner = &experiment;
            }

            auto arrival = experiment.ready_for_next_timepoint();
            if (arrival != acq::experiment_t::arrival_t::released) {
                if (_log) { _log->debug("experiment \"{}\" left the group ({})", experiment.name(), cadence::sync::to_string(arrival)); }
                _release(experiment);
                break;
            }

            // hold the camera until the experiment's time point is written or the experiment ends
            std::unique_lock<std::mutex> lock(_mutex);
            while (_owner == &experiment && !experiment.done()) {
                _cv.wait_for(lock, std::chrono::milliseconds(50));
            }
            if (_owner == &experiment) {
                _owner = nullptr;
                _cv.notify_all();
            }
        }
    }

    void timepoint_generation_finished(acq::experiment_t& experiment) override {
        if (_log) { _log->debug("experiment \"{}\" released the camera", experiment.name()); }
        _release(experiment);
    }

    void aborted(acq::experiment_t& experiment) override {
        if (_log) { _log->warn("experiment \"{}\" aborted", experiment.name()); }
        _release(experiment);

        _writer->wait_drained(experiment.id());
        if (_log) { _log->debug("writer drained experiment \"{}\"", experiment.name()); }
    }

protected:

    void _release(acq::experiment_t& experiment) {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_owner == &experiment) {
            _owner = nullptr;
            _cv.notify_all();
        }
    }

    std::shared_ptr<writer_t> _writer;
    std::shared_ptr<spdlog::logger> _log;

    std::mutex _mutex;
    std::condition_variable _cv;
    acq::experiment_t* _owner = nullptr;

};

int run(int argc, char* argv[]) {
    //
    // defaults
    //

    size_t time_points = 3;
    double interval = 1;
    std::string unit = "s";
    double z_start = 0, z_end = 10, z_step = 2;
    size_t rows = 2, columns = 2;
    size_t experiment_count = 2;
    size_t capacity = 200;
    double abort_after = 0;
    size_t exposure_ms = 5;

    size_t log_level = spdlog::level::info;
    if (auto level = cadence::envvar("CADENCE_LOG_LEVEL")) {
        log_level = spdlog::level::from_str(*level);
    }

    //
    // argument parsing
    //

    bool help = false;
    auto cli = lyra::help(help)
        | lyra::opt(time_points, "count")["--time-points"]("number of time points (0 disables time lapse)")
        | lyra::opt(interval, "interval")["--interval"]("time between time point starts")
        | lyra::opt(unit, "unit")["--unit"].choices("ms", "s", "min")("unit of the interval")
        | lyra::opt(z_start, "z")["--z-start"]("first focal position")
        | lyra::opt(z_end, "z")["--z-end"]("last focal position")
        | lyra::opt(z_step, "step")["--z-step"]("focal slice spacing (0 images a single plane)")
        | lyra::opt(rows, "rows")["--rows"]("tile rows")
        | lyra::opt(columns, "columns")["--columns"]("tile columns")
        | lyra::opt(experiment_count, "count")["--experiments"]("number of experiments sharing the camera")
        | lyra::opt(capacity, "capacity")["--capacity"]("instruction queue capacity")
        | lyra::opt(exposure_ms, "ms")["--exposure"]("simulated write time per frame in milliseconds")
        | lyra::opt(abort_after, "seconds")["--abort-after"]("abort all experiments after this many seconds (0 = never)")
        | lyra::opt(log_level, "log-level")["--log-level"](fmt::format("log level ({} = trace, {} = off)", spdlog::level::trace, spdlog::level::off));
    ;

    auto result = cli.parse({ argc, argv });
    if (!result) {
        std::cout << "invalid arguments: " << result.errorMessage() << std::endl;
        return -1;
    } else if (help) {
        std::cout << cli << std::endl;
        return 0;
    }

    spdlog::set_level(spdlog::level::level_enum(log_level));

    //
    // shared collaborators
    //

    auto queue = std::make_shared<acq::instruction_queue_t>(acq::instruction_queue_config_t{ capacity }, spdlog::get("queue"));
    auto writer = std::make_shared<writer_t>(queue, spdlog::get("sink"));
    auto group = std::make_shared<lockstep_group_t>(writer, spdlog::get("group"));
    auto hardware = std::make_shared<simulated_hardware_t>();
    auto footprint = std::make_shared<raster_footprint_t>(rows, columns, 2048 * 0.65);

    //
    // experiments
    //

    std::vector<std::unique_ptr<acq::experiment_t>> experiments;
    std::map<acq::experiment_id_t, acq::experiment_t*> lookup;
    for (size_t i = 0; i < experiment_count; i++) {
        acq::experiment_config_t ec;
        ec.name = fmt::format("Experiment {}", i);
        ec.footprint = footprint;
        ec.tile_overlap = 10;

        if (z_step == 0) {
            ec.space_mode = acq::space_mode_t::region_2d;
        } else {
            ec.space_mode = acq::space_mode_t::simple_z_stack;
            ec.z_start = z_start;
            ec.z_end = z_end;
            ec.z_step = z_step;
        }

        ec.time_enabled = time_points > 0;
        ec.time_points = std::max<size_t>(time_points, 1);
        ec.time_interval = interval;
        if (unit == "min") {
            ec.time_interval_unit = acq::interval_unit_t::minutes;
        } else if (unit == "s") {
            ec.time_interval_unit = acq::interval_unit_t::seconds;
        } else {
            ec.time_interval_unit = acq::interval_unit_t::milliseconds;
        }

        ec.property_pairings.push_back({ "Camera", "Binning", "1" });

        auto callback = [name = ec.name](acq::state_t state, std::exception_ptr error) {
            if (error) {
                logger->error("{} {}: {}", name, acq::to_string(state), cadence::to_string(error));
            }
        };

        experiments.push_back(std::make_unique<acq::experiment_t>(ec, queue, group, hardware, nullptr, callback, spdlog::get("experiment")));
        lookup[experiments.back()->id()] = experiments.back().get();
    }

    //
    // run
    //

    std::thread writer_thread(&writer_t::run, writer.get(), std::cref(lookup), std::chrono::milliseconds(exposure_ms));

    std::vector<std::thread> drivers;
    for (auto& e : experiments) {
        drivers.emplace_back(&lockstep_group_t::drive, group.get(), std::ref(*e));
    }

    cadence::setup_keyboard_interrupt();

    auto abort_all = [&]() {
        for (auto& e : experiments) {
            try {
                e->abort();
            } catch (const std::exception& ex) {
                logger->error("abort of {} failed: {}", e->name(), cadence::to_string(ex));
            }
        }
    };

    auto start = std::chrono::steady_clock::now();
    bool aborted = false;
    while (true) {
        bool done = true;
        for (auto& e : experiments) {
            done &= e->wait_for(std::chrono::milliseconds(100));
        }
        if (done) {
            break;
        }

        for (auto& e : experiments) {
            auto status = e->status();
            logger->info("{}: {:<11} time point {}/{} ( {:4.1f}% )    emitted = {:6d}    queued = {:4d}", e->name(), acq::to_string(status.state), status.time_index, status.time_points, 100.0 * status.progress(), status.emitted, queue->size());
        }

        if (!aborted && (cadence::check_keyboard_interrupt() || (abort_after > 0 && cadence::seconds(std::chrono::steady_clock::now() - start).count() > abort_after))) {
            logger->warn("aborting");
            abort_all();
            aborted = true;
        }
    }

    writer_thread.join();
    for (auto& t : drivers) {
        t.join();
    }

    logger->info("wrote {} frames in {:.2f} s", writer->frames(), cadence::seconds(std::chrono::steady_clock::now() - start).count());
    for (auto& e : experiments) {
        logger->info("{}: {} with {} slices per position", e->name(), acq::to_string(e->state()), e->max_slice_index() + 1);
    }

    return 0;
}

int main(int argc, char* argv[]) {
    cadence::set_thread_name("Main");

    spdlog::set_pattern("[%d-%b-%Y %H:%M:%S.%f] %-10n %^(%L) %v%$");
    spdlog::enable_backtrace(20);

    int code = -1;
#if defined(CADENCE_EXCEPTION_GUARDS)
    try {
#endif
        code = run(argc, argv);
#if defined(CADENCE_EXCEPTION_GUARDS)
    } catch (const std::exception& e) {
        logger->critical("unhandled exception in main thread: {}\n{}", cadence::to_string(e), cadence::check_trace(e));
    }
#endif

    spdlog::shutdown();
    return code;
}
