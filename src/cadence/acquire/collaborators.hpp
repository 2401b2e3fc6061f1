/** \rst

    interfaces of the collaborators that surround an experiment

    The hardware status, autofocus and coordinating group are implemented
    elsewhere.  The experiment consumes the first two and notifies the
    third; the group in turn drives the experiment's time point gate.

 \endrst */

#pragma once

#include <array>
#include <optional>
#include <string>

#include <cadence/core.hpp>

namespace cadence::acquire {

    class experiment_t;

    class hardware_t {
    public:

        virtual ~hardware_t() {}

        virtual std::array<double, 2> xy_stage_position() const = 0;
        virtual double focus_position() const = 0;

        // travel limits of the focus device, if it has any
        virtual std::optional<range_t<double>> focus_limits() const { return {}; }

        virtual size_t image_width() const = 0;
        virtual size_t image_height() const = 0;
        virtual std::string pixel_size_config() const = 0;

    };

    class autofocus_t {
    public:

        virtual ~autofocus_t() {}

        // compute the focus correction after all images of a time point are written
        virtual void run(size_t time_index) = 0;

        // last computed focus device position
        virtual double position() const = 0;

    };

    class group_t {
    public:

        virtual ~group_t() {}

        // the experiment finished generating (and writing) one time point
        virtual void timepoint_generation_finished(experiment_t& experiment) = 0;

        // the experiment was aborted or its generator failed; returns once the write sink has drained
        // NOTE: called at most once per experiment, after its stream has been terminated
        virtual void aborted(experiment_t& experiment) = 0;

    };

}
