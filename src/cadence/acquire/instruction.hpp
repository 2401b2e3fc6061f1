/** \rst

    instructions placed on the shared acquisition queue

    Capture instructions describe one frame to acquire.  The remaining
    alternatives are markers on the same stream: an autofocus adjustment
    that must be applied before the captures of its time point, the end of
    a time point, and the permanent end of an experiment's stream.  Every
    alternative names the experiment that owns it so that several
    experiments can share one queue.

 \endrst */

#pragma once

#include <compare>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <cadence/core.hpp>

#include <cadence/geometry/position.hpp>

#include <cadence/util/variant.hpp>

namespace cadence::acquire {

    using experiment_id_t = size_t;

    struct property_pairing_t {
        std::string device, property, value;

        auto operator<=>(const property_pairing_t&) const = default;
    };
    using property_pairings_t = std::vector<property_pairing_t>;

    namespace instruction {

        namespace detail {
            struct base {
                experiment_id_t owner = 0;

                auto operator<=>(const base&) const = default;
            };
        }

        struct capture : detail::base {
            size_t time_index = 0, channel_index = 0, slice_index = 0, position_index = 0;
            double z = 0;
            geometry::xy_position_t position;

            // shared between all captures of an experiment
            std::shared_ptr<const property_pairings_t> properties;

            bool operator==(const capture&) const = default;
        };

        struct autofocus_adjust : detail::base {
            size_t time_index = 0;
            std::string device;
            double position = 0;

            auto operator<=>(const autofocus_adjust&) const = default;
        };

        struct timepoint_finished : detail::base {
            size_t time_index = 0;

            auto operator<=>(const timepoint_finished&) const = default;
        };

        struct experiment_finished : detail::base {
            auto operator<=>(const experiment_finished&) const = default;
        };

    }

    using instruction_t = std::variant<
        instruction::capture,
        instruction::autofocus_adjust,
        instruction::timepoint_finished,
        instruction::experiment_finished
    >;

    inline experiment_id_t owner(const instruction_t& o) {
        return ACCESS_CONST(o, owner);
    }

    inline bool is_terminal(const instruction_t& o) {
        return std::holds_alternative<instruction::experiment_finished>(o);
    }

}
