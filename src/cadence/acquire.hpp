#pragma once

#include <cadence/acquire/collaborators.hpp>
#include <cadence/acquire/config.hpp>
#include <cadence/acquire/experiment.hpp>
#include <cadence/acquire/instruction.hpp>
#include <cadence/acquire/queue.hpp>
