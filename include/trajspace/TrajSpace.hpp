#pragma once

#include "Trajectory.hpp"
#include "core/Error.hpp"
#include "core/Parameter.hpp"
#include "core/Result.hpp"
#include "core/TrajectoryOptions.hpp"
#include "env/Environment.hpp"
#include "storage/StorageRegistry.hpp"
