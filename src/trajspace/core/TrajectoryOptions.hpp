#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace TS {

struct TrajectoryOptions {
    std::string name           = "trajectory";
    std::string comment;
    std::string storageService = "memory";
    std::string location       = "trajspace";
    bool        autoLoad       = false;
    bool        withLinks      = true;
    bool        shortcuts      = true;
    std::size_t maxOverviewRows = 1000;
    std::size_t queueCapacity   = 64;
    std::size_t workerCount     = 4;
};

// Reads a JSON object; missing keys keep their defaults.
auto LoadTrajectoryOptionsFile(std::filesystem::path const& path) -> Expected<TrajectoryOptions>;

// Applies TRAJSPACE_* variables. Returns false and reports on stderr when one is malformed.
bool ApplyTrajectoryEnvOverrides(TrajectoryOptions& options);

auto ValidateTrajectoryOptions(TrajectoryOptions const& options) -> std::optional<std::string>;

} // namespace TS
