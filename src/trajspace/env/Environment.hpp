#pragma once
#include "Trajectory.hpp"
#include "core/Error.hpp"
#include "storage/StorageCoordinator.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace TS {

struct EnvironmentOptions {
    // Fall back to the trajectory settings when unset.
    std::optional<std::size_t> workerCount;
    std::optional<std::size_t> queueCapacity;
    StoreOptions               storeOptions;
};

struct RunOutcome {
    std::size_t          index = 0;
    std::string          name;
    std::optional<Error> error;
};

struct RunSummary {
    std::vector<RunOutcome> runs;

    auto succeeded() const -> std::size_t;
    auto failed() const -> std::size_t { return this->runs.size() - this->succeeded(); }
    auto ok() const -> bool { return this->failed() == 0; }
};

/**
 * @brief Runs every run of a trajectory on a worker pool.
 *
 * The trajectory is stored once, then each worker gets a private copy decoded
 * from the same snapshot with its run bound. What a run adds is shipped to a
 * single writer through a WriteQueue and grafted into the caller's trajectory
 * there. The caller's trajectory must not be touched until run() returns.
 */
class Environment {
public:
    using RunFunction = std::function<Expected<void>(Trajectory&)>;

    explicit Environment(EnvironmentOptions options = {});

    auto run(Trajectory& trajectory, RunFunction const& fn) -> Expected<RunSummary>;

private:
    auto runOne(std::vector<std::uint8_t> const& snapshot, TrajectoryOptions const& settings, std::size_t index, RunFunction const& fn,
                WriteQueue& queue) -> std::optional<Error>;

    EnvironmentOptions options;
};

} // namespace TS
