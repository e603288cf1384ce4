#include "env/Environment.hpp"

#include "log/TaggedLogger.hpp"
#include "queue/WriteQueue.hpp"
#include "task/RunPool.hpp"

#include <algorithm>
#include <exception>

namespace TS {

auto RunSummary::succeeded() const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(this->runs.begin(), this->runs.end(), [](RunOutcome const& run) { return !run.error; }));
}

Environment::Environment(EnvironmentOptions environmentOptions)
    : options(std::move(environmentOptions)) {}

auto Environment::runOne(std::vector<std::uint8_t> const& snapshot, TrajectoryOptions const& settings, std::size_t index,
                         RunFunction const& fn, WriteQueue& queue) -> std::optional<Error> {
    auto submission = queue.openSubmission();
    if (!submission)
        return submission.error();

    auto local = Trajectory::fromSnapshot(snapshot, settings);
    if (!local)
        return local.error();
    Trajectory& trajectory = **local;
    if (auto bound = trajectory.setCurrentRun(index); !bound)
        return bound.error();

    Expected<void> outcome{};
    try {
        outcome = fn(trajectory);
    } catch (std::exception const& e) {
        outcome = std::unexpected(Error{Error::Code::UnknownError, std::string("Run function threw: ") + e.what()});
    }
    if (!outcome)
        return outcome.error();

    auto request = trajectory.packStoreRequest(this->options.storeOptions);
    if (!request)
        return request.error();
    auto pending = submission->submit(std::move(*request));
    if (!pending)
        return pending.error();
    submission->release();
    if (auto written = pending->get(); !written)
        return written.error();
    return std::nullopt;
}

auto Environment::run(Trajectory& trajectory, RunFunction const& fn) -> Expected<RunSummary> {
    if (trajectory.size() == 0)
        return std::unexpected(Error{Error::Code::InvalidArgument, "Trajectory " + trajectory.name() + " has no runs, explore it first"});

    if (auto stored = trajectory.store(this->options.storeOptions); !stored)
        return std::unexpected(stored.error());
    auto coordinator = trajectory.storage();
    if (!coordinator)
        return std::unexpected(coordinator.error());
    auto snapshot = trajectory.snapshot();
    if (!snapshot)
        return std::unexpected(snapshot.error());

    // Workers never touch storage; everything they add goes through the writer.
    TrajectoryOptions workerSettings = trajectory.settings();
    workerSettings.autoLoad          = false;

    StorageCoordinator* writerCoordinator = *coordinator;
    WriteQueue          queue(
            [&trajectory, writerCoordinator](StoreRequest const& request) -> Expected<void> {
                if (auto applied = applyStoreRequest(trajectory.tree(), *writerCoordinator, request); !applied)
                    return applied;
                if (request.completedRun)
                    return trajectory.markRunCompleted(*request.completedRun);
                return {};
            },
            this->options.queueCapacity.value_or(trajectory.settings().queueCapacity));

    RunSummary summary;
    summary.runs.resize(trajectory.size());
    for (auto const& run : trajectory.runList())
        summary.runs[run.index] = RunOutcome{run.index, run.name, std::nullopt};

    {
        RunPool pool(std::max<std::size_t>(1, this->options.workerCount.value_or(trajectory.settings().workerCount)));
        for (std::size_t index = 0; index < summary.runs.size(); ++index) {
            auto refused = pool.submit([this, &snapshot, &workerSettings, &fn, &queue, &summary, index] {
                summary.runs[index].error = this->runOne(*snapshot, workerSettings, index, fn, queue);
            });
            if (refused)
                summary.runs[index].error = refused;
        }
        pool.waitIdle();
        pool.shutdown();
    }
    queue.close();

    ts_log("Environment::run finished ok=" + std::to_string(summary.succeeded()) + " failed=" + std::to_string(summary.failed()),
           "Environment");
    if (auto written = trajectory.storeRecord(); !written)
        return std::unexpected(written.error());
    return summary;
}

} // namespace TS
