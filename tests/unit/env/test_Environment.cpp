#include "Trajectory.hpp"
#include "env/Environment.hpp"
#include "storage/MemoryBackend.hpp"

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>

using namespace TS;

namespace {

auto exploredTrajectory(std::string const& location) -> TrajectoryOptions {
    MemoryBackend::discard(location);
    TrajectoryOptions options;
    options.name     = "sweep";
    options.location = location;
    return options;
}

// Squares x into results.runs.<run>.square.
auto square(Trajectory& traj) -> Expected<void> {
    auto x = traj.value("x");
    if (!x)
        return std::unexpected(x.error());
    auto added = traj.addResult("runs.$.square", {{"value", Value(x->get<int>() * x->get<int>())}});
    if (!added)
        return std::unexpected(added.error());
    return {};
}

} // namespace

TEST_SUITE("env.environment") {
    TEST_CASE("Every run is stored through the writer") {
        auto       options = exploredTrajectory("env-all");
        Trajectory traj{options};
        REQUIRE(traj.addParameter("x", Value(0)).has_value());
        REQUIRE(traj.explore({{"x", {Value(1), Value(2), Value(3), Value(4), Value(5)}}}).has_value());

        Environment env{EnvironmentOptions{.workerCount = 3, .queueCapacity = 2}};
        auto        summary = env.run(traj, square);
        REQUIRE(summary.has_value());
        CHECK(summary->ok());
        CHECK(summary->succeeded() == 5);
        REQUIRE(summary->runs.size() == 5);
        CHECK(summary->runs[4].name == "run_00000004");

        for (auto const& run : traj.runList())
            CHECK(run.completed);
        CHECK((*traj.value("results.runs.run_00000003.square"))["value"] == 16);

        Trajectory reloaded{options};
        REQUIRE(reloaded.load().has_value());
        CHECK(reloaded.runList()[2].completed);
        auto squares = reloaded.getFromRuns("square");
        REQUIRE(squares.has_value());
        CHECK(squares->size() == 5);
        CHECK((*reloaded.value("results.runs.run_00000001.square"))["value"] == 4);
    }

    TEST_CASE("A failing run does not stop the others") {
        auto       options = exploredTrajectory("env-failure");
        Trajectory traj{options};
        REQUIRE(traj.explore({{"x", {Value(1), Value(2), Value(3)}}}).has_value());

        Environment env{EnvironmentOptions{.workerCount = 2}};
        auto        summary = env.run(traj, [](Trajectory& local) -> Expected<void> {
            if (*local.currentRunIndex() == 1)
                return std::unexpected(Error{Error::Code::InvalidArgument, "bad input"});
            if (*local.currentRunIndex() == 2)
                throw std::runtime_error("crashed");
            return square(local);
        });
        REQUIRE(summary.has_value());
        CHECK_FALSE(summary->ok());
        CHECK(summary->failed() == 2);
        CHECK_FALSE(summary->runs[0].error.has_value());
        REQUIRE(summary->runs[1].error.has_value());
        CHECK(summary->runs[1].error->code == Error::Code::InvalidArgument);
        CHECK(summary->runs[2].error->code == Error::Code::UnknownError);

        CHECK(traj.runList()[0].completed);
        CHECK_FALSE(traj.runList()[1].completed);
        CHECK(traj.contains("results.runs.run_00000000.square"));
        CHECK_FALSE(traj.contains("results.runs.run_00000001"));
    }

    TEST_CASE("Nothing to run") {
        Trajectory  traj{exploredTrajectory("env-empty")};
        Environment env;
        auto        summary = env.run(traj, square);
        REQUIRE_FALSE(summary.has_value());
        CHECK(summary.error().code == Error::Code::InvalidArgument);
    }
}
