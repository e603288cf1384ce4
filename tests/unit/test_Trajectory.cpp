#include "Trajectory.hpp"
#include "queue/Snapshot.hpp"
#include "storage/MemoryBackend.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

using namespace TS;

namespace {

auto freshOptions(std::string const& location, std::string name = "traj") -> TrajectoryOptions {
    MemoryBackend::discard(location);
    TrajectoryOptions options;
    options.name     = std::move(name);
    options.location = location;
    return options;
}

auto buildSimulation(Trajectory& traj) -> void {
    REQUIRE(traj.addParameter("sim.dt", Value(0.1), "time step").has_value());
    REQUIRE(traj.addParameter("par.sim.steps", Value(100)).has_value());
    REQUIRE(traj.addConfig("ncores", Value(2)).has_value());
    REQUIRE(traj.addDerivedParameter("sim.total", Value(10.0)).has_value());
    REQUIRE(traj.addResult("summary", {{"mean", Value(0.5)}}, "overall").has_value());
}

} // namespace

TEST_SUITE("trajectory") {
    TEST_CASE("Building into branches") {
        Trajectory traj{freshOptions("traj-build")};
        buildSimulation(traj);

        CHECK(traj.contains("parameters.sim.dt"));
        CHECK(traj.contains("config.ncores"));
        CHECK((*traj.get("total"))->fullName == "derived_parameters.sim.total");
        CHECK((*traj.get("summary"))->comment == "overall");
        CHECK(*traj.value("dt") == 0.1);
        CHECK(*traj.value("conf.ncores") == 2);
        CHECK((*traj.value("summary"))["mean"] == 0.5);
        CHECK(traj.lifecycle() == Lifecycle::Built);

        SUBCASE("wrong branch") {
            auto misplaced = traj.addResult("parameters.x");
            REQUIRE_FALSE(misplaced.has_value());
            CHECK(misplaced.error().code == Error::Code::TypeMismatch);
            CHECK(traj.addParameter("", Value(1)).error().code == Error::Code::InvalidPath);
            CHECK(traj.addGroup("loose.group").error().code == Error::Code::InvalidPath);
        }

        SUBCASE("typed accessors") {
            CHECK(traj.parameter("dt").has_value());
            CHECK(traj.result("dt").error().code == Error::Code::TypeMismatch);
            CHECK(traj.value("parameters.sim").error().code == Error::Code::TypeMismatch);
            REQUIRE(traj.addParameter("unset", Value()).has_value());
            CHECK((*traj.parameter("unset"))->isEmpty());
        }

        SUBCASE("defaults") {
            CHECK(*traj.getDefault("nothing", Value(5)) == 5);
            CHECK(*traj.getDefault("dt", Value(5)) == 0.1);
            REQUIRE(traj.addParameter("post.steps", Value(3)).has_value());
            CHECK(traj.getDefault("steps", Value(1)).error().code == Error::Code::NotUniqueNode);
            CHECK(traj.getAll("steps")->size() == 2);
        }

        SUBCASE("groups and links") {
            REQUIRE(traj.addGroup("results.analysis", "derived numbers").has_value());
            REQUIRE(traj.addLink("results.analysis", "sim", "parameters.sim").has_value());
            CHECK((*traj.get("results.analysis.sim.dt"))->fullName == "parameters.sim.dt");
            REQUIRE(traj.removeLink("results.analysis", "sim").has_value());
            CHECK_FALSE(traj.contains("results.analysis.sim"));
        }
    }

    TEST_CASE("Runs and the bound run") {
        Trajectory traj{freshOptions("traj-runs")};
        buildSimulation(traj);
        REQUIRE(*traj.explore({{"dt", {Value(0.1), Value(0.2), Value(0.3)}}}) == 3);
        CHECK(traj.size() == 3);
        CHECK(traj.exploredParameters().size() == 1);

        CHECK(traj.setCurrentRun(3).error().code == Error::Code::OutOfRange);
        CHECK(traj.setCurrentRun("run_00000009").error().code == Error::Code::NoSuchPath);

        REQUIRE(traj.setCurrentRun("r_1").has_value());
        CHECK(traj.currentRunIndex() == std::optional<std::size_t>{1});
        CHECK(*traj.value("dt") == 0.2);
        REQUIRE(traj.addResult("runs.$.z", {{"z", Value(20)}}).has_value());

        REQUIRE(traj.setCurrentRun(std::size_t{2}).has_value());
        REQUIRE(traj.addResult("runs.crun.z", {{"z", Value(30)}}).has_value());
        CHECK((*traj.get("z"))->fullName == "results.runs.run_00000002.z");

        traj.clearCurrentRun();
        CHECK(*traj.value("dt") == 0.1);
        CHECK(traj.get("z").error().code == Error::Code::NotUniqueNode);

        auto perRun = traj.getFromRuns("z");
        REQUIRE(perRun.has_value());
        REQUIRE(perRun->size() == 2);
        CHECK((*perRun)[0].index == 1);
        CHECK((*perRun)[1].runName == "run_00000002");
        CHECK((*perRun)[1].node->fullName == "results.runs.run_00000002.z");

        REQUIRE(traj.markRunCompleted(1).has_value());
        CHECK(traj.runList()[1].completed);
        CHECK(traj.markRunCompleted(7).error().code == Error::Code::OutOfRange);

        REQUIRE(traj.shrink().has_value());
        CHECK(traj.size() == 0);
        CHECK_FALSE(traj.currentRunIndex().has_value());
    }

    TEST_CASE("Store and load") {
        auto options = freshOptions("traj-store");
        {
            Trajectory traj{options};
            traj.setComment("baseline");
            buildSimulation(traj);
            REQUIRE(traj.explore({{"dt", {Value(0.1), Value(0.2)}}}).has_value());
            REQUIRE(traj.markRunCompleted(0).has_value());
            REQUIRE(traj.store().has_value());
            CHECK(traj.lifecycle() == Lifecycle::FullyStored);
            CHECK(lifecycleToString(traj.lifecycle()) == "fully_stored");

            auto shrunk = traj.shrink();
            REQUIRE_FALSE(shrunk.has_value());
            CHECK(shrunk.error().code == Error::Code::NotSupported);

            auto overview = traj.overview("parameters");
            REQUIRE(overview.has_value());
            CHECK(overview->size() == 2);
        }

        Trajectory loaded{options};
        REQUIRE(loaded.load().has_value());
        CHECK(loaded.lifecycle() == Lifecycle::Loaded);
        CHECK(loaded.comment() == "baseline");
        REQUIRE(loaded.size() == 2);
        CHECK(loaded.runList()[0].completed);
        CHECK_FALSE(loaded.runList()[1].completed);
        CHECK((*loaded.get("dt"))->comment == "time step");
        REQUIRE(loaded.setCurrentRun(1).has_value());
        CHECK(*loaded.value("dt") == 0.2);
        CHECK((*loaded.value("summary"))["mean"] == 0.5);

        Trajectory newer{options};
        newer.setVersion("2.0");
        auto refused = newer.load();
        REQUIRE_FALSE(refused.has_value());
        CHECK(refused.error().code == Error::Code::VersionMismatch);
        CHECK(newer.load(LoadOptions{.force = true}).has_value());
    }

    TEST_CASE("Overwrite load drops a bound run that no longer exists") {
        auto       options = freshOptions("traj-rebind");
        Trajectory traj{options};
        buildSimulation(traj);
        REQUIRE(traj.explore({{"dt", {Value(0.1), Value(0.2)}}}).has_value());
        REQUIRE(traj.store().has_value());

        REQUIRE(*traj.expand({{"dt", {Value(0.3), Value(0.4)}}}) == 4);
        REQUIRE(traj.setCurrentRun(3).has_value());
        CHECK(*traj.value("dt") == 0.4);

        REQUIRE(traj.load(LoadOptions{.level = LoadLevel::Overwrite}).has_value());
        CHECK(traj.size() == 2);
        CHECK_FALSE(traj.currentRunIndex().has_value());
        auto dt = traj.get("dt");
        REQUIRE(dt.has_value());
        CHECK((*dt)->fullName == "parameters.sim.dt");
        CHECK(*traj.value("dt") == 0.1);
        CHECK((*traj.parameter("dt"))->size() == 2);

        SUBCASE("a run still in range stays bound") {
            REQUIRE(*traj.expand({{"dt", {Value(0.5)}}}) == 3);
            REQUIRE(traj.setCurrentRun(1).has_value());
            REQUIRE(traj.load(LoadOptions{.level = LoadLevel::Overwrite}).has_value());
            CHECK(traj.currentRunIndex() == std::optional<std::size_t>{1});
            CHECK(*traj.value("dt") == 0.2);
        }
    }

    TEST_CASE("Options are validated") {
        auto options = freshOptions("traj-validate");
        auto created = Trajectory::create(options);
        REQUIRE(created.has_value());
        CHECK((*created)->name() == "traj");

        options.name = "bad.name";
        auto refused = Trajectory::create(options);
        REQUIRE_FALSE(refused.has_value());
        CHECK(refused.error().code == Error::Code::InvalidArgument);

        Trajectory direct{options};
        CHECK(direct.store().error().code == Error::Code::InvalidArgument);
        CHECK(direct.load().error().code == Error::Code::InvalidArgument);
    }

    TEST_CASE("Loading an unknown trajectory") {
        Trajectory traj{freshOptions("traj-absent")};
        CHECK(traj.load().error().code == Error::Code::DataNotInStorage);

        TrajectoryOptions broken = freshOptions("traj-absent");
        broken.storageService    = "tape";
        Trajectory nowhere{broken};
        CHECK(nowhere.store().error().code == Error::Code::NoSuchService);
    }

    TEST_CASE("Auto-loading on lookup") {
        auto options = freshOptions("traj-autoload");
        {
            Trajectory traj{options};
            buildSimulation(traj);
            REQUIRE(traj.store().has_value());
        }

        Trajectory lazy{options};
        lazy.setAutoLoad(true);
        auto dt = lazy.get("parameters.sim.dt");
        REQUIRE(dt.has_value());
        CHECK(*lazy.value("parameters.sim.dt") == 0.1);
        CHECK(lazy.contains("parameters.sim.dt"));
        CHECK_FALSE(lazy.contains("parameters.sim.steps"));

        auto missing = lazy.get("parameters.sim.nothing");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::DataNotInStorage);
        CHECK(lazy.get("nothing").error().code == Error::Code::DataNotInStorage);
        CHECK(*lazy.getDefault("parameters.sim.nothing", Value("x")) == "x");

        Trajectory skeleton{options};
        REQUIRE(skeleton.loadSkeleton().has_value());
        CHECK((*skeleton.parameter("steps"))->isEmpty());
        skeleton.setAutoLoad(true);
        CHECK(*skeleton.value("steps") == 100);

        Trajectory strict{options};
        CHECK(strict.get("parameters.sim.dt").error().code == Error::Code::NoSuchPath);
        auto item = strict.loadItem("par.sim.dt");
        REQUIRE(item.has_value());
        CHECK((*item)->fullName == "parameters.sim.dt");
    }

    TEST_CASE("Storing single items") {
        Trajectory traj{freshOptions("traj-item")};
        buildSimulation(traj);
        REQUIRE(traj.storeItem("dt").has_value());
        CHECK(traj.lifecycle() == Lifecycle::PartiallyStored);

        auto coordinator = traj.storage();
        REQUIRE(coordinator.has_value());
        CHECK((*coordinator)->isStored(""));
        CHECK((*coordinator)->isStored("parameters.sim.dt"));
        CHECK_FALSE((*coordinator)->isStored("parameters.sim.steps"));

        REQUIRE(traj.store(StoreOptions{.maxDepth = 1}).has_value());
        CHECK(traj.lifecycle() == Lifecycle::PartiallyStored);
        CHECK_FALSE((*coordinator)->isStored("parameters.sim.steps"));
    }

    TEST_CASE("Deleting items and links") {
        Trajectory traj{freshOptions("traj-delete")};
        buildSimulation(traj);
        REQUIRE(traj.addLink("results", "cfg", "parameters.sim").has_value());
        REQUIRE(traj.store().has_value());
        auto coordinator = *traj.storage();
        CHECK(coordinator->isStored("results.cfg"));

        REQUIRE(traj.deleteItem("results.cfg").has_value());
        CHECK_FALSE(traj.contains("results.cfg"));
        CHECK(traj.contains("parameters.sim"));
        CHECK_FALSE(coordinator->isStored("results.cfg"));
        CHECK(coordinator->isStored("parameters.sim"));

        REQUIRE(traj.deleteItem("summary").has_value());
        CHECK_FALSE(traj.contains("results.summary"));
        CHECK_FALSE(coordinator->isStored("results.summary"));

        CHECK(traj.deleteItem("parameters.sim").error().code == Error::Code::NotEmpty);
        REQUIRE(traj.deleteItem("parameters.sim", DeleteOptions{.recursive = true}).has_value());
        CHECK_FALSE(coordinator->isStored("parameters.sim.dt"));
    }

    TEST_CASE("Migrating to another location") {
        auto options = freshOptions("traj-migrate-src");
        MemoryBackend::discard("traj-migrate-dst");
        Trajectory traj{options};
        buildSimulation(traj);
        REQUIRE(traj.store().has_value());

        CHECK(traj.migrate("traj-migrate-dst", "bad.name").error().code == Error::Code::InvalidArgument);
        REQUIRE(traj.migrate("traj-migrate-dst", "moved").has_value());
        CHECK(traj.name() == "moved");
        CHECK(traj.settings().location == "traj-migrate-dst");
        REQUIRE(traj.addResult("later", {{"v", Value(1)}}).has_value());
        REQUIRE(traj.storeItem("later").has_value());

        auto reopened     = options;
        reopened.name     = "moved";
        reopened.location = "traj-migrate-dst";
        Trajectory copy{reopened};
        REQUIRE(copy.load().has_value());
        CHECK(copy.contains("parameters.sim.dt"));
        CHECK(copy.contains("results.later"));
    }

    TEST_CASE("Worker copies ship only what they added") {
        auto       options = freshOptions("traj-worker");
        Trajectory traj{options};
        buildSimulation(traj);
        REQUIRE(traj.explore({{"dt", {Value(0.1), Value(0.2)}}}).has_value());
        REQUIRE(traj.store().has_value());

        auto bytes = traj.snapshot();
        REQUIRE(bytes.has_value());
        auto worker = Trajectory::fromSnapshot(*bytes, options);
        REQUIRE(worker.has_value());
        Trajectory& copy = **worker;
        CHECK(copy.name() == "traj");
        CHECK(copy.size() == 2);
        REQUIRE(copy.setCurrentRun(1).has_value());
        CHECK(*copy.value("dt") == 0.2);
        REQUIRE(copy.addResult("runs.$.z", {{"z", Value(2)}}).has_value());

        auto request = copy.packStoreRequest();
        REQUIRE(request.has_value());
        CHECK(request->completedRun == std::optional<std::size_t>{1});
        CHECK(request->label == "run_00000001");
        auto shipped = decodeSnapshot(request->snapshot);
        REQUIRE(shipped.has_value());
        REQUIRE_FALSE(shipped->entries.empty());
        CHECK(shipped->entries.front().fullName == "results.runs");

        REQUIRE(applyStoreRequest(traj.tree(), **traj.storage(), *request).has_value());
        CHECK(traj.contains("results.runs.run_00000001.z"));
        CHECK((*traj.storage())->isStored("results.runs.run_00000001.z"));
    }
}
