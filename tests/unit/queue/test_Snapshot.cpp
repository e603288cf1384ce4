#include "core/NodeTree.hpp"
#include "core/Parameter.hpp"
#include "core/Result.hpp"
#include "queue/Snapshot.hpp"

#include <doctest/doctest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace TS;

namespace {

auto buildSample(NodeTree& tree) -> void {
    auto seed = tree.addLeaf("parameters.sim.seed", std::make_unique<Parameter>(Value(7)));
    REQUIRE(seed.has_value());
    (*seed)->item->lock();
    (*seed)->comment             = "rng seed";
    (*seed)->annotations["note"] = "fixed";
    REQUIRE(tree.addLeaf("results.summary", std::make_unique<Result>(std::map<std::string, Value>{{"mean", Value(1.5)}})).has_value());
    REQUIRE(tree.addLink(*tree.find("results"), "sim", *tree.find("parameters.sim")).has_value());
}

} // namespace

TEST_SUITE("queue.snapshot") {
    TEST_CASE("Whole tree through bytes") {
        NodeTree source;
        buildSample(source);
        auto snapshot    = captureTree(source);
        snapshot.name    = "traj";
        snapshot.version = "1.0";
        snapshot.runs    = runsToSnapshot({RunInfo{0, "run_00000000", true}, RunInfo{1, "run_00000001", false}});
        CHECK(snapshot.entries.front().fullName == "parameters");

        auto bytes = encodeSnapshot(snapshot);
        REQUIRE(bytes.has_value());
        auto decoded = decodeSnapshot(*bytes);
        REQUIRE(decoded.has_value());
        CHECK(decoded->name == "traj");
        CHECK(decoded->entries.size() == snapshot.entries.size());

        auto runs = runsFromSnapshot(decoded->runs);
        REQUIRE(runs.size() == 2);
        CHECK(runs[0].completed);
        CHECK(runs[1].name == "run_00000001");

        NodeTree copy;
        auto     grafted = graftSnapshot(copy, *decoded);
        REQUIRE(grafted.has_value());
        CHECK(grafted->tops.size() == 2);
        REQUIRE(grafted->linkOwners.size() == 1);
        CHECK(grafted->linkOwners.front() == copy.find("results"));

        Node* seed = copy.find("parameters.sim.seed");
        REQUIRE(seed != nullptr);
        CHECK(seed->comment == "rng seed");
        CHECK(seed->annotations.at("note") == "fixed");
        CHECK(seed->item->isLocked());
        CHECK(*static_cast<Parameter&>(*seed->item).get() == 7);
        CHECK(*static_cast<Result&>(*copy.find("results.summary")->item).get("mean") == 1.5);
        CHECK(copy.links().target(*copy.find("results"), "sim") == copy.find("parameters.sim"));
    }

    TEST_CASE("Grafting keeps existing payloads") {
        NodeTree tree;
        buildSample(tree);
        NodeTree worker;
        buildSample(worker);
        REQUIRE(worker.addLeaf("results.runs.run_00000000.z", std::make_unique<Result>(std::map<std::string, Value>{{"z", Value(3)}}))
                        .has_value());
        REQUIRE(static_cast<Result&>(*worker.find("results.summary")->item).set("mean", Value(9.0)).has_value());

        auto shipped = captureSubtrees(worker, {worker.find("results.runs")});
        CHECK(shipped.entries.size() == 3);
        CHECK(shipped.entries.front().fullName == "results.runs");

        auto grafted = graftSnapshot(tree, shipped);
        REQUIRE(grafted.has_value());
        REQUIRE(grafted->tops.size() == 1);
        CHECK(grafted->tops.front()->fullName == "results.runs");
        CHECK(grafted->linkOwners.empty());
        CHECK(tree.find("results.runs.run_00000000.z") != nullptr);

        auto again = graftSnapshot(tree, captureTree(worker));
        REQUIRE(again.has_value());
        CHECK(*static_cast<Result&>(*tree.find("results.summary")->item).get("mean") == 1.5);
    }

    TEST_CASE("Graft failures") {
        NodeTree tree;
        buildSample(tree);

        SUBCASE("dangling link") {
            TreeSnapshot snapshot;
            snapshot.links.push_back(SnapshotLink{"results", "ghost", "parameters.nothing"});
            auto grafted = graftSnapshot(tree, snapshot);
            REQUIRE_FALSE(grafted.has_value());
            CHECK(grafted.error().code == Error::Code::InvalidLinkTarget);
        }

        SUBCASE("group turned leaf") {
            TreeSnapshot snapshot;
            snapshot.entries.push_back(SnapshotEntry{.fullName = "parameters.sim", .kind = 1, .itemType = "parameter"});
            CHECK(graftSnapshot(tree, snapshot).error().code == Error::Code::TypeMismatch);
        }

        SUBCASE("malformed payload") {
            TreeSnapshot snapshot;
            snapshot.entries.push_back(SnapshotEntry{.fullName = "results.bad", .kind = 1, .itemType = "result", .payload = "{oops"});
            CHECK(graftSnapshot(tree, snapshot).error().code == Error::Code::MalformedInput);
            CHECK(tree.find("results.bad") == nullptr);
        }
    }

    TEST_CASE("Decoding garbage") {
        auto decoded = decodeSnapshot({});
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::MalformedInput);
    }
}
