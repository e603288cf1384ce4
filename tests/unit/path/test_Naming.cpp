#include "core/NodeTree.hpp"
#include "core/Parameter.hpp"
#include "core/Result.hpp"
#include "path/Naming.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

using namespace TS;

TEST_SUITE("path.naming") {
    TEST_CASE("Run names") {
        CHECK(formatRunName(0) == "run_00000000");
        CHECK(formatRunName(42) == "run_00000042");
        CHECK(parseRunIndex("run_00000042") == std::optional<std::size_t>{42});
        CHECK_FALSE(parseRunIndex("run_42").has_value());
        CHECK_FALSE(parseRunIndex("runs").has_value());
    }

    TEST_CASE("Name validation") {
        CHECK(isValidName("dt"));
        CHECK(isValidName("_hidden2"));
        CHECK_FALSE(isValidName(""));
        CHECK_FALSE(isValidName("2fast"));
        CHECK_FALSE(isValidName("a.b"));
        CHECK_FALSE(isValidName("par"));
        CHECK_FALSE(isValidName("crun"));
        CHECK_FALSE(isValidName("r_3"));
    }

    TEST_CASE("Splitting keeps empty segments") {
        CHECK(splitPath("") == std::vector<std::string>{});
        CHECK(splitPath("a.b") == std::vector<std::string>{"a", "b"});
        CHECK(splitPath("a..b") == std::vector<std::string>{"a", "", "b"});
    }

    TEST_CASE("Segment translation") {
        std::optional<std::string> const bound = formatRunName(3);
        CHECK(*translateSegment("par", std::nullopt) == "parameters");
        CHECK(*translateSegment("dpar", std::nullopt) == "derived_parameters");
        CHECK(*translateSegment("res", std::nullopt) == "results");
        CHECK(*translateSegment("conf", std::nullopt) == "config");
        CHECK(*translateSegment("r_7", std::nullopt) == "run_00000007");
        CHECK(*translateSegment("run_7", std::nullopt) == "run_00000007");
        CHECK(*translateSegment("$", bound) == "run_00000003");
        CHECK(*translateSegment("crun", bound) == "run_00000003");

        auto unbound = translateSegment("$", std::nullopt);
        REQUIRE_FALSE(unbound.has_value());
        CHECK(unbound.error().code == Error::Code::NoRunBound);

        auto path = translatePath("res.runs.$.z", bound);
        REQUIRE(path.has_value());
        CHECK(*path == std::vector<std::string>{"results", "runs", "run_00000003", "z"});
    }

    TEST_CASE("Shortcut resolution") {
        NodeTree tree;
        REQUIRE(tree.addLeaf("parameters.sim.dt", std::make_unique<Parameter>(Value(0.1))).has_value());
        REQUIRE(tree.addLeaf("parameters.sim.steps", std::make_unique<Parameter>(Value(10))).has_value());
        REQUIRE(tree.addLeaf("parameters.post.steps", std::make_unique<Parameter>(Value(2))).has_value());

        SUBCASE("unique descendant") {
            auto dt = tree.resolve("dt");
            REQUIRE(dt.has_value());
            CHECK((*dt)->fullName == "parameters.sim.dt");
            CHECK(*tree.resolve("parameters.dt") == *dt);
            CHECK(*tree.resolve("parameters..dt") == *dt);
        }

        SUBCASE("two descendants are ambiguous") {
            auto steps = tree.resolve("steps");
            REQUIRE_FALSE(steps.has_value());
            CHECK(steps.error().code == Error::Code::NotUniqueNode);
            CHECK((*tree.resolve("post.steps"))->fullName == "parameters.post.steps");
        }

        SUBCASE("shortcuts off") {
            ResolveOptions exact{.shortcuts = false};
            CHECK(tree.resolve("dt", exact).error().code == Error::Code::NoSuchPath);
            CHECK((*tree.resolve("parameters.sim.dt", exact))->name == "dt");
            CHECK(tree.resolve("parameters..dt", exact).error().code == Error::Code::InvalidPath);
        }

        SUBCASE("missing and malformed") {
            CHECK(tree.resolve("nothing").error().code == Error::Code::NoSuchPath);
            CHECK(tree.resolve("parameters.sim.dt.deeper").error().code == Error::Code::NoSuchPath);
            CHECK(tree.resolve("parameters.").error().code == Error::Code::InvalidPath);
        }

        SUBCASE("findAll lists every match") {
            auto all = tree.findAll("steps");
            REQUIRE(all.has_value());
            CHECK(all->size() == 2);
            auto post = tree.findAll("post.steps");
            REQUIRE(post.has_value());
            REQUIRE(post->size() == 1);
            CHECK(post->front()->fullName == "parameters.post.steps");
        }
    }

    TEST_CASE("Wildcard binds the current run") {
        NodeTree tree;
        REQUIRE(tree.addLeaf("results.runs.run_00000000.z", std::make_unique<Result>()).has_value());
        REQUIRE(tree.addLeaf("results.runs.run_00000001.z", std::make_unique<Result>()).has_value());

        ResolveOptions first{.runName = formatRunName(0)};
        ResolveOptions second{.runName = formatRunName(1)};
        CHECK((*tree.resolve("results.runs.$.z", first))->fullName == "results.runs.run_00000000.z");
        CHECK((*tree.resolve("results.runs.crun.z", second))->fullName == "results.runs.run_00000001.z");
        CHECK((*tree.resolve("results.runs.r_1.z"))->fullName == "results.runs.run_00000001.z");

        // Nodes of other runs are invisible to a shortcut search while a run is bound.
        CHECK((*tree.resolve("z", second))->fullName == "results.runs.run_00000001.z");
        CHECK(tree.resolve("z").error().code == Error::Code::NotUniqueNode);

        auto unbound = tree.resolve("results.runs.$.z");
        REQUIRE_FALSE(unbound.has_value());
        CHECK(unbound.error().code == Error::Code::NoRunBound);
    }

    TEST_CASE("Links take part in resolution") {
        NodeTree tree;
        REQUIRE(tree.addLeaf("parameters.a.x", std::make_unique<Parameter>(Value(1))).has_value());
        REQUIRE(tree.addGroup("results.b").has_value());
        Node& b = *tree.find("results.b");
        REQUIRE(tree.addLink(b, "src", *tree.find("parameters.a")).has_value());

        CHECK((*tree.resolve("results.b.src.x"))->fullName == "parameters.a.x");
        ResolveOptions noLinks{.withLinks = false};
        CHECK(tree.resolve("results.b.src", noLinks).error().code == Error::Code::NoSuchPath);
        CHECK_FALSE(tree.contains("results.b.src", false));
        CHECK(tree.contains("results.b.src", true));

        // Reachable twice (as a child and through a link of the same name) counts as two candidates.
        REQUIRE(tree.addLink(b, "a", *tree.find("parameters.a")).has_value());
        CHECK(tree.resolve("a").error().code == Error::Code::NotUniqueNode);
        CHECK((*tree.resolve("a", noLinks))->fullName == "parameters.a");
    }
}
