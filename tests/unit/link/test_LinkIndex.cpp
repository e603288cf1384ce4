#include "core/NodeTree.hpp"
#include "core/Parameter.hpp"
#include "link/LinkIndex.hpp"

#include <doctest/doctest.h>

#include <memory>

using namespace TS;

TEST_SUITE("link.index") {
    TEST_CASE("Cyclic links resolve in both directions") {
        NodeTree tree;
        REQUIRE(tree.addGroup("parameters.A").has_value());
        REQUIRE(tree.addGroup("parameters.B").has_value());
        Node& a = *tree.find("parameters.A");
        Node& b = *tree.find("parameters.B");

        REQUIRE(tree.addLink(a, "c1", b).has_value());
        REQUIRE(tree.addLink(b, "c2", a).has_value());
        CHECK(*tree.resolve("parameters.A.c1.c2") == &a);
        CHECK(*tree.resolve("parameters.A.c1.c2.c1") == &b);

        REQUIRE(tree.links().removeLink(a, "c1").has_value());
        CHECK_FALSE(tree.contains("parameters.A.c1"));
        CHECK(tree.links().hasLink(b, "c2"));
        CHECK(tree.find("parameters.B") == &b);
    }

    TEST_CASE("Adding links is checked") {
        NodeTree tree;
        REQUIRE(tree.addLeaf("parameters.g.x", std::make_unique<Parameter>(Value(1))).has_value());
        REQUIRE(tree.addGroup("results.h").has_value());
        Node& g = *tree.find("parameters.g");
        Node& h = *tree.find("results.h");
        Node& x = *tree.find("parameters.g.x");

        SUBCASE("name of a real child") {
            auto clash = tree.addLink(g, "x", h);
            REQUIRE_FALSE(clash.has_value());
            CHECK(clash.error().code == Error::Code::AlreadyExists);
        }

        SUBCASE("root as target") {
            auto toRoot = tree.addLink(h, "top", tree.root());
            REQUIRE_FALSE(toRoot.has_value());
            CHECK(toRoot.error().code == Error::Code::InvalidLinkTarget);
        }

        SUBCASE("leaf as owner") {
            CHECK(tree.addLink(x, "back", g).error().code == Error::Code::TypeMismatch);
        }

        SUBCASE("node of another tree") {
            NodeTree other;
            REQUIRE(other.addGroup("results.far").has_value());
            CHECK(tree.addLink(h, "far", *other.find("results.far")).error().code == Error::Code::InvalidLinkTarget);
        }

        SUBCASE("same link twice is accepted, a different target is not") {
            REQUIRE(tree.addLink(h, "src", g).has_value());
            CHECK(tree.addLink(h, "src", g).has_value());
            CHECK(tree.addLink(h, "src", x).error().code == Error::Code::AlreadyExists);
            CHECK(tree.links().size() == 1);
        }

        SUBCASE("invalid name") {
            CHECK(tree.addLink(h, "a.b", g).error().code == Error::Code::InvalidPath);
        }
    }

    TEST_CASE("Reverse index and reference counts") {
        NodeTree tree;
        REQUIRE(tree.addGroup("parameters.target").has_value());
        REQUIRE(tree.addGroup("results.one").has_value());
        REQUIRE(tree.addGroup("results.two").has_value());
        Node& target = *tree.find("parameters.target");
        Node& one    = *tree.find("results.one");
        Node& two    = *tree.find("results.two");

        REQUIRE(tree.addLink(one, "t", target).has_value());
        REQUIRE(tree.addLink(two, "t", target).has_value());
        REQUIRE(tree.addLink(two, "u", target).has_value());

        CHECK(tree.links().refCount(target) == 3);
        auto owners = tree.links().ownersOf(target);
        CHECK(owners.size() == 3);
        CHECK(owners.contains(LinkIndex::LinkRef{&two, "u"}));

        auto targets = tree.links().targetsOf(two);
        CHECK(targets.size() == 2);
        CHECK(targets.at("t") == &target);

        REQUIRE(tree.links().removeLink(two, "u").has_value());
        CHECK(tree.links().refCount(target) == 2);
        CHECK(tree.links().removeLink(two, "u").error().code == Error::Code::NoSuchPath);

        tree.links().dropTargeting(target);
        CHECK(tree.links().refCount(target) == 0);
        CHECK(tree.links().targetsOf(one).empty());
    }
}
