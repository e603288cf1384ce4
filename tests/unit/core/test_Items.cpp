#include "core/Item.hpp"
#include "core/Parameter.hpp"
#include "core/Result.hpp"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace TS;

TEST_SUITE("core.items") {
    TEST_CASE("Parameter set and lock") {
        Parameter param{Value(10)};
        param.setOwnerName("parameters.x");
        CHECK(param.size() == 1);
        CHECK_FALSE(param.isArray());
        CHECK(*param.get() == 10);

        REQUIRE(param.set(Value(11)).has_value());
        CHECK(*param.get() == 11);

        param.lock();
        auto locked = param.set(Value(12));
        REQUIRE_FALSE(locked.has_value());
        CHECK(locked.error().code == Error::Code::ParameterLocked);
        CHECK(*param.get() == 11);
        param.unlock();
        CHECK(param.set(Value(12)).has_value());

        auto null = param.set(Value{});
        REQUIRE_FALSE(null.has_value());
        CHECK(null.error().code == Error::Code::InvalidArgument);
    }

    TEST_CASE("Parameter array operations") {
        Parameter param{Value(1)};

        SUBCASE("array-only calls on a plain value") {
            auto added = param.addItems({Value(2)});
            REQUIRE_FALSE(added.has_value());
            CHECK(added.error().code == Error::Code::ParameterNotArray);
            auto changed = param.changeValuesInArray({Value(2)}, {0});
            REQUIRE_FALSE(changed.has_value());
            CHECK(changed.error().code == Error::Code::ParameterNotArray);
        }

        SUBCASE("explore, access and change") {
            REQUIRE(param.explore({Value(1), Value(2), Value(3), Value(4)}).has_value());
            CHECK(param.isArray());
            CHECK(param.size() == 4);
            CHECK(*param.access(2) == 3);
            auto outside = param.access(4);
            REQUIRE_FALSE(outside.has_value());
            CHECK(outside.error().code == Error::Code::OutOfRange);

            REQUIRE(param.changeValuesInArray({Value(30)}, {2}).has_value());
            CHECK(*param.access(2) == 30);
            REQUIRE(param.addItems({Value(5)}).has_value());
            CHECK(param.size() == 5);

            auto mismatch = param.addItems({Value("text")});
            REQUIRE_FALSE(mismatch.has_value());
            CHECK(mismatch.error().code == Error::Code::TypeMismatch);

            auto lengths = param.changeValuesInArray({Value(1), Value(2)}, {0});
            REQUIRE_FALSE(lengths.has_value());
            CHECK(lengths.error().code == Error::Code::LengthMismatch);
        }

        SUBCASE("explore ignores the lock but shrink does not") {
            param.lock();
            REQUIRE(param.explore({Value(7), Value(8)}).has_value());
            CHECK(param.size() == 2);
            auto shrunk = param.shrink();
            REQUIRE_FALSE(shrunk.has_value());
            CHECK(shrunk.error().code == Error::Code::ParameterLocked);
            param.unlock();
            REQUIRE(param.shrink().has_value());
            CHECK_FALSE(param.isArray());
            CHECK(*param.get() == 1);
        }

        SUBCASE("valueForRun picks the run entry") {
            REQUIRE(param.explore({Value(5), Value(6)}).has_value());
            CHECK(*param.valueForRun(1) == 6);
            CHECK(*param.valueForRun(std::nullopt) == 1);
        }
    }

    TEST_CASE("Parameter store and load") {
        Parameter source{Value(2.5)};
        REQUIRE(source.explore({Value(1.0), Value(2.0)}).has_value());
        auto representation = source.store();
        CHECK(representation.contains("data"));
        CHECK(representation.contains("explored_data"));

        Parameter copy;
        CHECK(copy.isEmpty());
        REQUIRE(copy.load(representation).has_value());
        CHECK(copy.size() == 2);
        CHECK(*copy.get() == 2.5);

        std::vector<std::string> fields{"explored_data"};
        REQUIRE(copy.removeFields(fields).has_value());
        CHECK_FALSE(copy.isArray());
        CHECK(copy.fieldNames() == std::vector<std::string>{"data"});

        auto bad = copy.load(Value::array());
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == Error::Code::MalformedInput);
    }

    TEST_CASE("Result fields") {
        Result result{{{"mean", Value(1.5)}, {"count", Value(3)}}};
        CHECK(result.size() == 2);
        CHECK(*result.get("mean") == 1.5);
        CHECK(result.get("missing").error().code == Error::Code::NoSuchPath);
        CHECK(result.fieldNames() == std::vector<std::string>{"count", "mean"});

        REQUIRE(result.set("std", Value(0.1)).has_value());
        CHECK(result.toDict().size() == 3);

        std::vector<std::string> fields{"count"};
        REQUIRE(result.removeFields(fields).has_value());
        CHECK_FALSE(result.contains("count"));

        auto clone = result.clone();
        CHECK(clone->kind() == ItemKind::Result);
        CHECK(clone->store() == result.store());

        result.lock();
        CHECK(result.set("std", Value(0.2)).error().code == Error::Code::ParameterLocked);
    }

    TEST_CASE("Item kinds") {
        CHECK(itemKindToString(ItemKind::Parameter) == "parameter");
        CHECK(*itemKindFromString("result") == ItemKind::Result);
        CHECK(itemKindFromString("table").error().code == Error::Code::MalformedInput);
        auto item = makeItem(ItemKind::Parameter);
        REQUIRE(item);
        CHECK(item->isEmpty());
    }
}
