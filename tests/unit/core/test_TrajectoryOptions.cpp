#include "core/TrajectoryOptions.hpp"
#include "storage/FileUtils.hpp"

#include <doctest/doctest.h>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

using namespace TS;

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value)
        : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str()))
            original = std::string(existing);
        apply(value);
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() { apply(original ? original->c_str() : nullptr); }

private:
    void apply(const char* value) {
        if (value)
            ::setenv(key.c_str(), value, 1);
        else
            ::unsetenv(key.c_str());
    }

    std::string                key;
    std::optional<std::string> original;
};

auto tempFile(std::string const& name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / ("trajspace_options_" + name + ".json");
}

} // namespace

TEST_SUITE("core.options") {
    TEST_CASE("Defaults validate") {
        TrajectoryOptions options;
        CHECK(options.storageService == "memory");
        CHECK(options.maxOverviewRows == 1000);
        CHECK_FALSE(ValidateTrajectoryOptions(options).has_value());
    }

    TEST_CASE("Validation rejects bad settings") {
        TrajectoryOptions options;
        options.name = "9bad";
        CHECK(ValidateTrajectoryOptions(options).has_value());

        options                = {};
        options.storageService = "tape";
        auto message           = ValidateTrajectoryOptions(options);
        REQUIRE(message.has_value());
        CHECK(message->find("tape") != std::string::npos);

        options                 = {};
        options.maxOverviewRows = 0;
        CHECK(ValidateTrajectoryOptions(options).has_value());

        options             = {};
        options.workerCount = 0;
        CHECK(ValidateTrajectoryOptions(options).has_value());
    }

    TEST_CASE("Options file") {
        auto path = tempFile("load");
        REQUIRE(FileUtils::writeTextFileAtomic(path,
                                               R"({"name": "sweep", "storage_service": "file", "auto_load": true, "worker_count": 2})",
                                               false)
                        .has_value());
        auto options = LoadTrajectoryOptionsFile(path);
        REQUIRE(options.has_value());
        CHECK(options->name == "sweep");
        CHECK(options->storageService == "file");
        CHECK(options->autoLoad);
        CHECK(options->workerCount == 2);
        CHECK(options->queueCapacity == 64);

        REQUIRE(FileUtils::writeTextFileAtomic(path, R"({"worker_count": "many"})", false).has_value());
        auto wrongType = LoadTrajectoryOptionsFile(path);
        REQUIRE_FALSE(wrongType.has_value());
        CHECK(wrongType.error().code == Error::Code::MalformedInput);

        REQUIRE(FileUtils::writeTextFileAtomic(path, "[1, 2", false).has_value());
        CHECK(LoadTrajectoryOptionsFile(path).error().code == Error::Code::MalformedInput);

        REQUIRE(FileUtils::removePathIfExists(path).has_value());
        CHECK(LoadTrajectoryOptionsFile(path).error().code == Error::Code::NoSuchPath);
    }

    TEST_CASE("Environment overrides") {
        SUBCASE("valid values apply") {
            EnvGuard storage{"TRAJSPACE_STORAGE", "file"};
            EnvGuard workers{"TRAJSPACE_WORKERS", "8"};
            EnvGuard autoLoad{"TRAJSPACE_AUTO_LOAD", "yes"};
            TrajectoryOptions options;
            CHECK(ApplyTrajectoryEnvOverrides(options));
            CHECK(options.storageService == "file");
            CHECK(options.workerCount == 8);
            CHECK(options.autoLoad);
        }

        SUBCASE("malformed values are reported") {
            EnvGuard          workers{"TRAJSPACE_WORKERS", "zero"};
            TrajectoryOptions options;
            CHECK_FALSE(ApplyTrajectoryEnvOverrides(options));
            CHECK(options.workerCount == 4);
        }

        SUBCASE("unset variables leave defaults") {
            EnvGuard          capacity{"TRAJSPACE_QUEUE_CAPACITY", nullptr};
            EnvGuard          storage{"TRAJSPACE_STORAGE", nullptr};
            TrajectoryOptions options;
            CHECK(ApplyTrajectoryEnvOverrides(options));
            CHECK(options.queueCapacity == 64);
            CHECK(options.storageService == "memory");
        }
    }
}
