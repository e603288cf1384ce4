#include "log/TaggedLogger.hpp"

#include <doctest/doctest.h>

#ifdef TS_LOG_DEBUG
#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

void waitForFlush() {
    std::this_thread::sleep_for(20ms);
}

} // namespace

TEST_SUITE("log.tagged_logger") {
    TEST_CASE("Disabled logger drops messages") {
        auto output = captureStderr([] {
            TS::TaggedLogger logger;
            logger.log_impl("should not appear", std::source_location::current(), "Storage");
            waitForFlush();
        });
        CHECK(output.empty());
    }

    TEST_CASE("Enabled logger writes tags, thread and message") {
        auto output = captureStderr([] {
            TS::TaggedLogger logger;
            logger.setLoggingEnabled(true);
            logger.setThreadName("Writer");
            logger.log_impl("stored run_00000001", std::source_location::current(), "Storage", "WriteQueue");
            waitForFlush();
        });
        CHECK(output.find("[Storage][WriteQueue]") != std::string::npos);
        CHECK(output.find("[Writer]") != std::string::npos);
        CHECK(output.find("stored run_00000001") != std::string::npos);
        CHECK(output.find("test_TaggedLogger.cpp:") != std::string::npos);
    }

    TEST_CASE("Traversal tags are muted unless enabled") {
        auto muted = captureStderr([] {
            TS::TaggedLogger logger;
            logger.setLoggingEnabled(true);
            logger.log_impl("visiting", std::source_location::current(), "NodeTree");
            waitForFlush();
        });
        CHECK(muted.empty());

        auto focused = captureStderr([] {
            TS::TaggedLogger logger;
            logger.setLoggingEnabled(true);
            logger.setEnabledTags({"NodeTree"});
            logger.log_impl("visiting", std::source_location::current(), "NodeTree");
            logger.log_impl("elsewhere", std::source_location::current(), "Storage");
            waitForFlush();
        });
        CHECK(focused.find("visiting") != std::string::npos);
        CHECK(focused.find("elsewhere") == std::string::npos);
    }

    TEST_CASE("Global wrappers and macro") {
        auto output = captureStderr([] {
            TS::set_thread_name("WrapperThread");
            TS::set_logging_enabled(true);
            ts_log("via macro", "Alpha", "Beta");
            waitForFlush();
            TS::set_logging_enabled(false);
        });
        CHECK(output.find("[Alpha][Beta]") != std::string::npos);
        CHECK(output.find("[WrapperThread]") != std::string::npos);
    }
}
#endif // TS_LOG_DEBUG
