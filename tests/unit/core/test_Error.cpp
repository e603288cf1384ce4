#include "core/Error.hpp"

#include <doctest/doctest.h>

#include <set>
#include <string>
#include <vector>

using namespace TS;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::UnknownError); i <= static_cast<int>(Error::Code::NotSupported); ++i)
            codes.push_back(static_cast<Error::Code>(i));

        std::set<std::string> labels;
        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            labels.insert(std::string{label});
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }
        // Every code renders to its own label.
        CHECK(labels.size() == codes.size());

        Error withMsg{Error::Code::NotUniqueNode, "x"};
        CHECK(describeError(withMsg) == "not_unique_node:x");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }
}
