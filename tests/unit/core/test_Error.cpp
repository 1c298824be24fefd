#include <renderweave/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace RW;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::NotSupported);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            // describeError echoes the label when the message is empty.
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::ConsistencyViolation, "bad link"};
        CHECK(describeError(withMsg) == "consistency_violation:bad link");

        Error deferred{Error::Code::MutationDeferred, "node 'a' mutated while a frame was running"};
        CHECK(describeError(deferred) == "mutation_deferred:node 'a' mutated while a frame was running");

        Error withoutMsg{Error::Code::NoSuchInstance, {}};
        CHECK(describeError(withoutMsg) == "no_such_instance");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("make_error feeds Expected") {
        auto fail = []() -> Expected<int> {
            return std::unexpected(make_error("cycle at 'a'", Error::Code::ContractViolation));
        };
        auto result = fail();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::ContractViolation);
        REQUIRE(result.error().message.has_value());
        CHECK(*result.error().message == "cycle at 'a'");

        Error cleared{Error::Code::CapabilityMismatch, "x"};
        cleared.message.reset();
        CHECK(describeError(cleared) == "capability_mismatch");
    }
}
