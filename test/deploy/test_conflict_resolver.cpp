#include <catch2/catch_test_macros.hpp>

#include <ccpm/deploy/conflict_resolver.hpp>

#include "../../test/mocks/mock_prompt.hpp"

using namespace ccpm;
using ccpm::testing::MockPrompt;

TEST_CASE("ConflictResolver: skip never overwrites", "[deploy][conflict]") {
    MockPrompt prompt;
    auto logger = MakeNullLogger();
    ConflictResolver resolver(prompt, *logger);

    CHECK_FALSE(resolver.ShouldOverwrite("/x/commands/a.md", ConflictStrategy::Skip));
    CHECK(prompt.CallCount() == 0);
}

TEST_CASE("ConflictResolver: overwrite always overwrites", "[deploy][conflict]") {
    MockPrompt prompt;
    auto logger = MakeNullLogger();
    ConflictResolver resolver(prompt, *logger);

    CHECK(resolver.ShouldOverwrite("/x/commands/a.md", ConflictStrategy::Overwrite));
    CHECK(prompt.CallCount() == 0);
}

TEST_CASE("ConflictResolver: prompt follows the answer", "[deploy][conflict]") {
    MockPrompt prompt;
    prompt.EnqueueAnswer(true);
    prompt.EnqueueAnswer(false);
    auto logger = MakeNullLogger();
    ConflictResolver resolver(prompt, *logger, std::chrono::milliseconds(1234));

    CHECK(resolver.ShouldOverwrite("/x/commands/a.md", ConflictStrategy::Prompt));
    CHECK_FALSE(resolver.ShouldOverwrite("/x/commands/b.md", ConflictStrategy::Prompt));

    REQUIRE(prompt.CallCount() == 2);
    CHECK(prompt.Calls()[0].message.find("/x/commands/a.md") != std::string::npos);
    CHECK(prompt.Calls()[0].timeout == std::chrono::milliseconds(1234));
    CHECK_FALSE(prompt.Calls()[0].default_answer);
}

TEST_CASE("ConflictResolver: unanswered prompt keeps the file", "[deploy][conflict]") {
    MockPrompt prompt;
    auto logger = MakeNullLogger();
    ConflictResolver resolver(prompt, *logger);

    CHECK_FALSE(resolver.ShouldOverwrite("/x/agents/a.md", ConflictStrategy::Prompt));
    REQUIRE(prompt.CallCount() == 1);
    CHECK(prompt.Calls()[0].timeout == ConflictResolver::kDefaultPromptTimeout);
}
