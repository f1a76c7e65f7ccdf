#include "execution/outcome.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runner;

TEST(OutcomeTest, SuccessfulRun) {
    auto outcome = aggregate({"  hi\n", ""}, 0, nullopt);
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.output, "hi");
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_EQ(outcome.exit_code, 0);
}

TEST(OutcomeTest, StderrMeansFailureEvenWithZeroExit) {
    auto outcome = aggregate({"done\n", "warning: deprecated\n"}, 0, nullopt);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, optional<string>("warning: deprecated"));
    EXPECT_EQ(outcome.exit_code, 0);
}

TEST(OutcomeTest, NonZeroExitSynthesizesMessage) {
    auto outcome = aggregate({"", ""}, 2, nullopt);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, optional<string>("Process exited with code 2"));
    EXPECT_EQ(outcome.exit_code, 2);
}

TEST(OutcomeTest, NonZeroExitKeepsStderr) {
    auto outcome = aggregate({"", "Traceback...\nNameError\n"}, 1, nullopt);
    EXPECT_EQ(outcome.error, optional<string>("Traceback...\nNameError"));
}

TEST(OutcomeTest, MissingExitCodeIsMinusOne) {
    auto outcome = aggregate({"partial", ""}, nullopt, nullopt);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_EQ(outcome.error, optional<string>("Process exited with code -1"));
}

TEST(OutcomeTest, SupervisoryErrorOverridesStderr) {
    auto outcome = aggregate({"partial output\n", "noise"}, 0, string("Execution timeout (1000 ms)"));
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.output, "partial output");
    EXPECT_EQ(outcome.error, optional<string>("Execution timeout (1000 ms)"));
    EXPECT_EQ(outcome.exit_code, -1);
}

TEST(OutcomeTest, FailedOutcome) {
    auto outcome = failed_outcome("No such image: runner-python");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.output, "");
    EXPECT_EQ(outcome.error, optional<string>("No such image: runner-python"));
    EXPECT_EQ(outcome.exit_code, -1);
}

TEST(OutcomeTest, JsonDocument) {
    auto j = to_json(aggregate({"ok\n", ""}, 0, nullopt));
    EXPECT_EQ(j, nlohmann::json::parse(R"({"success": true, "output": "ok", "error": null, "exitCode": 0})"));

    j = to_json(aggregate({"", ""}, 2, nullopt));
    EXPECT_EQ(j["error"], "Process exited with code 2");
    EXPECT_EQ(j["exitCode"], 2);
    EXPECT_EQ(j["success"], false);
}
