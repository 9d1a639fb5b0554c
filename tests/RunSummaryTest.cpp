#include "app/RunSummary.hpp"

#include <gtest/gtest.h>

namespace {
RunReport sampleReport() {
    RunReport r;
    r.started = "2024-05-01 10:00:00";
    r.finished = "2024-05-01 10:01:20";
    r.outcome = RunOutcome::RecoveredAfterRestart;
    r.adapters = {"eth0"};
    r.properties = {{"eth0", "tx-tcp-segmentation", "on", "off", "changed", ""},
                    {"eth0", "tx-tcp6-segmentation", "", "off", "absent", ""}};
    r.anyChangeMade = true;
    r.probes = {{"Teste pós-alteração", false, ""}, {"Teste pós-reinício", true, "1.1.1.1"}};
    r.restarts = {{"eth0", "restarted", ""}};
    return r;
}
}  // namespace

TEST(RunSummaryTest, JsonCarriesOutcomeAndSteps) {
    auto j = reportToJson(sampleReport());

    EXPECT_EQ(j["outcome"], "recovered_after_restart");
    EXPECT_EQ(j["exit_code"], 0);
    EXPECT_EQ(j["dry_run"], false);
    EXPECT_EQ(j["any_change_made"], true);
    ASSERT_EQ(j["properties"].size(), 2u);
    EXPECT_EQ(j["properties"][0]["result"], "changed");
    EXPECT_FALSE(j["properties"][0].contains("error"));
    ASSERT_EQ(j["probes"].size(), 2u);
    EXPECT_FALSE(j["probes"][0].contains("target"));
    EXPECT_EQ(j["probes"][1]["target"], "1.1.1.1");
    EXPECT_EQ(j["restarts"][0]["adapter"], "eth0");
}

TEST(RunSummaryTest, EmptyReportStillHasArrays) {
    RunReport r;
    r.outcome = RunOutcome::NoAdapters;
    auto j = reportToJson(r);

    EXPECT_EQ(j["exit_code"], 1);
    EXPECT_TRUE(j["properties"].is_array());
    EXPECT_TRUE(j["probes"].is_array());
    EXPECT_TRUE(j["restarts"].is_array());
}

TEST(RunSummaryTest, TextSummaryMentionsEachStep) {
    auto s = summarize(sampleReport());

    EXPECT_NE(s.find("recovered_after_restart"), std::string::npos);
    EXPECT_NE(s.find("eth0 tx-tcp-segmentation: on -> off [changed]"), std::string::npos);
    EXPECT_NE(s.find("tx-tcp6-segmentation: não disponível"), std::string::npos);
    EXPECT_NE(s.find("OK via 1.1.1.1"), std::string::npos);
    EXPECT_NE(s.find("Reinício eth0: restarted"), std::string::npos);
}

TEST(RunSummaryTest, ExitCodesAreDistinct) {
    EXPECT_EQ(exitCode(RunOutcome::Healthy), 0);
    EXPECT_EQ(exitCode(RunOutcome::Remediated), 0);
    EXPECT_EQ(exitCode(RunOutcome::NoAdapters), 1);
    EXPECT_EQ(exitCode(RunOutcome::InsufficientPrivilege), 2);
    EXPECT_EQ(exitCode(RunOutcome::UnsupportedEnvironment), 3);
    EXPECT_EQ(exitCode(RunOutcome::ManualInterventionRequired), 4);
    EXPECT_EQ(exitCode(RunOutcome::RebootInitiated), 5);
}
