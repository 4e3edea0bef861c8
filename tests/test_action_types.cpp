// EN: Unit tests for action kinds, status tokens, step recording and result serialisation
// FR: Tests unitaires pour les types d'action, jetons d'état, enregistrement des étapes et sérialisation

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>

#include "infrastructure/logging/logger.hpp"
#include "orchestrator/action_types.hpp"
#include "orchestrator/countdown.hpp"
#include "test_doubles.hpp"

using namespace DAO;
using namespace DAO::Orchestrator;
using DAO::Testing::FakeTicker;
using DAO::Testing::anyLineContains;
using ::testing::ElementsAre;

// EN: Test fixture for action type tests
// FR: Fixture de test pour les tests des types d'action
class ActionTypesTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().reset();
        Logger::getInstance().setConsoleOutput(false);
    }

    void TearDown() override {
        Logger::getInstance().reset();
    }
};

TEST_F(ActionTypesTest, KindNames) {
    EXPECT_EQ(ActionUtils::kindToString(ActionKind::STATUS_CHECK), "status-check");
    EXPECT_EQ(ActionUtils::kindArtifactName(ActionKind::ISOLATE), "isolation");
    EXPECT_EQ(ActionUtils::kindArtifactName(ActionKind::STATUS_CHECK), "status_check");

    EXPECT_EQ(ActionUtils::kindFromString("isolate"), ActionKind::ISOLATE);
    EXPECT_EQ(ActionUtils::kindFromString("isolation"), ActionKind::ISOLATE);
    EXPECT_EQ(ActionUtils::kindFromString("emergency-shutdown"), ActionKind::SHUTDOWN);
    EXPECT_EQ(ActionUtils::kindFromString("status_check"), ActionKind::STATUS_CHECK);
    EXPECT_FALSE(ActionUtils::kindFromString("reboot").has_value());

    EXPECT_EQ(ActionUtils::allKinds().size(), 4u);
}

TEST_F(ActionTypesTest, StatusTokens) {
    for (auto status : {ActionStatus::NOT_STARTED, ActionStatus::IN_PROGRESS,
                        ActionStatus::COMPLETED, ActionStatus::FAILED}) {
        EXPECT_EQ(ActionUtils::statusFromToken(ActionUtils::statusToToken(status)), status);
    }
    EXPECT_EQ(ActionUtils::statusToToken(ActionStatus::IN_PROGRESS), "IN_PROGRESS");
    EXPECT_FALSE(ActionUtils::statusFromToken("completed").has_value());
}

// EN: Each step is logged at the level matching its status
// FR: Chaque étape est journalisée au niveau correspondant à son statut
TEST_F(ActionTypesTest, RecorderLogsAtMatchingLevel) {
    StepRecorder recorder("isolation");
    recorder.succeeded("firewall_snapshot", "saved");
    recorder.skipped("stop_services", "not active");
    recorder.warned("suspicious_processes", "Found suspicious process: nc");

    auto lines = Logger::getInstance().getRecentLines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_THAT(lines[0], ::testing::HasSubstr("INFO"));
    EXPECT_THAT(lines[2], ::testing::HasSubstr("WARN"));
    EXPECT_TRUE(anyLineContains(lines, "suspicious_processes: Found suspicious process: nc"));
    EXPECT_EQ(recorder.steps().size(), 3u);
}

TEST_F(ActionTypesTest, FatalRecordsThenThrows) {
    StepRecorder recorder("patch");
    try {
        recorder.fatal("package_upgrade", "apt-get upgrade failed");
        FAIL() << "fatal() must throw";
    } catch (const FatalActionError& e) {
        EXPECT_EQ(e.step(), "package_upgrade");
        EXPECT_STREQ(e.what(), "apt-get upgrade failed");
    }

    ASSERT_EQ(recorder.steps().size(), 1u);
    EXPECT_EQ(recorder.steps()[0].status, StepStatus::FATAL);
    EXPECT_TRUE(anyLineContains(Logger::getInstance().getRecentLines(), "ERROR"));

    auto taken = recorder.takeSteps();
    EXPECT_EQ(taken.size(), 1u);
    EXPECT_TRUE(recorder.steps().empty());
}

TEST_F(ActionTypesTest, ResultJson) {
    ActionResult result;
    result.kind = ActionKind::ISOLATE;
    result.status = ActionStatus::COMPLETED;
    result.cve = "CVE-2024-6387";
    result.snapshot_path = "/tmp/dao/snapshots/iptables_backup_x";
    result.steps.push_back({"firewall_snapshot", StepStatus::SUCCEEDED, "saved", {}});
    result.steps.push_back({"stop_services", StepStatus::WARNED, "1 failed", {}});

    auto json = result.toJson();
    EXPECT_EQ(json["action"], "isolate");
    EXPECT_EQ(json["status"], "COMPLETED");
    EXPECT_EQ(json["cve"], "CVE-2024-6387");
    EXPECT_EQ(json["snapshot"], "/tmp/dao/snapshots/iptables_backup_x");
    EXPECT_FALSE(json.contains("report"));
    ASSERT_EQ(json["steps"].size(), 2u);
    EXPECT_EQ(json["steps"][1]["status"], "warned");
    EXPECT_EQ(json["summary"]["warned"], 1);
    EXPECT_EQ(json["summary"]["succeeded"], 1);

    EXPECT_EQ(result.countSteps(StepStatus::WARNED), 1u);
    ASSERT_TRUE(result.findStep("stop_services").has_value());
    EXPECT_FALSE(result.findStep("halt").has_value());
}

TEST_F(ActionTypesTest, AnnouncementSchedule) {
    EXPECT_TRUE(shouldAnnounce(60));
    EXPECT_TRUE(shouldAnnounce(10));
    EXPECT_TRUE(shouldAnnounce(7));
    EXPECT_TRUE(shouldAnnounce(1));
    EXPECT_FALSE(shouldAnnounce(25));
    EXPECT_FALSE(shouldAnnounce(11));
    EXPECT_FALSE(shouldAnnounce(0));
}

TEST_F(ActionTypesTest, CountdownAnnouncesMultiplesOfTenAndFinalSeconds) {
    CancellationToken token;
    FakeTicker ticker;
    std::vector<int> heard;

    CountdownResult result = runCountdown(25, ticker, token, [&heard](int s) { heard.push_back(s); });

    EXPECT_TRUE(result.completed);
    EXPECT_EQ(ticker.ticks(), 25);
    EXPECT_THAT(result.announced, ElementsAre(20, 10, 9, 8, 7, 6, 5, 4, 3, 2, 1));
    EXPECT_EQ(heard, result.announced);
}

TEST_F(ActionTypesTest, CountdownZeroCompletesImmediately) {
    CancellationToken token;
    FakeTicker ticker;
    CountdownResult result = runCountdown(0, ticker, token, nullptr);
    EXPECT_TRUE(result.completed);
    EXPECT_EQ(ticker.ticks(), 0);
}

TEST_F(ActionTypesTest, CountdownCancelledMidway) {
    CancellationToken token;
    FakeTicker ticker(&token, 5);

    CountdownResult result = runCountdown(60, ticker, token, nullptr);
    EXPECT_FALSE(result.completed);
    EXPECT_EQ(result.remaining_seconds, 56);
    EXPECT_EQ(ticker.ticks(), 5);
}

// EN: A cancellation arriving during the last second still prevents completion
// FR: Une annulation arrivant pendant la dernière seconde empêche encore l'achèvement
TEST_F(ActionTypesTest, CountdownCancelledOnLastTick) {
    CancellationToken token;
    FakeTicker ticker(&token, 3);

    CountdownResult result = runCountdown(3, ticker, token, nullptr);
    EXPECT_FALSE(result.completed);
}

TEST_F(ActionTypesTest, CountdownAlreadyCancelled) {
    CancellationToken token;
    token.cancel();
    FakeTicker ticker;

    CountdownResult result = runCountdown(10, ticker, token, nullptr);
    EXPECT_FALSE(result.completed);
    EXPECT_EQ(result.remaining_seconds, 10);
    EXPECT_EQ(ticker.ticks(), 0);
}

// EN: Main function for running tests
// FR: Fonction principale pour exécuter les tests
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
