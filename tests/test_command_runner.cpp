// EN: Unit tests for SystemCommandRunner and the privileged capabilities
// FR: Tests unitaires pour SystemCommandRunner et les capacités privilégiées

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <string>
#include <vector>

#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/command_runner.hpp"
#include "infrastructure/system/privileged_capability.hpp"
#include "test_doubles.hpp"

using namespace DAO;
using DAO::Testing::MockCommandRunner;
using DAO::Testing::okResult;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::StrictMock;

// EN: Test fixture for command runner tests
// FR: Fixture de test pour les tests de l'exécuteur de commandes
class CommandRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().reset();
        Logger::getInstance().setConsoleOutput(false);
    }

    void TearDown() override {
        Logger::getInstance().reset();
    }

    SystemCommandRunner runner_{std::chrono::seconds(10)};
};

TEST_F(CommandRunnerTest, CapturesStdoutAndExitCode) {
    CommandResult result = runner_.run({"sh", "-c", "echo hello; echo oops >&2; exit 3"});

    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_output, "hello\n");
    EXPECT_EQ(result.stderr_output, "oops\n");
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.failureReason(), "exit code 3: oops");
}

TEST_F(CommandRunnerTest, SuccessfulCommand) {
    CommandResult result = runner_.run({"true"});
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.exit_code, 0);
}

// EN: Arguments reach the program verbatim, no shell expansion
// FR: Les arguments atteignent le programme tels quels, sans expansion shell
TEST_F(CommandRunnerTest, ArgumentsAreNotShellExpanded) {
    CommandResult result = runner_.run({"echo", "$HOME", "a;b"});
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_output, "$HOME a;b\n");
}

TEST_F(CommandRunnerTest, MissingProgram) {
    CommandResult result = runner_.run({"dao-no-such-program-xyz"});
    EXPECT_FALSE(result.launched);
    EXPECT_FALSE(result.succeeded());
    EXPECT_THAT(result.failureReason(), HasSubstr("command not found"));
    EXPECT_FALSE(runner_.isAvailable("dao-no-such-program-xyz"));
}

TEST_F(CommandRunnerTest, EmptyCommand) {
    CommandResult result = runner_.run({});
    EXPECT_FALSE(result.launched);
}

TEST_F(CommandRunnerTest, AvailabilityLookup) {
    EXPECT_TRUE(runner_.isAvailable("sh"));
    EXPECT_FALSE(SystemCommandRunner::resolveProgram("sh").empty());
    EXPECT_EQ(SystemCommandRunner::resolveProgram("/bin/sh"), "/bin/sh");
    EXPECT_TRUE(SystemCommandRunner::resolveProgram("").empty());
}

TEST_F(CommandRunnerTest, TimeoutKillsCommand) {
    SystemCommandRunner quick(std::chrono::seconds(1));

    auto start = std::chrono::steady_clock::now();
    CommandResult result = quick.run({"sleep", "5"});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.launched);
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.failureReason(), "command timed out");
    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

TEST_F(CommandRunnerTest, FormatCommand) {
    EXPECT_EQ(formatCommand({"iptables", "-A", "INPUT", "-j", "DROP"}), "iptables -A INPUT -j DROP");
    EXPECT_EQ(formatCommand({}), "");
}

TEST_F(CommandRunnerTest, SudoCapabilityPrefixesNonInteractiveSudo) {
    StrictMock<MockCommandRunner> runner;
    EXPECT_CALL(runner, run(ElementsAre("sudo", "-n", "systemctl", "stop", "nginx")))
        .WillOnce(Return(okResult()));

    SudoCapability capability(runner);
    EXPECT_TRUE(capability.execute({"systemctl", "stop", "nginx"}).succeeded());
    EXPECT_EQ(capability.describe(), "sudo");
}

TEST_F(CommandRunnerTest, DirectCapabilityPassesThrough) {
    StrictMock<MockCommandRunner> runner;
    EXPECT_CALL(runner, run(ElementsAre("sync"))).WillOnce(Return(okResult()));

    DirectCapability capability(runner);
    EXPECT_TRUE(capability.execute({"sync"}).succeeded());
}

// EN: Dry-run never touches the runner and reports success with a marker
// FR: La simulation ne touche jamais l'exécuteur et réussit avec un marqueur
TEST_F(CommandRunnerTest, DryRunRecordsWithoutExecuting) {
    DryRunCapability capability;

    CommandResult result = capability.execute({"iptables-save"});
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_output, "# dry-run: iptables-save\n");

    capability.execute({"shutdown", "-h", "now"});
    auto commands = capability.executedCommands();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_THAT(commands[1], ElementsAre("shutdown", "-h", "now"));
}

TEST_F(CommandRunnerTest, MakeCapabilitySelectsMode) {
    StrictMock<MockCommandRunner> runner;
    EXPECT_EQ(makeCapability(runner, true, true)->describe(), "dry-run");
    EXPECT_EQ(makeCapability(runner, false, true)->describe(), "sudo");
    EXPECT_EQ(makeCapability(runner, false, false)->describe(), "direct");
}

// EN: Main function for running tests
// FR: Fonction principale pour exécuter les tests
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
