// EN: Unit tests for ActionReport
// FR: Tests unitaires pour ActionReport

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>

#include "orchestrator/action_report.hpp"
#include "test_doubles.hpp"

using namespace DAO::Orchestrator;
using DAO::Testing::TempDir;
using DAO::Testing::readFile;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::StartsWith;

class ActionReportTest : public ::testing::Test {
protected:
    ActionReport buildIsolationReport() {
        ActionReport report("Isolation Report");
        report.addHeader("CVE", "CVE-2024-6387");
        report.addHeader("Status", "ISOLATED");
        report.addSection("FIREWALL RULES");
        report.addLine("  applied: allow loopback");
        report.addSection("RESTORE INSTRUCTIONS");
        report.addLine("1. Restore firewall rules:");
        return report;
    }
};

TEST_F(ActionReportTest, RenderLayout) {
    const std::string text = buildIsolationReport().render();
    const std::string rule(50, '=');

    EXPECT_THAT(text, StartsWith(rule + "\nIsolation Report\n" + rule + "\n"));
    EXPECT_THAT(text, HasSubstr("CVE: CVE-2024-6387\nStatus: ISOLATED\n"));
    EXPECT_THAT(text, HasSubstr("\n=== FIREWALL RULES ===\n  applied: allow loopback\n"));
    EXPECT_LT(text.find("FIREWALL RULES"), text.find("RESTORE INSTRUCTIONS"));
}

TEST_F(ActionReportTest, SectionLookup) {
    ActionReport report = buildIsolationReport();

    EXPECT_THAT(report.sectionTitles(), ElementsAre("FIREWALL RULES", "RESTORE INSTRUCTIONS"));
    const auto* section = report.findSection("RESTORE INSTRUCTIONS");
    ASSERT_NE(section, nullptr);
    EXPECT_THAT(section->lines, ElementsAre("1. Restore firewall rules:"));
    EXPECT_EQ(report.findSection("SERVICES"), nullptr);
}

// EN: Lines added before any section go to an implicit DETAILS section
// FR: Les lignes ajoutées avant toute section vont dans une section DETAILS implicite
TEST_F(ActionReportTest, ImplicitDetailsSection) {
    ActionReport report("Patch Report");
    report.addLine("first line");
    EXPECT_THAT(report.sectionTitles(), ElementsAre("DETAILS"));
}

TEST_F(ActionReportTest, WriteToRefusesOverwrite) {
    TempDir dir;
    const std::string path = dir.path() + "/report.txt";
    ActionReport report = buildIsolationReport();

    std::string error;
    ASSERT_TRUE(report.writeTo(path, error)) << error;
    EXPECT_EQ(readFile(path), report.render());

    ActionReport other("Other");
    EXPECT_FALSE(other.writeTo(path, error));
    EXPECT_THAT(error, HasSubstr("Cannot create report"));
    EXPECT_EQ(readFile(path), report.render());
}

TEST_F(ActionReportTest, WriteToMissingDirectoryFails) {
    std::string error;
    EXPECT_FALSE(ActionReport("x").writeTo("/nonexistent-dao-dir/report.txt", error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ActionReportTest, CurrentDateFormat) {
    EXPECT_THAT(ActionReport::currentDate(),
                ::testing::MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2}.*"));
}

// EN: Main function for running tests
// FR: Fonction principale pour exécuter les tests
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
