// EN: Unit tests for DiagnosticCollector - fixed sections, graceful degradation and threshold recommendations
// FR: Tests unitaires pour DiagnosticCollector - sections fixes, dégradation gracieuse et recommandations à seuils

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "infrastructure/logging/logger.hpp"
#include "orchestrator/diagnostic_collector.hpp"
#include "test_doubles.hpp"

using namespace DAO;
using namespace DAO::Orchestrator;
using DAO::Testing::FakeProbe;
using DAO::Testing::TempDir;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

FilesystemUsage mount(const std::string& mountpoint, double used_pct) {
    FilesystemUsage fs;
    fs.device = "/dev/sda1";
    fs.mountpoint = mountpoint;
    fs.fstype = "ext4";
    fs.total_bytes = 100ull * 1024 * 1024 * 1024;
    fs.used_bytes = static_cast<uint64_t>(fs.total_bytes * used_pct / 100.0);
    fs.used_pct = used_pct;
    return fs;
}

MemoryUsage memory(double used_pct) {
    MemoryUsage usage;
    usage.total_kb = 1000000;
    usage.used_kb = static_cast<uint64_t>(usage.total_kb * used_pct / 100.0);
    usage.available_kb = usage.total_kb - usage.used_kb;
    usage.used_pct = used_pct;
    return usage;
}

} // namespace

// EN: Test fixture for DiagnosticCollector tests
// FR: Fixture de test pour les tests DiagnosticCollector
class DiagnosticCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().reset();
        Logger::getInstance().setConsoleOutput(false);
    }

    void TearDown() override {
        Logger::getInstance().reset();
    }

    std::vector<std::string> linesOf(const DiagnosticOutcome& outcome, const std::string& title) {
        const auto* section = outcome.report.findSection(title);
        return section ? section->lines : std::vector<std::string>{};
    }

    TempDir dir_;
    ArtifactLayout layout_{dir_.path()};
    StatusTracker tracker_{layout_};
    FakeProbe probe_;
};

// EN: A host with no tools at all still gets every section
// FR: Un hôte sans aucun outil obtient quand même toutes les sections
TEST_F(DiagnosticCollectorTest, EverySectionPresentWhenNothingIsAvailable) {
    DiagnosticCollector collector(probe_, tracker_);
    DiagnosticOutcome outcome = collector.collect("CVE-2024-6387");

    EXPECT_EQ(outcome.report.sectionTitles(), DiagnosticCollector::sectionTitles());
    EXPECT_EQ(outcome.report.sectionTitles().size(), 10u);
    EXPECT_EQ(outcome.unavailable_items, 14u);
    EXPECT_THAT(linesOf(outcome, "MEMORY USAGE"), ElementsAre("Memory information: not available"));
    EXPECT_THAT(outcome.recommendations, ElementsAre("No critical issues detected"));

    const std::string text = outcome.report.render();
    EXPECT_THAT(text, HasSubstr("CVE Context: CVE-2024-6387\n"));
    EXPECT_THAT(text, HasSubstr("Host: not available\n"));
}

TEST_F(DiagnosticCollectorTest, PopulatedSections) {
    probe_.hostname_value = "web01";
    probe_.uptime_value = "up 3 days, 2 hours, 5 minutes";
    probe_.load_value = LoadAverage{0.5, 0.4, 0.3};
    probe_.kernel_value = "6.1.0-18-amd64";
    probe_.memory_value = memory(40.0);
    probe_.filesystems_value = std::vector<FilesystemUsage>{mount("/", 42.0)};
    probe_.services_value = std::vector<ServiceState>{{"ssh", true, true}, {"nginx", false, false}};
    probe_.interfaces_value = std::vector<NetworkAddress>{{"eth0", "inet", "192.0.2.10"}};
    probe_.sockets_value = std::vector<std::string>{"tcp LISTEN 0.0.0.0:22"};
    probe_.processes_value = std::vector<std::string>{"USER PID %CPU", "root 1 0.1"};
    probe_.failed_logins_value = 3;
    probe_.firewall_value = std::string("iptables rules count: 4");
    probe_.running_value = std::vector<std::string>{};
    probe_.updates_value = UpdateSummary{"apt", 7};

    DiagnosticCollector collector(probe_, tracker_);
    DiagnosticOutcome outcome = collector.collect("CVE-2024-6387");

    EXPECT_EQ(outcome.unavailable_items, 0u);
    EXPECT_THAT(linesOf(outcome, "SYSTEM INFORMATION"),
                ElementsAre("Hostname: web01", "Uptime: up 3 days, 2 hours, 5 minutes",
                            "Load Average: 0.50 0.40 0.30", "Kernel: 6.1.0-18-amd64"));
    EXPECT_THAT(linesOf(outcome, "CRITICAL SERVICES STATUS"),
                ElementsAre("ssh: active (enabled)", "nginx: inactive (disabled)"));
    EXPECT_THAT(linesOf(outcome, "NETWORK STATUS"), Contains("  eth0 inet 192.0.2.10"));
    EXPECT_THAT(linesOf(outcome, "SECURITY STATUS"),
                ElementsAre("Recent failed login attempts: 3", "Firewall: iptables rules count: 4",
                            "No suspicious processes detected"));
    EXPECT_THAT(linesOf(outcome, "SYSTEM UPDATES"), ElementsAre("Available updates (apt): 7"));
    EXPECT_TRUE(outcome.suspicious_processes.empty());
}

TEST_F(DiagnosticCollectorTest, SuspiciousProcessesAreFlagged) {
    probe_.running_value = std::vector<std::string>{"sshd", "nmap", "nc"};

    DiagnosticCollector collector(probe_, tracker_);
    DiagnosticOutcome outcome = collector.collect("Unknown");

    EXPECT_THAT(outcome.suspicious_processes, ElementsAre("nc", "nmap"));
    EXPECT_THAT(linesOf(outcome, "SECURITY STATUS"), Contains("WARNING: Suspicious process found: nmap"));
    EXPECT_TRUE(DAO::Testing::anyLineContains(Logger::getInstance().getRecentLines(),
                                              "Suspicious process found: nc"));
}

TEST_F(DiagnosticCollectorTest, RemediationStatusReflectsTokens) {
    ASSERT_TRUE(tracker_.setStatus(ActionKind::PATCH, ActionStatus::COMPLETED));

    DiagnosticCollector collector(probe_, tracker_);
    DiagnosticOutcome outcome = collector.collect("Unknown");

    EXPECT_THAT(linesOf(outcome, "REMEDIATION STATUS"),
                ElementsAre("Last patch status: COMPLETED", "Isolation status: NOT_STARTED"));
}

// EN: A probe raising an exception degrades like a missing tool
// FR: Une sonde qui lève une exception se dégrade comme un outil manquant
TEST_F(DiagnosticCollectorTest, ThrowingProbeIsTolerated) {
    probe_.throw_on_memory = true;

    DiagnosticCollector collector(probe_, tracker_);
    DiagnosticOutcome outcome;
    ASSERT_NO_THROW(outcome = collector.collect("Unknown"));

    EXPECT_THAT(linesOf(outcome, "MEMORY USAGE"), ElementsAre("Memory information: not available"));
    EXPECT_TRUE(DAO::Testing::anyLineContains(Logger::getInstance().getRecentLines(), "memory probe failed"));
}

TEST_F(DiagnosticCollectorTest, RecommendationThresholds) {
    auto high = DiagnosticCollector::recommendations(LoadAverage{2.5, 1.0, 1.0},
                                                     std::vector<FilesystemUsage>{mount("/", 50.0), mount("/mnt", 95.0)},
                                                     memory(92.5));
    EXPECT_THAT(high, ElementsAre("HIGH: System load is high (2.50)",
                                  "HIGH: Disk usage is critical: /mnt 95%",
                                  "HIGH: Memory usage is high (92.5%)"));

    // EN: Boundaries: load and memory must exceed, disk may equal
    // FR: Limites : charge et mémoire doivent dépasser, le disque peut égaler
    auto boundary = DiagnosticCollector::recommendations(LoadAverage{2.0, 0.0, 0.0},
                                                         std::vector<FilesystemUsage>{mount("/", 90.0)},
                                                         memory(90.0));
    EXPECT_THAT(boundary, ElementsAre("HIGH: Disk usage is critical: / 90%"));

    auto none = DiagnosticCollector::recommendations(std::nullopt, std::nullopt, std::nullopt);
    EXPECT_THAT(none, ElementsAre("No critical issues detected"));
}

TEST_F(DiagnosticCollectorTest, FormatBytes) {
    EXPECT_EQ(DiagnosticCollector::formatBytes(512), "512 B");
    EXPECT_EQ(DiagnosticCollector::formatBytes(1536), "1.5 KiB");
    EXPECT_EQ(DiagnosticCollector::formatBytes(8ull * 1024 * 1024 * 1024), "8.0 GiB");
}

// EN: Main function for running tests
// FR: Fonction principale pour exécuter les tests
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
