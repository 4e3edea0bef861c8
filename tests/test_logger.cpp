// EN: Unit tests for Logger - levels, text and NDJSON lines, file sink, correlation id and metadata
// FR: Tests unitaires pour Logger - niveaux, lignes texte et NDJSON, sortie fichier, ID de corrélation et métadonnées

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "infrastructure/logging/logger.hpp"
#include "test_doubles.hpp"

using namespace DAO;
using DAO::Testing::TempDir;
using DAO::Testing::readFile;
using ::testing::HasSubstr;
using ::testing::EndsWith;

// EN: Test fixture for Logger tests
// FR: Fixture de test pour les tests Logger
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = &Logger::getInstance();
        logger_->reset();
        logger_->setConsoleOutput(false);
    }

    void TearDown() override {
        logger_->reset();
    }

    std::string lastLine() const {
        auto lines = logger_->getRecentLines();
        return lines.empty() ? std::string() : lines.back();
    }

    Logger* logger_ = nullptr;
};

TEST_F(LoggerTest, SingletonPattern) {
    EXPECT_EQ(&Logger::getInstance(), &Logger::getInstance());
}

// EN: Entries below the configured level are dropped from every sink
// FR: Les entrées sous le niveau configuré sont écartées de toutes les sorties
TEST_F(LoggerTest, LevelFiltering) {
    logger_->setLogLevel(LogLevel::WARN);

    LOG_DEBUG("test", "debug message");
    LOG_INFO("test", "info message");
    LOG_WARN("test", "warn message");
    LOG_ERROR("test", "error message");

    auto lines = logger_->getRecentLines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_THAT(lines[0], HasSubstr("warn message"));
    EXPECT_THAT(lines[1], HasSubstr("error message"));
}

TEST_F(LoggerTest, TextLineCarriesLevelModuleAndCve) {
    logger_->setCorrelationId("CVE-2024-6387");
    LOG_INFO("patch", "Starting emergency patching");

    const std::string line = lastLine();
    EXPECT_THAT(line, HasSubstr("INFO"));
    EXPECT_THAT(line, HasSubstr("[patch]"));
    EXPECT_THAT(line, HasSubstr("[CVE-2024-6387]"));
    EXPECT_THAT(line, EndsWith("Starting emergency patching"));
}

TEST_F(LoggerTest, TextMetadataIsSortedByKey) {
    const std::unordered_map<std::string, std::string> metadata{{"warned", "2"}, {"duration_ms", "15"}};
    LOG_INFO_META("isolation", "Action finished", metadata);

    EXPECT_THAT(lastLine(), EndsWith("Action finished duration_ms=15 warned=2"));
}

TEST_F(LoggerTest, NdjsonLineIsParseable) {
    logger_->setFormat(LogFormat::NDJSON);
    logger_->setCorrelationId("CVE-2021-44228");
    const std::unordered_map<std::string, std::string> metadata{{"step", "firewall_snapshot"}};
    LOG_ERROR_META("isolation", "iptables-save failed", metadata);

    auto json = nlohmann::json::parse(lastLine());
    EXPECT_EQ(json["level"], "ERROR");
    EXPECT_EQ(json["module"], "isolation");
    EXPECT_EQ(json["message"], "iptables-save failed");
    EXPECT_EQ(json["cve"], "CVE-2021-44228");
    EXPECT_EQ(json["step"], "firewall_snapshot");
    EXPECT_TRUE(json.contains("timestamp"));
}

// EN: Metadata never overrides the reserved NDJSON fields
// FR: Les métadonnées n'écrasent jamais les champs NDJSON réservés
TEST_F(LoggerTest, NdjsonReservedFieldsWin) {
    logger_->setFormat(LogFormat::NDJSON);
    const std::unordered_map<std::string, std::string> metadata{{"message", "spoofed"}};
    LOG_INFO_META("status", "real message", metadata);

    auto json = nlohmann::json::parse(lastLine());
    EXPECT_EQ(json["message"], "real message");
}

// EN: Invalid UTF-8 is replaced, the line is still emitted and parseable
// FR: L'UTF-8 invalide est remplacé, la ligne est tout de même émise et analysable
TEST_F(LoggerTest, NdjsonReplacesInvalidUtf8) {
    logger_->setFormat(LogFormat::NDJSON);
    const std::unordered_map<std::string, std::string> metadata{{"stderr", "\xE9" "chec"}};
    EXPECT_NO_THROW(LOG_WARN_META("patch", "bad byte \xC3\x28 in output", metadata));

    ASSERT_EQ(logger_->getRecentLines().size(), 1u);
    auto json = nlohmann::json::parse(lastLine());
    EXPECT_EQ(json["message"], "bad byte \xEF\xBF\xBD( in output");
    EXPECT_EQ(json["stderr"], "\xEF\xBF\xBD" "chec");
}

TEST_F(LoggerTest, FileSinkAppendsLines) {
    TempDir dir;
    const std::string path = dir.path() + "/run.log";

    ASSERT_TRUE(logger_->setOutputFile(path));
    EXPECT_EQ(logger_->getOutputFile(), path);
    LOG_WARN("shutdown", "Shutdown in 10 seconds...");
    logger_->closeOutputFile();
    EXPECT_TRUE(logger_->getOutputFile().empty());

    LOG_WARN("shutdown", "after close");

    const std::string content = readFile(path);
    EXPECT_THAT(content, HasSubstr("Shutdown in 10 seconds..."));
    EXPECT_THAT(content, ::testing::Not(HasSubstr("after close")));
}

// EN: An unopenable file is reported but logging carries on
// FR: Un fichier impossible à ouvrir est signalé mais la journalisation continue
TEST_F(LoggerTest, UnopenableFileKeepsLogging) {
    EXPECT_FALSE(logger_->setOutputFile("/nonexistent-dao-dir/sub/run.log"));
    EXPECT_TRUE(logger_->getOutputFile().empty());

    LOG_INFO("test", "still logged");
    EXPECT_THAT(lastLine(), HasSubstr("still logged"));
}

TEST_F(LoggerTest, GlobalMetadataMergedWithoutOverride) {
    logger_->addGlobalMetadata("host", "web-01");
    logger_->addGlobalMetadata("step", "global");
    const std::unordered_map<std::string, std::string> metadata{{"step", "local"}};
    LOG_INFO_META("test", "merged", metadata);

    const std::string line = lastLine();
    EXPECT_THAT(line, HasSubstr("host=web-01"));
    EXPECT_THAT(line, HasSubstr("step=local"));
    EXPECT_THAT(line, ::testing::Not(HasSubstr("step=global")));

    logger_->clearGlobalMetadata();
    LOG_INFO("test", "plain");
    EXPECT_THAT(lastLine(), ::testing::Not(HasSubstr("host=web-01")));
}

TEST_F(LoggerTest, RecentLinesAreBounded) {
    logger_->setRecentCapacity(3);
    for (int i = 0; i < 5; ++i) {
        LOG_INFO("test", "message " + std::to_string(i));
    }

    auto lines = logger_->getRecentLines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_THAT(lines.front(), HasSubstr("message 2"));
    EXPECT_THAT(lines.back(), HasSubstr("message 4"));

    logger_->clearRecentLines();
    EXPECT_TRUE(logger_->getRecentLines().empty());
}

TEST_F(LoggerTest, LevelAndFormatParsing) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromString("Info"), LogLevel::INFO);
    EXPECT_EQ(Logger::levelFromString("WARNING"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("warn"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("error"), LogLevel::ERROR);
    EXPECT_THROW(Logger::levelFromString("verbose"), std::invalid_argument);

    EXPECT_EQ(Logger::formatFromString("text"), LogFormat::TEXT);
    EXPECT_EQ(Logger::formatFromString("ndjson"), LogFormat::NDJSON);
    EXPECT_THROW(Logger::formatFromString("xml"), std::invalid_argument);

    EXPECT_EQ(Logger::levelToString(LogLevel::WARN), "WARN");
}

TEST_F(LoggerTest, ResetRestoresDefaults) {
    logger_->setLogLevel(LogLevel::ERROR);
    logger_->setCorrelationId("CVE-1");
    logger_->setFormat(LogFormat::NDJSON);

    logger_->reset();

    EXPECT_EQ(logger_->getLogLevel(), LogLevel::INFO);
    EXPECT_TRUE(logger_->getCorrelationId().empty());
    EXPECT_TRUE(logger_->getOutputFile().empty());
}

// EN: Concurrent writers never lose or interleave lines
// FR: Des écrivains concurrents ne perdent ni n'entrelacent de lignes
TEST_F(LoggerTest, ConcurrentLogging) {
    logger_->setRecentCapacity(1000);
    const int threads = 4;
    const int per_thread = 50;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([t] {
            for (int i = 0; i < per_thread; ++i) {
                LOG_INFO("worker" + std::to_string(t), "message " + std::to_string(i));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    auto lines = logger_->getRecentLines();
    EXPECT_EQ(lines.size(), static_cast<size_t>(threads * per_thread));
    for (const auto& line : lines) {
        EXPECT_THAT(line, ::testing::MatchesRegex(".*\\[worker[0-3]\\] message [0-9]+"));
    }
}

// EN: Main function for running tests
// FR: Fonction principale pour exécuter les tests
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
