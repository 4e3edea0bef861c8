// EN: Unit tests for SignalHandler - signals delivered to the bound countdown cancellation token
// FR: Tests unitaires pour SignalHandler - signaux transmis au jeton d'annulation du compte à rebours

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <csignal>
#include <thread>

#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "orchestrator/countdown.hpp"
#include "test_doubles.hpp"

using namespace DAO;
using namespace DAO::Orchestrator;
using namespace std::chrono_literals;

// EN: Test fixture for SignalHandler tests
// FR: Fixture de test pour les tests SignalHandler
class SignalHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().reset();
        Logger::getInstance().setConsoleOutput(false);
        handler_ = &SignalHandler::getInstance();
        handler_->reset();
        handler_->setEnabled(true);
    }

    void TearDown() override {
        handler_->bindCancellationToken(nullptr);
        handler_->restoreDefaults();
        handler_->reset();
        handler_->setEnabled(true);
    }

    SignalHandler* handler_ = nullptr;
};

TEST_F(SignalHandlerTest, SingletonPattern) {
    EXPECT_EQ(&SignalHandler::getInstance(), &SignalHandler::getInstance());
}

TEST_F(SignalHandlerTest, DefaultStatistics) {
    auto stats = handler_->getStats();
    EXPECT_EQ(stats.signals_received, 0u);
    EXPECT_EQ(stats.sigint_count, 0u);
    EXPECT_EQ(stats.sigterm_count, 0u);
    EXPECT_EQ(stats.cancellations_delivered, 0u);
    EXPECT_FALSE(handler_->isShutdownRequested());
}

TEST_F(SignalHandlerTest, InitializeAndRestore) {
    EXPECT_NO_THROW(handler_->initialize());
    EXPECT_TRUE(handler_->isInitialized());
    EXPECT_NO_THROW(handler_->initialize());

    handler_->restoreDefaults();
    EXPECT_FALSE(handler_->isInitialized());
}

TEST_F(SignalHandlerTest, TriggerCancelsBoundToken) {
    CancellationToken token;
    handler_->bindCancellationToken(&token);

    handler_->triggerShutdown(SIGINT);

    EXPECT_TRUE(token.isCancelled());
    EXPECT_TRUE(handler_->isShutdownRequested());
    auto stats = handler_->getStats();
    EXPECT_EQ(stats.signals_received, 1u);
    EXPECT_EQ(stats.sigint_count, 1u);
    EXPECT_EQ(stats.cancellations_delivered, 1u);
}

TEST_F(SignalHandlerTest, TriggerWithoutTokenOnlyRecords) {
    handler_->triggerShutdown(SIGTERM);

    EXPECT_TRUE(handler_->isShutdownRequested());
    auto stats = handler_->getStats();
    EXPECT_EQ(stats.sigterm_count, 1u);
    EXPECT_EQ(stats.cancellations_delivered, 0u);
}

// EN: A signal received before the token is bound still cancels it
// FR: Un signal reçu avant la liaison du jeton l'annule quand même
TEST_F(SignalHandlerTest, EarlySignalCancelsLateBinding) {
    handler_->triggerShutdown(SIGTERM);

    CancellationToken token;
    handler_->bindCancellationToken(&token);
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(handler_->getStats().cancellations_delivered, 1u);
}

TEST_F(SignalHandlerTest, UnboundTokenIsLeftAlone) {
    CancellationToken token;
    handler_->bindCancellationToken(&token);
    handler_->bindCancellationToken(nullptr);

    handler_->triggerShutdown(SIGINT);
    EXPECT_FALSE(token.isCancelled());
}

TEST_F(SignalHandlerTest, DisabledHandlerIgnoresTrigger) {
    CancellationToken token;
    handler_->bindCancellationToken(&token);
    handler_->setEnabled(false);

    handler_->triggerShutdown(SIGTERM);
    EXPECT_FALSE(token.isCancelled());
    EXPECT_FALSE(handler_->isShutdownRequested());
}

// EN: A real SIGTERM raised by the process reaches the token through the installed handler
// FR: Un vrai SIGTERM levé par le processus atteint le jeton via le gestionnaire installé
TEST_F(SignalHandlerTest, RaisedSignalCancelsCountdown) {
    CancellationToken token;
    handler_->initialize();
    handler_->bindCancellationToken(&token);

    std::raise(SIGTERM);

    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(handler_->getStats().sigterm_count, 1u);
}

TEST_F(SignalHandlerTest, SignalInterruptsSteadyTicker) {
    CancellationToken token;
    handler_->bindCancellationToken(&token);
    SteadyTicker ticker(10ms);

    std::thread sender([this] {
        std::this_thread::sleep_for(50ms);
        handler_->triggerShutdown(SIGINT);
    });

    auto start = std::chrono::steady_clock::now();
    CountdownResult result = runCountdown(30, ticker, token, nullptr);
    auto elapsed = std::chrono::steady_clock::now() - start;
    sender.join();

    EXPECT_FALSE(result.completed);
    EXPECT_EQ(result.remaining_seconds, 30);
    EXPECT_LT(elapsed, 1s);
}

TEST_F(SignalHandlerTest, ResetClearsState) {
    handler_->triggerShutdown(SIGINT);
    handler_->reset();

    EXPECT_FALSE(handler_->isShutdownRequested());
    EXPECT_EQ(handler_->getStats().signals_received, 0u);
}

// EN: Main function for running tests
// FR: Fonction principale pour exécuter les tests
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
