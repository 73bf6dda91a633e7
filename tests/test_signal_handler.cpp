// EN: Unit tests for SignalHandler - shutdown requests, one-shot dispatch and cleanup callbacks
// FR: Tests unitaires de SignalHandler - demandes d'arrêt, dispatch unique et callbacks de nettoyage

#include <gtest/gtest.h>
#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <atomic>
#include <csignal>
#include <stdexcept>
#include <string>
#include <vector>

using namespace FP;

class SignalHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        SignalHandler::getInstance().reset();
    }

    void TearDown() override {
        SignalHandler::getInstance().reset();
    }

    SignalHandler& handler() { return SignalHandler::getInstance(); }
};

TEST_F(SignalHandlerTest, StartsIdle) {
    EXPECT_FALSE(handler().isShutdownRequested());
    EXPECT_FALSE(handler().isInitialized());
    EXPECT_TRUE(handler().isEnabled());
    EXPECT_FALSE(handler().dispatchPendingShutdown());

    auto stats = handler().getStats();
    EXPECT_EQ(stats.signals_received, 0u);
    EXPECT_EQ(stats.shutdowns_dispatched, 0u);
    EXPECT_TRUE(stats.signal_counts.empty());
}

TEST_F(SignalHandlerTest, TriggeredShutdownRunsCallbacksOnce) {
    int runs = 0;
    handler().registerCleanupCallback("counter", [&runs]() { ++runs; });

    handler().triggerShutdown(SIGINT);
    EXPECT_TRUE(handler().isShutdownRequested());
    EXPECT_EQ(runs, 0);

    EXPECT_TRUE(handler().dispatchPendingShutdown());
    EXPECT_EQ(runs, 1);

    // EN: A second signal does not run the callbacks again
    // FR: Un second signal ne relance pas les callbacks
    handler().triggerShutdown(SIGINT);
    EXPECT_FALSE(handler().dispatchPendingShutdown());
    EXPECT_EQ(runs, 1);

    auto stats = handler().getStats();
    EXPECT_EQ(stats.signals_received, 2u);
    EXPECT_EQ(stats.signal_counts[SIGINT], 2u);
    EXPECT_EQ(stats.last_signal, SIGINT);
    EXPECT_EQ(stats.shutdowns_dispatched, 1u);
}

TEST_F(SignalHandlerTest, CallbacksRunInNameOrder) {
    std::vector<std::string> order;
    handler().registerCleanupCallback("b_report", [&order]() { order.push_back("b_report"); });
    handler().registerCleanupCallback("a_job", [&order]() { order.push_back("a_job"); });

    handler().triggerShutdown();
    handler().dispatchPendingShutdown();

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "a_job");
    EXPECT_EQ(order[1], "b_report");
}

TEST_F(SignalHandlerTest, FailingCallbackDoesNotStopTheOthers) {
    bool later_ran = false;
    handler().registerCleanupCallback("a_failing", []() { throw std::runtime_error("boom"); });
    handler().registerCleanupCallback("b_later", [&later_ran]() { later_ran = true; });

    handler().triggerShutdown(SIGTERM);
    EXPECT_TRUE(handler().dispatchPendingShutdown());
    EXPECT_TRUE(later_ran);
}

TEST_F(SignalHandlerTest, CallbacksCanBeReplacedAndRemoved) {
    int first = 0;
    int second = 0;
    handler().registerCleanupCallback("job", [&first]() { ++first; });
    handler().registerCleanupCallback("job", [&second]() { ++second; });
    EXPECT_EQ(handler().getStats().cleanup_callbacks_registered, 1u);

    handler().registerCleanupCallback("other", [&first]() { ++first; });
    handler().unregisterCleanupCallback("other");
    handler().unregisterCleanupCallback("never_registered");

    handler().triggerShutdown();
    handler().dispatchPendingShutdown();
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST_F(SignalHandlerTest, RaisedSignalIsRecordedAfterInitialize) {
    handler().initialize();
    ASSERT_TRUE(handler().isInitialized());

    std::atomic<bool> cancelled{false};
    handler().registerCleanupCallback("validation_job", [&cancelled]() { cancelled.store(true); });

    std::raise(SIGTERM);
    EXPECT_TRUE(handler().isShutdownRequested());
    EXPECT_EQ(handler().getStats().signal_counts[SIGTERM], 1u);

    EXPECT_TRUE(handler().dispatchPendingShutdown());
    EXPECT_TRUE(cancelled.load());
}

TEST_F(SignalHandlerTest, SecondInitializeIsHarmless) {
    handler().initialize();
    EXPECT_NO_THROW(handler().initialize());
    EXPECT_TRUE(handler().isInitialized());
}

TEST_F(SignalHandlerTest, DisabledHandlerIgnoresSignals) {
    handler().setEnabled(false);
    handler().initialize();
    EXPECT_FALSE(handler().isInitialized());

    handler().triggerShutdown(SIGINT);
    EXPECT_FALSE(handler().isShutdownRequested());
    EXPECT_EQ(handler().getStats().signals_received, 0u);
}

TEST_F(SignalHandlerTest, ResetClearsEverything) {
    handler().registerCleanupCallback("job", []() {});
    handler().triggerShutdown(SIGINT);
    handler().dispatchPendingShutdown();

    handler().reset();
    EXPECT_FALSE(handler().isShutdownRequested());
    auto stats = handler().getStats();
    EXPECT_EQ(stats.cleanup_callbacks_registered, 0u);
    EXPECT_EQ(stats.signals_received, 0u);
    EXPECT_EQ(stats.shutdowns_dispatched, 0u);
    EXPECT_EQ(stats.last_signal, 0);
}
