#include "graceful_shutdown.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace roomcast::GracefulShutdown;

class GracefulShutdownTest : public ::testing::Test {
   protected:
    void SetUp() override {
        state_.reset();
        controller_.setSignalState(&state_);
        stopActions_.clear();
        logLines_.clear();
        controller_.setStopCallback([this](Controller::Action action) {
            stopActions_.push_back(action);
        });
        controller_.setLogCallback([this](const char* msg) { logLines_.emplace_back(msg); });
    }

    SignalState state_;
    Controller controller_;
    std::vector<Controller::Action> stopActions_;
    std::vector<std::string> logLines_;
};

// ========== Signal State Tests ==========

TEST_F(GracefulShutdownTest, SignalState_InitiallyZero) {
    SignalState s;
    EXPECT_EQ(s.shutdown, 0);
    EXPECT_EQ(s.reload, 0);
    EXPECT_EQ(s.received, 0);
}

TEST_F(GracefulShutdownTest, SignalState_Reset) {
    state_.shutdown = 1;
    state_.reload = 1;
    state_.received = 15;
    state_.reset();
    EXPECT_EQ(state_.shutdown, 0);
    EXPECT_EQ(state_.reload, 0);
    EXPECT_EQ(state_.received, 0);
}

// ========== Controller Tests ==========

TEST_F(GracefulShutdownTest, Controller_InitialState) {
    EXPECT_TRUE(controller_.isRunning());
    EXPECT_FALSE(controller_.isReloadRequested());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::NONE);
}

TEST_F(GracefulShutdownTest, ProcessPendingSignals_NoSignal_ReturnsFalse) {
    EXPECT_FALSE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::NONE);
    EXPECT_TRUE(controller_.isRunning());
    EXPECT_TRUE(stopActions_.empty());
}

TEST_F(GracefulShutdownTest, ProcessPendingSignals_NullState_ReturnsFalse) {
    Controller bare;
    EXPECT_FALSE(bare.processPendingSignals());
    EXPECT_TRUE(bare.isRunning());
}

// ========== SIGTERM / SIGINT ==========

TEST_F(GracefulShutdownTest, ProcessPendingSignals_SIGTERM_StopsLoop) {
    state_.shutdown = 1;
    state_.received = SIGTERM;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::SHUTDOWN);
    EXPECT_EQ(controller_.getLastSignal(), SIGTERM);
    EXPECT_FALSE(controller_.isRunning());
    EXPECT_FALSE(controller_.isReloadRequested());
    EXPECT_EQ(state_.shutdown, 0);

    ASSERT_EQ(stopActions_.size(), 1u);
    EXPECT_EQ(stopActions_[0], Controller::Action::SHUTDOWN);
    ASSERT_EQ(logLines_.size(), 1u);
    EXPECT_NE(logLines_[0].find("stopping"), std::string::npos);
}

TEST_F(GracefulShutdownTest, ProcessPendingSignals_SIGINT_TreatedAsShutdown) {
    state_.shutdown = 1;
    state_.received = SIGINT;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::SHUTDOWN);
    EXPECT_EQ(controller_.getLastSignal(), SIGINT);
}

TEST_F(GracefulShutdownTest, ProcessPendingSignals_SignalConsumedOnce) {
    state_.shutdown = 1;
    state_.received = SIGTERM;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_FALSE(controller_.processPendingSignals());
    EXPECT_EQ(stopActions_.size(), 1u);
}

// ========== SIGHUP ==========

TEST_F(GracefulShutdownTest, ProcessPendingSignals_SIGHUP_RequestsReload) {
    state_.reload = 1;
    state_.received = SIGHUP;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::RELOAD);
    EXPECT_TRUE(controller_.isReloadRequested());
    EXPECT_FALSE(controller_.isRunning());
    EXPECT_EQ(state_.reload, 0);

    ASSERT_EQ(stopActions_.size(), 1u);
    EXPECT_EQ(stopActions_[0], Controller::Action::RELOAD);
}

TEST_F(GracefulShutdownTest, Reset_ClearsReloadForNextIteration) {
    state_.reload = 1;
    state_.received = SIGHUP;
    controller_.processPendingSignals();

    controller_.reset();
    EXPECT_TRUE(controller_.isRunning());
    EXPECT_FALSE(controller_.isReloadRequested());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::NONE);
}

// ========== Priority ==========

TEST_F(GracefulShutdownTest, ProcessPendingSignals_SIGTERM_TakesPriorityOverSIGHUP) {
    state_.shutdown = 1;
    state_.reload = 1;
    state_.received = SIGTERM;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::SHUTDOWN);
    EXPECT_FALSE(controller_.isReloadRequested());
    // the pending reload is dropped so the daemon loop cannot restart
    EXPECT_EQ(state_.reload, 0);
    EXPECT_FALSE(controller_.processPendingSignals());
}

TEST_F(GracefulShutdownTest, ProcessPendingSignals_SIGHUP_ThenSIGTERM_ShutdownWins) {
    state_.reload = 1;
    state_.received = SIGHUP;
    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_TRUE(controller_.isReloadRequested());

    state_.shutdown = 1;
    state_.received = SIGTERM;
    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.getLastAction(), Controller::Action::SHUTDOWN);
    EXPECT_FALSE(controller_.isReloadRequested());
    EXPECT_FALSE(controller_.isRunning());
}

// ========== Signal Handler ==========

TEST_F(GracefulShutdownTest, GetGlobalSignalState_ReturnsSameInstance) {
    EXPECT_EQ(&getGlobalSignalState(), &getGlobalSignalState());
}

TEST_F(GracefulShutdownTest, SignalHandler_SetsFlags) {
    SignalState& global = getGlobalSignalState();
    global.reset();

    signalHandler(SIGTERM);
    EXPECT_EQ(global.shutdown, 1);
    EXPECT_EQ(global.received, SIGTERM);
    global.reset();

    signalHandler(SIGINT);
    EXPECT_EQ(global.shutdown, 1);
    EXPECT_EQ(global.reload, 0);
    global.reset();

    signalHandler(SIGHUP);
    EXPECT_EQ(global.reload, 1);
    EXPECT_EQ(global.shutdown, 0);
    EXPECT_EQ(global.received, SIGHUP);
    global.reset();
}
