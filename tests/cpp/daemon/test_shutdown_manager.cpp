#include "daemon/shutdown_manager.h"

#include <gtest/gtest.h>

#include <atomic>
#include <csignal>
#include <stdexcept>

using namespace prerender;
using Action = graceful_shutdown::Controller::Action;

class ShutdownManagerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        graceful_shutdown::getGlobalSignalState().reset();
    }

    void TearDown() override {
        graceful_shutdown::getGlobalSignalState().reset();
    }

    std::atomic<bool> running{true};
    std::atomic<bool> reload{false};
};

TEST_F(ShutdownManagerTest, RequiresFlags) {
    EXPECT_THROW(shutdown_manager::ShutdownManager({nullptr, nullptr}), std::invalid_argument);
}

TEST_F(ShutdownManagerTest, TickWithoutSignalKeepsRunning) {
    shutdown_manager::ShutdownManager manager({&running, &reload});
    EXPECT_EQ(manager.tick(), Action::NONE);
    EXPECT_TRUE(running.load());
    EXPECT_FALSE(reload.load());
}

TEST_F(ShutdownManagerTest, TerminateClearsRunningAndWakes) {
    shutdown_manager::ShutdownManager manager({&running, &reload});
    int wakes = 0;
    manager.setWakeCallback([&wakes]() { ++wakes; });

    graceful_shutdown::signalHandler(SIGTERM);
    EXPECT_EQ(manager.tick(), Action::SHUTDOWN);

    EXPECT_FALSE(running.load());
    EXPECT_FALSE(reload.load());
    EXPECT_EQ(wakes, 1);
    EXPECT_FALSE(manager.isRunning());
}

TEST_F(ShutdownManagerTest, HangupRequestsReloadAndResetRestores) {
    shutdown_manager::ShutdownManager manager({&running, &reload});

    graceful_shutdown::signalHandler(SIGHUP);
    EXPECT_EQ(manager.tick(), Action::RELOAD);
    EXPECT_FALSE(running.load());
    EXPECT_TRUE(reload.load());
    EXPECT_TRUE(manager.isReloadRequested());

    manager.reset();
    EXPECT_TRUE(running.load());
    EXPECT_FALSE(reload.load());
    EXPECT_TRUE(manager.isRunning());
}

TEST_F(ShutdownManagerTest, Usr1TriggersEvictionCallbackOnly) {
    shutdown_manager::ShutdownManager manager({&running, &reload});
    int passes = 0;
    int wakes = 0;
    manager.setEvictCallback([&passes]() { ++passes; });
    manager.setWakeCallback([&wakes]() { ++wakes; });

    graceful_shutdown::signalHandler(SIGUSR1);
    EXPECT_EQ(manager.tick(), Action::EVICT);

    EXPECT_EQ(passes, 1);
    EXPECT_EQ(wakes, 0);
    EXPECT_TRUE(running.load());
    EXPECT_FALSE(reload.load());
}
