#include <gtest/gtest.h>
#include <csignal>
#include "core/shutdown_manager.hpp"

class ShutdownManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        // Reset the ShutdownManager to a clean state before each test
        ShutdownManager::getInstance().reset();
    }

    void TearDown() override
    {
        ShutdownManager::getInstance().reset();
    }
};

TEST_F(ShutdownManagerTest, NotRequestedInitially)
{
    auto &mgr = ShutdownManager::getInstance();
    EXPECT_FALSE(mgr.isShutdownRequested());
    EXPECT_FALSE(mgr.cancellationCheck()());
}

TEST_F(ShutdownManagerTest, ProgrammaticShutdownIsObserved)
{
    auto &mgr = ShutdownManager::getInstance();
    auto check = mgr.cancellationCheck();

    mgr.requestShutdown("unit-test");

    EXPECT_TRUE(check());
    EXPECT_EQ(mgr.getSignalNumber(), 0);
    EXPECT_EQ(mgr.getReason(), "unit-test");
}

TEST_F(ShutdownManagerTest, FirstRequestWins)
{
    auto &mgr = ShutdownManager::getInstance();

    mgr.requestShutdown("test-signal", SIGTERM);
    mgr.requestShutdown("later");

    EXPECT_TRUE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), SIGTERM);
    EXPECT_EQ(mgr.getReason(), "test-signal");
}

TEST_F(ShutdownManagerTest, DeliveredSignalIsPickedUpOnNextCheck)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.installSignalHandlers();

    std::raise(SIGINT);

    EXPECT_TRUE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), SIGINT);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

TEST_F(ShutdownManagerTest, ResetClearsState)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("unit-test", SIGTERM);

    mgr.reset();

    EXPECT_FALSE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), 0);
    EXPECT_TRUE(mgr.getReason().empty());
}
