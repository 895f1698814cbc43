#include "rolodex/core/shutdown.hpp"

#include <chrono>
#include <csignal>
#include <gtest/gtest.h>
#include <thread>

using namespace rolodex;
using namespace std::chrono_literals;

class ShutdownManagerTest : public ::testing::Test {
protected:
    void SetUp() override { shutdown_manager::instance().reset(); }

    void TearDown() override {
        auto& mgr = shutdown_manager::instance();
        mgr.set_shutdown_callback(nullptr);
        mgr.reset();
    }
};

TEST_F(ShutdownManagerTest, Singleton) {
    EXPECT_EQ(&shutdown_manager::instance(), &shutdown_manager::instance());
}

TEST_F(ShutdownManagerTest, RequestSetsFlag) {
    auto& mgr = shutdown_manager::instance();
    EXPECT_FALSE(mgr.is_shutdown_requested());
    mgr.request_shutdown();
    EXPECT_TRUE(mgr.is_shutdown_requested());

    mgr.reset();
    EXPECT_FALSE(mgr.is_shutdown_requested());
}

TEST_F(ShutdownManagerTest, WaitReturnsImmediatelyWhenAlreadyRequested) {
    auto& mgr = shutdown_manager::instance();
    int calls = 0;
    mgr.set_shutdown_callback([&calls]() { ++calls; });

    mgr.request_shutdown();
    ASSERT_TRUE(mgr.wait().has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_NE(mgr.shutdown_time(), shutdown_manager::time_point{});
}

TEST_F(ShutdownManagerTest, WaitBlocksUntilRequestedFromAnotherThread) {
    auto& mgr = shutdown_manager::instance();
    bool called = false;
    mgr.set_shutdown_callback([&called]() { called = true; });

    auto start = std::chrono::steady_clock::now();
    std::thread requester([&mgr]() {
        std::this_thread::sleep_for(50ms);
        mgr.request_shutdown();
    });

    ASSERT_TRUE(mgr.wait().has_value());
    requester.join();

    EXPECT_TRUE(called);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST_F(ShutdownManagerTest, SignalTriggersShutdown) {
    auto& mgr = shutdown_manager::instance();
    ASSERT_TRUE(mgr.setup_signal_handlers().has_value());

    std::thread signaller([]() {
        std::this_thread::sleep_for(20ms);
        std::raise(SIGTERM);
    });

    ASSERT_TRUE(mgr.wait().has_value());
    signaller.join();
    EXPECT_TRUE(mgr.is_shutdown_requested());
}

TEST_F(ShutdownManagerTest, ResetAllowsReuse) {
    auto& mgr = shutdown_manager::instance();
    mgr.request_shutdown();
    ASSERT_TRUE(mgr.wait().has_value());
    mgr.reset();

    std::thread requester([&mgr]() {
        std::this_thread::sleep_for(20ms);
        mgr.request_shutdown();
    });
    ASSERT_TRUE(mgr.wait().has_value());
    requester.join();
    EXPECT_TRUE(mgr.is_shutdown_requested());
}
