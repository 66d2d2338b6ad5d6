/**
 * @file test_single_instance.cpp
 * @brief Tests for the single-instance lock and hand-off
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <gtest/gtest.h>
#include <Courier/Shell/SingleInstance.hpp>
#include <Courier/Shell/CommandBridge.hpp>
#include "TestHarness.hpp"
#include <memory>
#include <utility>

using namespace Courier;
using namespace Courier::Shell;
using namespace Courier::Testing;

class SingleInstanceTest : public TempDirFixture {
protected:
    std::string runtimeDir() const {
        return (tempDir / "run").string();
    }
};

TEST_F(SingleInstanceTest, SecondAcquireFails) {
    auto first = InstanceLock::acquire(runtimeDir());
    ASSERT_TRUE(first.isSuccess());
    EXPECT_TRUE(std::filesystem::exists(first.value().path()));

    auto second = InstanceLock::acquire(runtimeDir());
    ASSERT_TRUE(second.isFailure());
    EXPECT_EQ(second.error(), ErrorCode::AlreadyRunning);
}

TEST_F(SingleInstanceTest, ReleasedOnDestruction) {
    {
        auto first = InstanceLock::acquire(runtimeDir());
        ASSERT_TRUE(first.isSuccess());
    }

    auto again = InstanceLock::acquire(runtimeDir());
    EXPECT_TRUE(again.isSuccess());
}

TEST_F(SingleInstanceTest, MovedLockStaysHeld) {
    auto acquired = InstanceLock::acquire(runtimeDir());
    ASSERT_TRUE(acquired.isSuccess());

    InstanceLock held = std::move(acquired).value();

    EXPECT_EQ(InstanceLock::acquire(runtimeDir()).error(), ErrorCode::AlreadyRunning);
}

TEST_F(SingleInstanceTest, PublishedPortIsReadable) {
    EXPECT_EQ(InstanceLock::readPrimaryPort(runtimeDir()).error(), ErrorCode::FileNotFound);

    auto lock = InstanceLock::acquire(runtimeDir());
    ASSERT_TRUE(lock.isSuccess());

    EXPECT_EQ(InstanceLock::readPrimaryPort(runtimeDir()).error(), ErrorCode::FileReadError);

    ASSERT_TRUE(lock.value().publishPort(8765).isSuccess());
    auto port = InstanceLock::readPrimaryPort(runtimeDir());
    ASSERT_TRUE(port.isSuccess());
    EXPECT_EQ(port.value(), 8765);

    // A later publish replaces the earlier one
    ASSERT_TRUE(lock.value().publishPort(80).isSuccess());
    EXPECT_EQ(InstanceLock::readPrimaryPort(runtimeDir()).value(), 80);
}

TEST_F(SingleInstanceTest, GarbagePortRejected) {
    std::filesystem::create_directories(runtimeDir());
    writeFile(std::string("run/") + InstanceLock::LOCK_FILE_NAME, "not-a-port\n");

    auto port = InstanceLock::readPrimaryPort(runtimeDir());
    ASSERT_TRUE(port.isFailure());
    EXPECT_EQ(port.error(), ErrorCode::ConfigInvalid);
}

TEST_F(SingleInstanceTest, NotifyPrimaryEmitsEvent) {
    Network::RequestForwarder forwarder;
    EventBus events;
    CommandBridge bridge(forwarder, events);

    auto port = bridge.start("127.0.0.1", 0);
    ASSERT_TRUE(port.isSuccess());

    InstanceNotice notice;
    notice.args = {"--open", "a.txt"};
    notice.cwd = "/srv";

    auto result = notifyPrimary("127.0.0.1", port.value(), notice);
    ASSERT_TRUE(result.isSuccess()) << getErrorMessage(result.error());

    auto emitted = events.since(0);
    ASSERT_EQ(emitted.size(), 1u);
    EXPECT_EQ(emitted[0].name, SINGLE_INSTANCE_EVENT);
    EXPECT_EQ(emitted[0].payload["args"][1], "a.txt");

    bridge.stop();
}

TEST_F(SingleInstanceTest, NotifyCarriesNonUtf8Arguments) {
    Network::RequestForwarder forwarder;
    EventBus events;
    CommandBridge bridge(forwarder, events);

    auto port = bridge.start("127.0.0.1", 0);
    ASSERT_TRUE(port.isSuccess());

    InstanceNotice notice;
    notice.args = {"caf\xE9.txt", "\xff"};
    notice.cwd = "/home/\xfe";

    auto result = notifyPrimary("127.0.0.1", port.value(), notice);
    ASSERT_TRUE(result.isSuccess()) << getErrorMessage(result.error());

    auto emitted = events.since(0);
    ASSERT_EQ(emitted.size(), 1u);
    EXPECT_EQ(emitted[0].payload["args"][0], "caf\xEF\xBF\xBD.txt");
    EXPECT_EQ(emitted[0].payload["args"][1], "\xEF\xBF\xBD");
    EXPECT_EQ(emitted[0].payload["cwd"], "/home/\xEF\xBF\xBD");

    bridge.stop();
}

TEST_F(SingleInstanceTest, NotifyWithoutPrimaryFails) {
    InstanceNotice notice;
    auto result = notifyPrimary("127.0.0.1", unusedPort(), notice);

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::ConnectionFailed);
}
