#include "daemon/core/instance_lock.h"
#include "support/test_support.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace prerender;
using daemon_core::InstanceLock;

class InstanceLockTest : public test::TempDirTest {
   protected:
    void SetUp() override {
        TempDirTest::SetUp();
        lockPath = (tempDir / "prerender.pid").string();
    }

    std::string lockPath;
};

TEST_F(InstanceLockTest, RecordsPidAndInstanceId) {
    auto lock = InstanceLock::tryAcquire(lockPath, "0123456789abcdef");
    ASSERT_TRUE(lock.has_value());

    auto owner = InstanceLock::readOwner(lockPath);
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(owner->pid, getpid());
    EXPECT_EQ(owner->instanceId, "0123456789abcdef");
}

TEST_F(InstanceLockTest, ReleaseRemovesLockFile) {
    auto lock = InstanceLock::tryAcquire(lockPath, "a");
    ASSERT_TRUE(lock.has_value());
    EXPECT_TRUE(fs::exists(lockPath));

    lock.reset();
    EXPECT_FALSE(fs::exists(lockPath));
    EXPECT_FALSE(InstanceLock::readOwner(lockPath).has_value());
}

TEST_F(InstanceLockTest, StaleFileFromCrashedOwnerIsReclaimed) {
    // flock does not survive the owner, only its file does.
    test::writeFile(lockPath, "999999 deadbeefdeadbeef\n");

    auto lock = InstanceLock::tryAcquire(lockPath, "fresh");
    ASSERT_TRUE(lock.has_value());
    auto owner = InstanceLock::readOwner(lockPath);
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(owner->instanceId, "fresh");
}

TEST_F(InstanceLockTest, GarbageFileHasNoOwner) {
    test::writeFile(lockPath, "not a pid\n");
    EXPECT_FALSE(InstanceLock::readOwner(lockPath).has_value());
}

TEST_F(InstanceLockTest, MovedLockReleasesOnce) {
    auto lock = InstanceLock::tryAcquire(lockPath, "a");
    ASSERT_TRUE(lock.has_value());
    {
        InstanceLock moved = std::move(*lock);
        lock.reset();
        EXPECT_TRUE(fs::exists(lockPath));
    }
    EXPECT_FALSE(fs::exists(lockPath));
}

TEST_F(InstanceLockTest, SecondRendererOnSameDirectoryIsRefused) {
    auto lock = InstanceLock::tryAcquire(lockPath, "first");
    ASSERT_TRUE(lock.has_value());

    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        auto second = InstanceLock::tryAcquire(lockPath, "second");
        _exit(second.has_value() ? 1 : 0);
    }

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_EQ(InstanceLock::readOwner(lockPath)->instanceId, "first");
}
