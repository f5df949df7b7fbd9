#include "daemon/core/pid_lock.h"
#include "gtest/gtest.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using roomcast::daemon_core::PidLock;

class PidLockTest : public ::testing::Test {
   protected:
    fs::path tempDir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "pid_lock";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir =
            fs::temp_directory_path() / ("roomcast_test_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }
};

TEST_F(PidLockTest, AcquireWritesPidAndReleaseRemovesFile) {
    fs::path lockPath = tempDir / "roomcastd.pid";

    auto lock = PidLock::tryAcquire(lockPath.string());
    ASSERT_TRUE(lock.has_value());
    EXPECT_TRUE(fs::exists(lockPath));
    EXPECT_EQ(PidLock::readOwner(lockPath.string()), getpid());
    EXPECT_EQ(lock->path(), lockPath.string());

    lock.reset();
    EXPECT_FALSE(fs::exists(lockPath));
}

TEST_F(PidLockTest, CreatesMissingParentDirectory) {
    fs::path lockPath = tempDir / "run" / "roomcast" / "roomcastd.pid";

    auto lock = PidLock::tryAcquire(lockPath.string());
    ASSERT_TRUE(lock.has_value());
    EXPECT_TRUE(fs::exists(lockPath));
}

TEST_F(PidLockTest, SecondProcessCannotAcquireWhileLocked) {
    fs::path lockPath = tempDir / "roomcastd.pid";

    auto lock = PidLock::tryAcquire(lockPath.string());
    ASSERT_TRUE(lock.has_value());

    pid_t pid = fork();
    ASSERT_GE(pid, 0);

    if (pid == 0) {
        auto second = PidLock::tryAcquire(lockPath.string());
        _exit(second.has_value() ? 1 : 0);
    }

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);

    // the failed attempt left the holder's file alone
    EXPECT_EQ(PidLock::readOwner(lockPath.string()), getpid());
}

TEST_F(PidLockTest, StaleFileWithoutLockIsTakenOver) {
    fs::path lockPath = tempDir / "roomcastd.pid";
    {
        std::ofstream stale(lockPath);
        stale << "999999\n";
    }

    auto lock = PidLock::tryAcquire(lockPath.string());
    ASSERT_TRUE(lock.has_value());
    EXPECT_EQ(PidLock::readOwner(lockPath.string()), getpid());
}

TEST_F(PidLockTest, MoveTransfersOwnership) {
    fs::path lockPath = tempDir / "roomcastd.pid";

    auto lock = PidLock::tryAcquire(lockPath.string());
    ASSERT_TRUE(lock.has_value());

    PidLock moved(std::move(*lock));
    lock.reset();  // moved-from object must not unlink
    EXPECT_TRUE(fs::exists(lockPath));
    EXPECT_EQ(moved.path(), lockPath.string());
}

TEST_F(PidLockTest, ReadOwnerWithoutFileIsZero) {
    EXPECT_EQ(PidLock::readOwner((tempDir / "missing.pid").string()), 0);

    fs::path garbage = tempDir / "garbage.pid";
    {
        std::ofstream out(garbage);
        out << "not-a-pid\n";
    }
    EXPECT_EQ(PidLock::readOwner(garbage.string()), 0);
}
