/**
 * @file test_platform_core.cpp
 * @brief Layer 0 tests for process and thread identification.
 */
#include "phb_platform.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>

#if PUBHUB_IS_POSIX
#include <sys/wait.h>
#include <unistd.h>
#endif

using namespace pubhub::platform;

TEST(PlatformCoreTest, GetPID_ReturnsValidID)
{
    EXPECT_GT(get_pid(), 0u) << "PID should be greater than zero";
}

TEST(PlatformCoreTest, GetPID_IsStable)
{
    EXPECT_EQ(get_pid(), get_pid()) << "PID should be stable within the same process";
}

TEST(PlatformCoreTest, GetThreadID_DiffersAcrossThreads)
{
    const uint64_t main_tid = get_native_thread_id();
    EXPECT_GT(main_tid, 0u);

    constexpr int kThreads = 4;
    std::vector<uint64_t> tids(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back([&tids, i]() { tids[i] = get_native_thread_id(); });
    }
    for (auto &t : threads)
        t.join();

    std::set<uint64_t> unique(tids.begin(), tids.end());
    unique.insert(main_tid);
    EXPECT_EQ(unique.size(), static_cast<size_t>(kThreads + 1))
        << "Live threads must report distinct native IDs";
}

#if PUBHUB_IS_POSIX
TEST(PlatformCoreTest, GetPID_ChangesInForkedChild)
{
    const uint64_t parent = get_pid();
    pid_t child = fork();
    ASSERT_NE(child, -1);
    if (child == 0)
    {
        _exit(get_pid() != parent && get_pid() == static_cast<uint64_t>(getpid()) ? 0 : 1);
    }
    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0) << "Forked child must observe its own PID";
}
#endif
