// tests/test_filelock.cpp
//
// FileLock: in-process exclusion between threads, bounded waits, and
// exclusion against a second process holding the same lock.

#include "test_preamble.h"

#include "helpers/test_process_utils.h"
#include "simpaths/utils/FileLock.hpp"

using namespace test_utils;
using simpaths::utils::FileLock;
using simpaths::utils::LockMode;
using namespace std::chrono_literals;

class FileLockTest : public ::testing::Test
{
  protected:
    static fs::path g_temp_dir_;

    static void SetUpTestSuite()
    {
        g_temp_dir_ = fs::temp_directory_path() / ("simpaths_filelock_tests_" + std::to_string(::getpid()));
        fs::create_directories(g_temp_dir_);
    }

    static void TearDownTestSuite()
    {
        std::error_code ec;
        fs::remove_all(g_temp_dir_, ec);
    }

    fs::path temp_dir() const { return g_temp_dir_; }
};

fs::path FileLockTest::g_temp_dir_;

TEST_F(FileLockTest, LockFileSitsBesideTarget)
{
    const auto resource = temp_dir() / "alice.json";
    const auto expected = FileLock::get_expected_lock_fullname_for(resource);
    EXPECT_EQ(expected.filename(), "alice.json.lock");

    FileLock lock(resource, LockMode::NonBlocking);
    ASSERT_TRUE(lock.valid());
    EXPECT_FALSE(lock.error_code());
    ASSERT_TRUE(lock.get_canonical_lock_file_path().has_value());
    EXPECT_EQ(*lock.get_canonical_lock_file_path(), expected);
    EXPECT_TRUE(fs::exists(expected));
}

TEST_F(FileLockTest, DifferentSpellingsShareOneLock)
{
    const auto resource = temp_dir() / "spelled.json";
    const auto other = temp_dir() / "." / "sub" / ".." / "spelled.json";
    EXPECT_EQ(FileLock::get_expected_lock_fullname_for(resource), FileLock::get_expected_lock_fullname_for(other));
}

TEST_F(FileLockTest, NonBlockingFailsWhileHeld)
{
    const auto resource = temp_dir() / "nonblocking.json";
    {
        FileLock first(resource, LockMode::NonBlocking);
        ASSERT_TRUE(first.valid());

        FileLock second(resource, LockMode::NonBlocking);
        EXPECT_FALSE(second.valid());
        EXPECT_EQ(second.error_code(), std::errc::resource_unavailable_try_again);
        EXPECT_FALSE(second.get_canonical_lock_file_path().has_value());
    }
    FileLock third(resource, LockMode::NonBlocking);
    EXPECT_TRUE(third.valid());
}

TEST_F(FileLockTest, TimedLockTimesOut)
{
    const auto resource = temp_dir() / "timed.json";
    FileLock holder(resource, LockMode::Blocking);
    ASSERT_TRUE(holder.valid());

    std::atomic<bool> valid{true};
    std::error_code ec;
    std::chrono::milliseconds waited{0};
    std::thread t(
        [&]
        {
            const auto start = std::chrono::steady_clock::now();
            FileLock contender(resource, 150ms);
            waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            valid = contender.valid();
            ec = contender.error_code();
        });
    t.join();

    EXPECT_FALSE(valid);
    EXPECT_EQ(ec, std::errc::timed_out);
    EXPECT_GE(waited.count(), 100);
}

TEST_F(FileLockTest, ZeroTimeoutMakesOneAttempt)
{
    const auto resource = temp_dir() / "zero.json";
    {
        FileLock free_lock(resource, 0ms);
        EXPECT_TRUE(free_lock.valid());
    }
    FileLock holder(resource, LockMode::Blocking);
    ASSERT_TRUE(holder.valid());
    FileLock contender(resource, 0ms);
    EXPECT_FALSE(contender.valid());
}

TEST_F(FileLockTest, BlockingWaitsForRelease)
{
    const auto resource = temp_dir() / "blocking.json";
    auto main_lock = std::make_unique<FileLock>(resource, LockMode::Blocking);
    ASSERT_TRUE(main_lock->valid());

    std::atomic<bool> thread_valid{false};
    std::atomic<bool> thread_saw_block{false};
    std::thread t(
        [&]
        {
            const auto start = std::chrono::steady_clock::now();
            FileLock thread_lock(resource, LockMode::Blocking);
            if (thread_lock.valid())
                thread_valid = true;
            if (std::chrono::steady_clock::now() - start > 100ms)
                thread_saw_block = true;
        });

    std::this_thread::sleep_for(200ms);
    main_lock.reset();
    t.join();

    EXPECT_TRUE(thread_valid);
    EXPECT_TRUE(thread_saw_block);
}

TEST_F(FileLockTest, ThreadsNeverOverlap)
{
    const auto resource = temp_dir() / "threads.json";
    constexpr int kThreads = 8;
    constexpr int kIterations = 25;
    std::atomic<int> inside{0};
    std::atomic<bool> overlap{false};
    int counter = 0;

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back(
            [&]
            {
                for (int n = 0; n < kIterations; ++n)
                {
                    FileLock lock(resource, 5000ms);
                    if (!lock.valid())
                        continue;
                    if (inside.fetch_add(1) != 0)
                        overlap = true;
                    ++counter;
                    inside.fetch_sub(1);
                }
            });
    }
    for (auto &t : threads)
        t.join();

    EXPECT_FALSE(overlap);
    EXPECT_EQ(counter, kThreads * kIterations);
}

TEST_F(FileLockTest, MoveTransfersOwnership)
{
    const auto resource = temp_dir() / "move.json";
    FileLock a(resource, LockMode::NonBlocking);
    ASSERT_TRUE(a.valid());

    FileLock b(std::move(a));
    EXPECT_TRUE(b.valid());
    EXPECT_FALSE(a.valid()); // NOLINT(bugprone-use-after-move)

    FileLock blocked(resource, LockMode::NonBlocking);
    EXPECT_FALSE(blocked.valid());

    FileLock c(temp_dir() / "move_other.json", LockMode::NonBlocking);
    ASSERT_TRUE(c.valid());
    c = std::move(b);
    EXPECT_TRUE(c.valid());

    FileLock freed(temp_dir() / "move_other.json", LockMode::NonBlocking);
    EXPECT_TRUE(freed.valid());
}

TEST_F(FileLockTest, CreatesMissingParentDirectory)
{
    const auto resource = temp_dir() / "nested" / "deeper" / "bob.json";
    FileLock lock(resource, LockMode::NonBlocking);
    ASSERT_TRUE(lock.valid());
    EXPECT_TRUE(fs::is_directory(resource.parent_path()));
}

TEST_F(FileLockTest, ExcludesOtherProcess)
{
    const auto resource = temp_dir() / "cross_process.json";
    const auto ready = temp_dir() / "cross_process.ready";
    fs::remove(ready);

    ProcessHandle proc =
        spawn_worker_process(g_self_exe_path, "registry.hold_lock", {resource.string(), "700", ready.string()});
    ASSERT_NE(proc, NULL_PROC_HANDLE);
    ASSERT_TRUE(wait_for_file(ready, 5000ms));

    {
        FileLock contender(resource, LockMode::NonBlocking);
        EXPECT_FALSE(contender.valid());
        EXPECT_EQ(contender.error_code(), std::errc::resource_unavailable_try_again);
    }

    FileLock waiter(resource, 10000ms);
    EXPECT_TRUE(waiter.valid());
    EXPECT_EQ(wait_for_worker_and_get_exit_code(proc), 0);
}
