#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "session/named_lock_table.hpp"
#include "unit/test_support.hpp"

namespace {

using venvbox::session::NamedLock;
using venvbox::session::NamedLockTable;
using venvbox::testing::TempWorkspace;

TEST(NamedLockTableTest, SerializesHoldersOfTheSameName) {
    NamedLockTable table;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            const NamedLock lock = table.acquire("web");
            const int now = ++inside;
            int seen = max_inside.load();
            while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --inside;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(table.size(), 1u);
}

TEST(NamedLockTableTest, DifferentNamesDoNotBlock) {
    NamedLockTable table;
    const NamedLock first = table.acquire("a");

    std::atomic<bool> acquired{false};
    std::thread other([&] {
        const NamedLock second = table.acquire("b");
        acquired = true;
    });
    other.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(first.name(), "a");
    EXPECT_EQ(table.size(), 2u);
}

TEST(NamedLockTableTest, ReleasesOnDestruction) {
    NamedLockTable table;
    { const NamedLock lock = table.acquire("web"); }

    std::atomic<bool> acquired{false};
    std::thread other([&] {
        const NamedLock lock = table.acquire("web");
        acquired = true;
    });
    other.join();
    EXPECT_TRUE(acquired.load());
}

TEST(NamedLockTableTest, MovedLockKeepsHolding) {
    NamedLockTable table;
    NamedLock first = table.acquire("web");
    NamedLock moved(std::move(first));

    std::atomic<bool> acquired{false};
    std::thread other([&] {
        const NamedLock lock = table.acquire("web");
        acquired = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired.load());
    {
        const NamedLock released(std::move(moved));
    }
    other.join();
    EXPECT_TRUE(acquired.load());
}

TEST(NamedLockTableTest, LockFileExcludesOtherTables) {
    // Separate tables share no mutex; only the lock file can serialize them,
    // exactly as between two processes on one cache root.
    TempWorkspace workspace("named_lock_table");
    const auto lock_file = workspace.root() / "web.lock";
    NamedLockTable first_table;
    NamedLockTable second_table;

    std::atomic<bool> acquired{false};
    std::thread other;
    {
        const NamedLock held = first_table.acquire("web", lock_file);
        EXPECT_FALSE(held.file_lock_error().has_value());
        EXPECT_TRUE(std::filesystem::exists(lock_file));

        other = std::thread([&] {
            const NamedLock lock = second_table.acquire("web", lock_file);
            acquired = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        EXPECT_FALSE(acquired.load());
    }
    other.join();
    EXPECT_TRUE(acquired.load());
}

TEST(NamedLockTableTest, ReportsUnusableLockFile) {
    TempWorkspace workspace("named_lock_table");
    NamedLockTable table;
    const NamedLock lock = table.acquire("web", workspace.root() / "missing" / "web.lock");
    ASSERT_TRUE(lock.file_lock_error().has_value());
    EXPECT_NE(lock.file_lock_error()->find("web.lock"), std::string::npos);
}

}  // namespace
