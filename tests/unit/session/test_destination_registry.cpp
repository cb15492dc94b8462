/**
 * @file test_destination_registry.cpp
 * @brief Unit tests for destination exclusivity
 */

#include "integration/test_fixtures.h"

#include <rtransfer/session/destination_registry.h>

#include <atomic>
#include <thread>
#include <vector>

namespace rtransfer::test {

class DestinationRegistryTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        registry_ = destination_registry::create();
    }

    std::shared_ptr<destination_registry> registry_;
};

// ============================================================================
// Acquire / release
// ============================================================================

TEST_F(DestinationRegistryTest, AcquireHoldsDestination) {
    auto path = test_dir_ / "a.bin";

    auto lease = registry_->acquire(path);

    ASSERT_TRUE(lease.has_value());
    EXPECT_TRUE(lease.value().held());
    EXPECT_TRUE(registry_->is_held(path));
    EXPECT_EQ(registry_->size(), 1u);
}

TEST_F(DestinationRegistryTest, SecondAcquireConflicts) {
    auto path = test_dir_ / "a.bin";
    auto first = registry_->acquire(path);
    ASSERT_TRUE(first.has_value());

    auto second = registry_->acquire(path);

    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::destination_conflict);
    EXPECT_EQ(registry_->size(), 1u);
}

TEST_F(DestinationRegistryTest, DistinctPathsDoNotConflict) {
    auto a = registry_->acquire(test_dir_ / "a.bin");
    auto b = registry_->acquire(test_dir_ / "b.bin");

    EXPECT_TRUE(a.has_value());
    EXPECT_TRUE(b.has_value());
    EXPECT_EQ(registry_->size(), 2u);
}

TEST_F(DestinationRegistryTest, ReleasedOnDestruction) {
    auto path = test_dir_ / "a.bin";
    {
        auto lease = registry_->acquire(path);
        ASSERT_TRUE(lease.has_value());
    }

    EXPECT_FALSE(registry_->is_held(path));
    EXPECT_TRUE(registry_->acquire(path).has_value());
}

TEST_F(DestinationRegistryTest, ExplicitReleaseIsIdempotent) {
    auto path = test_dir_ / "a.bin";
    auto lease = registry_->acquire(path);
    ASSERT_TRUE(lease.has_value());

    lease.value().release();
    lease.value().release();

    EXPECT_FALSE(lease.value().held());
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(DestinationRegistryTest, MoveTransfersOwnership) {
    auto path = test_dir_ / "a.bin";
    auto acquired = registry_->acquire(path);
    ASSERT_TRUE(acquired.has_value());

    destination_lease moved(std::move(acquired.value()));
    EXPECT_TRUE(moved.held());
    EXPECT_TRUE(registry_->is_held(path));

    destination_lease target;
    target = std::move(moved);
    EXPECT_FALSE(moved.held());
    EXPECT_TRUE(target.held());

    target.release();
    EXPECT_FALSE(registry_->is_held(path));
}

TEST_F(DestinationRegistryTest, LeaseKeepsRegistryAlive) {
    auto path = test_dir_ / "a.bin";
    auto lease = registry_->acquire(path);
    ASSERT_TRUE(lease.has_value());

    std::weak_ptr<destination_registry> weak = registry_;
    registry_.reset();

    EXPECT_FALSE(weak.expired());
    lease.value().release();
    EXPECT_TRUE(weak.expired());
}

// ============================================================================
// Normalization
// ============================================================================

TEST_F(DestinationRegistryTest, EquivalentSpellingsCollide) {
    std::filesystem::create_directories(test_dir_ / "sub");
    auto lease = registry_->acquire(test_dir_ / "b.bin");
    ASSERT_TRUE(lease.has_value());

    auto again = registry_->acquire(test_dir_ / "sub" / ".." / "b.bin");

    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::destination_conflict);
}

TEST_F(DestinationRegistryTest, NormalizeIsAbsolute) {
    auto key = destination_registry::normalize("relative/file.bin");
    EXPECT_TRUE(std::filesystem::path(key).is_absolute());
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(DestinationRegistryTest, ConcurrentAcquireHasSingleWinner) {
    auto path = test_dir_ / "contended.bin";
    constexpr int thread_count = 8;

    std::atomic<int> winners{0};
    std::atomic<int> conflicts{0};
    std::vector<destination_lease> kept(thread_count);
    std::vector<std::thread> threads;

    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&, i] {
            auto lease = registry_->acquire(path);
            if (lease) {
                ++winners;
                kept[static_cast<std::size_t>(i)] = std::move(lease.value());
            } else if (lease.error().code == error_code::destination_conflict) {
                ++conflicts;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(conflicts.load(), thread_count - 1);
    EXPECT_EQ(registry_->size(), 1u);
}

}  // namespace rtransfer::test
