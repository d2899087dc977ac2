// StreamProv - Dedicated stream provisioning service
// Tests for the Port Pool

#include <gtest/gtest.h>
#include "streamprov/storage/port_pool.hpp"
#include "streamprov/storage/stream_store.hpp"
#include "support/database_fixture.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace streamprov {
namespace storage {
namespace test {

using streamprov::test::DatabaseTest;

namespace {

StreamRecord ownerRecord(const UserId& user, PortNumber port, StreamStatus status) {
    StreamRecord record;
    record.userId = user;
    record.port = port;
    record.sourcePassword = "SourcePass123456";
    record.adminPassword = "AdminPass1234567";
    record.title = "Radio " + user;
    record.status = status;
    record.createdAt = core::SystemClock::now();
    return record;
}

}  // namespace

class PortPoolTest : public DatabaseTest {
protected:
    void SetUp() override {
        DatabaseTest::SetUp();
        pool_ = std::make_unique<SqlitePortPool>(db_);
        streams_ = std::make_unique<SqliteStreamStore>(db_);
    }

    OwnerFactory createOwner(const UserId& user, StreamStatus status = StreamStatus::Provisioning) {
        return [this, user, status](PortNumber port) {
            return streams_->create(ownerRecord(user, port, status));
        };
    }

    std::unique_ptr<SqlitePortPool> pool_;
    std::unique_ptr<SqliteStreamStore> streams_;
};

// =============================================================================
// Initialization
// =============================================================================

TEST_F(PortPoolTest, InitializeCreatesOneRowPerPort) {
    auto added = pool_->initialize(8100, 8109);
    ASSERT_TRUE(added.isSuccess());
    EXPECT_EQ(added.value(), 10u);

    auto status = pool_->status();
    ASSERT_TRUE(status.isSuccess());
    EXPECT_EQ(status.value().total, 10u);
    EXPECT_EQ(status.value().allocated, 0u);
    EXPECT_EQ(status.value().available, 10u);
    EXPECT_EQ(status.value().rangeStart, 8100);
    EXPECT_EQ(status.value().rangeEnd, 8109);
    EXPECT_DOUBLE_EQ(status.value().allocationRate, 0.0);
}

TEST_F(PortPoolTest, ReinitializeKeepsAllocations) {
    ASSERT_TRUE(pool_->initialize(8100, 8104).isSuccess());
    auto port = pool_->allocate("user-1");
    ASSERT_TRUE(port.isSuccess());

    auto again = pool_->initialize(8100, 8106);
    ASSERT_TRUE(again.isSuccess());
    EXPECT_EQ(again.value(), 2u);

    auto record = pool_->getPort(port.value());
    ASSERT_TRUE(record.isSuccess());
    EXPECT_TRUE(record.value().allocated);
    EXPECT_EQ(record.value().allocatedTo, std::optional<UserId>("user-1"));
}

TEST_F(PortPoolTest, InvertedRangeRejected) {
    auto result = pool_->initialize(8200, 8100);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, PortPoolError::Code::InvalidRange);
    EXPECT_EQ(toErrorCode(result.error().code), core::ErrorCode::PortRangeInvalid);
}

TEST_F(PortPoolTest, SinglePortRangeIsValid) {
    auto added = pool_->initialize(8100, 8100);
    ASSERT_TRUE(added.isSuccess());
    EXPECT_EQ(added.value(), 1u);
}

// =============================================================================
// Allocation
// =============================================================================

TEST_F(PortPoolTest, AllocatesLowestFreePort) {
    ASSERT_TRUE(pool_->initialize(8100, 8104).isSuccess());

    EXPECT_EQ(pool_->allocate("a").value(), 8100);
    EXPECT_EQ(pool_->allocate("b").value(), 8101);
    ASSERT_TRUE(pool_->release(8100).isSuccess());
    EXPECT_EQ(pool_->allocate("c").value(), 8100);
}

TEST_F(PortPoolTest, AllocationRecordsOwnerAndTime) {
    ASSERT_TRUE(pool_->initialize(8100, 8101).isSuccess());
    const auto before = core::SystemClock::now() - std::chrono::seconds(1);

    auto port = pool_->allocate("user-9");
    ASSERT_TRUE(port.isSuccess());

    auto record = pool_->getPort(port.value());
    ASSERT_TRUE(record.isSuccess());
    EXPECT_TRUE(record.value().allocated);
    ASSERT_TRUE(record.value().allocatedAt.has_value());
    EXPECT_GE(*record.value().allocatedAt, before);
    EXPECT_FALSE(record.value().streamId.has_value());
}

TEST_F(PortPoolTest, ExhaustionReported) {
    ASSERT_TRUE(pool_->initialize(8100, 8101).isSuccess());
    ASSERT_TRUE(pool_->allocate("a").isSuccess());
    ASSERT_TRUE(pool_->allocate("b").isSuccess());

    auto none = pool_->allocate("c");
    ASSERT_TRUE(none.isError());
    EXPECT_EQ(none.error().code, PortPoolError::Code::NoPortsAvailable);
    EXPECT_EQ(toErrorCode(none.error().code), core::ErrorCode::NoPortsAvailable);

    auto status = pool_->status();
    ASSERT_TRUE(status.isSuccess());
    EXPECT_EQ(status.value().available, 0u);
    EXPECT_DOUBLE_EQ(status.value().allocationRate, 100.0);
}

TEST_F(PortPoolTest, EmptyPoolHasNothingToAllocate) {
    auto none = pool_->allocate("a");
    ASSERT_TRUE(none.isError());
    EXPECT_EQ(none.error().code, PortPoolError::Code::NoPortsAvailable);
}

// =============================================================================
// Release and binding
// =============================================================================

TEST_F(PortPoolTest, ReleaseClearsOwnershipAndIsIdempotent) {
    ASSERT_TRUE(pool_->initialize(8100, 8101).isSuccess());
    auto port = pool_->allocate("a");
    ASSERT_TRUE(port.isSuccess());
    ASSERT_TRUE(pool_->bindStream(port.value(), 42).isSuccess());

    ASSERT_TRUE(pool_->release(port.value()).isSuccess());
    ASSERT_TRUE(pool_->release(port.value()).isSuccess());

    auto record = pool_->getPort(port.value());
    ASSERT_TRUE(record.isSuccess());
    EXPECT_FALSE(record.value().allocated);
    EXPECT_FALSE(record.value().allocatedTo.has_value());
    EXPECT_FALSE(record.value().streamId.has_value());
}

TEST_F(PortPoolTest, ReleasingUnknownPortIsNotFound) {
    ASSERT_TRUE(pool_->initialize(8100, 8101).isSuccess());
    auto result = pool_->release(9000);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, PortPoolError::Code::NotFound);
}

TEST_F(PortPoolTest, BindRequiresAllocatedPort) {
    ASSERT_TRUE(pool_->initialize(8100, 8101).isSuccess());
    auto result = pool_->bindStream(8100, 1);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, PortPoolError::Code::NotFound);

    ASSERT_TRUE(pool_->allocate("a").isSuccess());
    ASSERT_TRUE(pool_->bindStream(8100, 1).isSuccess());
    EXPECT_EQ(pool_->getPort(8100).value().streamId, std::optional<StreamId>(1));
}

// =============================================================================
// Claim with owner
// =============================================================================

TEST_F(PortPoolTest, AllocateForBindsTheNewOwner) {
    ASSERT_TRUE(pool_->initialize(8100, 8101).isSuccess());

    auto binding = pool_->allocateFor("user-1", createOwner("user-1"));
    ASSERT_TRUE(binding.isSuccess()) << binding.error().message;
    EXPECT_EQ(binding.value().port, 8100);

    auto record = pool_->getPort(8100).value();
    EXPECT_TRUE(record.allocated);
    EXPECT_EQ(record.allocatedTo, std::optional<UserId>("user-1"));
    EXPECT_EQ(record.streamId, std::optional<StreamId>(binding.value().streamId));
    EXPECT_EQ(streams_->findById(binding.value().streamId).value().port, 8100);
}

TEST_F(PortPoolTest, AllocateForRollsBackClaimWhenOwnerFails) {
    ASSERT_TRUE(pool_->initialize(8100, 8100).isSuccess());

    auto binding = pool_->allocateFor("user-1", [](PortNumber) {
        return core::Result<StreamId, StorageError>::error(
            StorageError(StorageError::Code::ConstraintViolation, "duplicate"));
    });
    ASSERT_TRUE(binding.isError());
    EXPECT_EQ(binding.error().code, PortPoolError::Code::OwnerFailed);
    EXPECT_FALSE(pool_->getPort(8100).value().allocated);

    auto next = pool_->allocateFor("user-2", createOwner("user-2"));
    ASSERT_TRUE(next.isSuccess());
    EXPECT_EQ(next.value().port, 8100);
}

TEST_F(PortPoolTest, AllocateForOnFullPoolCreatesNoOwner) {
    ASSERT_TRUE(pool_->initialize(8100, 8100).isSuccess());
    ASSERT_TRUE(pool_->allocateFor("a", createOwner("a")).isSuccess());

    bool ownerCalled = false;
    auto none = pool_->allocateFor("b", [&](PortNumber port) {
        ownerCalled = true;
        return streams_->create(ownerRecord("b", port, StreamStatus::Provisioning));
    });
    ASSERT_TRUE(none.isError());
    EXPECT_EQ(none.error().code, PortPoolError::Code::NoPortsAvailable);
    EXPECT_FALSE(ownerCalled);
}

TEST(PortPoolSharedFileTest, ClaimInvisibleToOtherConnectionsUntilOwnerCommits) {
    const std::string path = streamprov::test::tempDatabasePath("pool_claim");
    auto writer = streamprov::test::openMigratedDatabase(path);
    auto observer = streamprov::test::openMigratedDatabase(path);
    ASSERT_NE(writer, nullptr);
    ASSERT_NE(observer, nullptr);

    SqlitePortPool pool(writer);
    SqlitePortPool observedPool(observer);
    SqliteStreamStore streams(writer);
    ASSERT_TRUE(pool.initialize(8100, 8100).isSuccess());

    // A process dying at this point would leave nothing behind.
    bool seenFreeMidway = false;
    auto binding = pool.allocateFor("user-1", [&](PortNumber port) {
        seenFreeMidway = !observedPool.getPort(port).value().allocated;
        return streams.create(ownerRecord("user-1", port, StreamStatus::Provisioning));
    });
    ASSERT_TRUE(binding.isSuccess());
    EXPECT_TRUE(seenFreeMidway);
    EXPECT_EQ(observedPool.getPort(8100).value().streamId,
              std::optional<StreamId>(binding.value().streamId));

    writer.reset();
    observer.reset();
    streamprov::test::removeDatabaseFiles(path);
}

// =============================================================================
// Reclaiming orphaned ports
// =============================================================================

TEST_F(PortPoolTest, ReclaimFreesPortsWithoutLiveOwner) {
    ASSERT_TRUE(pool_->initialize(8100, 8103).isSuccess());

    // 8100: claimed, owner never written.
    ASSERT_EQ(pool_->allocate("crashed").value(), 8100);
    // 8101: live owner.
    auto live = pool_->allocateFor("live", createOwner("live", StreamStatus::Active));
    ASSERT_TRUE(live.isSuccess());
    // 8102: owner terminated, release never happened.
    auto ended = pool_->allocateFor("ended", createOwner("ended", StreamStatus::Terminated));
    ASSERT_TRUE(ended.isSuccess());

    auto reclaimed = pool_->reclaimOrphaned();
    ASSERT_TRUE(reclaimed.isSuccess());
    EXPECT_EQ(reclaimed.value(), 2u);

    EXPECT_FALSE(pool_->getPort(8100).value().allocated);
    EXPECT_TRUE(pool_->getPort(8101).value().allocated);
    EXPECT_EQ(pool_->getPort(8101).value().streamId, std::optional<StreamId>(live.value().streamId));
    EXPECT_FALSE(pool_->getPort(8102).value().allocated);
    EXPECT_FALSE(pool_->getPort(8103).value().allocated);

    auto again = pool_->reclaimOrphaned();
    ASSERT_TRUE(again.isSuccess());
    EXPECT_EQ(again.value(), 0u);
}

TEST(PortPoolSharedFileTest, ClaimLeftByDeadConnectionReclaimedOnRestart) {
    const std::string path = streamprov::test::tempDatabasePath("pool_restart");
    {
        auto crashed = streamprov::test::openMigratedDatabase(path);
        ASSERT_NE(crashed, nullptr);
        SqlitePortPool pool(crashed);
        ASSERT_TRUE(pool.initialize(8100, 8100).isSuccess());
        ASSERT_TRUE(pool.allocate("user-a").isSuccess());
    }

    auto restarted = streamprov::test::openMigratedDatabase(path);
    ASSERT_NE(restarted, nullptr);
    SqlitePortPool pool(restarted);
    ASSERT_TRUE(pool.initialize(8100, 8100).isSuccess());
    EXPECT_TRUE(pool.getPort(8100).value().allocated);

    auto reclaimed = pool.reclaimOrphaned();
    ASSERT_TRUE(reclaimed.isSuccess());
    EXPECT_EQ(reclaimed.value(), 1u);

    SqliteStreamStore streams(restarted);
    auto binding = pool.allocateFor("user-b", [&](PortNumber port) {
        return streams.create(ownerRecord("user-b", port, StreamStatus::Provisioning));
    });
    ASSERT_TRUE(binding.isSuccess());
    EXPECT_EQ(binding.value().port, 8100);

    restarted.reset();
    streamprov::test::removeDatabaseFiles(path);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(PortPoolTest, ConcurrentAllocationsNeverShareAPort) {
    constexpr int threadCount = 8;
    constexpr int perThread = 10;
    ASSERT_TRUE(pool_->initialize(8100, 8100 + threadCount * perThread - 1).isSuccess());

    std::mutex mutex;
    std::vector<PortNumber> ports;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < perThread; ++i) {
                auto port = pool_->allocate("user-" + std::to_string(t));
                if (port.isError()) {
                    failures++;
                    continue;
                }
                std::lock_guard<std::mutex> lock(mutex);
                ports.push_back(port.value());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    std::set<PortNumber> unique(ports.begin(), ports.end());
    EXPECT_EQ(unique.size(), ports.size());
    EXPECT_EQ(ports.size(), static_cast<size_t>(threadCount * perThread));
    EXPECT_EQ(pool_->status().value().available, 0u);
}

TEST(PortPoolSharedFileTest, SeparateConnectionsNeverShareAPort) {
    const std::string path = streamprov::test::tempDatabasePath("pool_shared");
    auto first = streamprov::test::openMigratedDatabase(path);
    auto second = streamprov::test::openMigratedDatabase(path);
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);

    SqlitePortPool poolA(first);
    SqlitePortPool poolB(second);
    ASSERT_TRUE(poolA.initialize(8100, 8139).isSuccess());

    std::vector<PortNumber> fromA;
    std::vector<PortNumber> fromB;
    std::thread threadA([&]() {
        for (int i = 0; i < 20; ++i) {
            auto port = poolA.allocate("a");
            if (port.isSuccess()) fromA.push_back(port.value());
        }
    });
    std::thread threadB([&]() {
        for (int i = 0; i < 20; ++i) {
            auto port = poolB.allocate("b");
            if (port.isSuccess()) fromB.push_back(port.value());
        }
    });
    threadA.join();
    threadB.join();

    std::set<PortNumber> all(fromA.begin(), fromA.end());
    all.insert(fromB.begin(), fromB.end());
    EXPECT_EQ(all.size(), fromA.size() + fromB.size());
    EXPECT_EQ(fromA.size() + fromB.size(), 40u);

    first.reset();
    second.reset();
    streamprov::test::removeDatabaseFiles(path);
}

} // namespace test
} // namespace storage
} // namespace streamprov
