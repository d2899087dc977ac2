// StreamProv - Dedicated stream provisioning service
// Tests for the Stream Entity Store

#include <gtest/gtest.h>
#include "streamprov/storage/port_pool.hpp"
#include "streamprov/storage/stream_store.hpp"
#include "support/database_fixture.hpp"

namespace streamprov {
namespace storage {
namespace test {

using streamprov::test::DatabaseTest;

class StreamStoreTest : public DatabaseTest {
protected:
    void SetUp() override {
        DatabaseTest::SetUp();
        SqlitePortPool pool(db_);
        ASSERT_TRUE(pool.initialize(8100, 8109).isSuccess());
        store_ = std::make_unique<SqliteStreamStore>(db_);
        now_ = core::fromUnixMillis(core::toUnixMillis(core::SystemClock::now()));
    }

    StreamRecord makeRecord(const UserId& user, PortNumber port) const {
        StreamRecord record;
        record.userId = user;
        record.stationId = "station-" + user;
        record.port = port;
        record.sourcePassword = "SourcePass123456";
        record.adminPassword = "AdminPass1234567";
        record.title = "Radio " + user;
        record.genre = "Various";
        record.status = StreamStatus::Provisioning;
        record.createdAt = now_;
        return record;
    }

    StreamId createActive(const UserId& user, PortNumber port) {
        StreamRecord record = makeRecord(user, port);
        record.status = StreamStatus::Active;
        record.activatedAt = now_;
        auto id = store_->create(record);
        EXPECT_TRUE(id.isSuccess());
        return id.isSuccess() ? id.value() : core::INVALID_STREAM_ID;
    }

    std::unique_ptr<SqliteStreamStore> store_;
    TimePoint now_;
};

// =============================================================================
// Create and read
// =============================================================================

TEST_F(StreamStoreTest, CreateThenFindReturnsSameFields) {
    StreamRecord record = makeRecord("user-1", 8100);
    record.description = "Late night jazz";
    record.bitrate = 192;
    record.maxListeners = 250;
    record.publicServer = false;

    auto id = store_->create(record);
    ASSERT_TRUE(id.isSuccess()) << id.error().message;
    EXPECT_NE(id.value(), core::INVALID_STREAM_ID);

    auto found = store_->findById(id.value());
    ASSERT_TRUE(found.isSuccess());
    const StreamRecord& stored = found.value();
    EXPECT_EQ(stored.id, id.value());
    EXPECT_EQ(stored.userId, "user-1");
    EXPECT_EQ(stored.stationId, std::optional<StationId>("station-user-1"));
    EXPECT_EQ(stored.port, 8100);
    EXPECT_EQ(stored.sourcePassword, "SourcePass123456");
    EXPECT_EQ(stored.adminPassword, "AdminPass1234567");
    EXPECT_EQ(stored.description, "Late night jazz");
    EXPECT_EQ(stored.bitrate, 192u);
    EXPECT_EQ(stored.maxListeners, 250u);
    EXPECT_FALSE(stored.publicServer);
    EXPECT_EQ(stored.status, StreamStatus::Provisioning);
    EXPECT_EQ(stored.createdAt, now_);
    EXPECT_FALSE(stored.activatedAt.has_value());
    EXPECT_EQ(stored.configVersion, 1u);
}

TEST_F(StreamStoreTest, MissingStreamIsNotFound) {
    auto found = store_->findById(404);
    ASSERT_TRUE(found.isError());
    EXPECT_EQ(found.error().code, StorageError::Code::NotFound);
}

TEST_F(StreamStoreTest, FindActiveByUserIgnoresTerminated) {
    StreamRecord old = makeRecord("user-1", 8100);
    old.status = StreamStatus::Terminated;
    old.terminatedAt = now_;
    ASSERT_TRUE(store_->create(old).isSuccess());

    auto none = store_->findActiveByUser("user-1");
    ASSERT_TRUE(none.isError());
    EXPECT_EQ(none.error().code, StorageError::Code::NotFound);

    StreamId current = createActive("user-1", 8101);
    auto found = store_->findActiveByUser("user-1");
    ASSERT_TRUE(found.isSuccess());
    EXPECT_EQ(found.value().id, current);
}

// =============================================================================
// Uniqueness
// =============================================================================

TEST_F(StreamStoreTest, SecondLiveStreamForUserRejected) {
    createActive("user-1", 8100);
    auto second = store_->create(makeRecord("user-1", 8101));
    ASSERT_TRUE(second.isError());
    EXPECT_EQ(second.error().code, StorageError::Code::ConstraintViolation);
}

TEST_F(StreamStoreTest, SecondLiveStreamOnPortRejected) {
    createActive("user-1", 8100);
    auto second = store_->create(makeRecord("user-2", 8100));
    ASSERT_TRUE(second.isError());
    EXPECT_EQ(second.error().code, StorageError::Code::ConstraintViolation);
}

TEST_F(StreamStoreTest, TerminatedStreamsFreeUserAndPort) {
    StreamId first = createActive("user-1", 8100);
    auto record = store_->findById(first).value();
    record.status = StreamStatus::Terminated;
    record.terminatedAt = now_;
    ASSERT_TRUE(store_->update(record).isSuccess());

    auto again = store_->create(makeRecord("user-1", 8100));
    EXPECT_TRUE(again.isSuccess());
}

TEST_F(StreamStoreTest, PortOutsidePoolRejected) {
    auto result = store_->create(makeRecord("user-1", 9999));
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, StorageError::Code::ConstraintViolation);
}

// =============================================================================
// Update and listing
// =============================================================================

TEST_F(StreamStoreTest, UpdateOverwritesMutableColumns) {
    StreamId id = createActive("user-1", 8100);
    auto record = store_->findById(id).value();

    record.status = StreamStatus::Suspended;
    record.suspendedAt = now_;
    record.suspensionReason = "billing";
    record.title = "Renamed";
    record.configVersion = 2;
    record.pendingExternalSync = true;
    record.lastError = "kick failed";
    ASSERT_TRUE(store_->update(record).isSuccess());

    auto stored = store_->findById(id).value();
    EXPECT_EQ(stored.status, StreamStatus::Suspended);
    EXPECT_EQ(stored.suspendedAt, std::optional<TimePoint>(now_));
    EXPECT_EQ(stored.suspensionReason, "billing");
    EXPECT_EQ(stored.title, "Renamed");
    EXPECT_EQ(stored.configVersion, 2u);
    EXPECT_TRUE(stored.pendingExternalSync);
    EXPECT_EQ(stored.lastError, "kick failed");
}

TEST_F(StreamStoreTest, UpdatingMissingStreamIsNotFound) {
    StreamRecord ghost = makeRecord("user-1", 8100);
    ghost.id = 77;
    auto result = store_->update(ghost);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, StorageError::Code::NotFound);
}

TEST_F(StreamStoreTest, ListByStatusFiltersAndOrders) {
    StreamId a = createActive("a", 8100);
    StreamId b = createActive("b", 8101);
    ASSERT_TRUE(store_->create(makeRecord("c", 8102)).isSuccess());

    auto active = store_->listByStatus({StreamStatus::Active});
    ASSERT_TRUE(active.isSuccess());
    ASSERT_EQ(active.value().size(), 2u);
    EXPECT_EQ(active.value()[0].id, a);
    EXPECT_EQ(active.value()[1].id, b);

    auto both = store_->listByStatus({StreamStatus::Active, StreamStatus::Provisioning});
    ASSERT_TRUE(both.isSuccess());
    EXPECT_EQ(both.value().size(), 3u);

    auto none = store_->listByStatus({StreamStatus::Error});
    ASSERT_TRUE(none.isSuccess());
    EXPECT_TRUE(none.value().empty());
}

// =============================================================================
// Liveness
// =============================================================================

TEST_F(StreamStoreTest, LivenessTracksListenersAndPeak) {
    StreamId id = createActive("user-1", 8100);

    auto first = store_->recordLiveness(id, true, 12, now_);
    ASSERT_TRUE(first.isSuccess());
    EXPECT_TRUE(first.value());

    ASSERT_TRUE(store_->recordLiveness(id, true, 5, std::nullopt).isSuccess());

    auto stored = store_->findById(id).value();
    EXPECT_TRUE(stored.isLive);
    EXPECT_EQ(stored.currentListeners, 5u);
    EXPECT_EQ(stored.peakListeners, 12u);
    EXPECT_EQ(stored.lastConnectionAt, std::optional<TimePoint>(now_));
}

TEST_F(StreamStoreTest, LivenessIgnoredUnlessActive) {
    StreamId id = createActive("user-1", 8100);
    auto record = store_->findById(id).value();
    record.status = StreamStatus::Suspended;
    ASSERT_TRUE(store_->update(record).isSuccess());

    auto result = store_->recordLiveness(id, true, 30, now_);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_FALSE(result.value());

    auto stored = store_->findById(id).value();
    EXPECT_EQ(stored.status, StreamStatus::Suspended);
    EXPECT_FALSE(stored.isLive);
    EXPECT_EQ(stored.currentListeners, 0u);
}

TEST_F(StreamStoreTest, UpdateLeavesLivenessToSampler) {
    StreamId id = createActive("user-1", 8100);
    StreamRecord stale = store_->findById(id).value();

    ASSERT_TRUE(store_->recordLiveness(id, true, 42, now_).isSuccess());

    stale.title = "Renamed";
    stale.configVersion += 1;
    ASSERT_TRUE(store_->update(stale).isSuccess());

    auto stored = store_->findById(id).value();
    EXPECT_EQ(stored.title, "Renamed");
    EXPECT_TRUE(stored.isLive);
    EXPECT_EQ(stored.currentListeners, 42u);
    EXPECT_EQ(stored.peakListeners, 42u);
    EXPECT_EQ(stored.lastConnectionAt, std::optional<TimePoint>(now_));

    stale.status = StreamStatus::Suspended;
    stale.suspendedAt = now_;
    ASSERT_TRUE(store_->update(stale).isSuccess());

    stored = store_->findById(id).value();
    EXPECT_FALSE(stored.isLive);
    EXPECT_EQ(stored.currentListeners, 0u);
    EXPECT_EQ(stored.peakListeners, 42u);
    EXPECT_EQ(stored.lastConnectionAt, std::optional<TimePoint>(now_));
}

TEST(StreamStatusTest, NamesRoundTrip) {
    for (auto status : {StreamStatus::Provisioning, StreamStatus::Active, StreamStatus::Suspended,
                        StreamStatus::Error, StreamStatus::Terminated}) {
        EXPECT_EQ(parseStreamStatus(streamStatusToString(status)), status);
    }
    EXPECT_FALSE(parseStreamStatus("deleted").has_value());
}

} // namespace test
} // namespace storage
} // namespace streamprov
