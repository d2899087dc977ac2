// StreamProv - Dedicated stream provisioning service
// Tests for the Provisioning Coordinator

#include <gtest/gtest.h>
#include "streamprov/provisioning/provisioning_coordinator.hpp"
#include "streamprov/storage/port_pool.hpp"
#include "streamprov/storage/stream_store.hpp"
#include "support/database_fixture.hpp"
#include "support/failing_stores.hpp"
#include "support/fake_streaming_server.hpp"

#include <atomic>
#include <set>
#include <thread>
#include <vector>

namespace streamprov {
namespace provisioning {
namespace test {

using streamprov::test::DatabaseTest;
using streamprov::test::FailingPortPool;
using streamprov::test::FailingStreamStore;
using streamprov::test::FakeStreamingServer;
using shoutcast::StreamingServerError;

class ProvisioningCoordinatorTest : public DatabaseTest {
protected:
    void SetUp() override {
        DatabaseTest::SetUp();
        auto pool = std::make_shared<storage::SqlitePortPool>(db_);
        ASSERT_TRUE(pool->initialize(8100, 8102).isSuccess());
        pool_ = std::make_shared<FailingPortPool>(pool);
        store_ = std::make_shared<FailingStreamStore>(std::make_shared<storage::SqliteStreamStore>(db_));
        server_ = std::make_shared<FakeStreamingServer>();

        settings_.publicHost = "radio.example.com";
        coordinator_ = std::make_unique<ProvisioningCoordinator>(settings_, pool_, store_, server_);
    }

    static ProvisionRequest request(const UserId& user) {
        ProvisionRequest req;
        req.userId = user;
        req.title = "Station of " + user;
        return req;
    }

    StreamRecord provisionActive(const UserId& user) {
        auto outcome = coordinator_->provision(request(user));
        EXPECT_TRUE(outcome.isSuccess());
        if (outcome.isError()) {
            return StreamRecord();
        }
        EXPECT_EQ(outcome.value().stream.status, StreamStatus::Active);
        return outcome.value().stream;
    }

    uint32_t allocatedPorts() {
        auto status = pool_->status();
        EXPECT_TRUE(status.isSuccess());
        return status.isSuccess() ? status.value().allocated : 0;
    }

    StreamRecord stored(StreamId id) {
        auto found = store_->findById(id);
        EXPECT_TRUE(found.isSuccess());
        return found.isSuccess() ? found.value() : StreamRecord();
    }

    CoordinatorSettings settings_;
    std::shared_ptr<FailingPortPool> pool_;
    std::shared_ptr<FailingStreamStore> store_;
    std::shared_ptr<FakeStreamingServer> server_;
    std::unique_ptr<ProvisioningCoordinator> coordinator_;
};

// =============================================================================
// Provision
// =============================================================================

TEST_F(ProvisioningCoordinatorTest, ProvisionAllocatesPortAndConfiguresServer) {
    ProvisionRequest req = request("user-1");
    req.bitrate = 192;
    req.maxListeners = 50;
    req.genre = "Jazz";

    auto outcome = coordinator_->provision(req);
    ASSERT_TRUE(outcome.isSuccess()) << outcome.error().message;
    EXPECT_EQ(outcome.value().disposition, ProvisionDisposition::Created);

    const StreamRecord& stream = outcome.value().stream;
    EXPECT_EQ(stream.status, StreamStatus::Active);
    EXPECT_EQ(stream.port, 8100);
    EXPECT_EQ(stream.bitrate, 192u);
    EXPECT_EQ(stream.maxListeners, 50u);
    EXPECT_EQ(stream.genre, "Jazz");
    EXPECT_TRUE(stream.activatedAt.has_value());
    EXPECT_GE(stream.sourcePassword.size(), MIN_SECRET_LENGTH);
    EXPECT_NE(stream.sourcePassword, stream.adminPassword);

    auto port = pool_->getPort(8100).value();
    EXPECT_TRUE(port.allocated);
    EXPECT_EQ(port.streamId, std::optional<StreamId>(stream.id));
    EXPECT_EQ(port.allocatedTo, std::optional<UserId>("user-1"));

    auto mount = server_->mount(8100);
    ASSERT_TRUE(mount.has_value());
    EXPECT_EQ(mount->sourcePassword, stream.sourcePassword);
    EXPECT_EQ(mount->bitrateKbps, 192u);
    EXPECT_EQ(mount->title, "Station of user-1");

    const ConnectionDetails& connection = outcome.value().connection;
    EXPECT_EQ(connection.host, "radio.example.com");
    EXPECT_EQ(connection.port, 8100);
    EXPECT_EQ(connection.listenerUrl, "http://radio.example.com:8100");
    EXPECT_EQ(connection.sourcePassword, stream.sourcePassword);
}

TEST_F(ProvisioningCoordinatorTest, DefaultsFillUnsetFields) {
    auto stream = provisionActive("user-1");
    EXPECT_EQ(stream.bitrate, settings_.defaultBitrate);
    EXPECT_EQ(stream.maxListeners, settings_.defaultMaxListeners);
    EXPECT_EQ(stream.sampleRate, settings_.defaultSampleRate);
    EXPECT_EQ(stream.genre, settings_.defaultGenre);
    EXPECT_EQ(stream.publicServer, settings_.defaultPublicServer);
}

TEST_F(ProvisioningCoordinatorTest, SecondProvisionReturnsExistingStream) {
    auto first = coordinator_->provision(request("user-1"));
    ASSERT_TRUE(first.isSuccess());

    auto second = coordinator_->provision(request("user-1"));
    ASSERT_TRUE(second.isSuccess());
    EXPECT_EQ(second.value().disposition, ProvisionDisposition::AlreadyProvisioned);
    EXPECT_EQ(second.value().stream.id, first.value().stream.id);
    EXPECT_EQ(second.value().stream.port, first.value().stream.port);

    EXPECT_EQ(allocatedPorts(), 1u);
    EXPECT_EQ(server_->createCalls(), 1);
}

TEST_F(ProvisioningCoordinatorTest, ConcurrentProvisionForOneUserAllocatesOnce) {
    constexpr int attempts = 3;
    std::vector<std::thread> threads;
    std::vector<StreamId> ids(attempts, core::INVALID_STREAM_ID);
    std::atomic<int> failures{0};

    for (int i = 0; i < attempts; ++i) {
        threads.emplace_back([&, i]() {
            auto outcome = coordinator_->provision(request("user-1"));
            if (outcome.isError()) {
                failures++;
                return;
            }
            ids[i] = outcome.value().stream.id;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    std::set<StreamId> unique(ids.begin(), ids.end());
    EXPECT_EQ(unique.size(), 1u);
    EXPECT_EQ(allocatedPorts(), 1u);
}

TEST_F(ProvisioningCoordinatorTest, ConcurrentUsersGetDistinctPortsUntilPoolRunsOut) {
    constexpr int users = 4;
    std::vector<std::thread> threads;
    std::vector<PortNumber> ports(users, 0);
    std::atomic<int> noCapacity{0};

    for (int i = 0; i < users; ++i) {
        threads.emplace_back([&, i]() {
            auto outcome = coordinator_->provision(request("user-" + std::to_string(i)));
            if (outcome.isError()) {
                if (outcome.error().code == ProvisioningError::Code::NoCapacity) {
                    noCapacity++;
                }
                return;
            }
            ports[i] = outcome.value().stream.port;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(noCapacity.load(), 1);
    std::set<PortNumber> granted;
    for (PortNumber port : ports) {
        if (port != 0) {
            granted.insert(port);
        }
    }
    EXPECT_EQ(granted, (std::set<PortNumber>{8100, 8101, 8102}));
    EXPECT_EQ(allocatedPorts(), 3u);
}

TEST_F(ProvisioningCoordinatorTest, ExhaustedPoolIsNoCapacity) {
    provisionActive("a");
    provisionActive("b");
    provisionActive("c");

    auto outcome = coordinator_->provision(request("d"));
    ASSERT_TRUE(outcome.isError());
    EXPECT_EQ(outcome.error().code, ProvisioningError::Code::NoCapacity);
    EXPECT_EQ(toErrorCode(outcome.error().code), core::ErrorCode::NoCapacity);

    EXPECT_TRUE(store_->findActiveByUser("d").isError());
    EXPECT_EQ(server_->mountCount(), 3u);
}

TEST_F(ProvisioningCoordinatorTest, InvalidRequestTouchesNothing) {
    ProvisionRequest req = request("user-1");
    req.bitrate = 100;

    auto outcome = coordinator_->provision(req);
    ASSERT_TRUE(outcome.isError());
    EXPECT_EQ(outcome.error().code, ProvisioningError::Code::InvalidRequest);
    EXPECT_EQ(allocatedPorts(), 0u);
    EXPECT_EQ(server_->createCalls(), 0);
}

TEST_F(ProvisioningCoordinatorTest, ExternalFailureKeepsStreamAndPort) {
    server_->setCreateFailure(StreamingServerError(StreamingServerError::Code::HttpStatus, "HTTP 500", 500));

    auto outcome = coordinator_->provision(request("user-1"));
    ASSERT_TRUE(outcome.isSuccess());
    EXPECT_EQ(outcome.value().disposition, ProvisionDisposition::CreatedPendingConfiguration);
    EXPECT_EQ(outcome.value().externalError, "HTTP 500");

    const StreamRecord& stream = outcome.value().stream;
    EXPECT_EQ(stream.status, StreamStatus::Error);
    EXPECT_EQ(stream.lastError, "HTTP 500");
    EXPECT_FALSE(stream.activatedAt.has_value());

    auto port = pool_->getPort(stream.port).value();
    EXPECT_TRUE(port.allocated);
    EXPECT_EQ(port.streamId, std::optional<StreamId>(stream.id));
    EXPECT_EQ(stored(stream.id).status, StreamStatus::Error);
}

TEST_F(ProvisioningCoordinatorTest, RetryActivatesWithoutReallocating) {
    server_->setCreateFailure(StreamingServerError(StreamingServerError::Code::HttpStatus, "HTTP 500", 500));
    auto outcome = coordinator_->provision(request("user-1"));
    ASSERT_TRUE(outcome.isSuccess());
    const StreamRecord original = outcome.value().stream;

    server_->setCreateFailure(std::nullopt);
    auto retried = coordinator_->retryConfiguration(original.id);
    ASSERT_TRUE(retried.isSuccess()) << retried.error().message;
    EXPECT_EQ(retried.value().status, StreamStatus::Active);
    EXPECT_EQ(retried.value().port, original.port);
    EXPECT_TRUE(retried.value().lastError.empty());
    EXPECT_TRUE(retried.value().activatedAt.has_value());

    EXPECT_EQ(allocatedPorts(), 1u);
    EXPECT_TRUE(server_->hasMount(original.port));
}

TEST_F(ProvisioningCoordinatorTest, RetryWhileUnreachableReportsUnreachable) {
    server_->setUnreachable(true);
    auto outcome = coordinator_->provision(request("user-1"));
    ASSERT_TRUE(outcome.isSuccess());
    EXPECT_EQ(outcome.value().disposition, ProvisionDisposition::CreatedPendingConfiguration);

    auto retried = coordinator_->retryConfiguration(outcome.value().stream.id);
    ASSERT_TRUE(retried.isError());
    EXPECT_EQ(retried.error().code, ProvisioningError::Code::Unreachable);
    EXPECT_EQ(stored(outcome.value().stream.id).status, StreamStatus::Error);
}

TEST_F(ProvisioningCoordinatorTest, RetryOfHealthyActiveStreamRejected) {
    auto stream = provisionActive("user-1");
    auto retried = coordinator_->retryConfiguration(stream.id);
    ASSERT_TRUE(retried.isError());
    EXPECT_EQ(retried.error().code, ProvisioningError::Code::InvalidTransition);
}

// =============================================================================
// No leaked ports on local failure
// =============================================================================

TEST_F(ProvisioningCoordinatorTest, PersistenceFailureReleasesPort) {
    store_->failCreate = true;

    auto outcome = coordinator_->provision(request("user-1"));
    ASSERT_TRUE(outcome.isError());
    EXPECT_EQ(outcome.error().code, ProvisioningError::Code::PersistenceFailed);

    EXPECT_EQ(allocatedPorts(), 0u);
    EXPECT_FALSE(pool_->getPort(8100).value().allocated);
    EXPECT_EQ(server_->createCalls(), 0);

    store_->failCreate = false;
    auto again = coordinator_->provision(request("user-2"));
    ASSERT_TRUE(again.isSuccess());
    EXPECT_EQ(again.value().stream.port, 8100);
}

TEST_F(ProvisioningCoordinatorTest, BindFailureRollsBackStreamAndPort) {
    pool_->failBind = true;

    auto outcome = coordinator_->provision(request("user-1"));
    ASSERT_TRUE(outcome.isError());
    EXPECT_EQ(outcome.error().code, ProvisioningError::Code::PersistenceFailed);

    EXPECT_EQ(allocatedPorts(), 0u);
    EXPECT_TRUE(store_->findActiveByUser("user-1").isError());
    auto rows = store_->listByStatus({StreamStatus::Provisioning, StreamStatus::Active,
                                      StreamStatus::Suspended, StreamStatus::Error,
                                      StreamStatus::Terminated});
    ASSERT_TRUE(rows.isSuccess());
    EXPECT_TRUE(rows.value().empty());
    EXPECT_EQ(server_->createCalls(), 0);

    pool_->failBind = false;
    auto again = coordinator_->provision(request("user-1"));
    ASSERT_TRUE(again.isSuccess());
    EXPECT_EQ(again.value().stream.port, 8100);
}

TEST_F(ProvisioningCoordinatorTest, FailureToRecordActivationKeepsCommittedStream) {
    store_->failUpdate = true;

    auto outcome = coordinator_->provision(request("user-1"));
    ASSERT_TRUE(outcome.isSuccess()) << outcome.error().message;
    EXPECT_EQ(outcome.value().disposition, ProvisionDisposition::CreatedPendingConfiguration);
    EXPECT_FALSE(outcome.value().externalError.empty());

    const StreamRecord& stream = outcome.value().stream;
    EXPECT_NE(stream.id, core::INVALID_STREAM_ID);
    EXPECT_EQ(stream.port, 8100);
    EXPECT_EQ(stored(stream.id).status, StreamStatus::Provisioning);
    EXPECT_EQ(pool_->getPort(8100).value().streamId, std::optional<StreamId>(stream.id));
    EXPECT_TRUE(server_->hasMount(8100));

    store_->failUpdate = false;
    auto retried = coordinator_->retryConfiguration(stream.id);
    ASSERT_TRUE(retried.isSuccess()) << retried.error().message;
    EXPECT_EQ(retried.value().status, StreamStatus::Active);
    EXPECT_EQ(stored(stream.id).status, StreamStatus::Active);
    EXPECT_EQ(allocatedPorts(), 1u);
}

TEST_F(ProvisioningCoordinatorTest, LookupFailureIsPersistenceFailed) {
    store_->failFind = true;
    auto outcome = coordinator_->provision(request("user-1"));
    ASSERT_TRUE(outcome.isError());
    EXPECT_EQ(outcome.error().code, ProvisioningError::Code::PersistenceFailed);
    EXPECT_EQ(allocatedPorts(), 0u);
}

// =============================================================================
// Suspend and resume
// =============================================================================

TEST_F(ProvisioningCoordinatorTest, SuspendThenResume) {
    auto stream = provisionActive("user-1");
    server_->setSource(stream.port, true, 7);

    auto suspended = coordinator_->suspend(stream.id, "billing");
    ASSERT_TRUE(suspended.isSuccess());
    EXPECT_EQ(suspended.value().status, StreamStatus::Suspended);
    EXPECT_EQ(suspended.value().suspensionReason, "billing");
    EXPECT_TRUE(suspended.value().suspendedAt.has_value());
    EXPECT_FALSE(suspended.value().isLive);
    EXPECT_EQ(suspended.value().currentListeners, 0u);
    EXPECT_EQ(server_->kickSourceCalls(), 0);

    // The port stays with the suspended stream.
    EXPECT_EQ(pool_->getPort(stream.port).value().streamId, std::optional<StreamId>(stream.id));

    auto resumed = coordinator_->resume(stream.id);
    ASSERT_TRUE(resumed.isSuccess());
    EXPECT_EQ(resumed.value().status, StreamStatus::Active);
    EXPECT_FALSE(resumed.value().suspendedAt.has_value());
    EXPECT_TRUE(resumed.value().suspensionReason.empty());
    EXPECT_EQ(stored(stream.id).status, StreamStatus::Active);
}

TEST_F(ProvisioningCoordinatorTest, SuspendKicksSourceWhenConfigured) {
    settings_.kickSourceOnSuspend = true;
    coordinator_ = std::make_unique<ProvisioningCoordinator>(settings_, pool_, store_, server_);
    auto stream = provisionActive("user-1");

    ASSERT_TRUE(coordinator_->suspend(stream.id, "abuse").isSuccess());
    EXPECT_EQ(server_->kickSourceCalls(), 1);
}

TEST_F(ProvisioningCoordinatorTest, SuspendOnlyFromActive) {
    auto stream = provisionActive("user-1");
    ASSERT_TRUE(coordinator_->suspend(stream.id).isSuccess());

    auto again = coordinator_->suspend(stream.id);
    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().code, ProvisioningError::Code::InvalidTransition);
}

TEST_F(ProvisioningCoordinatorTest, ResumeOnlyFromSuspended) {
    auto stream = provisionActive("user-1");
    auto resumed = coordinator_->resume(stream.id);
    ASSERT_TRUE(resumed.isError());
    EXPECT_EQ(resumed.error().code, ProvisioningError::Code::InvalidTransition);
}

// =============================================================================
// Terminate
// =============================================================================

TEST_F(ProvisioningCoordinatorTest, TerminateReleasesPortForReuse) {
    auto first = provisionActive("user-1");

    auto terminated = coordinator_->terminate(first.id);
    ASSERT_TRUE(terminated.isSuccess());
    EXPECT_EQ(terminated.value().status, StreamStatus::Terminated);
    EXPECT_TRUE(terminated.value().terminatedAt.has_value());
    EXPECT_FALSE(server_->hasMount(first.port));
    EXPECT_EQ(allocatedPorts(), 0u);

    auto next = provisionActive("user-2");
    EXPECT_EQ(next.port, first.port);
    EXPECT_EQ(stored(first.id).status, StreamStatus::Terminated);
}

TEST_F(ProvisioningCoordinatorTest, TerminateTwiceSucceedsWithoutDoubleRelease) {
    auto first = provisionActive("user-1");
    ASSERT_TRUE(coordinator_->terminate(first.id).isSuccess());

    auto next = provisionActive("user-2");
    ASSERT_EQ(next.port, first.port);

    auto again = coordinator_->terminate(first.id);
    ASSERT_TRUE(again.isSuccess());
    EXPECT_EQ(again.value().status, StreamStatus::Terminated);

    // The port now belongs to user-2's stream and must stay allocated.
    auto port = pool_->getPort(first.port).value();
    EXPECT_TRUE(port.allocated);
    EXPECT_EQ(port.streamId, std::optional<StreamId>(next.id));
    EXPECT_EQ(server_->removeCalls(), 1);
}

TEST_F(ProvisioningCoordinatorTest, TerminateSucceedsWhenServerUnreachable) {
    auto stream = provisionActive("user-1");
    server_->setUnreachable(true);

    auto terminated = coordinator_->terminate(stream.id);
    ASSERT_TRUE(terminated.isSuccess());
    EXPECT_EQ(terminated.value().status, StreamStatus::Terminated);
    EXPECT_EQ(allocatedPorts(), 0u);
}

TEST_F(ProvisioningCoordinatorTest, TerminateFromSuspendedAndError) {
    auto suspended = provisionActive("a");
    ASSERT_TRUE(coordinator_->suspend(suspended.id).isSuccess());
    EXPECT_TRUE(coordinator_->terminate(suspended.id).isSuccess());

    server_->setCreateFailure(StreamingServerError(StreamingServerError::Code::HttpStatus, "HTTP 503", 503));
    auto failed = coordinator_->provision(request("b"));
    ASSERT_TRUE(failed.isSuccess());
    EXPECT_TRUE(coordinator_->terminate(failed.value().stream.id).isSuccess());

    EXPECT_EQ(allocatedPorts(), 0u);
}

TEST_F(ProvisioningCoordinatorTest, TerminatedStreamCannotBeResumedOrUpdated) {
    auto stream = provisionActive("user-1");
    ASSERT_TRUE(coordinator_->terminate(stream.id).isSuccess());

    EXPECT_EQ(coordinator_->suspend(stream.id).error().code, ProvisioningError::Code::InvalidTransition);
    EXPECT_EQ(coordinator_->resume(stream.id).error().code, ProvisioningError::Code::InvalidTransition);

    StreamUpdate change;
    change.title = "Back";
    EXPECT_EQ(coordinator_->update(stream.id, change).error().code,
              ProvisioningError::Code::InvalidTransition);
}

// =============================================================================
// Update
// =============================================================================

TEST_F(ProvisioningCoordinatorTest, ConfigChangeBumpsVersionAndReconfigures) {
    auto stream = provisionActive("user-1");
    EXPECT_EQ(stream.configVersion, 1u);

    StreamUpdate change;
    change.bitrate = 320;
    change.maxListeners = 500;

    auto updated = coordinator_->update(stream.id, change);
    ASSERT_TRUE(updated.isSuccess());
    EXPECT_EQ(updated.value().configVersion, 2u);
    EXPECT_EQ(updated.value().bitrate, 320u);
    EXPECT_FALSE(updated.value().pendingExternalSync);
    EXPECT_EQ(server_->createCalls(), 2);
    EXPECT_EQ(server_->mount(stream.port)->bitrateKbps, 320u);
    EXPECT_EQ(server_->mount(stream.port)->maxListeners, 500u);
}

TEST_F(ProvisioningCoordinatorTest, MetadataChangeKeepsVersion) {
    auto stream = provisionActive("user-1");

    StreamUpdate change;
    change.title = "New Name";
    change.genre = "Ambient";

    auto updated = coordinator_->update(stream.id, change);
    ASSERT_TRUE(updated.isSuccess());
    EXPECT_EQ(updated.value().configVersion, 1u);
    EXPECT_EQ(server_->createCalls(), 1);
    ASSERT_TRUE(server_->lastMetadata().has_value());
    EXPECT_EQ(server_->lastMetadata()->title, std::optional<std::string>("New Name"));
    EXPECT_EQ(server_->mount(stream.port)->genre, "Ambient");
}

TEST_F(ProvisioningCoordinatorTest, MetadataFailureFlagsPendingSync) {
    auto stream = provisionActive("user-1");
    server_->setMetadataFailure(StreamingServerError(StreamingServerError::Code::HttpStatus, "HTTP 500", 500));

    StreamUpdate change;
    change.title = "New Name";
    auto updated = coordinator_->update(stream.id, change);
    ASSERT_TRUE(updated.isSuccess());
    EXPECT_EQ(updated.value().status, StreamStatus::Active);
    EXPECT_TRUE(updated.value().pendingExternalSync);
    EXPECT_EQ(updated.value().lastError, "HTTP 500");

    auto persisted = stored(stream.id);
    EXPECT_EQ(persisted.title, "New Name");
    EXPECT_TRUE(persisted.pendingExternalSync);

    server_->setMetadataFailure(std::nullopt);
    auto retried = coordinator_->retryConfiguration(stream.id);
    ASSERT_TRUE(retried.isSuccess());
    EXPECT_FALSE(retried.value().pendingExternalSync);
    EXPECT_EQ(server_->mount(stream.port)->title, "New Name");
}

TEST_F(ProvisioningCoordinatorTest, ChangesWhileSuspendedArePushedOnResume) {
    auto stream = provisionActive("user-1");
    ASSERT_TRUE(coordinator_->suspend(stream.id).isSuccess());

    StreamUpdate change;
    change.bitrate = 64;
    auto updated = coordinator_->update(stream.id, change);
    ASSERT_TRUE(updated.isSuccess());
    EXPECT_EQ(updated.value().status, StreamStatus::Suspended);
    EXPECT_TRUE(updated.value().pendingExternalSync);
    EXPECT_EQ(server_->createCalls(), 1);

    auto resumed = coordinator_->resume(stream.id);
    ASSERT_TRUE(resumed.isSuccess());
    EXPECT_EQ(resumed.value().status, StreamStatus::Active);
    EXPECT_FALSE(resumed.value().pendingExternalSync);
    EXPECT_EQ(server_->createCalls(), 2);
    EXPECT_EQ(server_->mount(stream.port)->bitrateKbps, 64u);
}

TEST_F(ProvisioningCoordinatorTest, ExternalFailureOnUpdateKeepsStreamActive) {
    auto stream = provisionActive("user-1");
    server_->setCreateFailure(StreamingServerError(StreamingServerError::Code::HttpStatus, "HTTP 500", 500));

    StreamUpdate change;
    change.maxListeners = 10;
    auto updated = coordinator_->update(stream.id, change);
    ASSERT_TRUE(updated.isSuccess());
    EXPECT_EQ(updated.value().status, StreamStatus::Active);
    EXPECT_TRUE(updated.value().pendingExternalSync);
    EXPECT_EQ(updated.value().configVersion, 2u);
}

TEST_F(ProvisioningCoordinatorTest, EmptyUpdateChangesNothing) {
    auto stream = provisionActive("user-1");
    auto updated = coordinator_->update(stream.id, StreamUpdate());
    ASSERT_TRUE(updated.isSuccess());
    EXPECT_EQ(updated.value().configVersion, 1u);
    EXPECT_EQ(server_->createCalls(), 1);
    EXPECT_EQ(server_->metadataCalls(), 0);
}

TEST_F(ProvisioningCoordinatorTest, InvalidUpdateRejected) {
    auto stream = provisionActive("user-1");
    StreamUpdate change;
    change.maxListeners = 0;
    auto updated = coordinator_->update(stream.id, change);
    ASSERT_TRUE(updated.isError());
    EXPECT_EQ(updated.error().code, ProvisioningError::Code::InvalidRequest);
}

// =============================================================================
// Ownership, configuration loss and pass-throughs
// =============================================================================

TEST_F(ProvisioningCoordinatorTest, OtherUsersStreamIsNotFound) {
    auto stream = provisionActive("user-1");

    EXPECT_EQ(coordinator_->getStream(stream.id, UserId("user-2")).error().code,
              ProvisioningError::Code::NotFound);
    EXPECT_EQ(coordinator_->terminate(stream.id, UserId("user-2")).error().code,
              ProvisioningError::Code::NotFound);
    EXPECT_EQ(coordinator_->suspend(stream.id, "", UserId("user-2")).error().code,
              ProvisioningError::Code::NotFound);
    EXPECT_EQ(stored(stream.id).status, StreamStatus::Active);

    EXPECT_TRUE(coordinator_->getStream(stream.id, UserId("user-1")).isSuccess());
    EXPECT_EQ(coordinator_->getStream(9999).error().code, ProvisioningError::Code::NotFound);
}

TEST_F(ProvisioningCoordinatorTest, FindUserStream) {
    EXPECT_EQ(coordinator_->findUserStream("user-1").error().code, ProvisioningError::Code::NotFound);
    auto stream = provisionActive("user-1");
    auto found = coordinator_->findUserStream("user-1");
    ASSERT_TRUE(found.isSuccess());
    EXPECT_EQ(found.value().id, stream.id);
}

TEST_F(ProvisioningCoordinatorTest, MarkConfigurationLostMovesActiveToError) {
    auto stream = provisionActive("user-1");

    auto lost = coordinator_->markConfigurationLost(stream.id, "mount missing after restart");
    ASSERT_TRUE(lost.isSuccess());
    EXPECT_EQ(lost.value().status, StreamStatus::Error);
    EXPECT_EQ(lost.value().lastError, "mount missing after restart");

    ASSERT_TRUE(coordinator_->suspend(provisionActive("user-2").id).isSuccess());
    auto suspended = coordinator_->findUserStream("user-2").value();
    auto untouched = coordinator_->markConfigurationLost(suspended.id, "ignored");
    ASSERT_TRUE(untouched.isSuccess());
    EXPECT_EQ(untouched.value().status, StreamStatus::Suspended);
}

TEST_F(ProvisioningCoordinatorTest, SongTitleAndListenersRequireActive) {
    auto stream = provisionActive("user-1");
    server_->setSource(stream.port, true, 2);

    ASSERT_TRUE(coordinator_->setSongTitle(stream.id, "Artist - Track").isSuccess());
    EXPECT_EQ(server_->lastSong(), "Artist - Track");

    auto listeners = coordinator_->listListeners(stream.id);
    ASSERT_TRUE(listeners.isSuccess());
    EXPECT_EQ(listeners.value().size(), 2u);

    ASSERT_TRUE(coordinator_->kickListener(stream.id, "uid-1").isSuccess());
    EXPECT_EQ(server_->kickedListeners(), std::vector<std::string>{"uid-1"});

    ASSERT_TRUE(coordinator_->suspend(stream.id).isSuccess());
    EXPECT_EQ(coordinator_->setSongTitle(stream.id, "x").error().code,
              ProvisioningError::Code::InvalidTransition);
    EXPECT_EQ(coordinator_->listListeners(stream.id).error().code,
              ProvisioningError::Code::InvalidTransition);
}

TEST_F(ProvisioningCoordinatorTest, PassThroughFailuresAreMapped) {
    auto stream = provisionActive("user-1");
    server_->setUnreachable(true);
    EXPECT_EQ(coordinator_->setSongTitle(stream.id, "x").error().code, ProvisioningError::Code::Unreachable);

    server_->setUnreachable(false);
    server_->dropMount(stream.port);
    EXPECT_EQ(coordinator_->setSongTitle(stream.id, "x").error().code,
              ProvisioningError::Code::ExternalConfigurationFailed);
}

// =============================================================================
// Callbacks
// =============================================================================

TEST_F(ProvisioningCoordinatorTest, CallbacksFireOnProvisionAndStop) {
    std::vector<StreamId> provisioned;
    std::vector<core::LifecycleEventType> stopped;
    coordinator_->setProvisionedCallback([&](const StreamRecord& stream) {
        provisioned.push_back(stream.id);
    });
    coordinator_->setStoppedCallback([&](const StreamRecord&, core::LifecycleEventType event) {
        stopped.push_back(event);
    });

    auto stream = provisionActive("user-1");
    ASSERT_TRUE(coordinator_->suspend(stream.id).isSuccess());
    ASSERT_TRUE(coordinator_->terminate(stream.id).isSuccess());
    ASSERT_TRUE(coordinator_->terminate(stream.id).isSuccess());

    EXPECT_EQ(provisioned, std::vector<StreamId>{stream.id});
    ASSERT_EQ(stopped.size(), 2u);
    EXPECT_EQ(stopped[0], core::LifecycleEventType::Suspended);
    EXPECT_EQ(stopped[1], core::LifecycleEventType::Terminated);

    // Repeat provisioning returns the existing stream without a callback.
    auto other = provisionActive("user-2");
    ASSERT_TRUE(coordinator_->provision(request("user-2")).isSuccess());
    EXPECT_EQ(provisioned.size(), 2u);
    EXPECT_EQ(provisioned.back(), other.id);
}

TEST_F(ProvisioningCoordinatorTest, StoppedCallbackMayReenterForSameStream) {
    std::vector<core::LifecycleEventType> stopped;
    coordinator_->setStoppedCallback([&](const StreamRecord& stream, core::LifecycleEventType event) {
        stopped.push_back(event);
        if (event == core::LifecycleEventType::Suspended) {
            StreamUpdate change;
            change.title = "Off air";
            EXPECT_TRUE(coordinator_->update(stream.id, change).isSuccess());
        } else {
            EXPECT_TRUE(coordinator_->terminate(stream.id).isSuccess());
        }
    });

    auto stream = provisionActive("user-1");
    ASSERT_TRUE(coordinator_->suspend(stream.id).isSuccess());
    EXPECT_EQ(stored(stream.id).title, "Off air");

    ASSERT_TRUE(coordinator_->terminate(stream.id).isSuccess());
    EXPECT_EQ(stored(stream.id).status, StreamStatus::Terminated);
    EXPECT_EQ(stopped, (std::vector<core::LifecycleEventType>{core::LifecycleEventType::Suspended,
                                                             core::LifecycleEventType::Terminated}));
    EXPECT_EQ(allocatedPorts(), 0u);
}

// =============================================================================
// Status sampler running alongside coordinator writes
// =============================================================================

TEST_F(ProvisioningCoordinatorTest, UpdateDoesNotEraseLivenessSampledMeanwhile) {
    auto stream = provisionActive("user-1");
    const TimePoint sampledAt = core::fromUnixMillis(core::toUnixMillis(core::SystemClock::now()));

    // The sample lands after update loaded the stream and before it saves again.
    server_->setCreateHook([&](const shoutcast::StreamServerConfig&) {
        auto recorded = store_->recordLiveness(stream.id, true, 42, sampledAt);
        EXPECT_TRUE(recorded.isSuccess());
    });

    StreamUpdate change;
    change.bitrate = 192;
    auto updated = coordinator_->update(stream.id, change);
    ASSERT_TRUE(updated.isSuccess()) << updated.error().message;
    EXPECT_EQ(server_->createCalls(), 2);

    auto after = stored(stream.id);
    EXPECT_EQ(after.bitrate, 192u);
    EXPECT_TRUE(after.isLive);
    EXPECT_EQ(after.currentListeners, 42u);
    EXPECT_EQ(after.peakListeners, 42u);
    EXPECT_EQ(after.lastConnectionAt, std::optional<TimePoint>(sampledAt));
}

TEST_F(ProvisioningCoordinatorTest, ConcurrentSamplesAndUpdatesKeepPeak) {
    auto stream = provisionActive("user-1");
    constexpr int rounds = 20;

    std::thread sampler([&]() {
        for (int i = 1; i <= rounds; ++i) {
            auto recorded = store_->recordLiveness(stream.id, true, static_cast<uint32_t>(i),
                                                   std::nullopt);
            EXPECT_TRUE(recorded.isSuccess());
        }
    });
    std::thread writer([&]() {
        for (int i = 0; i < rounds; ++i) {
            StreamUpdate change;
            change.bitrate = (i % 2 == 0) ? 192 : 128;
            EXPECT_TRUE(coordinator_->update(stream.id, change).isSuccess());
        }
    });
    sampler.join();
    writer.join();

    auto after = stored(stream.id);
    EXPECT_EQ(after.status, StreamStatus::Active);
    EXPECT_TRUE(after.isLive);
    EXPECT_EQ(after.peakListeners, static_cast<uint32_t>(rounds));
    EXPECT_EQ(after.currentListeners, static_cast<uint32_t>(rounds));
}

// =============================================================================
// Pool invariant
// =============================================================================

TEST_F(ProvisioningCoordinatorTest, EveryLiveStreamOwnsItsPort) {
    auto a = provisionActive("a");
    auto b = provisionActive("b");
    ASSERT_TRUE(coordinator_->terminate(a.id).isSuccess());
    auto c = provisionActive("c");
    ASSERT_TRUE(coordinator_->suspend(b.id).isSuccess());

    auto live = store_->listByStatus({StreamStatus::Provisioning, StreamStatus::Active,
                                      StreamStatus::Suspended, StreamStatus::Error});
    ASSERT_TRUE(live.isSuccess());
    ASSERT_EQ(live.value().size(), 2u);
    for (const auto& stream : live.value()) {
        auto port = pool_->getPort(stream.port).value();
        EXPECT_TRUE(port.allocated);
        EXPECT_EQ(port.streamId, std::optional<StreamId>(stream.id));
    }

    auto terminated = stored(a.id);
    auto port = pool_->getPort(terminated.port).value();
    EXPECT_NE(port.streamId, std::optional<StreamId>(a.id));
    EXPECT_EQ(port.streamId, std::optional<StreamId>(c.id));
}

} // namespace test
} // namespace provisioning
} // namespace streamprov
