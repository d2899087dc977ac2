// StreamProv - Dedicated stream provisioning service
// Server Registry - Configured streaming-server instances
//
// Exactly one active server is designated primary and receives new
// provisioning requests. Multiple rows are supported, but only the
// primary is ever targeted.

#ifndef STREAMPROV_STORAGE_SERVER_REGISTRY_HPP
#define STREAMPROV_STORAGE_SERVER_REGISTRY_HPP

#include <memory>
#include <string>
#include <vector>

#include "streamprov/core/result.hpp"
#include "streamprov/core/types.hpp"
#include "streamprov/storage/database.hpp"
#include "streamprov/storage/records.hpp"

namespace streamprov {
namespace storage {

class ServerRegistry {
public:
    explicit ServerRegistry(std::shared_ptr<Database> db);

    /**
     * @brief Insert or update a server by name.
     *
     * When server.isPrimary is set, every other row loses the primary flag.
     * @return The server id
     */
    core::Result<core::ServerId, StorageError> upsert(const ServerRecord& server);

    /**
     * @brief The active primary server.
     * @return NotFound when none is configured
     */
    core::Result<ServerRecord, StorageError> primary();

    core::Result<ServerRecord, StorageError> findById(core::ServerId id);

    core::Result<std::vector<ServerRecord>, StorageError> list();

    /**
     * @brief Make id the only primary server.
     */
    core::Result<void, StorageError> setPrimary(core::ServerId id);

    core::Result<void, StorageError> recordHealthCheck(
        core::ServerId id, const std::string& healthStatus, uint32_t currentStreams, TimePoint at);

private:
    std::shared_ptr<Database> db_;
};

} // namespace storage
} // namespace streamprov

#endif // STREAMPROV_STORAGE_SERVER_REGISTRY_HPP
