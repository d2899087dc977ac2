// StreamProv - Dedicated stream provisioning service
// Database schema

#ifndef STREAMPROV_STORAGE_SCHEMA_HPP
#define STREAMPROV_STORAGE_SCHEMA_HPP

#include "streamprov/core/result.hpp"
#include "streamprov/storage/database.hpp"

namespace streamprov {
namespace storage {

constexpr int SCHEMA_VERSION = 1;

/**
 * @brief Create tables and indexes that do not exist yet.
 *
 * Safe to call on every start. Records SCHEMA_VERSION in user_version.
 */
core::Result<void, StorageError> applySchema(Database& db);

} // namespace storage
} // namespace streamprov

#endif // STREAMPROV_STORAGE_SCHEMA_HPP
