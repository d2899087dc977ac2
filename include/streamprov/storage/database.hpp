// StreamProv - Dedicated stream provisioning service
// SQLite database-of-record
//
// Responsibilities:
// - Own the sqlite3 connection (RAII)
// - Prepared statements with typed bind/column helpers
// - Serialized, nestable transactions
//
// All stores share one Database. Every statement sequence runs under the
// database's recursive mutex, so a store operation that issues several
// statements is never interleaved with another thread's.

#ifndef STREAMPROV_STORAGE_DATABASE_HPP
#define STREAMPROV_STORAGE_DATABASE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "streamprov/core/error_codes.hpp"
#include "streamprov/core/result.hpp"
#include "streamprov/core/types.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace streamprov {
namespace storage {

struct StorageError {
    enum class Code {
        None,
        OpenFailed,
        PrepareFailed,
        BindFailed,
        StepFailed,
        ConstraintViolation,  ///< UNIQUE / FOREIGN KEY / CHECK failed
        NotFound,             ///< Row does not exist
        TransactionFailed
    };

    Code code = Code::None;
    std::string message;
    int sqliteCode = 0;

    StorageError() = default;
    StorageError(Code c, std::string msg, int rc = 0)
        : code(c), message(std::move(msg)), sqliteCode(rc) {}
};

core::ErrorCode toErrorCode(StorageError::Code code);

/**
 * @brief A prepared statement. Move-only; finalized on destruction.
 *
 * Parameter and column indexes follow sqlite: binds are 1-based,
 * columns are 0-based.
 */
class Statement {
public:
    Statement(sqlite3* db, sqlite3_stmt* stmt);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    core::Result<void, StorageError> bind(int index, int64_t value);
    core::Result<void, StorageError> bind(int index, double value);
    core::Result<void, StorageError> bind(int index, const std::string& value);
    core::Result<void, StorageError> bindNull(int index);
    core::Result<void, StorageError> bind(int index, const std::optional<int64_t>& value);
    core::Result<void, StorageError> bind(int index, const std::optional<std::string>& value);

    /**
     * @brief Advance the statement.
     * @return true when a row is available, false when done
     */
    core::Result<bool, StorageError> step();

    /**
     * @brief Run to completion, discarding any rows.
     */
    core::Result<void, StorageError> run();

    void reset();

    int64_t columnInt64(int column) const;
    double columnDouble(int column) const;
    std::string columnText(int column) const;
    bool columnIsNull(int column) const;
    std::optional<int64_t> columnOptionalInt64(int column) const;
    std::optional<std::string> columnOptionalText(int column) const;

private:
    StorageError makeError(StorageError::Code code, const std::string& what, int rc) const;

    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

/**
 * @brief Binds consecutive parameters starting at 1, keeping the first failure.
 *
 * @code
 * ParameterBinder binder(stmt);
 * binder.text(userId).integer(port).timestamp(now);
 * if (binder.result().isError()) { ... }
 * @endcode
 */
class ParameterBinder {
public:
    explicit ParameterBinder(Statement& stmt) : stmt_(stmt) {}

    ParameterBinder& integer(int64_t value);
    ParameterBinder& real(double value);
    ParameterBinder& text(const std::string& value);
    ParameterBinder& optionalInteger(const std::optional<int64_t>& value);
    ParameterBinder& optionalText(const std::optional<std::string>& value);
    ParameterBinder& timestamp(TimePoint value);
    ParameterBinder& optionalTimestamp(const std::optional<TimePoint>& value);

    core::Result<void, StorageError> result() const;

private:
    void record(const core::Result<void, StorageError>& outcome);

    Statement& stmt_;
    int index_ = 0;
    bool failed_ = false;
    StorageError error_;
};

/**
 * @brief One SQLite connection shared by the stores.
 *
 * @code
 * auto db = Database::open(":memory:");
 * if (db.isError()) { ... }
 * auto stmt = db.value()->prepare("SELECT COUNT(*) FROM port_pool");
 * @endcode
 */
class Database {
public:
    using TransactionBody = std::function<core::Result<void, StorageError>()>;

    /**
     * @brief Open (creating if needed) the database file.
     *
     * Enables foreign keys; file databases use WAL journaling.
     */
    static core::Result<std::unique_ptr<Database>, StorageError> open(const std::string& path);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    core::Result<Statement, StorageError> prepare(const std::string& sql);

    /**
     * @brief Execute one or more statements without results.
     */
    core::Result<void, StorageError> execute(const std::string& sql);

    /**
     * @brief Run body inside a transaction.
     *
     * Commits when body succeeds, rolls back when it fails. Nested calls
     * from the same thread use savepoints. The database mutex is held
     * for the whole transaction.
     */
    core::Result<void, StorageError> transaction(const TransactionBody& body);

    int64_t lastInsertRowId() const;
    int changes() const;

    /**
     * @brief Lock held by stores around multi-statement operations.
     */
    std::unique_lock<std::recursive_mutex> lock() const;

    const std::string& path() const { return path_; }

private:
    Database(sqlite3* db, std::string path);

    sqlite3* db_;
    std::string path_;
    mutable std::recursive_mutex mutex_;
    uint32_t transactionDepth_ = 0;
};

} // namespace storage
} // namespace streamprov

#endif // STREAMPROV_STORAGE_DATABASE_HPP
