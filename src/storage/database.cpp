// StreamProv - Dedicated stream provisioning service
// SQLite database-of-record implementation

#include "streamprov/storage/database.hpp"

#include <sqlite3.h>

namespace streamprov {
namespace storage {

using core::Result;

namespace {

StorageError::Code classify(int rc, StorageError::Code fallback) {
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return StorageError::Code::ConstraintViolation;
    }
    return fallback;
}

} // anonymous namespace

core::ErrorCode toErrorCode(StorageError::Code code) {
    switch (code) {
        case StorageError::Code::None:
            return core::ErrorCode::Success;
        case StorageError::Code::OpenFailed:
            return core::ErrorCode::StorageOpenFailed;
        case StorageError::Code::ConstraintViolation:
            return core::ErrorCode::StorageConstraintViolation;
        case StorageError::Code::NotFound:
            return core::ErrorCode::NotFound;
        case StorageError::Code::PrepareFailed:
        case StorageError::Code::BindFailed:
        case StorageError::Code::StepFailed:
            return core::ErrorCode::StorageQueryFailed;
        case StorageError::Code::TransactionFailed:
            return core::ErrorCode::StorageError;
    }
    return core::ErrorCode::StorageError;
}

// =============================================================================
// Statement
// =============================================================================

Statement::Statement(sqlite3* db, sqlite3_stmt* stmt)
    : db_(db)
    , stmt_(stmt)
{
}

Statement::~Statement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_)
    , stmt_(other.stmt_)
{
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

StorageError Statement::makeError(StorageError::Code code, const std::string& what, int rc) const {
    return StorageError(classify(rc, code), what + ": " + sqlite3_errmsg(db_), rc);
}

Result<void, StorageError> Statement::bind(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    if (rc != SQLITE_OK) {
        return Result<void, StorageError>::error(makeError(StorageError::Code::BindFailed, "bind", rc));
    }
    return Result<void, StorageError>::success();
}

Result<void, StorageError> Statement::bind(int index, double value) {
    int rc = sqlite3_bind_double(stmt_, index, value);
    if (rc != SQLITE_OK) {
        return Result<void, StorageError>::error(makeError(StorageError::Code::BindFailed, "bind", rc));
    }
    return Result<void, StorageError>::success();
}

Result<void, StorageError> Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Result<void, StorageError>::error(makeError(StorageError::Code::BindFailed, "bind", rc));
    }
    return Result<void, StorageError>::success();
}

Result<void, StorageError> Statement::bindNull(int index) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) {
        return Result<void, StorageError>::error(makeError(StorageError::Code::BindFailed, "bind", rc));
    }
    return Result<void, StorageError>::success();
}

Result<void, StorageError> Statement::bind(int index, const std::optional<int64_t>& value) {
    return value ? bind(index, *value) : bindNull(index);
}

Result<void, StorageError> Statement::bind(int index, const std::optional<std::string>& value) {
    return value ? bind(index, *value) : bindNull(index);
}

Result<bool, StorageError> Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return Result<bool, StorageError>::success(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, StorageError>::success(false);
    }
    return Result<bool, StorageError>::error(makeError(StorageError::Code::StepFailed, "step", rc));
}

Result<void, StorageError> Statement::run() {
    while (true) {
        auto stepped = step();
        if (stepped.isError()) {
            return Result<void, StorageError>::error(stepped.error());
        }
        if (!stepped.value()) {
            return Result<void, StorageError>::success();
        }
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t Statement::columnInt64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

double Statement::columnDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::columnText(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (text == nullptr) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

bool Statement::columnIsNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

std::optional<int64_t> Statement::columnOptionalInt64(int column) const {
    if (columnIsNull(column)) {
        return std::nullopt;
    }
    return columnInt64(column);
}

std::optional<std::string> Statement::columnOptionalText(int column) const {
    if (columnIsNull(column)) {
        return std::nullopt;
    }
    return columnText(column);
}

// =============================================================================
// ParameterBinder
// =============================================================================

void ParameterBinder::record(const Result<void, StorageError>& outcome) {
    if (!failed_ && outcome.isError()) {
        failed_ = true;
        error_ = outcome.error();
    }
}

ParameterBinder& ParameterBinder::integer(int64_t value) {
    record(stmt_.bind(++index_, value));
    return *this;
}

ParameterBinder& ParameterBinder::real(double value) {
    record(stmt_.bind(++index_, value));
    return *this;
}

ParameterBinder& ParameterBinder::text(const std::string& value) {
    record(stmt_.bind(++index_, value));
    return *this;
}

ParameterBinder& ParameterBinder::optionalInteger(const std::optional<int64_t>& value) {
    record(stmt_.bind(++index_, value));
    return *this;
}

ParameterBinder& ParameterBinder::optionalText(const std::optional<std::string>& value) {
    record(stmt_.bind(++index_, value));
    return *this;
}

ParameterBinder& ParameterBinder::timestamp(TimePoint value) {
    return integer(core::toUnixMillis(value));
}

ParameterBinder& ParameterBinder::optionalTimestamp(const std::optional<TimePoint>& value) {
    if (!value) {
        record(stmt_.bindNull(++index_));
        return *this;
    }
    return timestamp(*value);
}

Result<void, StorageError> ParameterBinder::result() const {
    if (failed_) {
        return Result<void, StorageError>::error(error_);
    }
    return Result<void, StorageError>::success();
}

// =============================================================================
// Database
// =============================================================================

Database::Database(sqlite3* db, std::string path)
    : db_(db)
    , path_(std::move(path))
{
}

Database::~Database() {
    if (db_ != nullptr) {
        sqlite3_close_v2(db_);
    }
}

Result<std::unique_ptr<Database>, StorageError> Database::open(const std::string& path) {
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        if (handle != nullptr) {
            sqlite3_close_v2(handle);
        }
        return Result<std::unique_ptr<Database>, StorageError>::error(
            StorageError(StorageError::Code::OpenFailed, "Cannot open " + path + ": " + reason, rc));
    }

    sqlite3_busy_timeout(handle, 5000);

    std::unique_ptr<Database> db(new Database(handle, path));

    auto pragmas = db->execute("PRAGMA foreign_keys = ON;");
    if (pragmas.isError()) {
        return Result<std::unique_ptr<Database>, StorageError>::error(pragmas.error());
    }
    if (path != ":memory:" && !path.empty()) {
        auto wal = db->execute("PRAGMA journal_mode = WAL; PRAGMA synchronous = NORMAL;");
        if (wal.isError()) {
            return Result<std::unique_ptr<Database>, StorageError>::error(wal.error());
        }
    }

    return Result<std::unique_ptr<Database>, StorageError>::success(std::move(db));
}

Result<Statement, StorageError> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt != nullptr) {
            sqlite3_finalize(stmt);
        }
        return Result<Statement, StorageError>::error(
            StorageError(StorageError::Code::PrepareFailed,
                         std::string("prepare: ") + sqlite3_errmsg(db_), rc));
    }
    return Result<Statement, StorageError>::success(Statement(db_, stmt));
}

Result<void, StorageError> Database::execute(const std::string& sql) {
    auto guard = lock();
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string reason = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        return Result<void, StorageError>::error(
            StorageError(classify(rc, StorageError::Code::StepFailed), "exec: " + reason, rc));
    }
    return Result<void, StorageError>::success();
}

Result<void, StorageError> Database::transaction(const TransactionBody& body) {
    auto guard = lock();

    const uint32_t depth = transactionDepth_;
    const std::string savepoint = "sp_" + std::to_string(depth);

    auto begun = execute(depth == 0 ? "BEGIN IMMEDIATE;" : "SAVEPOINT " + savepoint + ";");
    if (begun.isError()) {
        return Result<void, StorageError>::error(
            StorageError(StorageError::Code::TransactionFailed, begun.error().message,
                         begun.error().sqliteCode));
    }

    ++transactionDepth_;
    auto outcome = body();
    --transactionDepth_;

    if (outcome.isError()) {
        auto rolledBack = execute(depth == 0
            ? std::string("ROLLBACK;")
            : "ROLLBACK TO " + savepoint + "; RELEASE " + savepoint + ";");
        if (rolledBack.isError()) {
            return Result<void, StorageError>::error(
                StorageError(StorageError::Code::TransactionFailed,
                             outcome.error().message + " (rollback failed: " +
                             rolledBack.error().message + ")",
                             outcome.error().sqliteCode));
        }
        return outcome;
    }

    auto committed = execute(depth == 0 ? std::string("COMMIT;") : "RELEASE " + savepoint + ";");
    if (committed.isError()) {
        if (depth == 0) {
            auto rolledBack = execute("ROLLBACK;");
            if (rolledBack.isError()) {
                return Result<void, StorageError>::error(
                    StorageError(StorageError::Code::TransactionFailed,
                                 committed.error().message + " (rollback failed: " +
                                 rolledBack.error().message + ")",
                                 committed.error().sqliteCode));
            }
        }
        return Result<void, StorageError>::error(
            StorageError(StorageError::Code::TransactionFailed, committed.error().message,
                         committed.error().sqliteCode));
    }
    return Result<void, StorageError>::success();
}

int64_t Database::lastInsertRowId() const {
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::unique_lock<std::recursive_mutex> Database::lock() const {
    return std::unique_lock<std::recursive_mutex>(mutex_);
}

} // namespace storage
} // namespace streamprov
