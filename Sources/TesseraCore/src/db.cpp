#include "tessera/db.hpp"
#include "tessera/log.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace tessera {

namespace {
constexpr int max_total_wait_ms = 30000;
}

database::database(const std::string& path, open_mode mode, int busy_timeout_ms)
    : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    flags |= mode == open_mode::read_only ? SQLITE_OPEN_READONLY
                                          : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    // WAL only makes sense for file-backed read-write connections
    if (mode == open_mode::read_write && path != ":memory:" && !path.empty()) {
        execute("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA temp_store = MEMORY");

    sqlite3_busy_timeout(db_, busy_timeout_ms);
    LOG_DEBUG("db", "Opened %s", path.c_str());
}

database::~database() {
    if (db_) {
        if (mode_ == open_mode::read_write) {
            sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
        }
        sqlite3_close(db_);
    }
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            if ((rc & 0xff) == SQLITE_CONSTRAINT) {
                throw constraint_error("SQL execution failed: " + error, std::string{});
            }
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
        return;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare statement: %s (SQL: %s)", sqlite3_errmsg(db_), sql.c_str());
        throw db_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        // Read the message before finalize resets the statement
        int code = sqlite3_extended_errcode(db_);
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        if ((code & 0xff) == SQLITE_CONSTRAINT) {
            LOG_DEBUG("db", "Constraint violation: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw constraint_error("Execution failed: " + error, std::string{});
        }
        LOG_ERROR("db", "Execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Execution failed: " + error);
    }
    sqlite3_finalize(stmt);
}

int64_t database::changes() const {
    return sqlite3_changes(db_);
}

int64_t database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

bool database::is_read_only() const {
    return sqlite3_db_readonly(db_, "main") == 1;
}

bool database::table_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare table_exists statement: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare statement");
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT:
        case SQLITE_BLOB: {
            // Documents are stored as text; blobs read back as their bytes
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "", static_cast<size_t>(sqlite3_column_bytes(stmt, index)));
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "%s in %s", sqlite3_errmsg(db_), sql.c_str());
        throw db_error("Failed to prepare query: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        LOG_ERROR("db", "Query failed: %s", error.c_str());
        throw db_error("Query failed: " + error);
    }
    sqlite3_finalize(stmt);

    return results;
}

void database::begin_transaction() {
    // IMMEDIATE: acquires the write lock up front, readers still allowed (WAL mode).
    const char* sql = "BEGIN IMMEDIATE";
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);

    // Retry with exponential backoff while another connection holds the write
    // lock. Threads sharing this connection are serialized by acquire().
    int backoff_ms = 1;
    const int max_backoff_ms = 1000;
    int total_waited_ms = 0;

    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && total_waited_ms < max_total_wait_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        total_waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, max_backoff_ms);
        rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Failed to begin transaction: %s", error.c_str());
        throw db_error("Failed to begin transaction: " + error);
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active
    return sqlite3_get_autocommit(db_) == 0;
}

void database::acquire() {
    std::unique_lock<std::mutex> lock(owner_mutex_);
    auto self = std::this_thread::get_id();
    if (owner_depth_ > 0 && owner_ == self) {
        ++owner_depth_;
        return;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(max_total_wait_ms);
    if (!owner_released_.wait_until(lock, deadline, [this] { return owner_depth_ == 0; })) {
        LOG_ERROR("db", "Timed out waiting for connection %s", path_.c_str());
        throw db_error("Timed out waiting for connection " + path_);
    }
    owner_ = self;
    owner_depth_ = 1;
}

void database::release() {
    {
        std::lock_guard<std::mutex> lock(owner_mutex_);
        if (owner_depth_ == 0 || --owner_depth_ > 0) {
            return;
        }
        owner_ = std::thread::id();
    }
    owner_released_.notify_all();
}

bool database::is_held_by_current_thread() const {
    std::lock_guard<std::mutex> lock(owner_mutex_);
    return owner_depth_ > 0 && owner_ == std::this_thread::get_id();
}

// Transaction RAII guard
transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            // Destructors must not throw; the connection reports the failure
            LOG_ERROR("db", "Rollback in transaction guard failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    completed_ = true;
    db_.rollback();
}

} // namespace tessera
