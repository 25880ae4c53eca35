#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace tessera {

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,           ///< Full read/write access (default)
        read_only             ///< Read-only access (for concurrent readers)
    };

    explicit database(const std::string& path,
                      open_mode mode = open_mode::read_write,
                      int busy_timeout_ms = 5000);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    bool table_exists(const std::string& name) const;

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return).
    // Constraint violations throw constraint_error, anything else db_error.
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Rows modified by the most recent INSERT/UPDATE/DELETE on this connection
    int64_t changes() const;

    /// Row id assigned by the most recent successful INSERT on this connection
    int64_t last_insert_rowid() const;

    bool is_read_only() const;

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Thread ownership. A thread holds the connection for a whole standalone
    // operation or session, so other threads never run inside its transaction.
    // Holding is reentrant for the owning thread.

    /// Blocks until no other thread holds the connection.
    /// @throws db_error after waiting 30 s
    void acquire();
    void release();
    bool is_held_by_current_thread() const;

    const std::string& path() const { return path_; }

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;

    mutable std::mutex owner_mutex_;
    std::condition_variable owner_released_;
    std::thread::id owner_;
    int owner_depth_ = 0;

    column_value_t extract_column(sqlite3_stmt* stmt, int index);
};

// RAII connection hold; a null database holds nothing
class connection_lease {
public:
    explicit connection_lease(database* db) : db_(db) {
        if (db_) db_->acquire();
    }
    ~connection_lease() {
        if (db_) db_->release();
    }

    connection_lease(const connection_lease&) = delete;
    connection_lease& operator=(const connection_lease&) = delete;

private:
    database* db_;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

    bool completed() const { return completed_; }

private:
    database& db_;
    bool completed_ = false;
};

} // namespace tessera

#endif // __cplusplus
