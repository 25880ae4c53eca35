#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "log.hpp"
#include <memory>
#include <string>

namespace tessera {

// ============================================================================
// Connection configuration
// ============================================================================

struct configuration {
    /// Database file path. Use ":memory:" for in-memory database.
    std::string path = ":memory:";

    /// Open the database read-only. No collection tables or indexes are created,
    /// so every write operation fails with db_error.
    bool read_only = false;

    /// How long a statement waits on a locked database before failing.
    int busy_timeout_ms = 5000;

    /// Applied to the process-wide log level by connect().
    log_level level = log_level::off;

    // Default constructor - in-memory
    configuration() = default;

    // Path only - file-based
    explicit configuration(const std::string& p) : path(p) {}
};

/// Opens a connection described by `config` without installing it as the default.
std::shared_ptr<database> open_connection(const configuration& config);

/// Opens a connection and installs it as the process-wide default used by
/// repositories and transaction coordinators built without an explicit one.
std::shared_ptr<database> connect(const configuration& config = configuration{});

/// Returns the installed default connection.
/// @throws configuration_error if connect() has not been called.
std::shared_ptr<database> default_connection();

/// Drops the default connection. Repositories holding it keep it alive.
void disconnect();

} // namespace tessera

#endif // __cplusplus
