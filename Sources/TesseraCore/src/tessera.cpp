// Process-wide state: log level and the default connection.

#include "tessera/connection.hpp"
#include <mutex>

namespace tessera {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

namespace {

std::mutex& default_connection_mutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<database>& default_connection_slot() {
    static std::shared_ptr<database> slot;
    return slot;
}

} // namespace

std::shared_ptr<database> open_connection(const configuration& config) {
    auto mode = config.read_only ? database::open_mode::read_only : database::open_mode::read_write;
    return std::make_shared<database>(config.path, mode, config.busy_timeout_ms);
}

std::shared_ptr<database> connect(const configuration& config) {
    set_log_level(config.level);
    auto conn = open_connection(config);

    std::lock_guard<std::mutex> lock(default_connection_mutex());
    default_connection_slot() = conn;
    LOG_INFO("connection", "Default connection set to %s", config.path.c_str());
    return conn;
}

std::shared_ptr<database> default_connection() {
    std::lock_guard<std::mutex> lock(default_connection_mutex());
    auto conn = default_connection_slot();
    if (!conn) {
        throw configuration_error("No connection available: call tessera::connect() or pass one in the options");
    }
    return conn;
}

void disconnect() {
    std::lock_guard<std::mutex> lock(default_connection_mutex());
    default_connection_slot().reset();
}

} // namespace tessera
