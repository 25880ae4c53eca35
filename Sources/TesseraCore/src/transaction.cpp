#include "tessera/transaction.hpp"

namespace tessera {

session::session(std::shared_ptr<database> conn)
    : conn_(std::move(conn)), id_(uuid_t::generate().to_string()) {
    if (!conn_) {
        throw configuration_error("A session requires a connection");
    }
    if (conn_->is_held_by_current_thread()) {
        throw invalid_argument_error("A unit of work is already open on this connection; "
                                     "pass its session to join it");
    }
    lease_ = std::make_unique<connection_lease>(conn_.get());
    tx_ = std::make_unique<transaction>(*conn_);
    LOG_DEBUG("transaction", "Session %s started", id_.c_str());
}

session::~session() {
    if (is_active()) {
        LOG_DEBUG("transaction", "Session %s ended without commit, rolling back", id_.c_str());
    }
    // The transaction guard rolls back anything left open
    tx_.reset();
    lease_.reset();
}

void session::commit() {
    if (!is_active()) {
        throw invalid_argument_error("Session " + id_ + " is no longer active");
    }
    tx_->commit();
    lease_.reset();
    LOG_DEBUG("transaction", "Session %s committed", id_.c_str());
}

void session::abort() {
    if (!is_active()) {
        return;
    }
    tx_->rollback();
    lease_.reset();
    LOG_DEBUG("transaction", "Session %s aborted", id_.c_str());
}

transaction_coordinator::transaction_coordinator(std::shared_ptr<database> conn)
    : conn_(conn ? std::move(conn) : default_connection()) {}

} // namespace tessera
