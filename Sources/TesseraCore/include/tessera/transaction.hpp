#pragma once

#ifdef __cplusplus

#include "connection.hpp"
#include "db.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <memory>
#include <string>
#include <type_traits>

namespace tessera {

// ============================================================================
// session - one open unit of work
//
// Holds the connection for the calling thread and begins a transaction on
// construction. Destroying a session that was neither committed nor aborted
// rolls the transaction back. Other threads wait for the session to end.
// ============================================================================

class session {
public:
    /// @throws invalid_argument_error if the calling thread already holds the
    ///         connection; nested work joins by passing the open session
    explicit session(std::shared_ptr<database> conn);
    ~session();

    session(const session&) = delete;
    session& operator=(const session&) = delete;

    database& db() { return *conn_; }
    const std::shared_ptr<database>& connection() const { return conn_; }
    const std::string& id() const { return id_; }

    bool is_active() const { return tx_ && !tx_->completed(); }

    /// @throws invalid_argument_error if the session already ended
    void commit();

    /// Rolls back; a no-op once the session has ended.
    void abort();

private:
    std::shared_ptr<database> conn_;
    std::string id_;
    std::unique_ptr<connection_lease> lease_;
    std::unique_ptr<transaction> tx_;
};

// ============================================================================
// transaction_coordinator - runs a unit of work inside one transaction
// ============================================================================

class transaction_coordinator {
public:
    /// Uses the default connection when `conn` is null.
    /// @throws configuration_error if neither is available
    explicit transaction_coordinator(std::shared_ptr<database> conn = nullptr);

    const std::shared_ptr<database>& connection() const { return conn_; }

    /// Invokes `work(session&)` and commits. With `outer` the work joins that
    /// session instead, and committing is left to its owner. Any exception
    /// aborts the transaction and propagates unchanged.
    template<typename F>
    auto run_in_transaction(F&& work, session* outer = nullptr) -> std::invoke_result_t<F, session&> {
        using result_t = std::invoke_result_t<F, session&>;
        if (outer) {
            if (!outer->is_active()) {
                throw invalid_argument_error("Session " + outer->id() + " is no longer active");
            }
            return work(*outer);
        }

        session s(conn_);
        try {
            if constexpr (std::is_void_v<result_t>) {
                work(s);
                s.commit();
            } else {
                result_t result = work(s);
                s.commit();
                return result;
            }
        } catch (...) {
            // The session destructor rolls back
            LOG_DEBUG("transaction", "Unit of work in session %s failed", s.id().c_str());
            throw;
        }
    }

private:
    std::shared_ptr<database> conn_;
};

} // namespace tessera

#endif // __cplusplus
