#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "filter.hpp"
#include <memory>
#include <optional>
#include <string>

namespace tessera {

class session;

/// Per-call options. Each operation reads the members that apply to it.
struct operation_options {
    /// Joins the session's transaction instead of running on its own.
    tessera::session* session = nullptr;

    /// find_one, find_all, delete_all
    std::optional<filter> filters;

    /// find_all
    std::optional<tessera::pageable> pageable;

    /// find_one, find_all
    std::optional<sort_spec> sort_by;

    /// save, save_all: stamped into createdBy/updatedBy of auditable entities
    std::optional<std::string> user_id;
};

/// Construction-time repository setup.
struct repository_options {
    /// Defaults to tessera::default_connection()
    std::shared_ptr<database> connection;

    /// Defaults to the supertype name, lowercased, with an "s" appended
    std::string collection_name;

    /// Supertype name for a supertype entry that has none
    std::string model_name;
};

} // namespace tessera

#endif // __cplusplus
