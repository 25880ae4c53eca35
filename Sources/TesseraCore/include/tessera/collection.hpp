#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "filter.hpp"
#include "schema.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tessera {

/// A document as read from a collection.
struct stored_document {
    document_id_t id;
    sequence_t seq = 0;
    nlohmann::json body;
    std::string raw;    // stored text, compared by replace()
};

// ============================================================================
// collection - one SQLite table of JSON documents
//
//   seq  INTEGER PRIMARY KEY AUTOINCREMENT   storage order
//   id   TEXT UNIQUE NOT NULL                generated UUID
//   doc  TEXT NOT NULL                       JSON body
//
// Every operation runs on the connection it is handed, so callers decide
// whether it joins a transaction.
// ============================================================================

class collection {
public:
    /// Creates the table and the unique field indexes unless the connection is read-only.
    /// @throws configuration_error for a name that is not a plain identifier
    collection(std::shared_ptr<database> conn,
               std::string name,
               schema_descriptor base_schema,
               std::map<std::string, schema_descriptor> subtype_schemas = {});

    const std::string& name() const { return name_; }
    const std::shared_ptr<database>& connection() const { return conn_; }

    /// Validates `body` against the schema its discriminator selects and stores it
    /// under a fresh id.
    /// @throws constraint_error on a schema or unique index violation
    stored_document insert(database& conn, nlohmann::json body);

    std::optional<stored_document> find_by_id(database& conn, const document_id_t& id);

    /// `where` and `order` may be null. limit < 0 means no limit.
    std::vector<stored_document> find(database& conn,
                                      const filter* where,
                                      const sort_spec* order = nullptr,
                                      int64_t limit = -1,
                                      int64_t skip = 0);

    std::optional<stored_document> find_one(database& conn,
                                            const filter* where,
                                            const sort_spec* order = nullptr);

    /// Overwrites `current` only if it is still stored unchanged.
    /// @throws constraint_error when the document was modified concurrently
    stored_document replace(database& conn, const stored_document& current, nlohmann::json body);

    /// True if a document was removed
    bool remove(database& conn, const document_id_t& id);

    int64_t count(database& conn, const filter* where = nullptr);

private:
    void ensure_storage();
    const schema_descriptor& schema_for(const nlohmann::json& body) const;
    void prepare(nlohmann::json& body) const;
    [[noreturn]] void rethrow_constraint(const constraint_error& e) const;
    static stored_document to_document(const database::row_t& row);

    std::shared_ptr<database> conn_;
    std::string name_;
    schema_descriptor base_schema_;
    std::map<std::string, schema_descriptor> subtype_schemas_;
};

} // namespace tessera

#endif // __cplusplus
