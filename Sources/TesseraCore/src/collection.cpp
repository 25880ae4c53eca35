#include "tessera/collection.hpp"
#include "tessera/errors.hpp"
#include "tessera/log.hpp"
#include <cctype>
#include <set>
#include <sstream>

namespace tessera {

namespace {

bool is_identifier(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

std::string index_name(const std::string& table, const std::string& field) {
    return "ux_" + table + "__" + field;
}

} // namespace

collection::collection(std::shared_ptr<database> conn,
                       std::string name,
                       schema_descriptor base_schema,
                       std::map<std::string, schema_descriptor> subtype_schemas)
    : conn_(std::move(conn)),
      name_(std::move(name)),
      base_schema_(std::move(base_schema)),
      subtype_schemas_(std::move(subtype_schemas)) {
    if (!conn_) {
        throw configuration_error("Collection '" + name_ + "' requires a connection");
    }
    if (!is_identifier(name_)) {
        throw configuration_error("Invalid collection name '" + name_ + "'");
    }
    connection_lease lease(conn_.get());
    ensure_storage();
}

void collection::ensure_storage() {
    if (conn_->is_read_only()) {
        LOG_DEBUG("collection", "Read-only connection, skipping storage setup for %s", name_.c_str());
        return;
    }

    conn_->execute("CREATE TABLE IF NOT EXISTS \"" + name_ + "\" ("
                   "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
                   "id TEXT UNIQUE NOT NULL, "
                   "doc TEXT NOT NULL)");

    // Unique fields across the supertype and every subtype share one index each
    std::set<std::string> unique_fields;
    auto collect = [&](const schema_descriptor& schema) {
        for (const auto& rule : schema.fields()) {
            if (rule.unique) unique_fields.insert(rule.name);
        }
    };
    collect(base_schema_);
    for (const auto& [_, schema] : subtype_schemas_) {
        collect(schema);
    }

    for (const auto& field : unique_fields) {
        if (!is_identifier(field)) {
            throw configuration_error("Invalid unique field name '" + field + "'");
        }
        conn_->execute("CREATE UNIQUE INDEX IF NOT EXISTS \"" + index_name(name_, field) + "\" ON \"" +
                       name_ + "\" (" + detail::field_expression(field) + ")");
    }
    LOG_DEBUG("collection", "Ensured %s with %zu unique indexes", name_.c_str(), unique_fields.size());
}

const schema_descriptor& collection::schema_for(const nlohmann::json& body) const {
    auto disc = body.find(discriminator_key);
    if (disc != body.end() && disc->is_string()) {
        auto it = subtype_schemas_.find(disc->get<std::string>());
        if (it != subtype_schemas_.end()) {
            return it->second;
        }
    }
    return base_schema_;
}

void collection::prepare(nlohmann::json& body) const {
    const auto& schema = schema_for(body);
    schema.strip_unknown(body);
    schema.validate(body);
}

void collection::rethrow_constraint(const constraint_error& e) const {
    // "UNIQUE constraint failed: index 'ux_books__isbn'" names the field through the index
    std::string message = e.what();
    std::string prefix = "ux_" + name_ + "__";
    auto pos = message.find(prefix);
    if (pos != std::string::npos) {
        auto start = pos + prefix.size();
        auto end = start;
        while (end < message.size() &&
               (std::isalnum(static_cast<unsigned char>(message[end])) || message[end] == '_')) {
            ++end;
        }
        auto field = message.substr(start, end - start);
        throw constraint_error("Duplicate value for unique field '" + field + "' in " + name_, field);
    }
    if (message.find(name_ + ".id") != std::string::npos) {
        throw constraint_error("Duplicate document id in " + name_, "id");
    }
    throw e;
}

stored_document collection::to_document(const database::row_t& row) {
    stored_document doc;
    doc.id = std::get<std::string>(row.at("id"));
    doc.seq = std::get<int64_t>(row.at("seq"));
    doc.raw = std::get<std::string>(row.at("doc"));
    try {
        doc.body = nlohmann::json::parse(doc.raw);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("collection", "Malformed document %s: %s", doc.id.c_str(), e.what());
        throw db_error("Malformed document " + doc.id + ": " + e.what());
    }
    return doc;
}

stored_document collection::insert(database& conn, nlohmann::json body) {
    prepare(body);

    stored_document doc;
    doc.id = uuid_t::generate().to_string();
    doc.raw = body.dump();
    doc.body = std::move(body);

    try {
        conn.execute("INSERT INTO \"" + name_ + "\" (id, doc) VALUES (?, ?)", {doc.id, doc.raw});
    } catch (const constraint_error& e) {
        rethrow_constraint(e);
    }
    doc.seq = conn.last_insert_rowid();
    LOG_DEBUG("collection", "Inserted %s into %s", doc.id.c_str(), name_.c_str());
    return doc;
}

std::optional<stored_document> collection::find_by_id(database& conn, const document_id_t& id) {
    auto rows = conn.query("SELECT seq, id, doc FROM \"" + name_ + "\" WHERE id = ?", {id});
    if (rows.empty()) {
        return std::nullopt;
    }
    return to_document(rows.front());
}

std::vector<stored_document> collection::find(database& conn,
                                              const filter* where,
                                              const sort_spec* order,
                                              int64_t limit,
                                              int64_t skip) {
    std::ostringstream sql;
    std::vector<column_value_t> params;

    sql << "SELECT seq, id, doc FROM \"" << name_ << "\"";
    if (where) {
        sql << " WHERE ";
        where->to_sql(sql, params);
    }
    sql << " ORDER BY ";
    if (order) {
        order->to_sql(sql);
    } else {
        sql << "seq ASC";
    }
    if (limit >= 0 || skip > 0) {
        sql << " LIMIT ? OFFSET ?";
        params.push_back(limit >= 0 ? limit : int64_t{-1});
        params.push_back(skip > 0 ? skip : int64_t{0});
    }

    auto rows = conn.query(sql.str(), params);
    std::vector<stored_document> docs;
    docs.reserve(rows.size());
    for (const auto& row : rows) {
        docs.push_back(to_document(row));
    }
    return docs;
}

std::optional<stored_document> collection::find_one(database& conn,
                                                    const filter* where,
                                                    const sort_spec* order) {
    auto docs = find(conn, where, order, 1, 0);
    if (docs.empty()) {
        return std::nullopt;
    }
    return std::move(docs.front());
}

stored_document collection::replace(database& conn, const stored_document& current, nlohmann::json body) {
    prepare(body);

    stored_document doc;
    doc.id = current.id;
    doc.seq = current.seq;
    doc.raw = body.dump();
    doc.body = std::move(body);

    try {
        conn.execute("UPDATE \"" + name_ + "\" SET doc = ? WHERE id = ? AND doc = ?",
                     {doc.raw, doc.id, current.raw});
    } catch (const constraint_error& e) {
        rethrow_constraint(e);
    }
    if (conn.changes() == 0) {
        LOG_WARN("collection", "Stale write on %s in %s", doc.id.c_str(), name_.c_str());
        throw constraint_error("Document '" + doc.id + "' was modified concurrently", version_key);
    }
    return doc;
}

bool collection::remove(database& conn, const document_id_t& id) {
    conn.execute("DELETE FROM \"" + name_ + "\" WHERE id = ?", {id});
    return conn.changes() > 0;
}

int64_t collection::count(database& conn, const filter* where) {
    std::ostringstream sql;
    std::vector<column_value_t> params;
    sql << "SELECT COUNT(*) AS n FROM \"" << name_ << "\"";
    if (where) {
        sql << " WHERE ";
        where->to_sql(sql, params);
    }
    auto rows = conn.query(sql.str(), params);
    return rows.empty() ? 0 : std::get<int64_t>(rows.front().at("n"));
}

} // namespace tessera
