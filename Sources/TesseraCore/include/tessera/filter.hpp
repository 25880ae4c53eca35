#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace tessera {

// ============================================================================
// filter - structured predicate over stored documents
//
// Field names address top-level document fields; "id" addresses the document
// id and "__t" the discriminator. Compiled to a SQL WHERE fragment over
// json_extract(doc, ...), with every value bound as a parameter.
// ============================================================================

class filter {
public:
    enum class op {
        all,        // matches every document
        null,       // explicit null predicate; never compiled
        eq,
        ne,
        lt,
        lte,
        gt,
        gte,
        in,
        exists,
        contains,   // array field holds the value
        all_of,
        any_of
    };

    filter() : op_(op::all) {}

    static filter all() { return filter(); }
    static filter null();

    static filter eq(std::string field, nlohmann::json value);
    static filter ne(std::string field, nlohmann::json value);
    static filter lt(std::string field, nlohmann::json value);
    static filter lte(std::string field, nlohmann::json value);
    static filter gt(std::string field, nlohmann::json value);
    static filter gte(std::string field, nlohmann::json value);
    static filter in(std::string field, std::vector<nlohmann::json> values);
    static filter exists(std::string field, bool present = true);
    static filter contains(std::string field, nlohmann::json value);
    static filter all_of(std::vector<filter> children);
    static filter any_of(std::vector<filter> children);

    /// Parses the object syntax: {"title": "x", "edition": {"$gte": 2}, "$or": [...]}.
    /// JSON null parses to filter::null().
    /// @throws invalid_argument_error on an unknown operator or malformed value
    static filter parse(const nlohmann::json& spec);

    op kind() const { return op_; }
    bool is_null() const { return op_ == op::null; }
    const std::string& field() const { return field_; }
    const nlohmann::json& value() const { return value_; }
    const std::vector<filter>& children() const { return children_; }

    /// Appends the WHERE fragment to `sql` and its parameters to `params`.
    /// @throws invalid_argument_error for the null predicate
    void to_sql(std::ostringstream& sql, std::vector<column_value_t>& params) const;

private:
    filter(op o, std::string field, nlohmann::json value);

    op op_;
    std::string field_;
    nlohmann::json value_;
    std::vector<filter> children_;
};

// ============================================================================
// sort_spec - ordered sort keys; ties fall back to storage order
// ============================================================================

struct sort_key {
    std::string field;
    bool ascending = true;
};

class sort_spec {
public:
    sort_spec() = default;

    static sort_spec by(std::string field, bool ascending = true);
    sort_spec& then(std::string field, bool ascending = true);

    /// {"title": 1, "edition": -1}, {"title": "asc"}, or "-edition"
    static sort_spec parse(const nlohmann::json& spec);

    const std::vector<sort_key>& keys() const { return keys_; }
    bool empty() const { return keys_.empty(); }

    /// Appends the ORDER BY expression list (without the keyword).
    void to_sql(std::ostringstream& sql) const;

private:
    std::vector<sort_key> keys_;
};

// ============================================================================
// pageable - 1-based page number and page size ("offset")
// ============================================================================

struct pageable {
    int64_t page_number = 0;
    int64_t offset = 0;

    /// Both values must be positive for paging to apply
    bool is_paged() const { return page_number > 0 && offset > 0; }

    /// Rows before the page; saturates at INT64_MAX
    int64_t skip() const {
        if (!is_paged()) return 0;
        if (page_number - 1 > std::numeric_limits<int64_t>::max() / offset) {
            return std::numeric_limits<int64_t>::max();
        }
        return (page_number - 1) * offset;
    }
};

namespace detail {
    /// SQL expression addressing a document field
    std::string field_expression(const std::string& field);
}

} // namespace tessera

#endif // __cplusplus
