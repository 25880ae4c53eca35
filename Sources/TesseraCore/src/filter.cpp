#include "tessera/filter.hpp"
#include "tessera/errors.hpp"
#include <cctype>

namespace tessera {

namespace detail {

std::string field_expression(const std::string& field) {
    if (field.empty()) {
        throw invalid_argument_error("Filter and sort fields must not be empty");
    }
    for (char c : field) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            throw invalid_argument_error("Invalid field name '" + field + "'");
        }
    }
    if (field == "id") {
        return "id";
    }
    return "json_extract(doc, '$.\"" + field + "\"')";
}

} // namespace detail

filter::filter(op o, std::string field, nlohmann::json value)
    : op_(o), field_(std::move(field)), value_(std::move(value)) {
    // Validate the field name eagerly so bad filters fail before any query
    if (!field_.empty()) {
        detail::field_expression(field_);
    }
}

filter filter::null() {
    filter f;
    f.op_ = op::null;
    return f;
}

filter filter::eq(std::string field, nlohmann::json value) {
    return filter(op::eq, std::move(field), std::move(value));
}

filter filter::ne(std::string field, nlohmann::json value) {
    return filter(op::ne, std::move(field), std::move(value));
}

filter filter::lt(std::string field, nlohmann::json value) {
    return filter(op::lt, std::move(field), std::move(value));
}

filter filter::lte(std::string field, nlohmann::json value) {
    return filter(op::lte, std::move(field), std::move(value));
}

filter filter::gt(std::string field, nlohmann::json value) {
    return filter(op::gt, std::move(field), std::move(value));
}

filter filter::gte(std::string field, nlohmann::json value) {
    return filter(op::gte, std::move(field), std::move(value));
}

filter filter::in(std::string field, std::vector<nlohmann::json> values) {
    return filter(op::in, std::move(field), nlohmann::json(std::move(values)));
}

filter filter::exists(std::string field, bool present) {
    return filter(op::exists, std::move(field), present);
}

filter filter::contains(std::string field, nlohmann::json value) {
    return filter(op::contains, std::move(field), std::move(value));
}

filter filter::all_of(std::vector<filter> children) {
    filter f;
    f.op_ = op::all_of;
    f.children_ = std::move(children);
    return f;
}

filter filter::any_of(std::vector<filter> children) {
    filter f;
    f.op_ = op::any_of;
    f.children_ = std::move(children);
    return f;
}

namespace {

std::vector<filter> parse_list(const nlohmann::json& list, const std::string& op_name) {
    if (!list.is_array()) {
        throw invalid_argument_error("Operator " + op_name + " expects an array");
    }
    std::vector<filter> out;
    for (const auto& item : list) {
        out.push_back(filter::parse(item));
    }
    return out;
}

filter parse_field(const std::string& field, const nlohmann::json& condition) {
    // A plain value (or an object without operators) is an equality match
    if (!condition.is_object() || condition.empty() || condition.begin().key().rfind('$', 0) != 0) {
        return filter::eq(field, condition);
    }

    std::vector<filter> parts;
    for (auto it = condition.begin(); it != condition.end(); ++it) {
        const auto& op = it.key();
        const auto& value = it.value();
        if (op == "$eq") {
            parts.push_back(filter::eq(field, value));
        } else if (op == "$ne") {
            parts.push_back(filter::ne(field, value));
        } else if (op == "$lt") {
            parts.push_back(filter::lt(field, value));
        } else if (op == "$lte") {
            parts.push_back(filter::lte(field, value));
        } else if (op == "$gt") {
            parts.push_back(filter::gt(field, value));
        } else if (op == "$gte") {
            parts.push_back(filter::gte(field, value));
        } else if (op == "$in") {
            if (!value.is_array()) {
                throw invalid_argument_error("Operator $in on '" + field + "' expects an array");
            }
            parts.push_back(filter::in(field, value.get<std::vector<nlohmann::json>>()));
        } else if (op == "$exists") {
            if (!value.is_boolean()) {
                throw invalid_argument_error("Operator $exists on '" + field + "' expects a boolean");
            }
            parts.push_back(filter::exists(field, value.get<bool>()));
        } else if (op == "$contains") {
            parts.push_back(filter::contains(field, value));
        } else {
            throw invalid_argument_error("Unknown filter operator '" + op + "' on field '" + field + "'");
        }
    }
    if (parts.size() == 1) {
        return std::move(parts.front());
    }
    return filter::all_of(std::move(parts));
}

} // namespace

filter filter::parse(const nlohmann::json& spec) {
    if (spec.is_null()) {
        return filter::null();
    }
    if (!spec.is_object()) {
        throw invalid_argument_error("Filters must be a JSON object");
    }

    std::vector<filter> parts;
    for (auto it = spec.begin(); it != spec.end(); ++it) {
        const auto& key = it.key();
        if (key == "$and") {
            parts.push_back(filter::all_of(parse_list(it.value(), key)));
        } else if (key == "$or") {
            parts.push_back(filter::any_of(parse_list(it.value(), key)));
        } else if (!key.empty() && key[0] == '$') {
            throw invalid_argument_error("Unknown filter operator '" + key + "'");
        } else {
            parts.push_back(parse_field(key, it.value()));
        }
    }
    if (parts.empty()) {
        return filter::all();
    }
    if (parts.size() == 1) {
        return std::move(parts.front());
    }
    return filter::all_of(std::move(parts));
}

void filter::to_sql(std::ostringstream& sql, std::vector<column_value_t>& params) const {
    auto compare = [&](const char* sql_op) {
        sql << detail::field_expression(field_) << " " << sql_op << " ?";
        params.push_back(detail::to_column_value(value_));
    };

    switch (op_) {
        case op::all:
            sql << "1";
            break;
        case op::null:
            throw invalid_argument_error("Null filters cannot be evaluated");
        case op::eq:
            if (value_.is_null()) {
                sql << detail::field_expression(field_) << " IS NULL";
            } else {
                compare("=");
            }
            break;
        case op::ne:
            // IS NOT also matches documents lacking the field
            compare("IS NOT");
            break;
        case op::lt: compare("<"); break;
        case op::lte: compare("<="); break;
        case op::gt: compare(">"); break;
        case op::gte: compare(">="); break;
        case op::in: {
            if (value_.empty()) {
                sql << "0";
                break;
            }
            sql << detail::field_expression(field_) << " IN (";
            bool first = true;
            for (const auto& v : value_) {
                if (!first) sql << ", ";
                sql << "?";
                params.push_back(detail::to_column_value(v));
                first = false;
            }
            sql << ")";
            break;
        }
        case op::exists: {
            bool present = value_.get<bool>();
            if (field_ == "id") {
                sql << (present ? "1" : "0");
            } else {
                sql << "json_type(doc, '$.\"" << field_ << "\"') IS " << (present ? "NOT NULL" : "NULL");
            }
            break;
        }
        case op::contains:
            sql << "EXISTS (SELECT 1 FROM json_each(doc, '$.\"" << field_ << "\"') WHERE json_each.value = ?)";
            params.push_back(detail::to_column_value(value_));
            break;
        case op::all_of:
        case op::any_of: {
            if (children_.empty()) {
                sql << (op_ == op::all_of ? "1" : "0");
                break;
            }
            const char* joiner = op_ == op::all_of ? " AND " : " OR ";
            sql << "(";
            bool first = true;
            for (const auto& child : children_) {
                if (!first) sql << joiner;
                child.to_sql(sql, params);
                first = false;
            }
            sql << ")";
            break;
        }
    }
}

// ============================================================================
// sort_spec
// ============================================================================

sort_spec sort_spec::by(std::string field, bool ascending) {
    sort_spec spec;
    spec.then(std::move(field), ascending);
    return spec;
}

sort_spec& sort_spec::then(std::string field, bool ascending) {
    detail::field_expression(field);
    keys_.push_back({std::move(field), ascending});
    return *this;
}

sort_spec sort_spec::parse(const nlohmann::json& spec) {
    sort_spec result;
    if (spec.is_null()) {
        return result;
    }
    if (spec.is_string()) {
        auto field = spec.get<std::string>();
        bool ascending = true;
        if (!field.empty() && (field[0] == '-' || field[0] == '+')) {
            ascending = field[0] == '+';
            field.erase(0, 1);
        }
        result.then(std::move(field), ascending);
        return result;
    }
    if (!spec.is_object()) {
        throw invalid_argument_error("Sort specification must be a string or a JSON object");
    }
    for (auto it = spec.begin(); it != spec.end(); ++it) {
        const auto& direction = it.value();
        bool ascending;
        if (direction.is_number_integer() && (direction.get<int64_t>() == 1 || direction.get<int64_t>() == -1)) {
            ascending = direction.get<int64_t>() == 1;
        } else if (direction == "asc" || direction == "ascending") {
            ascending = true;
        } else if (direction == "desc" || direction == "descending") {
            ascending = false;
        } else {
            throw invalid_argument_error("Invalid sort direction for field '" + it.key() + "'");
        }
        result.then(it.key(), ascending);
    }
    return result;
}

void sort_spec::to_sql(std::ostringstream& sql) const {
    for (const auto& key : keys_) {
        sql << detail::field_expression(key.field) << (key.ascending ? " ASC" : " DESC") << ", ";
    }
    sql << "seq ASC";
}

} // namespace tessera
