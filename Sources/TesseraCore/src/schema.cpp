#include "tessera/schema.hpp"
#include "tessera/errors.hpp"
#include <algorithm>
#include <array>

namespace tessera {

const char* to_string(field_type type) {
    switch (type) {
        case field_type::string: return "string";
        case field_type::integer: return "integer";
        case field_type::number: return "number";
        case field_type::boolean: return "boolean";
        case field_type::array: return "array";
        case field_type::timestamp: return "timestamp";
    }
    return "unknown";
}

bool is_reserved_key(const std::string& key) {
    static const std::array<const char*, 6> reserved = {
        discriminator_key, version_key, created_at_key, created_by_key, updated_at_key, updated_by_key
    };
    return std::any_of(reserved.begin(), reserved.end(),
                       [&](const char* r) { return key == r; });
}

schema_descriptor::schema_descriptor(std::vector<field_rule> fields) : fields_(std::move(fields)) {}

const field_rule* schema_descriptor::field(const std::string& name) const {
    for (const auto& rule : fields_) {
        if (rule.name == name) return &rule;
    }
    return nullptr;
}

field_rule& schema_descriptor::mutable_field(const std::string& name) {
    for (auto& rule : fields_) {
        if (rule.name == name) return rule;
    }
    throw configuration_error("Unknown schema field '" + name + "'");
}

schema_descriptor& schema_descriptor::require(const std::string& name) {
    mutable_field(name).required = true;
    return *this;
}

schema_descriptor& schema_descriptor::optional(const std::string& name) {
    mutable_field(name).required = false;
    return *this;
}

schema_descriptor& schema_descriptor::unique(const std::string& name) {
    mutable_field(name).unique = true;
    return *this;
}

schema_descriptor& schema_descriptor::add(field_rule rule) {
    if (has_field(rule.name)) {
        throw configuration_error("Duplicate schema field '" + rule.name + "'");
    }
    fields_.push_back(std::move(rule));
    return *this;
}

void schema_descriptor::strip_unknown(nlohmann::json& doc) const {
    for (auto it = doc.begin(); it != doc.end();) {
        if (!has_field(it.key()) && !is_reserved_key(it.key())) {
            it = doc.erase(it);
        } else {
            ++it;
        }
    }
}

namespace {

bool matches_type(const nlohmann::json& value, field_type type) {
    switch (type) {
        case field_type::string: return value.is_string();
        case field_type::integer: return value.is_number_integer();
        case field_type::number: return value.is_number();
        case field_type::boolean: return value.is_boolean();
        case field_type::array: return value.is_array();
        case field_type::timestamp: return value.is_number_integer();
    }
    return false;
}

} // namespace

void schema_descriptor::validate(const nlohmann::json& doc) const {
    if (!doc.is_object()) {
        throw constraint_error("Document validation failed: document must be an object", std::string{});
    }
    for (const auto& rule : fields_) {
        auto it = doc.find(rule.name);
        bool missing = it == doc.end() || it->is_null() ||
                       (it->is_string() && it->get_ref<const std::string&>().empty());
        if (missing) {
            if (rule.required) {
                throw constraint_error("Document validation failed: field '" + rule.name + "' is required",
                                       rule.name);
            }
            continue;
        }
        if (!matches_type(*it, rule.type)) {
            throw constraint_error("Document validation failed: field '" + rule.name + "' must be of type " +
                                       to_string(rule.type),
                                   rule.name);
        }
    }
}

} // namespace tessera
