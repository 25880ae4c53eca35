#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace tessera {

// Document field types understood by schema validation
enum class field_type {
    string,
    integer,
    number,
    boolean,
    array,
    timestamp
};

const char* to_string(field_type type);

// Type trait to get field_type from C++ type
template<typename T, typename = void>
struct type_to_field;

template<> struct type_to_field<std::string> {
    static constexpr field_type value = field_type::string;
};
template<> struct type_to_field<bool> {
    static constexpr field_type value = field_type::boolean;
};
template<> struct type_to_field<timestamp_t> {
    static constexpr field_type value = field_type::timestamp;
};
template<typename T>
struct type_to_field<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static constexpr field_type value = field_type::integer;
};
template<typename T>
struct type_to_field<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static constexpr field_type value = field_type::number;
};

// Optional handling
template<typename T>
struct type_to_field<std::optional<T>> {
    static constexpr field_type value = type_to_field<T>::value;
};

// Vectors are stored as JSON arrays
template<typename T>
struct type_to_field<std::vector<T>> {
    static constexpr field_type value = field_type::array;
};

// Field rule (runtime info about a document field)
struct field_rule {
    std::string name;
    field_type type = field_type::string;
    bool required = false;
    bool unique = false;
};

/// Field rules of one entity type. Validation mirrors a strict document schema:
/// unknown fields are dropped, required fields must be present, non-null and
/// (for strings) non-empty, present values must match their declared type.
class schema_descriptor {
public:
    schema_descriptor() = default;
    explicit schema_descriptor(std::vector<field_rule> fields);

    const std::vector<field_rule>& fields() const { return fields_; }
    const field_rule* field(const std::string& name) const;
    bool has_field(const std::string& name) const { return field(name) != nullptr; }

    // Fluent rule adjustments; unknown names throw configuration_error
    schema_descriptor& require(const std::string& name);
    schema_descriptor& optional(const std::string& name);
    schema_descriptor& unique(const std::string& name);
    schema_descriptor& add(field_rule rule);

    /// Removes keys that are neither declared fields nor reserved keys.
    void strip_unknown(nlohmann::json& doc) const;

    /// @throws constraint_error naming the first offending field
    void validate(const nlohmann::json& doc) const;

private:
    field_rule& mutable_field(const std::string& name);
    std::vector<field_rule> fields_;
};

/// True for document keys the repository manages itself (__t, __v, audit keys).
bool is_reserved_key(const std::string& key);

// ============================================================================
// Entity declaration
// ============================================================================

/// Specialised by TESSERA_ENTITY: name, schema(), to_document(), from_document().
template<typename T>
struct entity_traits;

/// Sparse patch for T, specialised by TESSERA_ENTITY.
/// Each field is std::optional<decltype(T::field)>; nullopt means "not supplied".
template<typename T>
struct partial;

template<typename T>
const schema_descriptor& schema_of() {
    return entity_traits<T>::schema();
}

// Auditable entity families carry `tessera::audit_info audit`
template<typename T, typename = void>
struct has_audit : std::false_type {};

template<typename T>
struct has_audit<T, std::void_t<decltype(std::declval<T>().audit)>>
    : std::is_same<std::decay_t<decltype(std::declval<T>().audit)>, audit_info> {};

// Soft-deletable entity families carry `bool is_deleted`
template<typename T, typename = void>
struct is_soft_deletable : std::false_type {};

template<typename T>
struct is_soft_deletable<T, std::void_t<decltype(std::declval<T>().is_deleted)>>
    : std::is_same<std::decay_t<decltype(std::declval<T>().is_deleted)>, bool> {};

namespace detail {
    template<typename PropType>
    void add_field_rule(std::vector<field_rule>& out, const char* name) {
        field_rule rule;
        rule.name = name;
        rule.type = type_to_field<PropType>::value;
        // Optionals and arrays may be absent; everything else is required
        rule.required = !is_optional<PropType>::value && !is_vector<PropType>::value;
        out.push_back(std::move(rule));
    }

    template<typename T>
    void write_audit(nlohmann::json& doc, const T& entity) {
        if constexpr (has_audit<T>::value) {
            const auto& a = entity.audit;
            doc[version_key] = a.version;
            doc[created_at_key] = to_json_value(a.created_at);
            doc[created_by_key] = to_json_value(a.created_by);
            doc[updated_at_key] = to_json_value(a.updated_at);
            doc[updated_by_key] = to_json_value(a.updated_by);
        }
    }

    template<typename T>
    void read_audit(const nlohmann::json& doc, T& entity) {
        if constexpr (has_audit<T>::value) {
            auto& a = entity.audit;
            a.version = doc.value(version_key, int64_t{0});
            read_field(doc, created_at_key, a.created_at);
            read_field(doc, created_by_key, a.created_by);
            read_field(doc, updated_at_key, a.updated_at);
            read_field(doc, updated_by_key, a.updated_by);
        }
    }

    template<typename T>
    void read_id(const nlohmann::json& doc, T& entity) {
        read_field(doc, "id", entity.id);
    }

    template<typename FieldType>
    void write_patch_field(nlohmann::json& out, const char* name,
                           const std::optional<FieldType>& value) {
        if (value.has_value()) {
            out[name] = to_json_value(*value);
        }
    }
} // namespace detail

} // namespace tessera

// ============================================================================
// TESSERA_ENTITY Macro System
//
// Usage:
//   struct Book {
//       std::optional<std::string> id;
//       std::string title;
//       std::string isbn;
//   };
//   TESSERA_ENTITY(Book, title, isbn);
//
// `id` and an optional `tessera::audit_info audit` member are handled
// implicitly and must not be listed.
// ============================================================================

// FOR_EACH variadic macro helpers (recursive concatenation)
#define TFE_0(WHAT, cls)
#define TFE_1(WHAT, cls, X) WHAT(cls, X)
#define TFE_2(WHAT, cls, X, ...) WHAT(cls, X) TFE_1(WHAT, cls, __VA_ARGS__)
#define TFE_3(WHAT, cls, X, ...) WHAT(cls, X) TFE_2(WHAT, cls, __VA_ARGS__)
#define TFE_4(WHAT, cls, X, ...) WHAT(cls, X) TFE_3(WHAT, cls, __VA_ARGS__)
#define TFE_5(WHAT, cls, X, ...) WHAT(cls, X) TFE_4(WHAT, cls, __VA_ARGS__)
#define TFE_6(WHAT, cls, X, ...) WHAT(cls, X) TFE_5(WHAT, cls, __VA_ARGS__)
#define TFE_7(WHAT, cls, X, ...) WHAT(cls, X) TFE_6(WHAT, cls, __VA_ARGS__)
#define TFE_8(WHAT, cls, X, ...) WHAT(cls, X) TFE_7(WHAT, cls, __VA_ARGS__)
#define TFE_9(WHAT, cls, X, ...) WHAT(cls, X) TFE_8(WHAT, cls, __VA_ARGS__)
#define TFE_10(WHAT, cls, X, ...) WHAT(cls, X) TFE_9(WHAT, cls, __VA_ARGS__)
#define TFE_11(WHAT, cls, X, ...) WHAT(cls, X) TFE_10(WHAT, cls, __VA_ARGS__)
#define TFE_12(WHAT, cls, X, ...) WHAT(cls, X) TFE_11(WHAT, cls, __VA_ARGS__)
#define TFE_13(WHAT, cls, X, ...) WHAT(cls, X) TFE_12(WHAT, cls, __VA_ARGS__)
#define TFE_14(WHAT, cls, X, ...) WHAT(cls, X) TFE_13(WHAT, cls, __VA_ARGS__)
#define TFE_15(WHAT, cls, X, ...) WHAT(cls, X) TFE_14(WHAT, cls, __VA_ARGS__)
#define TFE_16(WHAT, cls, X, ...) WHAT(cls, X) TFE_15(WHAT, cls, __VA_ARGS__)

#define T_GET_MACRO(_0, _1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, _12, _13, _14, _15, _16, NAME, ...) NAME

#define T_FOR_EACH(action, cls, ...) \
    T_GET_MACRO(_0, __VA_ARGS__, \
        TFE_16, TFE_15, TFE_14, TFE_13, TFE_12, TFE_11, TFE_10, TFE_9, \
        TFE_8, TFE_7, TFE_6, TFE_5, TFE_4, TFE_3, TFE_2, TFE_1, TFE_0)(action, cls, __VA_ARGS__)

// Individual action macros (each includes its own terminator)
#define TESSERA_FIELD_RULE(cls, prop) \
    ::tessera::detail::add_field_rule<decltype(cls::prop)>(rules, #prop);

#define TESSERA_WRITE_FIELD(cls, prop) \
    doc[#prop] = ::tessera::detail::to_json_value(entity.prop);

#define TESSERA_READ_FIELD(cls, prop) \
    ::tessera::detail::read_field(doc, #prop, entity.prop);

#define TESSERA_DECLARE_PATCH_FIELD(cls, prop) \
    std::optional<decltype(cls::prop)> prop;

#define TESSERA_COPY_PATCH_FIELD(cls, prop) \
    patch.prop = entity.prop;

#define TESSERA_COLLECT_PATCH_FIELD(cls, prop) \
    ::tessera::detail::write_patch_field(out, #prop, this->prop);

// Main entity declaration macro
#define TESSERA_ENTITY(cls, ...) \
    template<> \
    struct tessera::entity_traits<cls> { \
        static constexpr const char* name = #cls; \
        \
        static const ::tessera::schema_descriptor& schema() { \
            static const ::tessera::schema_descriptor s = []() { \
                std::vector<::tessera::field_rule> rules; \
                T_FOR_EACH(TESSERA_FIELD_RULE, cls, __VA_ARGS__) \
                return ::tessera::schema_descriptor(std::move(rules)); \
            }(); \
            return s; \
        } \
        \
        /* Declared fields plus audit keys; the id lives outside the document body */ \
        static nlohmann::json to_document(const cls& entity) { \
            nlohmann::json doc = nlohmann::json::object(); \
            T_FOR_EACH(TESSERA_WRITE_FIELD, cls, __VA_ARGS__) \
            ::tessera::detail::write_audit(doc, entity); \
            return doc; \
        } \
        \
        static cls from_document(const nlohmann::json& doc) { \
            cls entity{}; \
            ::tessera::detail::read_id(doc, entity); \
            T_FOR_EACH(TESSERA_READ_FIELD, cls, __VA_ARGS__) \
            ::tessera::detail::read_audit(doc, entity); \
            return entity; \
        } \
    }; \
    template<> \
    struct tessera::partial<cls> { \
        std::optional<std::string> id; \
        T_FOR_EACH(TESSERA_DECLARE_PATCH_FIELD, cls, __VA_ARGS__) \
        \
        /* Only the supplied fields */ \
        nlohmann::json fields() const { \
            nlohmann::json out = nlohmann::json::object(); \
            T_FOR_EACH(TESSERA_COLLECT_PATCH_FIELD, cls, __VA_ARGS__) \
            return out; \
        } \
        \
        /* Every field supplied */ \
        static partial from(const cls& entity) { \
            partial patch; \
            patch.id = entity.id; \
            T_FOR_EACH(TESSERA_COPY_PATCH_FIELD, cls, __VA_ARGS__) \
            return patch; \
        } \
    }

#endif // __cplusplus
