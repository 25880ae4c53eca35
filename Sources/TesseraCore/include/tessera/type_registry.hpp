#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include "log.hpp"
#include "schema.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace tessera {

/// Key of the supertype entry in a type_map.
inline constexpr const char* supertype_key = "Default";

namespace detail {
    template<typename T, typename Variant>
    struct is_alternative_of : std::false_type {};

    template<typename T, typename... Ts>
    struct is_alternative_of<T, std::variant<Ts...>>
        : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};
}

/// One registered type: its discriminator name, schema and constructor.
template<typename Variant>
struct type_entry {
    using constructor_t = std::function<Variant(const nlohmann::json&)>;

    std::string name;
    constructor_t construct;          // empty for an abstract supertype
    schema_descriptor schema;
    bool auditable = false;
    bool soft_deletable = false;

    bool is_abstract() const { return !construct; }

    /// Concrete entry for alternative T, named after T.
    template<typename T>
    static type_entry of(schema_descriptor schema = entity_traits<T>::schema()) {
        static_assert(detail::is_alternative_of<T, Variant>::value,
                      "type_entry::of<T> requires T to be an alternative of the repository variant");
        type_entry entry;
        entry.name = entity_traits<T>::name;
        entry.construct = [](const nlohmann::json& doc) -> Variant {
            return Variant(std::in_place_type<T>, entity_traits<T>::from_document(doc));
        };
        entry.schema = std::move(schema);
        entry.auditable = has_audit<T>::value;
        entry.soft_deletable = is_soft_deletable<T>::value;
        return entry;
    }

    /// Supertype without a constructor. Documents that resolve to it cannot be hydrated.
    static type_entry abstract(schema_descriptor schema, std::string name = {}) {
        type_entry entry;
        entry.name = std::move(name);
        entry.schema = std::move(schema);
        return entry;
    }
};

template<typename Variant>
using type_map = std::map<std::string, type_entry<Variant>>;

/// Runtime type name of the alternative held by `value`.
template<typename Variant>
std::string runtime_type_name(const Variant& value) {
    return std::visit([](const auto& entity) -> std::string {
        using T = std::decay_t<decltype(entity)>;
        return entity_traits<T>::name;
    }, value);
}

// ============================================================================
// type_registry - supertype plus named subtypes of one collection
// ============================================================================

template<typename Variant>
class type_registry {
public:
    /// @throws configuration_error on a missing supertype entry, an unnamed
    ///         supertype, a key that differs from its entry name, or a
    ///         subtype without a constructor
    explicit type_registry(type_map<Variant> types,
                           std::optional<std::string> model_name = std::nullopt) {
        auto super_it = types.find(supertype_key);
        if (super_it == types.end()) {
            throw configuration_error("The given map must include domain supertype data");
        }
        supertype_ = std::move(super_it->second);
        types.erase(super_it);

        if (supertype_.name.empty()) {
            if (!model_name || model_name->empty()) {
                throw configuration_error(
                    "Either a base class must be provided or the model name must be specified in the options.");
            }
            supertype_.name = *model_name;
        }

        for (auto& [key, entry] : types) {
            if (entry.name.empty()) {
                entry.name = key;
            }
            if (key != entry.name) {
                throw configuration_error("Subtype key '" + key + "' does not match its type name '" +
                                          entry.name + "'");
            }
            if (entry.is_abstract()) {
                throw configuration_error("Subtype '" + key + "' must provide a constructor");
            }
            if (key == supertype_.name) {
                throw configuration_error("Subtype '" + key + "' collides with the supertype name");
            }
        }
        subtypes_ = std::move(types);
        LOG_DEBUG("registry", "Registered supertype %s with %zu subtypes",
                  supertype_.name.c_str(), subtypes_.size());
    }

    /// Entry for `name`: a subtype or the supertype. nullptr when unknown.
    const type_entry<Variant>* resolve(const std::string& name) const {
        if (name == supertype_.name) {
            return &supertype_;
        }
        auto it = subtypes_.find(name);
        return it == subtypes_.end() ? nullptr : &it->second;
    }

    const std::string& supertype_name() const { return supertype_.name; }

    /// Empty for an abstract supertype.
    const typename type_entry<Variant>::constructor_t& supertype_constructor() const {
        return supertype_.construct;
    }

    const type_entry<Variant>& supertype() const { return supertype_; }

    const type_map<Variant>& subtype_entries() const { return subtypes_; }

    bool contains(const std::string& name) const { return resolve(name) != nullptr; }

private:
    type_entry<Variant> supertype_;
    type_map<Variant> subtypes_;
};

} // namespace tessera

#endif // __cplusplus
