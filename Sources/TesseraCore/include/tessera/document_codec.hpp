#pragma once

#ifdef __cplusplus

#include "collection.hpp"
#include "type_registry.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace tessera {

/// A document ready to be written, with the type it was produced from.
struct prepared_document {
    std::string type_name;
    nlohmann::json body;
};

// ============================================================================
// document_codec - stored documents <-> variant instances
// ============================================================================

template<typename Variant>
class document_codec {
public:
    explicit document_codec(const type_registry<Variant>& registry) : registry_(registry) {}

    /// nullopt in, nullopt out. A discriminator selects the subtype, otherwise
    /// the supertype constructor is used.
    /// @throws unregistered_constructor_error for an unknown discriminator or an abstract supertype
    /// @throws db_error when the stored body does not fit the resolved type
    std::optional<Variant> hydrate(const std::optional<stored_document>& stored) const {
        if (!stored) {
            return std::nullopt;
        }

        const type_entry<Variant>* entry = nullptr;
        auto disc = stored->body.find(discriminator_key);
        if (disc != stored->body.end() && disc->is_string()) {
            entry = registry_.resolve(disc->get<std::string>());
        } else {
            entry = &registry_.supertype();
        }

        if (!entry || entry->is_abstract()) {
            LOG_WARN("codec", "No constructor for document %s", stored->id.c_str());
            throw unregistered_constructor_error(
                "There is no registered instance constructor for the document with ID " + stored->id,
                disc != stored->body.end() && disc->is_string() ? disc->get<std::string>()
                                                                 : registry_.supertype_name());
        }

        nlohmann::json doc = stored->body;
        doc["id"] = stored->id;
        try {
            return entry->construct(doc);
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR("codec", "Malformed document %s: %s", stored->id.c_str(), e.what());
            throw db_error("Malformed document " + stored->id + ": " + e.what());
        }
    }

    /// Body for `value`, tagged with its type name unless it is the supertype.
    prepared_document dehydrate(const Variant& value) const {
        prepared_document out;
        out.type_name = runtime_type_name(value);
        out.body = std::visit([](const auto& entity) {
            using T = std::decay_t<decltype(entity)>;
            return entity_traits<T>::to_document(entity);
        }, value);
        if (out.type_name != registry_.supertype_name() && !out.body.contains(discriminator_key)) {
            out.body[discriminator_key] = out.type_name;
        }
        return out;
    }

private:
    const type_registry<Variant>& registry_;
};

} // namespace tessera

#endif // __cplusplus
