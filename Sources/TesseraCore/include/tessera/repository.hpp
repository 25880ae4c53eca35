#pragma once

#ifdef __cplusplus

#include "collection.hpp"
#include "connection.hpp"
#include "document_codec.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "options.hpp"
#include "transaction.hpp"
#include "type_registry.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tessera {

// ============================================================================
// repository - CRUD over one collection of a polymorphic entity family
//
// Variant is a std::variant of TESSERA_ENTITY structs. The type map names the
// supertype under "Default" and each subtype under its type name, which is
// also the discriminator stored with subtype documents.
//
//   using AnyBook = std::variant<Book, PaperBook, AudioBook>;
//   tessera::repository<AnyBook> books({
//       {tessera::supertype_key, tessera::type_entry<AnyBook>::of<Book>()},
//       {"PaperBook", tessera::type_entry<AnyBook>::of<PaperBook>()},
//       {"AudioBook", tessera::type_entry<AnyBook>::of<AudioBook>()},
//   });
//   auto saved = books.save(PaperBook{...});
// ============================================================================

template<typename Variant>
class repository {
public:
    /// @throws configuration_error on an invalid type map or a missing connection
    explicit repository(type_map<Variant> types, const repository_options& options = {})
        : registry_(std::move(types), options.model_name.empty()
                                          ? std::nullopt
                                          : std::optional<std::string>(options.model_name)),
          codec_(registry_),
          conn_(options.connection ? options.connection : default_connection()),
          collection_(conn_,
                      options.collection_name.empty() ? default_collection_name(registry_.supertype_name())
                                                      : options.collection_name,
                      registry_.supertype().schema,
                      subtype_schemas(registry_)) {
        LOG_DEBUG("repository", "Repository for %s on collection %s",
                  registry_.supertype_name().c_str(), collection_.name().c_str());
    }

    virtual ~repository() = default;

    repository(const repository&) = delete;
    repository& operator=(const repository&) = delete;

    /// @throws invalid_argument_error for an empty id
    std::optional<Variant> find_by_id(const document_id_t& id, const operation_options& options = {}) {
        if (id.empty()) {
            throw invalid_argument_error("The given ID must be valid");
        }
        auto lease = lease_for(options);
        auto& conn = connection_for(options);
        return codec_.hydrate(collection_.find_by_id(conn, id));
    }

    /// `options.filters` wins over `where` unless it is the null filter.
    /// @throws invalid_argument_error when neither supplies a filter
    std::optional<Variant> find_one(std::optional<filter> where = std::nullopt,
                                    const operation_options& options = {}) {
        const filter* chosen = nullptr;
        if (options.filters && !options.filters->is_null()) {
            chosen = &*options.filters;
        } else if (where && !where->is_null()) {
            chosen = &*where;
        }
        if (!chosen) {
            throw invalid_argument_error("Missing search criteria (filters)");
        }
        auto lease = lease_for(options);
        auto& conn = connection_for(options);
        const sort_spec* order = options.sort_by ? &*options.sort_by : nullptr;
        return codec_.hydrate(collection_.find_one(conn, chosen, order));
    }

    /// Matches in sort order, then storage order. Paging applies only when
    /// both page number and offset are positive.
    /// @throws invalid_argument_error for a negative page number or offset
    std::vector<Variant> find_all(const operation_options& options = {}) {
        int64_t limit = -1;
        int64_t skip = 0;
        if (options.pageable) {
            if (options.pageable->page_number < 0) {
                throw invalid_argument_error("The given page number must be a positive number");
            }
            if (options.pageable->offset < 0) {
                throw invalid_argument_error("The given page offset must be a positive number");
            }
            if (options.pageable->is_paged()) {
                if (options.pageable->page_number - 1 >
                    std::numeric_limits<int64_t>::max() / options.pageable->offset) {
                    throw invalid_argument_error("The given page number is out of range for the page offset");
                }
                limit = options.pageable->offset;
                skip = options.pageable->skip();
            }
        }

        const filter* where = options.filters && !options.filters->is_null() ? &*options.filters : nullptr;
        const sort_spec* order = options.sort_by ? &*options.sort_by : nullptr;

        auto lease = lease_for(options);
        auto& conn = connection_for(options);
        auto docs = collection_.find(conn, where, order, limit, skip);

        std::vector<Variant> result;
        result.reserve(docs.size());
        for (auto& doc : docs) {
            result.push_back(instantiate_from(doc));
        }
        return result;
    }

    /// Inserts an entity without an id (or with an empty one), otherwise
    /// updates the stored document with every declared field of the entity.
    /// @throws validation_error when the store rejects the data
    /// @throws invalid_argument_error for an unregistered type or an unknown id
    Variant save(const Variant& entity, const operation_options& options = {}) {
        auto id = std::visit([](const auto& e) { return e.id; }, entity);
        auto lease = lease_for(options);
        try {
            if (!id || id->empty()) {
                try {
                    return insert(entity, options);
                } catch (const unregistered_constructor_error&) {
                    throw invalid_argument_error("The entity with name " + runtime_type_name(entity) +
                                                 " is not included in the setup of the custom repository");
                }
            }
            auto fields = std::visit([](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                return partial<T>::from(e).fields();
            }, entity);
            return update(*id, fields, options);
        } catch (const constraint_error& e) {
            LOG_DEBUG("repository", "Save rejected: %s", e.what());
            throw validation_error("One or more fields of the given entity do not specify valid values",
                                   std::current_exception());
        }
    }

    /// Applies only the supplied fields of `patch` to the stored document.
    /// @throws invalid_argument_error if the patch carries no id
    template<typename T>
    Variant save(const partial<T>& patch, const operation_options& options = {}) {
        if (!patch.id || patch.id->empty()) {
            throw invalid_argument_error("The given entity must be valid");
        }
        auto lease = lease_for(options);
        try {
            return update(*patch.id, patch.fields(), options);
        } catch (const constraint_error& e) {
            LOG_DEBUG("repository", "Save rejected: %s", e.what());
            throw validation_error("One or more fields of the given entity do not specify valid values",
                                   std::current_exception());
        }
    }

    /// Physically removes the document. True if one was removed.
    bool delete_by_id(const document_id_t& id, const operation_options& options = {}) {
        if (id.empty()) {
            throw invalid_argument_error("The given ID must be valid");
        }
        auto lease = lease_for(options);
        auto& conn = connection_for(options);
        return collection_.remove(conn, id);
    }

    const type_registry<Variant>& registry() const { return registry_; }
    const std::shared_ptr<database>& connection() const { return conn_; }
    const std::string& collection_name() const { return collection_.name(); }

protected:
    Variant insert(const Variant& entity, const operation_options& options) {
        auto type_name = runtime_type_name(entity);
        const auto* entry = registry_.resolve(type_name);
        if (!entry) {
            throw invalid_argument_error("The entity with name " + type_name +
                                         " is not included in the setup of the custom repository");
        }

        auto prepared = codec_.dehydrate(entity);
        if (entry->auditable) {
            auto now = detail::to_json_value(std::chrono::system_clock::now());
            prepared.body[version_key] = 0;
            prepared.body[created_at_key] = now;
            prepared.body[updated_at_key] = now;
            if (options.user_id) {
                prepared.body[created_by_key] = *options.user_id;
                prepared.body[updated_by_key] = *options.user_id;
            } else {
                prepared.body.erase(created_by_key);
                prepared.body.erase(updated_by_key);
            }
        }

        auto& conn = connection_for(options);
        return within_write(conn, options, [&]() {
            auto stored = collection_.insert(conn, std::move(prepared.body));
            LOG_DEBUG("repository", "Inserted %s %s", type_name.c_str(), stored.id.c_str());
            return instantiate_from(stored);
        });
    }

    /// Merges `fields` into the stored document. Keys outside the stored
    /// type's schema are dropped; a null value clears the field.
    Variant update(const document_id_t& id, const nlohmann::json& fields, const operation_options& options) {
        if (id.empty()) {
            throw invalid_argument_error("The given ID must be valid");
        }

        auto& conn = connection_for(options);
        return within_write(conn, options, [&]() {
            auto current = collection_.find_by_id(conn, id);
            if (!current) {
                throw invalid_argument_error("There is no document matching the given ID '" + id + "'");
            }
            const auto& entry = entry_for(*current);

            nlohmann::json body = current->body;
            for (auto it = fields.begin(); it != fields.end(); ++it) {
                if (!entry.schema.has_field(it.key())) {
                    LOG_DEBUG("repository", "Dropping field %s not declared by %s",
                              it.key().c_str(), entry.name.c_str());
                    continue;
                }
                body[it.key()] = it.value();
            }

            if (entry.auditable) {
                body[version_key] = current->body.value(version_key, int64_t{0}) + 1;
                body[updated_at_key] = detail::to_json_value(std::chrono::system_clock::now());
                if (options.user_id) {
                    body[updated_by_key] = *options.user_id;
                }
            }

            auto stored = collection_.replace(conn, *current, std::move(body));
            LOG_DEBUG("repository", "Updated %s", id.c_str());
            return instantiate_from(stored);
        });
    }

    Variant instantiate_from(const stored_document& doc) const {
        // Non-empty input always yields a value
        return *codec_.hydrate(doc);
    }

    /// The session's connection, or the repository's own.
    /// @throws invalid_argument_error for an ended session or one on another connection
    database& connection_for(const operation_options& options) {
        if (!options.session) {
            return *conn_;
        }
        if (!options.session->is_active()) {
            throw invalid_argument_error("Session " + options.session->id() + " is no longer active");
        }
        if (options.session->connection() != conn_) {
            throw invalid_argument_error("Session " + options.session->id() +
                                         " belongs to a different connection");
        }
        return options.session->db();
    }

    /// Holds the repository's connection for the calling thread unless the
    /// operation runs in a session, which already holds it.
    connection_lease lease_for(const operation_options& options) {
        return connection_lease(options.session ? nullptr : conn_.get());
    }

    /// Runs a multi-statement write atomically unless the calling thread
    /// already has a transaction open.
    template<typename F>
    Variant within_write(database& conn, const operation_options& options, F&& work) {
        if (options.session || conn.is_in_transaction()) {
            return work();
        }
        transaction tx(conn);
        Variant result = work();
        tx.commit();
        return result;
    }

    const type_entry<Variant>& entry_for(const stored_document& doc) const {
        auto disc = doc.body.find(discriminator_key);
        std::string name = disc != doc.body.end() && disc->is_string() ? disc->get<std::string>()
                                                                        : registry_.supertype_name();
        const auto* entry = registry_.resolve(name);
        if (!entry) {
            throw unregistered_constructor_error(
                "There is no registered instance constructor for the document with ID " + doc.id, name);
        }
        return *entry;
    }

    static std::string default_collection_name(const std::string& model_name) {
        std::string name = model_name;
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return name + "s";
    }

    static std::map<std::string, schema_descriptor> subtype_schemas(const type_registry<Variant>& registry) {
        std::map<std::string, schema_descriptor> schemas;
        for (const auto& [name, entry] : registry.subtype_entries()) {
            schemas.emplace(name, entry.schema);
        }
        return schemas;
    }

    type_registry<Variant> registry_;
    document_codec<Variant> codec_;
    std::shared_ptr<database> conn_;
    tessera::collection collection_;
};

} // namespace tessera

#endif // __cplusplus
