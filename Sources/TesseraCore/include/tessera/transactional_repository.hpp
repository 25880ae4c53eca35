#pragma once

#ifdef __cplusplus

#include "repository.hpp"
#include "transaction.hpp"
#include <cstdint>
#include <vector>

namespace tessera {

// ============================================================================
// transactional_repository - repository with multi-entity operations that
// commit or fail as a whole
// ============================================================================

template<typename Variant>
class transactional_repository : public repository<Variant> {
public:
    explicit transactional_repository(type_map<Variant> types, const repository_options& options = {})
        : repository<Variant>(std::move(types), options), coordinator_(this->connection()) {}

    /// Saves every entity in one transaction; results keep the input order.
    /// Joins `options.session` when one is given.
    std::vector<Variant> save_all(const std::vector<Variant>& entities, const operation_options& options = {}) {
        return coordinator_.run_in_transaction([&](session& s) {
            operation_options scoped = options;
            scoped.session = &s;

            std::vector<Variant> saved;
            saved.reserve(entities.size());
            for (const auto& entity : entities) {
                saved.push_back(this->save(entity, scoped));
            }
            return saved;
        }, options.session);
    }

    /// Flags every document matching `options.filters` as deleted and returns
    /// how many were flagged. Absent filters match everything.
    /// @throws invalid_argument_error for the null filter, or when a matched
    ///         entity type has no `is_deleted` field (nothing is changed then)
    int64_t delete_all(const operation_options& options = {}) {
        if (options.filters && options.filters->is_null()) {
            throw invalid_argument_error("Null filters are disallowed");
        }

        return coordinator_.run_in_transaction([&](session& s) -> int64_t {
            operation_options scoped;
            scoped.session = &s;
            scoped.filters = options.filters;
            scoped.user_id = options.user_id;

            auto matches = this->find_all(scoped);
            std::vector<Variant> flagged;
            flagged.reserve(matches.size());
            for (const auto& entity : matches) {
                flagged.push_back(mark_deleted(entity));
            }
            auto saved = save_all(flagged, scoped);
            LOG_DEBUG("repository", "Soft-deleted %zu documents in %s",
                      saved.size(), this->collection_name().c_str());
            return static_cast<int64_t>(saved.size());
        }, options.session);
    }

    transaction_coordinator& coordinator() { return coordinator_; }

private:
    static Variant mark_deleted(const Variant& entity) {
        return std::visit([](const auto& e) -> Variant {
            using T = std::decay_t<decltype(e)>;
            if constexpr (is_soft_deletable<T>::value) {
                T copy = e;
                copy.is_deleted = true;
                return copy;
            } else {
                throw invalid_argument_error(std::string("The entity with name ") + entity_traits<T>::name +
                                             " does not support soft deletion");
            }
        }, entity);
    }

    transaction_coordinator coordinator_;
};

} // namespace tessera

#endif // __cplusplus
