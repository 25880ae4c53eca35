#pragma once

#ifdef __cplusplus

#include <exception>
#include <stdexcept>
#include <string>

namespace tessera {

/// Storage fault raised by the SQLite layer or by a malformed stored document.
class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// The store rejected the data itself: schema violation or unique constraint.
class constraint_error : public db_error {
public:
    constraint_error(const std::string& msg, std::string field)
        : db_error(msg), field_(std::move(field)) {}

    /// Offending field name, empty when SQLite did not report one.
    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/// Structurally invalid request. Always raised before any storage call.
class invalid_argument_error : public std::invalid_argument {
public:
    explicit invalid_argument_error(const std::string& msg) : std::invalid_argument(msg) {}
};

/// Data rejected by the store, surfaced from save with the original cause attached.
class validation_error : public std::runtime_error {
public:
    validation_error(const std::string& msg, std::exception_ptr cause)
        : std::runtime_error(msg), cause_(std::move(cause)) {}

    std::exception_ptr cause() const { return cause_; }

    /// what() of the original cause, or empty.
    std::string cause_message() const {
        if (!cause_) return {};
        try {
            std::rethrow_exception(cause_);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "unknown error";
        }
    }

private:
    std::exception_ptr cause_;
};

/// A stored discriminator has no matching entry in the running type registry.
class unregistered_constructor_error : public std::runtime_error {
public:
    unregistered_constructor_error(const std::string& msg, std::string type_name)
        : std::runtime_error(msg), type_name_(std::move(type_name)) {}

    const std::string& type_name() const { return type_name_; }

private:
    std::string type_name_;
};

/// Invalid repository/registry setup, detected at construction time.
class configuration_error : public std::logic_error {
public:
    explicit configuration_error(const std::string& msg) : std::logic_error(msg) {}
};

} // namespace tessera

#endif // __cplusplus
