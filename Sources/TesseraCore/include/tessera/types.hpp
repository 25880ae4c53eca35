#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace tessera {

// Timestamp type (milliseconds since Unix epoch)
using timestamp_t = std::chrono::system_clock::time_point;

// Storage order of a document within its collection
using sequence_t = int64_t;

// Document identifier (UUID string, generated on insert)
using document_id_t = std::string;

// UUID type (stored as TEXT)
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    uuid_t() = default;

    explicit uuid_t(const std::array<uint8_t, 16>& b) : bytes(b) {}

    // Convert to lowercase hyphenated string (e.g., "550e8400-e29b-41d4-a716-446655440000")
    std::string to_string() const {
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    // Generate a random UUID (v4)
    static uuid_t generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dis;

        uuid_t result;
        uint64_t a = dis(gen);
        uint64_t b = dis(gen);

        for (int i = 0; i < 8; ++i) {
            result.bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
            result.bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
        }

        result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;  // Version 4
        result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;  // Variant 1

        return result;
    }
};

// SQLite column / bound parameter values
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

// Audit metadata carried by auditable entity families.
// Stored in the document as __v, createdAt, createdBy, updatedAt, updatedBy.
// The repository owns every field; values set by callers are ignored on save.
struct audit_info {
    int64_t version = 0;
    std::optional<timestamp_t> created_at;
    std::optional<std::string> created_by;
    std::optional<timestamp_t> updated_at;
    std::optional<std::string> updated_by;

    bool operator==(const audit_info& other) const {
        return version == other.version && created_at == other.created_at &&
               created_by == other.created_by && updated_at == other.updated_at &&
               updated_by == other.updated_by;
    }
    bool operator!=(const audit_info& other) const { return !(*this == other); }
};

// Reserved document keys
inline constexpr const char* discriminator_key = "__t";
inline constexpr const char* version_key = "__v";
inline constexpr const char* created_at_key = "createdAt";
inline constexpr const char* created_by_key = "createdBy";
inline constexpr const char* updated_at_key = "updatedAt";
inline constexpr const char* updated_by_key = "updatedBy";

// ============================================================================
// Helper types and functions for field conversion
// ============================================================================

namespace detail {
    // Type traits
    template<typename T> struct is_optional : std::false_type {};
    template<typename T> struct is_optional<std::optional<T>> : std::true_type {};

    template<typename T>
    struct unwrap_optional { using type = T; };
    template<typename T>
    struct unwrap_optional<std::optional<T>> { using type = T; };

    template<typename T> struct is_vector : std::false_type {};
    template<typename T> struct is_vector<std::vector<T>> : std::true_type {};

    // Timestamps are stored as milliseconds since epoch
    inline int64_t to_millis(timestamp_t v) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(v.time_since_epoch()).count();
    }
    inline timestamp_t from_millis(int64_t millis) {
        return timestamp_t(std::chrono::milliseconds(millis));
    }

    // Convert C++ field values to JSON document values
    template<typename T>
    nlohmann::json to_json_value(const T& v);

    template<typename T>
    nlohmann::json to_json_value(const std::optional<T>& v) {
        if (!v.has_value()) return nullptr;
        return to_json_value(*v);
    }

    template<typename T>
    nlohmann::json to_json_value(const std::vector<T>& v) {
        auto arr = nlohmann::json::array();
        for (const auto& item : v) {
            arr.push_back(to_json_value(item));
        }
        return arr;
    }

    template<typename T>
    nlohmann::json to_json_value(const T& v) {
        if constexpr (std::is_same_v<T, timestamp_t>) {
            return to_millis(v);
        } else if constexpr (std::is_same_v<T, bool>) {
            return v;
        } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
            return static_cast<uint64_t>(v);
        } else if constexpr (std::is_integral_v<T>) {
            return static_cast<int64_t>(v);
        } else if constexpr (std::is_floating_point_v<T>) {
            return static_cast<double>(v);
        } else {
            return nlohmann::json(v);
        }
    }

    // Convert JSON document values back to C++ field values
    template<typename T>
    struct json_reader {
        static T read(const nlohmann::json& v) {
            if constexpr (std::is_same_v<T, timestamp_t>) {
                return from_millis(v.get<int64_t>());
            } else if constexpr (std::is_same_v<T, bool>) {
                // json_extract round-trips booleans as 0/1
                if (v.is_number_integer()) return v.get<int64_t>() != 0;
                return v.get<bool>();
            } else {
                return v.get<T>();
            }
        }
    };

    template<typename T>
    struct json_reader<std::optional<T>> {
        static std::optional<T> read(const nlohmann::json& v) {
            if (v.is_null()) return std::nullopt;
            return json_reader<T>::read(v);
        }
    };

    template<typename T>
    struct json_reader<std::vector<T>> {
        static std::vector<T> read(const nlohmann::json& v) {
            std::vector<T> result;
            if (v.is_null()) return result;
            result.reserve(v.size());
            for (const auto& item : v) {
                result.push_back(json_reader<T>::read(item));
            }
            return result;
        }
    };

    template<typename T>
    T from_json_value(const nlohmann::json& v) {
        return json_reader<T>::read(v);
    }

    // Read a field from a document; missing keys read as null
    template<typename T>
    void read_field(const nlohmann::json& doc, const char* name, T& out) {
        auto it = doc.find(name);
        if (it == doc.end() || it->is_null()) {
            if constexpr (is_optional<T>::value || is_vector<T>::value) {
                out = T{};
            }
            return;  // required field left default-initialised; validation guards storage
        }
        out = from_json_value<T>(*it);
    }

    // Convert JSON scalars to SQLite parameters
    inline column_value_t to_column_value(const nlohmann::json& v) {
        if (v.is_null()) return nullptr;
        if (v.is_boolean()) return static_cast<int64_t>(v.get<bool>() ? 1 : 0);
        if (v.is_number_unsigned()) {
            // SQLite integers are signed; json_extract reads larger values as REAL
            auto u = v.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<double>(u);
            }
            return static_cast<int64_t>(u);
        }
        if (v.is_number_integer()) return v.get<int64_t>();
        if (v.is_number_float()) return v.get<double>();
        if (v.is_string()) return v.get<std::string>();
        // Arrays and objects compare by their JSON text
        return v.dump();
    }
} // namespace detail

} // namespace tessera

#endif // __cplusplus
