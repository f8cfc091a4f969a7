#pragma once

#include "Schema.hpp"
#include <optional>
#include <string>

namespace toolrpc {

/**
 * @brief First argument that did not match its schema
 */
struct ValidationError {
    std::string path;     // Dotted path to the field, empty for the root value
    std::string message;

    json to_json() const;
};

/**
 * @brief Strict checker for tool arguments
 *
 * No coercion is performed: "2" is not a number and 2.5 is not an integer.
 * Checking stops at the first mismatch.
 */
class ArgumentValidator {
public:
    /**
     * @brief Check a value against a schema
     * @param schema Declared schema
     * @param value Value to check
     * @return Empty when the value conforms, otherwise the first error
     */
    static std::optional<ValidationError> validate(const Schema& schema, const json& value);

private:
    static std::optional<ValidationError> validate_node(
        const Schema& schema, const json& value, const std::string& path);

    static std::optional<ValidationError> validate_object(
        const Schema& schema, const json& value, const std::string& path);

    static std::optional<ValidationError> validate_array(
        const Schema& schema, const json& value, const std::string& path);

    static bool matches_kind(SchemaKind kind, const json& value);

    static std::string join(const std::string& path, const std::string& field);
};

} // namespace toolrpc
