#include "ArgumentValidator.hpp"
#include <cmath>

namespace toolrpc {

namespace {

const char* json_type_name(const json& value) {
    if (value.is_number_integer()) {
        return "integer";
    }
    return value.type_name();
}

} // namespace

json ValidationError::to_json() const {
    return {
        {"path", path},
        {"reason", message}
    };
}

std::optional<ValidationError> ArgumentValidator::validate(const Schema& schema, const json& value) {
    return validate_node(schema, value, "");
}

std::string ArgumentValidator::join(const std::string& path, const std::string& field) {
    return path.empty() ? field : path + "." + field;
}

bool ArgumentValidator::matches_kind(SchemaKind kind, const json& value) {
    switch (kind) {
        case SchemaKind::ANY:        return true;
        case SchemaKind::STRING:     return value.is_string();
        case SchemaKind::NUMBER:     return value.is_number();
        case SchemaKind::INTEGER:    return value.is_number_integer();
        case SchemaKind::BOOLEAN:    return value.is_boolean();
        case SchemaKind::NULL_VALUE: return value.is_null();
        case SchemaKind::OBJECT:     return value.is_object();
        case SchemaKind::ARRAY:      return value.is_array();
        case SchemaKind::ENUM:       return value.is_string();
    }
    return false;
}

std::optional<ValidationError> ArgumentValidator::validate_node(
    const Schema& schema, const json& value, const std::string& path) {

    if (!matches_kind(schema.kind(), value)) {
        std::string where = path.empty() ? "arguments" : "field '" + path + "'";
        return ValidationError{path,
            where + " must be of type " + Schema::kind_name(schema.kind()) +
            ", got " + json_type_name(value)};
    }

    switch (schema.kind()) {
        case SchemaKind::ENUM: {
            const auto text = value.get<std::string>();
            if (!schema.allows_value(text)) {
                json allowed = schema.enum_values();
                return ValidationError{path,
                    "field '" + path + "' must be one of " + allowed.dump() +
                    ", got \"" + text + "\""};
            }
            return std::nullopt;
        }
        case SchemaKind::NUMBER:
            if (value.is_number_float() && !std::isfinite(value.get<double>())) {
                return ValidationError{path, "field '" + path + "' must be a finite number"};
            }
            return std::nullopt;
        case SchemaKind::OBJECT:
            return validate_object(schema, value, path);
        case SchemaKind::ARRAY:
            return validate_array(schema, value, path);
        default:
            return std::nullopt;
    }
}

std::optional<ValidationError> ArgumentValidator::validate_object(
    const Schema& schema, const json& value, const std::string& path) {

    for (const auto& property : schema.properties()) {
        if (property.required && !value.contains(property.name)) {
            std::string field = join(path, property.name);
            return ValidationError{field, "missing required field '" + field + "'"};
        }
    }

    for (const auto& property : schema.properties()) {
        auto it = value.find(property.name);
        if (it == value.end()) {
            continue;
        }
        if (auto error = validate_node(property.schema, *it, join(path, property.name))) {
            return error;
        }
    }

    if (schema.is_closed()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!schema.find_property(it.key())) {
                std::string field = join(path, it.key());
                return ValidationError{field, "unexpected field '" + field + "'"};
            }
        }
    }

    return std::nullopt;
}

std::optional<ValidationError> ArgumentValidator::validate_array(
    const Schema& schema, const json& value, const std::string& path) {

    const Schema* items = schema.items();
    if (!items) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i < value.size(); ++i) {
        if (auto error = validate_node(*items, value[i], join(path, std::to_string(i)))) {
            return error;
        }
    }
    return std::nullopt;
}

} // namespace toolrpc
