#include "Schema.hpp"
#include <algorithm>
#include <stdexcept>

namespace toolrpc {

Schema::Schema() : kind_(SchemaKind::ANY) {}

Schema::Schema(SchemaKind kind, std::string description)
    : kind_(kind), description_(std::move(description)) {}

Schema Schema::any(std::string description) {
    return Schema(SchemaKind::ANY, std::move(description));
}

Schema Schema::string(std::string description) {
    return Schema(SchemaKind::STRING, std::move(description));
}

Schema Schema::number(std::string description) {
    return Schema(SchemaKind::NUMBER, std::move(description));
}

Schema Schema::integer(std::string description) {
    return Schema(SchemaKind::INTEGER, std::move(description));
}

Schema Schema::boolean(std::string description) {
    return Schema(SchemaKind::BOOLEAN, std::move(description));
}

Schema Schema::null_value(std::string description) {
    return Schema(SchemaKind::NULL_VALUE, std::move(description));
}

Schema Schema::object(std::string description) {
    return Schema(SchemaKind::OBJECT, std::move(description));
}

Schema Schema::array(Schema items, std::string description) {
    Schema schema(SchemaKind::ARRAY, std::move(description));
    schema.items_ = std::make_shared<const Schema>(std::move(items));
    return schema;
}

Schema Schema::array(std::string description) {
    return Schema(SchemaKind::ARRAY, std::move(description));
}

Schema Schema::enumeration(std::vector<std::string> values, std::string description) {
    if (values.empty()) {
        throw std::invalid_argument("Enumeration must list at least one value");
    }
    Schema schema(SchemaKind::ENUM, std::move(description));
    schema.enum_values_ = std::move(values);
    return schema;
}

Schema& Schema::property(const std::string& name, Schema schema, bool required) {
    if (kind_ != SchemaKind::OBJECT) {
        throw std::logic_error("Properties can only be declared on object schemas");
    }
    if (find_property(name)) {
        throw std::invalid_argument("Property declared twice: " + name);
    }
    properties_.push_back({name, std::move(schema), required});
    return *this;
}

Schema& Schema::closed(bool value) {
    closed_ = value;
    return *this;
}

const SchemaProperty* Schema::find_property(const std::string& name) const {
    auto it = std::find_if(properties_.begin(), properties_.end(),
        [&name](const SchemaProperty& property) { return property.name == name; });
    return it == properties_.end() ? nullptr : &*it;
}

bool Schema::allows_value(const std::string& value) const {
    return std::find(enum_values_.begin(), enum_values_.end(), value) != enum_values_.end();
}

const char* Schema::kind_name(SchemaKind kind) {
    switch (kind) {
        case SchemaKind::ANY:        return "any";
        case SchemaKind::STRING:     return "string";
        case SchemaKind::NUMBER:     return "number";
        case SchemaKind::INTEGER:    return "integer";
        case SchemaKind::BOOLEAN:    return "boolean";
        case SchemaKind::NULL_VALUE: return "null";
        case SchemaKind::OBJECT:     return "object";
        case SchemaKind::ARRAY:      return "array";
        case SchemaKind::ENUM:       return "string";
    }
    return "any";
}

json Schema::to_json() const {
    json schema = json::object();

    if (kind_ != SchemaKind::ANY) {
        schema["type"] = kind_name(kind_);
    }
    if (!description_.empty()) {
        schema["description"] = description_;
    }

    switch (kind_) {
        case SchemaKind::OBJECT: {
            json properties = json::object();
            json required = json::array();
            for (const auto& property : properties_) {
                properties[property.name] = property.schema.to_json();
                if (property.required) {
                    required.push_back(property.name);
                }
            }
            schema["properties"] = properties;
            if (!required.empty()) {
                schema["required"] = required;
            }
            if (closed_) {
                schema["additionalProperties"] = false;
            }
            break;
        }
        case SchemaKind::ARRAY:
            if (items_) {
                schema["items"] = items_->to_json();
            }
            break;
        case SchemaKind::ENUM:
            schema["enum"] = enum_values_;
            break;
        default:
            break;
    }

    return schema;
}

Schema Schema::from_json(const json& schema) {
    if (!schema.is_object()) {
        throw std::invalid_argument("Schema must be a JSON object");
    }

    std::string description = schema.value("description", "");

    if (schema.contains("enum")) {
        const json& values = schema["enum"];
        if (!values.is_array()) {
            throw std::invalid_argument("enum must be an array");
        }
        std::vector<std::string> names;
        for (const auto& value : values) {
            if (!value.is_string()) {
                throw std::invalid_argument("Only string enumerations are supported");
            }
            names.push_back(value.get<std::string>());
        }
        return enumeration(std::move(names), std::move(description));
    }

    if (!schema.contains("type")) {
        return any(std::move(description));
    }
    if (!schema["type"].is_string()) {
        throw std::invalid_argument("Schema type must be a single string");
    }

    const std::string type = schema["type"].get<std::string>();
    if (type == "string") return string(std::move(description));
    if (type == "number") return number(std::move(description));
    if (type == "integer") return integer(std::move(description));
    if (type == "boolean") return boolean(std::move(description));
    if (type == "null") return null_value(std::move(description));

    if (type == "array") {
        if (schema.contains("items")) {
            return array(from_json(schema["items"]), std::move(description));
        }
        return array(std::move(description));
    }

    if (type == "object") {
        Schema result = object(std::move(description));

        std::vector<std::string> required;
        if (schema.contains("required")) {
            if (!schema["required"].is_array()) {
                throw std::invalid_argument("required must be an array");
            }
            for (const auto& name : schema["required"]) {
                if (!name.is_string()) {
                    throw std::invalid_argument("required must list property names");
                }
                required.push_back(name.get<std::string>());
            }
        }

        if (schema.contains("properties")) {
            const json& properties = schema["properties"];
            if (!properties.is_object()) {
                throw std::invalid_argument("properties must be an object");
            }
            // nlohmann::json objects iterate in key order
            for (auto it = properties.begin(); it != properties.end(); ++it) {
                bool is_required =
                    std::find(required.begin(), required.end(), it.key()) != required.end();
                result.property(it.key(), from_json(it.value()), is_required);
            }
        }

        // Required names without a declared schema still have to be present
        for (const auto& name : required) {
            if (!result.find_property(name)) {
                result.property(name, any(), true);
            }
        }

        if (schema.contains("additionalProperties")) {
            const json& additional = schema["additionalProperties"];
            if (!additional.is_boolean()) {
                throw std::invalid_argument("additionalProperties must be a boolean");
            }
            result.closed(!additional.get<bool>());
        }
        return result;
    }

    throw std::invalid_argument("Unsupported schema type: " + type);
}

} // namespace toolrpc
