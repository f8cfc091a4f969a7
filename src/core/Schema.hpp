#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolrpc {

using json = nlohmann::json;

/**
 * @brief Value kinds a schema node can describe
 */
enum class SchemaKind {
    ANY,         // No constraint
    STRING,
    NUMBER,      // Integer or floating point
    INTEGER,
    BOOLEAN,
    NULL_VALUE,
    OBJECT,
    ARRAY,
    ENUM         // String drawn from a fixed set
};

struct SchemaProperty;

/**
 * @brief Declared shape of a tool's arguments
 *
 * A tagged tree of field descriptors. Object properties keep their
 * declaration order, which is the order the validator checks them in.
 *
 * Example:
 * @code
 * Schema::object()
 *     .property("x", Schema::integer("First operand"), true)
 *     .property("operation", Schema::enumeration({"add", "subtract"}), true);
 * @endcode
 */
class Schema {
public:
    Schema();

    static Schema any(std::string description = {});
    static Schema string(std::string description = {});
    static Schema number(std::string description = {});
    static Schema integer(std::string description = {});
    static Schema boolean(std::string description = {});
    static Schema null_value(std::string description = {});
    static Schema object(std::string description = {});
    static Schema array(Schema items, std::string description = {});
    static Schema array(std::string description = {});
    static Schema enumeration(std::vector<std::string> values, std::string description = {});

    /**
     * @brief Add an object property (object schemas only)
     * @param name Property name
     * @param schema Schema of the property value
     * @param required Whether the property must be present
     * @return *this for chaining
     * @throws std::logic_error if this is not an object schema
     * @throws std::invalid_argument if the property is already declared
     */
    Schema& property(const std::string& name, Schema schema, bool required = false);

    /**
     * @brief Reject properties that are not declared (additionalProperties: false)
     */
    Schema& closed(bool value = true);

    SchemaKind kind() const { return kind_; }
    const std::string& description() const { return description_; }
    const std::vector<SchemaProperty>& properties() const { return properties_; }
    const std::vector<std::string>& enum_values() const { return enum_values_; }
    bool is_closed() const { return closed_; }

    /**
     * @brief Item schema of an array, or nullptr when items are unconstrained
     */
    const Schema* items() const { return items_.get(); }

    /**
     * @brief Find a declared property by name
     * @return Pointer to the property or nullptr
     */
    const SchemaProperty* find_property(const std::string& name) const;

    bool allows_value(const std::string& value) const;

    /**
     * @brief Render as JSON Schema
     */
    json to_json() const;

    /**
     * @brief Build from a JSON Schema subset
     *
     * Understands type, properties, required, items, enum,
     * additionalProperties (boolean) and description.
     *
     * @throws std::invalid_argument for unsupported constructs
     */
    static Schema from_json(const json& schema);

    /**
     * @brief JSON Schema type name of a kind
     */
    static const char* kind_name(SchemaKind kind);

private:
    explicit Schema(SchemaKind kind, std::string description);

    SchemaKind kind_;
    std::string description_;
    std::vector<SchemaProperty> properties_;
    std::vector<std::string> enum_values_;
    std::shared_ptr<const Schema> items_;
    bool closed_ = false;
};

/**
 * @brief Named property of an object schema
 */
struct SchemaProperty {
    std::string name;
    Schema schema;
    bool required = false;
};

} // namespace toolrpc
