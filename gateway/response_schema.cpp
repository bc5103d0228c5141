#include "response_schema.H"
#include "gateway_error.H"

#include <cstdlib>

namespace predex::gateway {

const char* to_string(JSON_TYPE type) {
    switch (type) {
        case JSON_TYPE::ANY: return "any";
        case JSON_TYPE::OBJECT: return "object";
        case JSON_TYPE::ARRAY: return "array";
        case JSON_TYPE::STRING: return "string";
        case JSON_TYPE::NUMBER: return "number";
        case JSON_TYPE::BOOLEAN: return "boolean";
        case JSON_TYPE::NUMERIC: return "numeric";
    }
    return "unknown";
}

bool matches(const nlohmann::json& value, JSON_TYPE type) {
    switch (type) {
        case JSON_TYPE::ANY: return true;
        case JSON_TYPE::OBJECT: return value.is_object();
        case JSON_TYPE::ARRAY: return value.is_array();
        case JSON_TYPE::STRING: return value.is_string();
        case JSON_TYPE::NUMBER: return value.is_number();
        case JSON_TYPE::BOOLEAN: return value.is_boolean();
        case JSON_TYPE::NUMERIC: {
            if (value.is_number()) {
                return true;
            }
            if (!value.is_string()) {
                return false;
            }
            const std::string& text = value.get_ref<const std::string&>();
            if (text.empty()) {
                return false;
            }
            char* end = nullptr;
            std::strtod(text.c_str(), &end);
            return end != nullptr && *end == '\0';
        }
    }
    return false;
}

ResponseSchema ResponseSchema::any() {
    return ResponseSchema(JSON_TYPE::ANY);
}

ResponseSchema ResponseSchema::object() {
    return ResponseSchema(JSON_TYPE::OBJECT);
}

ResponseSchema ResponseSchema::array() {
    return ResponseSchema(JSON_TYPE::ARRAY);
}

ResponseSchema ResponseSchema::array_of(const ResponseSchema& element) {
    ResponseSchema schema(JSON_TYPE::ARRAY);
    schema.element = std::make_shared<const ResponseSchema>(element);
    return schema;
}

ResponseSchema& ResponseSchema::require(const std::string& name, JSON_TYPE type) {
    fields.push_back({name, type, true});
    return *this;
}

ResponseSchema& ResponseSchema::optional(const std::string& name, JSON_TYPE type) {
    fields.push_back({name, type, false});
    return *this;
}

void ResponseSchema::validate(const nlohmann::json& value) const {
    validate(value, "$");
}

void ResponseSchema::validate(const nlohmann::json& value, const std::string& path) const {
    if (!matches(value, root)) {
        throw SchemaViolation(path + " expected " + to_string(root) + ", got " + value.type_name());
    }

    if (value.is_object()) {
        for (const auto& field : fields) {
            auto it = value.find(field.name);
            if (it == value.end() || it->is_null()) {
                if (field.required) {
                    throw SchemaViolation(path + "." + field.name + " is missing");
                }
                continue;
            }
            if (!matches(*it, field.type)) {
                throw SchemaViolation(path + "." + field.name + " expected " + to_string(field.type) +
                                      ", got " + it->type_name());
            }
        }
    }

    if (element && value.is_array()) {
        for (size_t i = 0; i < value.size(); ++i) {
            element->validate(value[i], path + "[" + std::to_string(i) + "]");
        }
    }
}

} // namespace predex::gateway
