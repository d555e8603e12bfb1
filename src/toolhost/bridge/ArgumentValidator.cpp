//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ArgumentValidator.cpp
// Purpose: Schema-driven argument validation
//==========================================================================================================

#include <algorithm>

#include "toolhost/bridge/ArgumentValidator.h"

namespace toolhost {
namespace bridge {

const char* toString(SchemaType type) {
    switch (type) {
        case SchemaType::String: return "string";
        case SchemaType::Number: return "number";
        case SchemaType::Boolean: return "boolean";
        case SchemaType::Array: return "array";
        case SchemaType::Unknown: return "unknown";
    }
    return "unknown";
}

SchemaType schemaTypeFromString(const std::string& s) {
    if (s == "string") return SchemaType::String;
    if (s == "number") return SchemaType::Number;
    if (s == "boolean") return SchemaType::Boolean;
    if (s == "array") return SchemaType::Array;
    return SchemaType::Unknown;
}

namespace {

bool matches(SchemaType type, const JSONValue& v) {
    switch (type) {
        case SchemaType::String:
            return v.isString();
        case SchemaType::Number:
            return std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value);
        case SchemaType::Boolean:
            return std::holds_alternative<bool>(v.value);
        case SchemaType::Array:
            return v.isArray();
        case SchemaType::Unknown:
            return true;
    }
    return true;
}

} // namespace

ArgumentValidator ArgumentValidator::FromSchema(const JSONValue& inputSchema) {
    ArgumentValidator out;

    std::vector<std::string> required;
    if (const JSONValue* req = findMember(inputSchema, "required")) {
        if (req->isArray()) {
            for (const auto& r : std::get<JSONValue::Array>(req->value)) {
                if (r && r->isString()) {
                    required.push_back(std::get<std::string>(r->value));
                }
            }
        }
    }
    auto isRequired = [&required](const std::string& name) {
        return std::find(required.begin(), required.end(), name) != required.end();
    };

    const JSONValue* props = findMember(inputSchema, "properties");
    if (props != nullptr && props->isObject()) {
        for (const auto& [name, def] : std::get<JSONValue::Object>(props->value)) {
            FieldRule rule;
            rule.name = name;
            rule.required = isRequired(name);
            if (def) {
                if (auto t = getStringMember(*def, "type")) {
                    rule.type = schemaTypeFromString(*t);
                }
                rule.description = getStringMember(*def, "description").value_or(std::string());
            }
            out.fields.push_back(std::move(rule));
        }
    }
    // Properties come from an unordered map; keep violation reporting stable.
    std::sort(out.fields.begin(), out.fields.end(),
              [](const FieldRule& a, const FieldRule& b) { return a.name < b.name; });
    return out;
}

std::string ArgumentValidator::Check(const JSONValue& arguments) const {
    if (!arguments.isObject()) {
        return "arguments must be an object";
    }
    for (const auto& rule : fields) {
        const JSONValue* v = findMember(arguments, rule.name);
        if (v == nullptr) {
            if (rule.required) {
                return "missing required field '" + rule.name + "'";
            }
            continue;
        }
        if (!matches(rule.type, *v)) {
            return "field '" + rule.name + "' must be " + (rule.type == SchemaType::Array ? "an " : "a ") + toString(rule.type);
        }
    }
    return std::string();
}

} // namespace bridge
} // namespace toolhost
