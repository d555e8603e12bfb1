//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ArgumentValidator.h
// Purpose: Field-level argument checks generated from a tool's declared input schema
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace bridge {

// Declared primitive type of one schema property. Anything unrecognised is Unknown (accepts any value).
enum class SchemaType {
    String,
    Number,
    Boolean,
    Array,
    Unknown
};

const char* toString(SchemaType type);
SchemaType schemaTypeFromString(const std::string& s);

struct FieldRule {
    std::string name;
    SchemaType type{SchemaType::Unknown};
    bool required{false};
    std::string description;
};

//==========================================================================================================
// ArgumentValidator
// Purpose: Built once per tool from inputSchema.properties and inputSchema.required. Fields absent from the
//          required list are optional. Only declared properties produce rules: a name listed as required
//          without a property is not enforced. Members not declared in the schema are passed through unchecked.
//==========================================================================================================
class ArgumentValidator {
public:
    ArgumentValidator() = default;

    // A schema without a properties object yields a validator that only requires an object.
    static ArgumentValidator FromSchema(const JSONValue& inputSchema);

    // Returns an empty string when `arguments` satisfies every rule; otherwise the first violation,
    // e.g. "missing required field 'path'" or "field 'count' must be a number".
    std::string Check(const JSONValue& arguments) const;

    const std::vector<FieldRule>& Fields() const { return fields; }

private:
    std::vector<FieldRule> fields;
};

} // namespace bridge
} // namespace toolhost
