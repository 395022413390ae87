#pragma once
#include "ssemcp/exceptions.hpp"
#include "ssemcp/types.hpp"

namespace ssemcp::util::schema
{

// Minimal JSON Schema v7-like validator supporting:
// - type: object, array, string, number, integer, boolean, null (or a list of them)
// - required: [..]
// - properties: { name: { ... } } (recursive)
// - items: { ... } for arrays
// - enum: [..]
// Anything else in the schema is ignored. Throws ValidationError naming the
// offending path, e.g. "arguments.text: expected string".

void validate(const Json& schema, const Json& instance);

} // namespace ssemcp::util::schema
