#include "ssemcp/util/json_schema.hpp"

#include <algorithm>
#include <string>

namespace ssemcp::util::schema {

static bool is_type(const Json& inst, const std::string& type) {
  if (type == "object") return inst.is_object();
  if (type == "array") return inst.is_array();
  if (type == "string") return inst.is_string();
  if (type == "number") return inst.is_number();
  if (type == "integer") return inst.is_number_integer();
  if (type == "boolean") return inst.is_boolean();
  if (type == "null") return inst.is_null();
  return true; // unknown treated as pass-through
}

static bool matches_type(const Json& inst, const Json& type, std::string& expected) {
  if (type.is_string()) {
    expected = type.get<std::string>();
    return is_type(inst, expected);
  }
  if (type.is_array()) {
    expected.clear();
    for (const auto& t : type) {
      if (!t.is_string()) continue;
      if (!expected.empty()) expected += "|";
      expected += t.get<std::string>();
      if (is_type(inst, t.get<std::string>())) return true;
    }
    return expected.empty();
  }
  return true;
}

static void validate_at(const Json& schema, const Json& inst, const std::string& path) {
  if (!schema.is_object()) return;

  if (schema.contains("type")) {
    std::string expected;
    if (!matches_type(inst, schema["type"], expected))
      throw ValidationError(path + ": expected " + expected);
  }

  if (schema.contains("enum") && schema["enum"].is_array()) {
    const auto& options = schema["enum"];
    if (std::find(options.begin(), options.end(), inst) == options.end())
      throw ValidationError(path + ": value not in enum " + options.dump());
  }

  if (inst.is_object()) {
    if (schema.contains("required") && schema["required"].is_array()) {
      for (auto& req : schema["required"]) {
        if (!req.is_string()) continue;
        auto key = req.get<std::string>();
        if (!inst.contains(key)) throw ValidationError(path + ": missing required: " + key);
      }
    }
    if (schema.contains("properties") && schema["properties"].is_object()) {
      for (auto& [name, subschema] : schema["properties"].items()) {
        auto it = inst.find(name);
        if (it != inst.end()) validate_at(subschema, *it, path + "." + name);
      }
    }
  }

  if (inst.is_array() && schema.contains("items") && schema["items"].is_object()) {
    for (size_t i = 0; i < inst.size(); ++i)
      validate_at(schema["items"], inst[i], path + "[" + std::to_string(i) + "]");
  }
}

void validate(const Json& schema, const Json& instance) {
  validate_at(schema, instance, "arguments");
}

} // namespace ssemcp::util::schema
