#pragma once
#include "schemakit/Schema.hpp"
#include "schemakit/export.h"

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace schemakit {

/// Builds schemas from YAML descriptions:
///
///   type: object
///   unknown_keys: strict
///   fields:
///     name: { type: string, min: 1 }
///     age:  { type: number, int: true, optional: true }
///
/// Every node takes a `type` plus the constraint keys valid for that type;
/// `optional`, `nullable`, `default` and `description` apply to any type.
/// Unknown keys are rejected. Errors throw SchemaError whose where() is the
/// description path ("/fields/age").
class SCHEMAKIT_API SchemaLoader {
public:
  static Schema load_file(const std::string &path);
  static Schema load_string(const std::string &text);
  static Schema from_yaml(const YAML::Node &node);

private:
  static Schema build(const YAML::Node &node,
                      const std::vector<std::string> &path);
  static Schema build_base(const std::string &type, const YAML::Node &node,
                           const std::vector<std::string> &path);
};

} // namespace schemakit
