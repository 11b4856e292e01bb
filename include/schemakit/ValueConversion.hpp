#pragma once
#include "schemakit/Value.hpp"
#include "schemakit/export.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace schemakit {

/// Dates render as ISO-8601 strings, Undefined as null (object members
/// holding Undefined are omitted)
SCHEMAKIT_API nlohmann::json value_to_json(const Value &value);

/// JSON has no dates or undefined: every JSON value maps onto a Value
SCHEMAKIT_API Value json_to_value(const nlohmann::json &j);

/// Plain scalars are typed by content (null, booleans, numbers, otherwise
/// strings); quoted scalars are always strings
SCHEMAKIT_API Value yaml_to_value(const YAML::Node &node);

/// Parses "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS[.mmm]Z"; malformed text
/// yields Date::invalid()
SCHEMAKIT_API Date parse_iso_date(const std::string &text);

} // namespace schemakit
