#include "schemakit/SchemaLoader.hpp"
#include "schemakit/Logger.hpp"
#include "schemakit/ValueConversion.hpp"

#include <fmt/format.h>

#include <map>
#include <set>

namespace schemakit {

namespace {

std::string node_path(const std::vector<std::string> &path) {
  if (path.empty())
    return "/";
  std::string out;
  for (const auto &p : path) {
    out += "/" + p;
  }
  return out;
}

std::vector<std::string> child(const std::vector<std::string> &path,
                               const std::string &key) {
  auto out = path;
  out.push_back(key);
  return out;
}

[[noreturn]] void fail(const std::vector<std::string> &path,
                       const std::string &msg) {
  throw SchemaError(msg, node_path(path));
}

const std::set<std::string> &common_keys() {
  static const std::set<std::string> keys = {"type", "optional", "nullable",
                                             "default", "description"};
  return keys;
}

const std::map<std::string, std::set<std::string>> &type_keys() {
  static const std::map<std::string, std::set<std::string>> keys = {
      {"string",
       {"min", "max", "length", "nonempty", "regex", "format", "starts_with",
        "ends_with", "includes"}},
      {"number",
       {"min", "max", "gt", "gte", "lt", "lte", "int", "positive", "negative",
        "nonnegative", "nonpositive", "multiple_of", "finite"}},
      {"boolean", {}},
      {"date", {"min", "max", "coerce"}},
      {"null", {}},
      {"undefined", {}},
      {"literal", {"value"}},
      {"enum", {"values"}},
      {"object", {"fields", "unknown_keys"}},
      {"array", {"element", "min", "max", "length", "nonempty"}},
      {"tuple", {"items", "rest"}},
      {"union", {"options"}},
      {"discriminated_union", {"discriminator", "options"}},
      {"intersection", {"left", "right"}},
      {"record", {"key", "value"}},
  };
  return keys;
}

template <typename T>
T scalar(const YAML::Node &node, const std::vector<std::string> &path,
         const char *what) {
  if (!node.IsScalar())
    fail(path, fmt::format("expected {}", what));
  try {
    return node.as<T>();
  } catch (const YAML::BadConversion &) {
    fail(path, fmt::format("expected {}, got '{}'", what, node.Scalar()));
  }
}

bool flag(const YAML::Node &node, const std::string &key,
          const std::vector<std::string> &path) {
  if (!node[key])
    return false;
  return scalar<bool>(node[key], child(path, key), "a boolean");
}

YAML::Node require_key(const YAML::Node &node, const std::string &key,
                       const std::vector<std::string> &path,
                       const std::string &type) {
  YAML::Node found = node[key];
  if (!found)
    fail(path, fmt::format("{} schema requires '{}'", type, key));
  return found;
}

std::size_t length_bound(const YAML::Node &node,
                         const std::vector<std::string> &path) {
  double n = scalar<double>(node, path, "a non-negative integer");
  if (n < 0 || n != static_cast<double>(static_cast<std::size_t>(n)))
    fail(path, "expected a non-negative integer");
  return static_cast<std::size_t>(n);
}

Date date_bound(const YAML::Node &node, const std::vector<std::string> &path) {
  Date d = parse_iso_date(scalar<std::string>(node, path, "an ISO-8601 date"));
  if (!d.valid)
    fail(path, fmt::format("'{}' is not an ISO-8601 date", node.Scalar()));
  return d;
}

Schema apply_string_checks(Schema s, const YAML::Node &node,
                           const std::vector<std::string> &path) {
  if (node["min"])
    s = s.min(static_cast<double>(length_bound(node["min"], child(path, "min"))));
  if (node["max"])
    s = s.max(static_cast<double>(length_bound(node["max"], child(path, "max"))));
  if (node["length"])
    s = s.length(length_bound(node["length"], child(path, "length")));
  if (flag(node, "nonempty", path))
    s = s.nonempty();
  if (node["regex"])
    s = s.regex(scalar<std::string>(node["regex"], child(path, "regex"),
                                    "a pattern"));
  if (node["format"]) {
    auto format =
        scalar<std::string>(node["format"], child(path, "format"), "a format");
    if (format == "email") {
      s = s.email();
    } else if (format == "url") {
      s = s.url();
    } else if (format == "uuid") {
      s = s.uuid();
    } else {
      fail(child(path, "format"),
           fmt::format("unknown string format '{}'", format));
    }
  }
  if (node["starts_with"])
    s = s.starts_with(scalar<std::string>(
        node["starts_with"], child(path, "starts_with"), "a string"));
  if (node["ends_with"])
    s = s.ends_with(scalar<std::string>(node["ends_with"],
                                        child(path, "ends_with"), "a string"));
  if (node["includes"])
    s = s.includes(scalar<std::string>(node["includes"],
                                       child(path, "includes"), "a string"));
  return s;
}

Schema apply_number_checks(Schema s, const YAML::Node &node,
                           const std::vector<std::string> &path) {
  auto bound = [&](const char *key) {
    return scalar<double>(node[key], child(path, key), "a number");
  };
  if (node["min"])
    s = s.min(bound("min"));
  if (node["max"])
    s = s.max(bound("max"));
  if (node["gt"])
    s = s.gt(bound("gt"));
  if (node["gte"])
    s = s.gte(bound("gte"));
  if (node["lt"])
    s = s.lt(bound("lt"));
  if (node["lte"])
    s = s.lte(bound("lte"));
  if (flag(node, "int", path))
    s = s.int_();
  if (flag(node, "positive", path))
    s = s.positive();
  if (flag(node, "negative", path))
    s = s.negative();
  if (flag(node, "nonnegative", path))
    s = s.nonnegative();
  if (flag(node, "nonpositive", path))
    s = s.nonpositive();
  if (node["multiple_of"])
    s = s.multiple_of(bound("multiple_of"));
  if (flag(node, "finite", path))
    s = s.finite();
  return s;
}

Schema apply_array_checks(Schema s, const YAML::Node &node,
                          const std::vector<std::string> &path) {
  if (node["min"])
    s = s.min(static_cast<double>(length_bound(node["min"], child(path, "min"))));
  if (node["max"])
    s = s.max(static_cast<double>(length_bound(node["max"], child(path, "max"))));
  if (node["length"])
    s = s.length(length_bound(node["length"], child(path, "length")));
  if (flag(node, "nonempty", path))
    s = s.nonempty();
  return s;
}

UnknownKeys unknown_keys_policy(const YAML::Node &node,
                                const std::vector<std::string> &path) {
  auto text = scalar<std::string>(node, path, "an unknown-key policy");
  if (text == "strict")
    return UnknownKeys::Strict;
  if (text == "strip")
    return UnknownKeys::Strip;
  if (text == "passthrough")
    return UnknownKeys::Passthrough;
  fail(path, fmt::format("unknown-key policy must be strict, strip or "
                         "passthrough, got '{}'",
                         text));
}

} // namespace

Schema SchemaLoader::load_file(const std::string &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile &) {
    throw SchemaError("cannot open schema file", path);
  } catch (const YAML::ParserException &e) {
    throw SchemaError(fmt::format("malformed YAML: {}", e.what()), path);
  }
  Schema schema = from_yaml(root);
  SK_LOG_INFO("LOADER", "LOAD", "loaded {} schema from '{}'",
              node_kind_name(schema.kind()), path);
  return schema;
}

Schema SchemaLoader::load_string(const std::string &text) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::ParserException &e) {
    throw SchemaError(fmt::format("malformed YAML: {}", e.what()));
  }
  return from_yaml(root);
}

Schema SchemaLoader::from_yaml(const YAML::Node &node) {
  return build(node, {});
}

Schema SchemaLoader::build(const YAML::Node &node,
                           const std::vector<std::string> &path) {
  if (!node.IsMap())
    fail(path, "schema description must be a mapping");
  if (!node["type"])
    fail(path, "schema description requires 'type'");

  auto type = scalar<std::string>(node["type"], child(path, "type"), "a type");
  auto allowed = type_keys().find(type);
  if (allowed == type_keys().end())
    fail(child(path, "type"), fmt::format("unknown schema type '{}'", type));

  for (const auto &entry : node) {
    auto key = entry.first.as<std::string>();
    if (common_keys().count(key) == 0 && allowed->second.count(key) == 0) {
      fail(child(path, key),
           fmt::format("'{}' is not valid for {} schemas", key, type));
    }
  }

  Schema schema = build_base(type, node, path);

  if (node["description"]) {
    schema = schema.describe(scalar<std::string>(
        node["description"], child(path, "description"), "a string"));
  }
  if (flag(node, "nullable", path))
    schema = schema.nullable();
  if (node["default"]) {
    Value fallback = yaml_to_value(node["default"]);
    if (type == "date" && fallback.is_string())
      fallback = Value(parse_iso_date(fallback.as_string()));
    schema = schema.default_(std::move(fallback));
  }
  if (flag(node, "optional", path))
    schema = schema.optional();
  return schema;
}

Schema SchemaLoader::build_base(const std::string &type,
                                const YAML::Node &node,
                                const std::vector<std::string> &path) {
  try {
    if (type == "string")
      return apply_string_checks(string(), node, path);
    if (type == "number")
      return apply_number_checks(number(), node, path);
    if (type == "boolean")
      return boolean();
    if (type == "null")
      return null_();
    if (type == "undefined")
      return undefined_();

    if (type == "date") {
      Schema s = date();
      if (node["min"])
        s = s.min_date(date_bound(node["min"], child(path, "min")));
      if (node["max"])
        s = s.max_date(date_bound(node["max"], child(path, "max")));
      if (flag(node, "coerce", path)) {
        // JSON and YAML inputs carry dates as ISO strings
        s = preprocess(
            [](const Value &raw) {
              if (raw.is_string())
                return Value(parse_iso_date(raw.as_string()));
              return raw;
            },
            s);
      }
      return s;
    }

    if (type == "literal")
      return literal(yaml_to_value(require_key(node, "value", path, type)));

    if (type == "enum") {
      YAML::Node values = require_key(node, "values", path, type);
      if (!values.IsSequence())
        fail(child(path, "values"), "expected a sequence of values");
      std::vector<Value> list;
      for (const auto &v : values)
        list.push_back(yaml_to_value(v));
      return enum_(std::move(list));
    }

    if (type == "object") {
      ShapeSpec shape;
      if (node["fields"]) {
        YAML::Node fields = node["fields"];
        if (!fields.IsMap())
          fail(child(path, "fields"), "expected a mapping of fields");
        auto fields_path = child(path, "fields");
        for (const auto &entry : fields) {
          auto name = entry.first.as<std::string>();
          shape.emplace_back(name, build(entry.second, child(fields_path, name)));
        }
      }
      UnknownKeys policy = UnknownKeys::Strip;
      if (node["unknown_keys"])
        policy = unknown_keys_policy(node["unknown_keys"],
                                     child(path, "unknown_keys"));
      return object(shape, policy);
    }

    if (type == "array") {
      YAML::Node element = require_key(node, "element", path, type);
      Schema s = array(build(element, child(path, "element")));
      return apply_array_checks(s, node, path);
    }

    if (type == "tuple") {
      YAML::Node items = require_key(node, "items", path, type);
      if (!items.IsSequence())
        fail(child(path, "items"), "expected a sequence of schemas");
      std::vector<Schema> list;
      auto items_path = child(path, "items");
      for (std::size_t i = 0; i < items.size(); ++i)
        list.push_back(build(items[i], child(items_path, std::to_string(i))));
      Schema s = tuple(list);
      if (node["rest"])
        s = s.rest(build(node["rest"], child(path, "rest")));
      return s;
    }

    if (type == "union" || type == "discriminated_union") {
      YAML::Node options = require_key(node, "options", path, type);
      if (!options.IsSequence() || options.size() == 0)
        fail(child(path, "options"), "expected a non-empty sequence of schemas");
      std::vector<Schema> list;
      auto options_path = child(path, "options");
      for (std::size_t i = 0; i < options.size(); ++i)
        list.push_back(build(options[i], child(options_path, std::to_string(i))));
      if (type == "union")
        return union_(list);
      auto key = scalar<std::string>(
          require_key(node, "discriminator", path, type),
          child(path, "discriminator"), "a field name");
      return discriminated_union(key, list);
    }

    if (type == "intersection") {
      Schema left = build(require_key(node, "left", path, type),
                          child(path, "left"));
      Schema right = build(require_key(node, "right", path, type),
                           child(path, "right"));
      return intersection(left, right);
    }

    // record
    Schema value = build(require_key(node, "value", path, type),
                         child(path, "value"));
    if (node["key"])
      return record(build(node["key"], child(path, "key")), value);
    return record(value);
  } catch (const SchemaError &e) {
    if (!e.where().empty())
      throw;
    // Factory errors carry no location; attach this node's path
    throw SchemaError(e.what(), node_path(path));
  }
}

} // namespace schemakit
