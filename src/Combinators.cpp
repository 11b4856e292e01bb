#include "schemakit/Combinators.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <functional>

namespace schemakit {

namespace {

const ObjectDef &object_def(const Schema &schema, const char *op) {
  if (schema.kind() != NodeKind::Object) {
    throw SchemaError(fmt::format("{}() requires an object schema, got {}", op,
                                  node_kind_name(schema.kind())));
  }
  return schema.node()->as<ObjectDef>();
}

Schema rebuild(const Schema &base, Shape shape) {
  ObjectDef d;
  d.shape = std::move(shape);
  d.unknown_keys = base.node()->as<ObjectDef>().unknown_keys;
  return Schema(SchemaNode::make(NodeKind::Object, std::move(d), {},
                                 base.description()));
}

bool selected(const std::vector<std::string> *fields, const std::string &name) {
  if (!fields)
    return true;
  return std::find(fields->begin(), fields->end(), name) != fields->end();
}

Schema map_fields(const Schema &base, const char *op,
                  const std::vector<std::string> *fields,
                  const std::function<NodePtr(const NodePtr &)> &fn) {
  Shape shape = object_def(base, op).shape;
  for (auto &[name, node] : shape) {
    if (selected(fields, name))
      node = fn(node);
  }
  return rebuild(base, std::move(shape));
}

NodePtr make_optional(const NodePtr &node) {
  return Schema(node).optional().node();
}

NodePtr strip_optional(const NodePtr &node) {
  if (node->kind == NodeKind::Optional)
    return node->as<WrapperDef>().inner;
  return node;
}

} // namespace

Schema extend(const Schema &base, const ShapeSpec &fields) {
  Shape shape = object_def(base, "extend").shape;
  for (const auto &[name, schema] : fields) {
    auto it = std::find_if(shape.begin(), shape.end(),
                           [&name = name](const auto &f) { return f.first == name; });
    if (it != shape.end()) {
      it->second = schema.node();
    } else {
      shape.emplace_back(name, schema.node());
    }
  }
  return rebuild(base, std::move(shape));
}

Schema merge(const Schema &a, const Schema &b) {
  const auto &other = object_def(b, "merge");
  ShapeSpec fields;
  fields.reserve(other.shape.size());
  for (const auto &[name, node] : other.shape)
    fields.emplace_back(name, Schema(node));
  return extend(a, fields);
}

Schema partial(const Schema &base) {
  return map_fields(base, "partial", nullptr, make_optional);
}

Schema partial(const Schema &base, const std::vector<std::string> &fields) {
  return map_fields(base, "partial", &fields, make_optional);
}

Schema required(const Schema &base) {
  return map_fields(base, "required", nullptr, strip_optional);
}

Schema required(const Schema &base, const std::vector<std::string> &fields) {
  return map_fields(base, "required", &fields, strip_optional);
}

Schema pick(const Schema &base, const std::vector<std::string> &fields) {
  Shape shape;
  for (const auto &entry : object_def(base, "pick").shape) {
    if (selected(&fields, entry.first))
      shape.push_back(entry);
  }
  return rebuild(base, std::move(shape));
}

Schema omit(const Schema &base, const std::vector<std::string> &fields) {
  Shape shape;
  for (const auto &entry : object_def(base, "omit").shape) {
    if (!selected(&fields, entry.first))
      shape.push_back(entry);
  }
  return rebuild(base, std::move(shape));
}

} // namespace schemakit
