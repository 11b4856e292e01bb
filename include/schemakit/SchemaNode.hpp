#pragma once
#include "schemakit/Checks.hpp"
#include "schemakit/Effects.hpp"
#include "schemakit/Value.hpp"
#include "schemakit/export.h"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace schemakit {

enum class NodeKind {
  String,
  Number,
  Boolean,
  Date,
  Null,
  Undefined,
  Literal,
  Enum,
  Object,
  Array,
  Tuple,
  Union,
  DiscriminatedUnion,
  Intersection,
  Record,
  Optional,
  Nullable,
  Default,
  Effects
};

SCHEMAKIT_API std::string node_kind_name(NodeKind kind);

/// Handling of object keys not declared in the shape
enum class UnknownKeys { Strict, Strip, Passthrough };

struct SchemaNode;
using NodePtr = std::shared_ptr<const SchemaNode>;
using Shape = std::vector<std::pair<std::string, NodePtr>>;

// Payloads, one per node family

struct PrimitiveDef {};

struct LiteralDef {
  Value value;
};

struct EnumDef {
  std::vector<Value> values;
};

struct ObjectDef {
  Shape shape;
  UnknownKeys unknown_keys{UnknownKeys::Strip};

  const NodePtr *find(const std::string &name) const;
};

struct ArrayDef {
  NodePtr element;
};

struct TupleDef {
  std::vector<NodePtr> items;
  NodePtr rest; // null when the arity is exact
};

struct UnionDef {
  std::vector<NodePtr> options;
};

struct DiscriminatedUnionDef {
  std::string discriminator;
  // Declaration order, for error listings
  std::vector<Value> option_values;
  // Keyed by discriminator_key(value)
  std::map<std::string, NodePtr> branches;
};

struct IntersectionDef {
  NodePtr left;
  NodePtr right;
};

struct RecordDef {
  NodePtr key; // null accepts any key
  NodePtr value;
};

struct WrapperDef {
  NodePtr inner;
};

struct DefaultDef {
  NodePtr inner;
  Value default_value;
};

struct EffectsDef {
  NodePtr inner;
  std::vector<Effect> effects;
};

using NodeDef =
    std::variant<PrimitiveDef, LiteralDef, EnumDef, ObjectDef, ArrayDef,
                 TupleDef, UnionDef, DiscriminatedUnionDef, IntersectionDef,
                 RecordDef, WrapperDef, DefaultDef, EffectsDef>;

/// Immutable schema tree node. Built only through SchemaNode::make, shared
/// between schemas via NodePtr.
struct SCHEMAKIT_API SchemaNode {
  NodeKind kind{NodeKind::String};
  NodeDef def;
  std::vector<Check> checks;
  std::string description;
  // True if an asynchronous effect exists anywhere in this subtree
  bool has_async{false};

  template <typename T> const T &as() const { return std::get<T>(def); }

  static NodePtr make(NodeKind kind, NodeDef def,
                      std::vector<Check> checks = {},
                      std::string description = "");

  // Copy of this node with one replaced field
  NodePtr with_checks(std::vector<Check> checks) const;
  NodePtr with_description(std::string description) const;
};

/// Map key for discriminator lookup; distinguishes "1" from 1
SCHEMAKIT_API std::string discriminator_key(const Value &value);

} // namespace schemakit
