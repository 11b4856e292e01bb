#include "schemakit/Schema.hpp"
#include "schemakit/engine/ValidationEngine.hpp"

#include <fmt/format.h>
#include <set>
#include <type_traits>

namespace schemakit {

namespace {

std::vector<NodePtr> children_of(const NodeDef &def) {
  std::vector<NodePtr> out;
  std::visit(
      [&out](const auto &d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, ObjectDef>) {
          for (const auto &[name, node] : d.shape)
            out.push_back(node);
        } else if constexpr (std::is_same_v<T, ArrayDef>) {
          out.push_back(d.element);
        } else if constexpr (std::is_same_v<T, TupleDef>) {
          out.insert(out.end(), d.items.begin(), d.items.end());
          if (d.rest)
            out.push_back(d.rest);
        } else if constexpr (std::is_same_v<T, UnionDef>) {
          out.insert(out.end(), d.options.begin(), d.options.end());
        } else if constexpr (std::is_same_v<T, DiscriminatedUnionDef>) {
          for (const auto &[key, node] : d.branches)
            out.push_back(node);
        } else if constexpr (std::is_same_v<T, IntersectionDef>) {
          out.push_back(d.left);
          out.push_back(d.right);
        } else if constexpr (std::is_same_v<T, RecordDef>) {
          if (d.key)
            out.push_back(d.key);
          out.push_back(d.value);
        } else if constexpr (std::is_same_v<T, WrapperDef> ||
                             std::is_same_v<T, DefaultDef> ||
                             std::is_same_v<T, EffectsDef>) {
          out.push_back(d.inner);
        }
      },
      def);
  return out;
}

std::string check_kind_name(CheckKind kind) {
  switch (kind) {
  case CheckKind::MinLength:
    return "min";
  case CheckKind::MaxLength:
    return "max";
  case CheckKind::Length:
    return "length";
  case CheckKind::Regex:
    return "regex";
  case CheckKind::Email:
    return "email";
  case CheckKind::Url:
    return "url";
  case CheckKind::Uuid:
    return "uuid";
  case CheckKind::StartsWith:
    return "starts_with";
  case CheckKind::EndsWith:
    return "ends_with";
  case CheckKind::Includes:
    return "includes";
  case CheckKind::Int:
    return "int";
  case CheckKind::Min:
    return "min";
  case CheckKind::Max:
    return "max";
  case CheckKind::MultipleOf:
    return "multiple_of";
  case CheckKind::Finite:
    return "finite";
  case CheckKind::MinDate:
    return "min_date";
  case CheckKind::MaxDate:
    return "max_date";
  }
  return "unknown";
}

bool check_supported(CheckKind check, NodeKind node) {
  switch (check) {
  case CheckKind::MinLength:
  case CheckKind::MaxLength:
  case CheckKind::Length:
    return node == NodeKind::String || node == NodeKind::Array;
  case CheckKind::Regex:
  case CheckKind::Email:
  case CheckKind::Url:
  case CheckKind::Uuid:
  case CheckKind::StartsWith:
  case CheckKind::EndsWith:
  case CheckKind::Includes:
    return node == NodeKind::String;
  case CheckKind::Int:
  case CheckKind::Min:
  case CheckKind::Max:
  case CheckKind::MultipleOf:
  case CheckKind::Finite:
    return node == NodeKind::Number;
  case CheckKind::MinDate:
  case CheckKind::MaxDate:
    return node == NodeKind::Date;
  }
  return false;
}

bool is_wrapper(NodeKind kind) {
  return kind == NodeKind::Optional || kind == NodeKind::Nullable ||
         kind == NodeKind::Default || kind == NodeKind::Effects;
}

// Kind of the innermost non-wrapper node
NodeKind base_kind(const NodePtr &node) {
  const SchemaNode *n = node.get();
  while (is_wrapper(n->kind)) {
    switch (n->kind) {
    case NodeKind::Default:
      n = n->as<DefaultDef>().inner.get();
      break;
    case NodeKind::Effects:
      n = n->as<EffectsDef>().inner.get();
      break;
    default:
      n = n->as<WrapperDef>().inner.get();
      break;
    }
  }
  return n->kind;
}

std::size_t to_length(double n, const char *what) {
  if (n < 0 || n != static_cast<double>(static_cast<std::size_t>(n))) {
    throw SchemaError(
        fmt::format("{} length bound must be a non-negative integer", what));
  }
  return static_cast<std::size_t>(n);
}

bool is_primitive_value(const Value &v) {
  return !v.is_array() && !v.is_object() && !v.is_date();
}

} // namespace

std::string node_kind_name(NodeKind kind) {
  switch (kind) {
  case NodeKind::String:
    return "string";
  case NodeKind::Number:
    return "number";
  case NodeKind::Boolean:
    return "boolean";
  case NodeKind::Date:
    return "date";
  case NodeKind::Null:
    return "null";
  case NodeKind::Undefined:
    return "undefined";
  case NodeKind::Literal:
    return "literal";
  case NodeKind::Enum:
    return "enum";
  case NodeKind::Object:
    return "object";
  case NodeKind::Array:
    return "array";
  case NodeKind::Tuple:
    return "tuple";
  case NodeKind::Union:
    return "union";
  case NodeKind::DiscriminatedUnion:
    return "discriminated_union";
  case NodeKind::Intersection:
    return "intersection";
  case NodeKind::Record:
    return "record";
  case NodeKind::Optional:
    return "optional";
  case NodeKind::Nullable:
    return "nullable";
  case NodeKind::Default:
    return "default";
  case NodeKind::Effects:
    return "effects";
  }
  return "unknown";
}

std::string discriminator_key(const Value &value) {
  return value_kind_name(value.kind()) + ":" + value.describe();
}

const NodePtr *ObjectDef::find(const std::string &name) const {
  for (const auto &[field, node] : shape) {
    if (field == name)
      return &node;
  }
  return nullptr;
}

NodePtr SchemaNode::make(NodeKind kind, NodeDef def, std::vector<Check> checks,
                         std::string description) {
  auto node = std::make_shared<SchemaNode>();
  node->kind = kind;
  node->checks = std::move(checks);
  node->description = std::move(description);

  bool async = false;
  for (const auto &child : children_of(def)) {
    if (!child)
      throw SchemaError(fmt::format("{} schema has a null child",
                                    node_kind_name(kind)));
    async = async || child->has_async;
  }
  if (const auto *effects = std::get_if<EffectsDef>(&def)) {
    for (const auto &effect : effects->effects)
      async = async || effect.async;
  }
  node->has_async = async;
  node->def = std::move(def);
  return node;
}

NodePtr SchemaNode::with_checks(std::vector<Check> list) const {
  return make(kind, def, std::move(list), description);
}

NodePtr SchemaNode::with_description(std::string text) const {
  return make(kind, def, checks, std::move(text));
}

// ---------------- Schema ----------------

Schema::Schema(NodePtr node) : node_(std::move(node)) {
  if (!node_)
    throw SchemaError("Schema requires a node");
}

Schema Schema::with_check(Check check) const {
  switch (node_->kind) {
  case NodeKind::Optional:
  case NodeKind::Nullable: {
    auto inner = Schema(node_->as<WrapperDef>().inner).with_check(check);
    return Schema(SchemaNode::make(node_->kind, WrapperDef{inner.node()},
                                   node_->checks, node_->description));
  }
  case NodeKind::Default: {
    const auto &d = node_->as<DefaultDef>();
    auto inner = Schema(d.inner).with_check(check);
    return Schema(SchemaNode::make(node_->kind,
                                   DefaultDef{inner.node(), d.default_value},
                                   node_->checks, node_->description));
  }
  case NodeKind::Effects: {
    const auto &d = node_->as<EffectsDef>();
    auto inner = Schema(d.inner).with_check(check);
    return Schema(SchemaNode::make(node_->kind,
                                   EffectsDef{inner.node(), d.effects},
                                   node_->checks, node_->description));
  }
  default:
    break;
  }

  if (!check_supported(check.kind, node_->kind)) {
    throw SchemaError(fmt::format("'{}' check is not supported on {} schemas",
                                  check_kind_name(check.kind),
                                  node_kind_name(node_->kind)));
  }
  auto list = node_->checks;
  list.push_back(std::move(check));
  return Schema(node_->with_checks(std::move(list)));
}

Schema Schema::with_effect(Effect effect) const {
  if (node_->kind == NodeKind::Effects) {
    const auto &d = node_->as<EffectsDef>();
    auto effects = d.effects;
    effects.push_back(std::move(effect));
    return Schema(SchemaNode::make(NodeKind::Effects,
                                   EffectsDef{d.inner, std::move(effects)},
                                   node_->checks, node_->description));
  }
  std::vector<Effect> effects;
  effects.push_back(std::move(effect));
  return Schema(SchemaNode::make(NodeKind::Effects,
                                 EffectsDef{node_, std::move(effects)}, {},
                                 node_->description));
}

Schema Schema::with_unknown_keys(UnknownKeys policy) const {
  if (node_->kind != NodeKind::Object) {
    throw SchemaError(fmt::format("unknown-key policy requires an object "
                                  "schema, got {}",
                                  node_kind_name(node_->kind)));
  }
  ObjectDef d = node_->as<ObjectDef>();
  d.unknown_keys = policy;
  return Schema(SchemaNode::make(NodeKind::Object, std::move(d), node_->checks,
                                 node_->description));
}

Schema Schema::min(double n, std::string message) const {
  switch (base_kind(node_)) {
  case NodeKind::Number:
    return with_check(checks::min(n, true, std::move(message)));
  case NodeKind::String:
  case NodeKind::Array:
    return with_check(checks::min_length(to_length(n, "min"), std::move(message)));
  default:
    throw SchemaError(fmt::format("'min' is not supported on {} schemas",
                                  node_kind_name(base_kind(node_))));
  }
}

Schema Schema::max(double n, std::string message) const {
  switch (base_kind(node_)) {
  case NodeKind::Number:
    return with_check(checks::max(n, true, std::move(message)));
  case NodeKind::String:
  case NodeKind::Array:
    return with_check(checks::max_length(to_length(n, "max"), std::move(message)));
  default:
    throw SchemaError(fmt::format("'max' is not supported on {} schemas",
                                  node_kind_name(base_kind(node_))));
  }
}

Schema Schema::length(std::size_t n, std::string message) const {
  return with_check(checks::length(n, std::move(message)));
}

Schema Schema::nonempty(std::string message) const {
  return with_check(checks::min_length(1, std::move(message)));
}

Schema Schema::regex(const std::string &pattern, std::string message) const {
  return with_check(checks::regex(pattern, std::move(message)));
}

Schema Schema::email(std::string message) const {
  return with_check(checks::email(std::move(message)));
}

Schema Schema::url(std::string message) const {
  return with_check(checks::url(std::move(message)));
}

Schema Schema::uuid(std::string message) const {
  return with_check(checks::uuid(std::move(message)));
}

Schema Schema::starts_with(std::string prefix, std::string message) const {
  return with_check(checks::starts_with(std::move(prefix), std::move(message)));
}

Schema Schema::ends_with(std::string suffix, std::string message) const {
  return with_check(checks::ends_with(std::move(suffix), std::move(message)));
}

Schema Schema::includes(std::string needle, std::string message) const {
  return with_check(checks::includes(std::move(needle), std::move(message)));
}

Schema Schema::int_(std::string message) const {
  return with_check(checks::integer(std::move(message)));
}

Schema Schema::positive(std::string message) const {
  return with_check(checks::min(0, false, std::move(message)));
}

Schema Schema::negative(std::string message) const {
  return with_check(checks::max(0, false, std::move(message)));
}

Schema Schema::nonnegative(std::string message) const {
  return with_check(checks::min(0, true, std::move(message)));
}

Schema Schema::nonpositive(std::string message) const {
  return with_check(checks::max(0, true, std::move(message)));
}

Schema Schema::gt(double n, std::string message) const {
  return with_check(checks::min(n, false, std::move(message)));
}

Schema Schema::gte(double n, std::string message) const {
  return with_check(checks::min(n, true, std::move(message)));
}

Schema Schema::lt(double n, std::string message) const {
  return with_check(checks::max(n, false, std::move(message)));
}

Schema Schema::lte(double n, std::string message) const {
  return with_check(checks::max(n, true, std::move(message)));
}

Schema Schema::multiple_of(double n, std::string message) const {
  return with_check(checks::multiple_of(n, std::move(message)));
}

Schema Schema::finite(std::string message) const {
  return with_check(checks::finite(std::move(message)));
}

Schema Schema::min_date(const Date &bound, std::string message) const {
  return with_check(checks::min_date(bound, std::move(message)));
}

Schema Schema::max_date(const Date &bound, std::string message) const {
  return with_check(checks::max_date(bound, std::move(message)));
}

Schema Schema::optional() const {
  // Optional(Optional(x)) is never built
  if (node_->kind == NodeKind::Optional)
    return *this;
  return Schema(SchemaNode::make(NodeKind::Optional, WrapperDef{node_}, {},
                                 node_->description));
}

Schema Schema::nullable() const {
  if (node_->kind == NodeKind::Nullable)
    return *this;
  return Schema(SchemaNode::make(NodeKind::Nullable, WrapperDef{node_}, {},
                                 node_->description));
}

Schema Schema::default_(Value value) const {
  return Schema(SchemaNode::make(NodeKind::Default,
                                 DefaultDef{node_, std::move(value)}, {},
                                 node_->description));
}

Schema Schema::describe(std::string text) const {
  return Schema(node_->with_description(std::move(text)));
}

Schema Schema::refine(RefineFn predicate, const std::string &message) const {
  RefineOptions options;
  options.message = message;
  return refine(std::move(predicate), std::move(options));
}

Schema Schema::refine(RefineFn predicate, RefineOptions options) const {
  return with_effect(
      Effect::make_refine(std::move(predicate), std::move(options)));
}

Schema Schema::refine_async(AsyncRefineFn predicate,
                            const std::string &message) const {
  RefineOptions options;
  options.message = message;
  return refine_async(std::move(predicate), std::move(options));
}

Schema Schema::refine_async(AsyncRefineFn predicate,
                            RefineOptions options) const {
  return with_effect(
      Effect::make_refine(std::move(predicate), std::move(options)));
}

Schema Schema::super_refine(SuperRefineFn fn) const {
  return with_effect(Effect::make_super_refine(std::move(fn)));
}

Schema Schema::super_refine_async(AsyncSuperRefineFn fn) const {
  return with_effect(Effect::make_super_refine(std::move(fn)));
}

Schema Schema::transform(std::function<Value(const Value &)> fn) const {
  if (!fn)
    throw SchemaError("transform requires a callable");
  return transform(TransformFn(
      [fn = std::move(fn)](const Value &v, RefinementContext &) {
        return fn(v);
      }));
}

Schema Schema::transform(TransformFn fn) const {
  return with_effect(Effect::make_transform(std::move(fn)));
}

Schema Schema::transform_async(AsyncTransformFn fn) const {
  return with_effect(Effect::make_transform(std::move(fn)));
}

Schema Schema::strict() const { return with_unknown_keys(UnknownKeys::Strict); }

Schema Schema::strip() const { return with_unknown_keys(UnknownKeys::Strip); }

Schema Schema::passthrough() const {
  return with_unknown_keys(UnknownKeys::Passthrough);
}

const Shape &Schema::shape() const {
  if (node_->kind != NodeKind::Object) {
    throw SchemaError(fmt::format("shape() requires an object schema, got {}",
                                  node_kind_name(node_->kind)));
  }
  return node_->as<ObjectDef>().shape;
}

UnknownKeys Schema::unknown_keys() const {
  if (node_->kind != NodeKind::Object) {
    throw SchemaError(fmt::format(
        "unknown_keys() requires an object schema, got {}",
        node_kind_name(node_->kind)));
  }
  return node_->as<ObjectDef>().unknown_keys;
}

Schema Schema::rest(const Schema &schema) const {
  if (node_->kind != NodeKind::Tuple) {
    throw SchemaError(fmt::format("rest() requires a tuple schema, got {}",
                                  node_kind_name(node_->kind)));
  }
  TupleDef d = node_->as<TupleDef>();
  d.rest = schema.node();
  return Schema(SchemaNode::make(NodeKind::Tuple, std::move(d), node_->checks,
                                 node_->description));
}

Schema Schema::unwrap() const {
  switch (node_->kind) {
  case NodeKind::Optional:
  case NodeKind::Nullable:
    return Schema(node_->as<WrapperDef>().inner);
  case NodeKind::Default:
    return Schema(node_->as<DefaultDef>().inner);
  default:
    return *this;
  }
}

Result Schema::validate(const Value &value) const {
  return engine::validate(node_, value);
}

std::future<Result> Schema::validate_async(Value value,
                                           engine::AsyncOptions options) const {
  return engine::validate_async(node_, std::move(value), options);
}

Value Schema::parse(const Value &value) const {
  Result result = validate(value);
  if (!result.ok())
    throw ValidationError(result.issues());
  return result.value();
}

SafeParseResult Schema::safe_parse(const Value &value) const {
  return SafeParseResult::from_result(validate(value));
}

std::future<Value> Schema::parse_async(Value value) const {
  return engine::start_worker([node = node_, value = std::move(value)]() {
    Result result = engine::run_async_walk(node, value, {});
    if (!result.ok())
      throw ValidationError(result.issues());
    return result.value();
  });
}

std::future<SafeParseResult> Schema::safe_parse_async(Value value) const {
  return engine::start_worker([node = node_, value = std::move(value)]() {
    return SafeParseResult::from_result(engine::run_async_walk(node, value, {}));
  });
}

// ---------------- Construction surface ----------------

Schema string() {
  return Schema(SchemaNode::make(NodeKind::String, PrimitiveDef{}));
}

Schema number() {
  return Schema(SchemaNode::make(NodeKind::Number, PrimitiveDef{}));
}

Schema boolean() {
  return Schema(SchemaNode::make(NodeKind::Boolean, PrimitiveDef{}));
}

Schema date() { return Schema(SchemaNode::make(NodeKind::Date, PrimitiveDef{})); }

Schema null_() { return Schema(SchemaNode::make(NodeKind::Null, PrimitiveDef{})); }

Schema undefined_() {
  return Schema(SchemaNode::make(NodeKind::Undefined, PrimitiveDef{}));
}

Schema literal(Value value) {
  if (value.is_array() || value.is_object()) {
    throw SchemaError("literal() requires a primitive value");
  }
  return Schema(SchemaNode::make(NodeKind::Literal, LiteralDef{std::move(value)}));
}

Schema enum_(std::vector<Value> values) {
  if (values.empty())
    throw SchemaError("enum_() requires at least one value");
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (!is_primitive_value(values[i])) {
      throw SchemaError(fmt::format("enum_() value {} is not a primitive", i));
    }
    for (std::size_t j = 0; j < i; ++j) {
      if (values[i] == values[j]) {
        throw SchemaError(fmt::format("duplicate enum value {}",
                                      values[i].describe()));
      }
    }
  }
  return Schema(SchemaNode::make(NodeKind::Enum, EnumDef{std::move(values)}));
}

Schema object(const ShapeSpec &shape, UnknownKeys unknown_keys) {
  ObjectDef d;
  d.unknown_keys = unknown_keys;
  std::set<std::string> seen;
  for (const auto &[name, schema] : shape) {
    if (!seen.insert(name).second) {
      throw SchemaError(fmt::format("duplicate field '{}' in object shape", name));
    }
    d.shape.emplace_back(name, schema.node());
  }
  return Schema(SchemaNode::make(NodeKind::Object, std::move(d)));
}

Schema array(const Schema &element) {
  return Schema(SchemaNode::make(NodeKind::Array, ArrayDef{element.node()}));
}

Schema tuple(const std::vector<Schema> &items) {
  TupleDef d;
  for (const auto &item : items)
    d.items.push_back(item.node());
  return Schema(SchemaNode::make(NodeKind::Tuple, std::move(d)));
}

Schema union_(const std::vector<Schema> &options) {
  if (options.empty())
    throw SchemaError("union_() requires at least one option");
  UnionDef d;
  for (const auto &option : options)
    d.options.push_back(option.node());
  return Schema(SchemaNode::make(NodeKind::Union, std::move(d)));
}

namespace {

void add_branch(DiscriminatedUnionDef &d, const Value &key,
                const NodePtr &branch) {
  if (!is_primitive_value(key)) {
    throw SchemaError("discriminator values must be primitives");
  }
  if (!d.branches.emplace(discriminator_key(key), branch).second) {
    throw SchemaError(fmt::format("duplicate discriminator value {} for '{}'",
                                  key.describe(), d.discriminator));
  }
  d.option_values.push_back(key);
}

void require_object_branch(const Schema &branch, std::size_t index) {
  if (branch.kind() != NodeKind::Object) {
    throw SchemaError(fmt::format(
        "discriminated_union() branch {} must be an object schema, got {}",
        index, node_kind_name(branch.kind())));
  }
}

} // namespace

Schema discriminated_union(const std::string &discriminator,
                           const std::vector<Schema> &branches) {
  DiscriminatedUnionDef d;
  d.discriminator = discriminator;
  for (std::size_t i = 0; i < branches.size(); ++i) {
    const auto &branch = branches[i];
    require_object_branch(branch, i);
    const NodePtr *field = branch.node()->as<ObjectDef>().find(discriminator);
    if (!field) {
      throw SchemaError(fmt::format(
          "discriminated_union() branch {} has no '{}' field", i, discriminator));
    }
    const auto &field_node = **field;
    if (field_node.kind == NodeKind::Literal) {
      add_branch(d, field_node.as<LiteralDef>().value, branch.node());
    } else if (field_node.kind == NodeKind::Enum) {
      for (const auto &v : field_node.as<EnumDef>().values)
        add_branch(d, v, branch.node());
    } else {
      throw SchemaError(fmt::format(
          "discriminated_union() branch {} field '{}' must be a literal or "
          "enum, got {}",
          i, discriminator, node_kind_name(field_node.kind)));
    }
  }
  return Schema(SchemaNode::make(NodeKind::DiscriminatedUnion, std::move(d)));
}

Schema discriminated_union(const std::string &discriminator,
                           const std::vector<std::pair<Value, Schema>> &branches) {
  DiscriminatedUnionDef d;
  d.discriminator = discriminator;
  for (std::size_t i = 0; i < branches.size(); ++i) {
    require_object_branch(branches[i].second, i);
    add_branch(d, branches[i].first, branches[i].second.node());
  }
  return Schema(SchemaNode::make(NodeKind::DiscriminatedUnion, std::move(d)));
}

Schema intersection(const Schema &left, const Schema &right) {
  return Schema(SchemaNode::make(NodeKind::Intersection,
                                 IntersectionDef{left.node(), right.node()}));
}

Schema record(const Schema &value) {
  return Schema(
      SchemaNode::make(NodeKind::Record, RecordDef{nullptr, value.node()}));
}

Schema record(const Schema &key, const Schema &value) {
  return Schema(
      SchemaNode::make(NodeKind::Record, RecordDef{key.node(), value.node()}));
}

Schema preprocess(PreprocessFn fn, const Schema &inner) {
  if (!fn)
    throw SchemaError("preprocess requires a callable");
  std::vector<Effect> effects;
  effects.push_back(Effect::make_preprocess(std::move(fn)));
  return Schema(SchemaNode::make(NodeKind::Effects,
                                 EffectsDef{inner.node(), std::move(effects)}));
}

} // namespace schemakit
