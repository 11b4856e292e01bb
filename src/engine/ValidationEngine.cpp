#include "schemakit/engine/ValidationEngine.hpp"
#include "schemakit/Logger.hpp"
#include "schemakit/ValueConversion.hpp"
#include "schemakit/engine/AsyncCoordinator.hpp"
#include "schemakit/engine/EffectPipeline.hpp"
#include "schemakit/engine/UnionResolver.hpp"

#include <fmt/format.h>

#include <cmath>
#include <set>
#include <string>
#include <vector>

namespace schemakit {
namespace engine {

namespace {

// Stands in for object members absent from the input
const Value &missing() {
  static const Value kMissing;
  return kMissing;
}

const Value *member_or_missing(const ValueObject &obj, const std::string &key) {
  auto it = obj.find(key);
  return it == obj.end() ? &missing() : &it->second;
}

std::string expected_name(NodeKind kind) {
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
  default:
    return node_kind_name(kind);
  }
}

bool matches_kind(NodeKind kind, const Value &value) {
  switch (kind) {
  case NodeKind::String:
    return value.is_string();
  case NodeKind::Number:
    return value.is_number() && !std::isnan(value.as_number());
  case NodeKind::Boolean:
    return value.is_bool();
  case NodeKind::Date:
    return value.is_date();
  case NodeKind::Null:
    return value.is_null();
  case NodeKind::Undefined:
    return value.is_undefined();
  default:
    return false;
  }
}

std::string quote_if_string(const Value &v) {
  if (v.is_string())
    return fmt::format("'{}'", v.as_string());
  return v.describe();
}

Result to_result(Outcome outcome) {
  if (outcome.issues.empty())
    return Result::success(std::move(outcome.value));
  return Result::failure(std::move(outcome.issues));
}

Issue async_in_sync_issue(const Path &path) {
  Issue issue;
  issue.code = IssueCode::AsyncEffectEncountered;
  issue.path = path;
  issue.message = "Asynchronous effect encountered during synchronous "
                  "validation; use the async entry points";
  return issue;
}

} // namespace

Path child_path(const Path &parent, PathSegment segment) {
  Path path = parent;
  path.push_back(std::move(segment));
  return path;
}

std::optional<Value> merge_values(const Value &a, const Value &b) {
  if (a == b)
    return a;

  if (a.is_object() && b.is_object()) {
    ValueObject merged = a.as_object();
    for (const auto &[key, rhs] : b.as_object()) {
      auto it = merged.find(key);
      if (it == merged.end()) {
        merged.emplace(key, rhs);
        continue;
      }
      auto sub = merge_values(it->second, rhs);
      if (!sub)
        return std::nullopt;
      it->second = std::move(*sub);
    }
    return Value(std::move(merged));
  }

  if (a.is_array() && b.is_array()) {
    const auto &lhs = a.as_array();
    const auto &rhs = b.as_array();
    if (lhs.size() != rhs.size())
      return std::nullopt;
    ValueArray merged;
    merged.reserve(lhs.size());
    for (std::size_t i = 0; i < lhs.size(); ++i) {
      auto sub = merge_values(lhs[i], rhs[i]);
      if (!sub)
        return std::nullopt;
      merged.push_back(std::move(*sub));
    }
    return Value(std::move(merged));
  }

  return std::nullopt;
}

ValidationEngine ValidationEngine::with_token(
    std::shared_ptr<const CancellationToken> token) const {
  ExecContext ctx = ctx_;
  ctx.token = std::move(token);
  return ValidationEngine(std::move(ctx));
}

Outcome ValidationEngine::run(const SchemaNode &node, const Value &value,
                              const Path &path) const {
  if (ctx_.cancelled())
    return Outcome::aborted(std::vector<Issue>{});

  switch (node.kind) {
  case NodeKind::String:
  case NodeKind::Number:
  case NodeKind::Boolean:
  case NodeKind::Date:
  case NodeKind::Null:
  case NodeKind::Undefined:
    return run_primitive(node, value, path);
  case NodeKind::Literal:
    return run_literal(node, value, path);
  case NodeKind::Enum:
    return run_enum(node, value, path);
  case NodeKind::Object:
    return run_object(node, value, path);
  case NodeKind::Array:
    return run_array(node, value, path);
  case NodeKind::Tuple:
    return run_tuple(node, value, path);
  case NodeKind::Union:
    return UnionResolver(*this).resolve(node, value, path);
  case NodeKind::DiscriminatedUnion:
    return UnionResolver(*this).resolve_discriminated(node, value, path);
  case NodeKind::Intersection:
    return run_intersection(node, value, path);
  case NodeKind::Record:
    return run_record(node, value, path);
  case NodeKind::Optional:
    if (value.is_undefined())
      return Outcome::valid(Value());
    return run(*node.as<WrapperDef>().inner, value, path);
  case NodeKind::Nullable:
    if (value.is_null())
      return Outcome::valid(Value(nullptr));
    return run(*node.as<WrapperDef>().inner, value, path);
  case NodeKind::Default: {
    const auto &d = node.as<DefaultDef>();
    if (value.is_undefined())
      return run(*d.inner, d.default_value, path);
    return run(*d.inner, value, path);
  }
  case NodeKind::Effects:
    return run_effects(node, value, path);
  }

  throw SchemaError("unhandled node kind " + node_kind_name(node.kind),
                    path_to_string(path));
}

Outcome ValidationEngine::run_primitive(const SchemaNode &node,
                                        const Value &value,
                                        const Path &path) const {
  if (!matches_kind(node.kind, value)) {
    return Outcome::aborted(issues::invalid_type(path, expected_name(node.kind),
                                                 received_type_name(value)));
  }

  if (node.kind == NodeKind::Date && !value.as_date().valid) {
    Issue issue;
    issue.code = IssueCode::InvalidDate;
    issue.path = path;
    issue.message = "Invalid date";
    return Outcome::aborted(std::move(issue));
  }

  Outcome outcome = Outcome::valid(value);
  std::vector<Issue> failed;
  if (!run_checks(node.checks, value, path, failed)) {
    for (auto &issue : failed)
      outcome.add_issue(std::move(issue));
  }
  return outcome;
}

Outcome ValidationEngine::run_literal(const SchemaNode &node,
                                      const Value &value,
                                      const Path &path) const {
  const auto &expected = node.as<LiteralDef>().value;
  if (value == expected)
    return Outcome::valid(value);

  Issue issue;
  issue.code = IssueCode::InvalidLiteral;
  issue.path = path;
  issue.params = {{"expected", value_to_json(expected)},
                  {"received", value_to_json(value)}};
  issue.message = fmt::format("Invalid literal value, expected {}",
                              value_to_json(expected).dump());
  return Outcome::aborted(std::move(issue));
}

Outcome ValidationEngine::run_enum(const SchemaNode &node, const Value &value,
                                   const Path &path) const {
  const auto &values = node.as<EnumDef>().values;
  for (const auto &candidate : values) {
    if (candidate == value)
      return Outcome::valid(value);
  }

  std::string expected;
  nlohmann::json options = nlohmann::json::array();
  for (const auto &candidate : values) {
    if (!expected.empty())
      expected += " | ";
    expected += quote_if_string(candidate);
    options.push_back(value_to_json(candidate));
  }

  Issue issue;
  issue.code = IssueCode::InvalidEnumValue;
  issue.path = path;
  issue.params = {{"options", options}, {"received", value_to_json(value)}};
  issue.message = fmt::format("Invalid enum value. Expected {}, received {}",
                              expected, quote_if_string(value));
  return Outcome::aborted(std::move(issue));
}

Outcome ValidationEngine::run_object(const SchemaNode &node,
                                     const Value &value,
                                     const Path &path) const {
  if (!value.is_object()) {
    return Outcome::aborted(
        issues::invalid_type(path, "object", received_type_name(value)));
  }

  const auto &d = node.as<ObjectDef>();
  const auto &input = value.as_object();

  std::vector<ChildTask> tasks;
  tasks.reserve(d.shape.size());
  for (const auto &[name, field] : d.shape) {
    tasks.push_back(
        {field.get(), member_or_missing(input, name), child_path(path, name)});
  }

  std::vector<Outcome> children = AsyncCoordinator(*this).run_all(tasks);

  Outcome outcome = Outcome::valid(Value(ValueObject{}));
  ValueObject &out = outcome.value.as_object();
  std::set<std::string> declared;
  for (std::size_t i = 0; i < d.shape.size(); ++i) {
    const std::string &name = d.shape[i].first;
    declared.insert(name);
    Outcome &child = children[i];
    outcome.absorb(child);
    // An optional field left out of the input stays out of the output
    if (child.value.is_undefined() && input.find(name) == input.end())
      continue;
    out[name] = std::move(child.value);
  }

  std::vector<std::string> extras;
  for (const auto &[key, member] : input) {
    if (declared.count(key) == 0)
      extras.push_back(key);
  }

  if (!extras.empty()) {
    switch (d.unknown_keys) {
    case UnknownKeys::Strict: {
      std::string listing;
      for (const auto &key : extras) {
        if (!listing.empty())
          listing += ", ";
        listing += fmt::format("'{}'", key);
      }
      Issue issue;
      issue.code = IssueCode::UnrecognizedKeys;
      issue.path = path;
      issue.params = {{"keys", extras}};
      issue.message = "Unrecognized key(s) in object: " + listing;
      outcome.add_issue(std::move(issue));
      break;
    }
    case UnknownKeys::Passthrough:
      for (const auto &key : extras)
        out[key] = input.at(key);
      break;
    case UnknownKeys::Strip:
      break;
    }
  }

  if (outcome.is_aborted())
    outcome.value = Value();
  return outcome;
}

Outcome ValidationEngine::run_array(const SchemaNode &node, const Value &value,
                                    const Path &path) const {
  if (!value.is_array()) {
    return Outcome::aborted(
        issues::invalid_type(path, "array", received_type_name(value)));
  }

  Outcome outcome = Outcome::valid(Value(ValueArray{}));
  std::vector<Issue> failed;
  if (!run_checks(node.checks, value, path, failed)) {
    for (auto &issue : failed)
      outcome.add_issue(std::move(issue));
  }

  const auto &items = value.as_array();
  const auto &element = node.as<ArrayDef>().element;
  std::vector<ChildTask> tasks;
  tasks.reserve(items.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    tasks.push_back({element.get(), &items[i], child_path(path, i)});
  }

  std::vector<Outcome> children = AsyncCoordinator(*this).run_all(tasks);
  ValueArray &out = outcome.value.as_array();
  out.reserve(children.size());
  for (auto &child : children) {
    outcome.absorb(child);
    out.push_back(std::move(child.value));
  }

  if (outcome.is_aborted())
    outcome.value = Value();
  return outcome;
}

Outcome ValidationEngine::run_tuple(const SchemaNode &node, const Value &value,
                                    const Path &path) const {
  if (!value.is_array()) {
    return Outcome::aborted(
        issues::invalid_type(path, "array", received_type_name(value)));
  }

  const auto &d = node.as<TupleDef>();
  const auto &items = value.as_array();
  const std::size_t arity = d.items.size();

  if (items.size() < arity) {
    return Outcome::aborted(issues::too_small(
        path, "array", static_cast<double>(arity), true, false, ""));
  }

  Outcome outcome = Outcome::valid(Value(ValueArray{}));
  std::size_t limit = items.size();
  if (!d.rest && items.size() > arity) {
    outcome.add_issue(issues::too_big(path, "array", static_cast<double>(arity),
                                      true, false, ""));
    limit = arity;
  }

  std::vector<ChildTask> tasks;
  tasks.reserve(limit);
  for (std::size_t i = 0; i < limit; ++i) {
    const SchemaNode *schema = i < arity ? d.items[i].get() : d.rest.get();
    tasks.push_back({schema, &items[i], child_path(path, i)});
  }

  std::vector<Outcome> children = AsyncCoordinator(*this).run_all(tasks);
  ValueArray &out = outcome.value.as_array();
  for (auto &child : children) {
    outcome.absorb(child);
    out.push_back(std::move(child.value));
  }

  if (outcome.is_aborted())
    outcome.value = Value();
  return outcome;
}

Outcome ValidationEngine::run_record(const SchemaNode &node,
                                     const Value &value,
                                     const Path &path) const {
  if (!value.is_object()) {
    return Outcome::aborted(
        issues::invalid_type(path, "object", received_type_name(value)));
  }

  const auto &d = node.as<RecordDef>();
  const auto &input = value.as_object();

  // Keys are validated as string values; they need stable storage
  std::vector<Value> keys;
  keys.reserve(input.size());
  for (const auto &entry : input)
    keys.emplace_back(entry.first);

  std::vector<ChildTask> tasks;
  tasks.reserve(input.size() * 2);
  std::size_t index = 0;
  for (const auto &[key, member] : input) {
    Path where = child_path(path, key);
    if (d.key)
      tasks.push_back({d.key.get(), &keys[index], where});
    tasks.push_back({d.value.get(), &member, std::move(where)});
    ++index;
  }

  std::vector<Outcome> children = AsyncCoordinator(*this).run_all(tasks);

  Outcome outcome = Outcome::valid(Value(ValueObject{}));
  ValueObject &out = outcome.value.as_object();
  std::size_t next = 0;
  for (const auto &entry : input) {
    std::string out_key = entry.first;
    if (d.key) {
      Outcome &key_outcome = children[next++];
      outcome.absorb(key_outcome);
      if (key_outcome.value.is_string())
        out_key = key_outcome.value.as_string();
    }
    Outcome &member = children[next++];
    outcome.absorb(member);
    // Later entries win when transformed keys collide
    out[out_key] = std::move(member.value);
  }

  if (outcome.is_aborted())
    outcome.value = Value();
  return outcome;
}

Outcome ValidationEngine::run_intersection(const SchemaNode &node,
                                           const Value &value,
                                           const Path &path) const {
  const auto &d = node.as<IntersectionDef>();
  std::vector<ChildTask> tasks = {{d.left.get(), &value, path},
                                  {d.right.get(), &value, path}};
  std::vector<Outcome> sides = AsyncCoordinator(*this).run_all(tasks);

  Outcome outcome;
  Value left = std::move(sides[0].value);
  Value right = std::move(sides[1].value);
  outcome.absorb(sides[0]);
  outcome.absorb(sides[1]);
  if (outcome.is_aborted())
    return outcome;

  auto merged = merge_values(left, right);
  if (!merged) {
    Issue issue;
    issue.code = IssueCode::InvalidIntersectionTypes;
    issue.path = path;
    issue.message = "Intersection results could not be merged";
    outcome.issues.push_back(std::move(issue));
    outcome.status = Status::Aborted;
    return outcome;
  }

  outcome.value = std::move(*merged);
  return outcome;
}

Outcome ValidationEngine::run_effects(const SchemaNode &node,
                                      const Value &value,
                                      const Path &path) const {
  const auto &d = node.as<EffectsDef>();
  Value input = EffectPipeline::preprocess(d.effects, value);
  Outcome outcome = run(*d.inner, input, path);
  EffectPipeline(ctx_).run(d.effects, outcome, path);
  return outcome;
}

Result validate(const NodePtr &node, const Value &value) {
  if (!node)
    throw SchemaError("validate called without a schema", "");

  ValidationEngine engine(ExecContext{ExecMode::Sync, {}, nullptr});
  try {
    Outcome outcome = engine.run(*node, value, {});
    SK_LOG_DEBUG("ENGINE", "SYNC", "{} validation finished with {} issue(s)",
                 node_kind_name(node->kind), outcome.issues.size());
    return to_result(std::move(outcome));
  } catch (const AsyncEffectAbort &e) {
    SK_LOG_WARN("ENGINE", "SYNC", "asynchronous effect at '{}' in sync call",
                path_to_string(e.path()));
    return Result::failure({async_in_sync_issue(e.path())});
  }
}

Result run_async_walk(const NodePtr &node, const Value &value,
                      const AsyncOptions &options) {
  if (!node)
    throw SchemaError("validate_async called without a schema", "");

  auto root = std::make_shared<CancellationToken>();
  auto workers = std::make_shared<WorkerBudget>(options.max_concurrency);
  ValidationEngine engine(ExecContext{ExecMode::Async, options, root, workers});
  Outcome outcome = engine.run(*node, value, {});
  SK_LOG_DEBUG("ENGINE", "ASYNC", "{} validation finished with {} issue(s)",
               node_kind_name(node->kind), outcome.issues.size());
  return to_result(std::move(outcome));
}

std::future<Result> validate_async(NodePtr node, Value value,
                                   AsyncOptions options) {
  if (!node)
    throw SchemaError("validate_async called without a schema", "");

  return start_worker([node = std::move(node), value = std::move(value),
                       options]() {
    return run_async_walk(node, value, options);
  });
}

} // namespace engine
} // namespace schemakit
