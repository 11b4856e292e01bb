#pragma once
#include "schemakit/Effects.hpp"
#include "schemakit/Result.hpp"
#include "schemakit/SchemaNode.hpp"
#include "schemakit/Value.hpp"
#include "schemakit/engine/Outcome.hpp"
#include "schemakit/export.h"

#include <future>
#include <string>
#include <utility>
#include <vector>

namespace schemakit {

/// Value handle over an immutable schema node. Every modifier returns a new
/// Schema; the receiver is never changed.
class SCHEMAKIT_API Schema {
public:
  explicit Schema(NodePtr node);

  const NodePtr &node() const { return node_; }
  NodeKind kind() const { return node_->kind; }
  const std::string &description() const { return node_->description; }
  bool has_async() const { return node_->has_async; }

  // Constraints. min/max/length apply to strings and arrays (length) and
  // numbers (bounds); wrappers forward them to the wrapped node.
  Schema min(double n, std::string message = "") const;
  Schema max(double n, std::string message = "") const;
  Schema length(std::size_t n, std::string message = "") const;
  Schema nonempty(std::string message = "") const;
  Schema regex(const std::string &pattern, std::string message = "") const;
  Schema email(std::string message = "") const;
  Schema url(std::string message = "") const;
  Schema uuid(std::string message = "") const;
  Schema starts_with(std::string prefix, std::string message = "") const;
  Schema ends_with(std::string suffix, std::string message = "") const;
  Schema includes(std::string needle, std::string message = "") const;
  Schema int_(std::string message = "") const;
  Schema positive(std::string message = "") const;
  Schema negative(std::string message = "") const;
  Schema nonnegative(std::string message = "") const;
  Schema nonpositive(std::string message = "") const;
  Schema gt(double n, std::string message = "") const;
  Schema gte(double n, std::string message = "") const;
  Schema lt(double n, std::string message = "") const;
  Schema lte(double n, std::string message = "") const;
  Schema multiple_of(double n, std::string message = "") const;
  Schema finite(std::string message = "") const;
  Schema min_date(const Date &bound, std::string message = "") const;
  Schema max_date(const Date &bound, std::string message = "") const;

  // Wrappers
  Schema optional() const;
  Schema nullable() const;
  Schema default_(Value value) const;
  Schema describe(std::string description) const;

  // Effects, appended to this node's effect list in declaration order
  Schema refine(RefineFn predicate, const std::string &message = "") const;
  Schema refine(RefineFn predicate, RefineOptions options) const;
  Schema refine_async(AsyncRefineFn predicate,
                      const std::string &message = "") const;
  Schema refine_async(AsyncRefineFn predicate, RefineOptions options) const;
  Schema super_refine(SuperRefineFn fn) const;
  Schema super_refine_async(AsyncSuperRefineFn fn) const;
  Schema transform(std::function<Value(const Value &)> fn) const;
  Schema transform(TransformFn fn) const;
  Schema transform_async(AsyncTransformFn fn) const;

  // Object only
  Schema strict() const;
  Schema strip() const;
  Schema passthrough() const;
  const Shape &shape() const;
  UnknownKeys unknown_keys() const;

  // Tuple only
  Schema rest(const Schema &schema) const;

  // Unwraps one Optional/Nullable/Default layer; other kinds return *this
  Schema unwrap() const;

  // Entry points
  Result validate(const Value &value) const;
  std::future<Result> validate_async(Value value,
                                     engine::AsyncOptions options = {}) const;
  // Throws ValidationError on failure
  Value parse(const Value &value) const;
  SafeParseResult safe_parse(const Value &value) const;
  std::future<Value> parse_async(Value value) const;
  std::future<SafeParseResult> safe_parse_async(Value value) const;

private:
  Schema with_check(Check check) const;
  Schema with_effect(Effect effect) const;
  Schema with_unknown_keys(UnknownKeys policy) const;

  NodePtr node_;
};

using ShapeSpec = std::vector<std::pair<std::string, Schema>>;

// Construction surface

SCHEMAKIT_API Schema string();
SCHEMAKIT_API Schema number();
SCHEMAKIT_API Schema boolean();
SCHEMAKIT_API Schema date();
SCHEMAKIT_API Schema null_();
SCHEMAKIT_API Schema undefined_();
SCHEMAKIT_API Schema literal(Value value);
// Throws SchemaError on an empty or duplicated value list
SCHEMAKIT_API Schema enum_(std::vector<Value> values);
// Throws SchemaError on a duplicate field name
SCHEMAKIT_API Schema object(const ShapeSpec &shape,
                            UnknownKeys unknown_keys = UnknownKeys::Strip);
SCHEMAKIT_API Schema array(const Schema &element);
SCHEMAKIT_API Schema tuple(const std::vector<Schema> &items);
SCHEMAKIT_API Schema union_(const std::vector<Schema> &options);
// Branch discriminator values are read from each branch's literal or enum
// field named `discriminator`
SCHEMAKIT_API Schema discriminated_union(const std::string &discriminator,
                                         const std::vector<Schema> &branches);
SCHEMAKIT_API Schema
discriminated_union(const std::string &discriminator,
                    const std::vector<std::pair<Value, Schema>> &branches);
SCHEMAKIT_API Schema intersection(const Schema &left, const Schema &right);
SCHEMAKIT_API Schema record(const Schema &value);
// Entries are visited in key order. When the key schema transforms two keys
// to the same string, the entry visited later wins.
SCHEMAKIT_API Schema record(const Schema &key, const Schema &value);
SCHEMAKIT_API Schema preprocess(PreprocessFn fn, const Schema &inner);

} // namespace schemakit
