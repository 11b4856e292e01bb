#pragma once
#include "schemakit/Result.hpp"
#include "schemakit/SchemaNode.hpp"
#include "schemakit/Value.hpp"
#include "schemakit/engine/Outcome.hpp"
#include "schemakit/export.h"

#include <future>
#include <memory>
#include <optional>
#include <system_error>

namespace schemakit {
namespace engine {

/// Synchronous entry point. Never spawns threads. An asynchronous effect on
/// the walked path fails the call with one AsyncEffectEncountered issue.
SCHEMAKIT_API Result validate(const NodePtr &node, const Value &value);

/// Asynchronous entry point. The walk runs on a worker thread and may wait
/// on user futures; the schema tree is kept alive until the result is ready.
SCHEMAKIT_API std::future<Result>
validate_async(NodePtr node, Value value, AsyncOptions options = {});

/// The asynchronous walk on the calling thread; subtrees still fan out to
/// workers within options.max_concurrency
SCHEMAKIT_API Result run_async_walk(const NodePtr &node, const Value &value,
                                    const AsyncOptions &options);

/// Runs fn on a new thread, or lazily on the thread that calls get() when no
/// thread can be started
template <typename Fn>
auto start_worker(Fn fn) -> std::future<decltype(fn())> {
  try {
    return std::async(std::launch::async, fn);
  } catch (const std::system_error &) {
    return std::async(std::launch::deferred, std::move(fn));
  }
}

/// Recursive evaluator shared by both entry points
class SCHEMAKIT_API ValidationEngine {
public:
  explicit ValidationEngine(ExecContext ctx) : ctx_(std::move(ctx)) {}

  Outcome run(const SchemaNode &node, const Value &value,
              const Path &path) const;

  const ExecContext &context() const { return ctx_; }

  // Same mode and options, different cancellation group
  ValidationEngine
  with_token(std::shared_ptr<const CancellationToken> token) const;

private:
  Outcome run_primitive(const SchemaNode &node, const Value &value,
                        const Path &path) const;
  Outcome run_literal(const SchemaNode &node, const Value &value,
                      const Path &path) const;
  Outcome run_enum(const SchemaNode &node, const Value &value,
                   const Path &path) const;
  Outcome run_object(const SchemaNode &node, const Value &value,
                     const Path &path) const;
  Outcome run_array(const SchemaNode &node, const Value &value,
                    const Path &path) const;
  Outcome run_tuple(const SchemaNode &node, const Value &value,
                    const Path &path) const;
  Outcome run_record(const SchemaNode &node, const Value &value,
                     const Path &path) const;
  Outcome run_intersection(const SchemaNode &node, const Value &value,
                           const Path &path) const;
  Outcome run_effects(const SchemaNode &node, const Value &value,
                      const Path &path) const;

  ExecContext ctx_;
};

/// Merges the outputs of the two sides of an intersection: objects by key
/// union, equal-length arrays element-wise, otherwise equal values only
SCHEMAKIT_API std::optional<Value> merge_values(const Value &a,
                                                const Value &b);

SCHEMAKIT_API Path child_path(const Path &parent, PathSegment segment);

} // namespace engine
} // namespace schemakit
