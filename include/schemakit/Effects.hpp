#pragma once
#include "schemakit/Issue.hpp"
#include "schemakit/Value.hpp"
#include "schemakit/export.h"

#include <functional>
#include <future>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace schemakit {

/// Capability handed to super_refine and transform callbacks. Issue paths
/// given to add_issue are relative to the node being refined.
class SCHEMAKIT_API RefinementContext {
public:
  explicit RefinementContext(Path path) : path_(std::move(path)) {}

  void add_issue(Issue issue);
  void add_issue(const std::string &message, const Path &sub_path = {});
  // Marks the node as unusable: later effects and transforms are skipped
  void abort() { fatal_ = true; }

  const Path &path() const { return path_; }
  const std::vector<Issue> &issues() const { return issues_; }
  bool fatal() const { return fatal_; }

  std::vector<Issue> take_issues() { return std::move(issues_); }

private:
  Path path_;
  std::vector<Issue> issues_;
  bool fatal_{false};
};

enum class EffectKind { Preprocess, Refine, SuperRefine, Transform };

struct SCHEMAKIT_API RefineOptions {
  std::string message;
  // Appended to the current path when the refinement fails
  Path path;
  nlohmann::json params = nlohmann::json::object();
};

using PreprocessFn = std::function<Value(const Value &)>;
using RefineFn = std::function<bool(const Value &)>;
using AsyncRefineFn = std::function<std::future<bool>(const Value &)>;
using SuperRefineFn = std::function<void(const Value &, RefinementContext &)>;
using AsyncSuperRefineFn =
    std::function<std::future<void>(const Value &, RefinementContext &)>;
using TransformFn = std::function<Value(const Value &, RefinementContext &)>;
using AsyncTransformFn =
    std::function<std::future<Value>(const Value &, RefinementContext &)>;

/// One preprocess/refine/superRefine/transform step. Exactly one callback is
/// set, selected by `kind` and `async`.
struct SCHEMAKIT_API Effect {
  EffectKind kind{EffectKind::Refine};
  bool async{false};
  RefineOptions options;

  PreprocessFn preprocess;
  RefineFn refine;
  AsyncRefineFn refine_async;
  SuperRefineFn super_refine;
  AsyncSuperRefineFn super_refine_async;
  TransformFn transform;
  AsyncTransformFn transform_async;

  static Effect make_preprocess(PreprocessFn fn);
  static Effect make_refine(RefineFn fn, RefineOptions options);
  static Effect make_refine(AsyncRefineFn fn, RefineOptions options);
  static Effect make_super_refine(SuperRefineFn fn);
  static Effect make_super_refine(AsyncSuperRefineFn fn);
  static Effect make_transform(TransformFn fn);
  static Effect make_transform(AsyncTransformFn fn);
};

} // namespace schemakit
