#include "schemakit/Effects.hpp"
#include "schemakit/Result.hpp"

namespace schemakit {

void RefinementContext::add_issue(Issue issue) {
  Path full = path_;
  full.insert(full.end(), issue.path.begin(), issue.path.end());
  issue.path = std::move(full);
  if (issue.message.empty())
    issue.message = "Invalid input";
  issues_.push_back(std::move(issue));
}

void RefinementContext::add_issue(const std::string &message,
                                  const Path &sub_path) {
  add_issue(schemakit::issues::custom(sub_path, message));
}

Effect Effect::make_preprocess(PreprocessFn fn) {
  if (!fn)
    throw SchemaError("preprocess requires a callable");
  Effect e;
  e.kind = EffectKind::Preprocess;
  e.preprocess = std::move(fn);
  return e;
}

Effect Effect::make_refine(RefineFn fn, RefineOptions options) {
  if (!fn)
    throw SchemaError("refine requires a callable");
  Effect e;
  e.kind = EffectKind::Refine;
  e.refine = std::move(fn);
  e.options = std::move(options);
  return e;
}

Effect Effect::make_refine(AsyncRefineFn fn, RefineOptions options) {
  if (!fn)
    throw SchemaError("refine_async requires a callable");
  Effect e;
  e.kind = EffectKind::Refine;
  e.async = true;
  e.refine_async = std::move(fn);
  e.options = std::move(options);
  return e;
}

Effect Effect::make_super_refine(SuperRefineFn fn) {
  if (!fn)
    throw SchemaError("super_refine requires a callable");
  Effect e;
  e.kind = EffectKind::SuperRefine;
  e.super_refine = std::move(fn);
  return e;
}

Effect Effect::make_super_refine(AsyncSuperRefineFn fn) {
  if (!fn)
    throw SchemaError("super_refine_async requires a callable");
  Effect e;
  e.kind = EffectKind::SuperRefine;
  e.async = true;
  e.super_refine_async = std::move(fn);
  return e;
}

Effect Effect::make_transform(TransformFn fn) {
  if (!fn)
    throw SchemaError("transform requires a callable");
  Effect e;
  e.kind = EffectKind::Transform;
  e.transform = std::move(fn);
  return e;
}

Effect Effect::make_transform(AsyncTransformFn fn) {
  if (!fn)
    throw SchemaError("transform_async requires a callable");
  Effect e;
  e.kind = EffectKind::Transform;
  e.async = true;
  e.transform_async = std::move(fn);
  return e;
}

} // namespace schemakit
