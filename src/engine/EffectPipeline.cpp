#include "schemakit/engine/EffectPipeline.hpp"
#include "schemakit/Logger.hpp"

namespace schemakit {
namespace engine {

namespace {

void absorb_context(RefinementContext &rc, Outcome &outcome) {
  for (auto &issue : rc.take_issues())
    outcome.add_issue(std::move(issue));
  if (rc.fatal())
    outcome.status = Status::Aborted;
}

} // namespace

Value EffectPipeline::preprocess(const std::vector<Effect> &effects,
                                 Value raw) {
  for (const auto &effect : effects) {
    if (effect.kind == EffectKind::Preprocess)
      raw = effect.preprocess(raw);
  }
  return raw;
}

void EffectPipeline::run(const std::vector<Effect> &effects, Outcome &outcome,
                         const Path &path) const {
  for (const auto &effect : effects) {
    if (effect.kind == EffectKind::Preprocess)
      continue;
    if (outcome.is_aborted())
      return;
    // A transform never runs once the node has issues, and the effects
    // after it would see an untransformed value
    if (effect.kind == EffectKind::Transform && !outcome.is_valid())
      return;

    if (effect.async) {
      if (ctx_.mode == ExecMode::Sync)
        throw AsyncEffectAbort(path);
      if (ctx_.cancelled()) {
        SK_LOG_TRACE("PIPELINE", "CANCEL",
                     "skipping async effect at '{}' after cancellation",
                     path_to_string(path));
        outcome.status = Status::Aborted;
        return;
      }
    }

    switch (effect.kind) {
    case EffectKind::Refine:
      run_refine(effect, outcome, path);
      break;
    case EffectKind::SuperRefine:
      run_super_refine(effect, outcome, path);
      break;
    case EffectKind::Transform:
      run_transform(effect, outcome, path);
      break;
    case EffectKind::Preprocess:
      break;
    }
  }
}

void EffectPipeline::run_refine(const Effect &effect, Outcome &outcome,
                                const Path &path) const {
  bool ok = effect.async ? effect.refine_async(outcome.value).get()
                         : effect.refine(outcome.value);
  if (ok)
    return;

  Path where = path;
  where.insert(where.end(), effect.options.path.begin(),
               effect.options.path.end());
  outcome.add_issue(
      issues::custom(where, effect.options.message, effect.options.params));
}

void EffectPipeline::run_super_refine(const Effect &effect, Outcome &outcome,
                                      const Path &path) const {
  RefinementContext rc(path);
  if (effect.async) {
    effect.super_refine_async(outcome.value, rc).get();
  } else {
    effect.super_refine(outcome.value, rc);
  }
  absorb_context(rc, outcome);
}

void EffectPipeline::run_transform(const Effect &effect, Outcome &outcome,
                                   const Path &path) const {
  RefinementContext rc(path);
  Value next = effect.async ? effect.transform_async(outcome.value, rc).get()
                            : effect.transform(outcome.value, rc);
  outcome.value = std::move(next);
  absorb_context(rc, outcome);
}

} // namespace engine
} // namespace schemakit
