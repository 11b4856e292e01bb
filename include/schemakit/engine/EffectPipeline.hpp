#pragma once
#include "schemakit/Effects.hpp"
#include "schemakit/engine/Outcome.hpp"
#include "schemakit/export.h"

#include <vector>

namespace schemakit {
namespace engine {

/// Runs the effects attached to an Effects node. Preprocess steps run on the
/// raw value before the inner node; everything else runs on the inner
/// node's outcome, in declaration order.
class SCHEMAKIT_API EffectPipeline {
public:
  explicit EffectPipeline(const ExecContext &ctx) : ctx_(ctx) {}

  static Value preprocess(const std::vector<Effect> &effects, Value raw);

  // Refinements run on Valid and Dirty outcomes, transforms on Valid only.
  // In sync mode an asynchronous effect throws AsyncEffectAbort.
  void run(const std::vector<Effect> &effects, Outcome &outcome,
           const Path &path) const;

private:
  void run_refine(const Effect &effect, Outcome &outcome,
                  const Path &path) const;
  void run_super_refine(const Effect &effect, Outcome &outcome,
                        const Path &path) const;
  void run_transform(const Effect &effect, Outcome &outcome,
                     const Path &path) const;

  const ExecContext &ctx_;
};

} // namespace engine
} // namespace schemakit
