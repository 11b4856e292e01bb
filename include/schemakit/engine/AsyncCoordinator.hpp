#pragma once
#include "schemakit/SchemaNode.hpp"
#include "schemakit/engine/Outcome.hpp"
#include "schemakit/export.h"

#include <optional>
#include <vector>

namespace schemakit {
namespace engine {

class ValidationEngine;

/// One sibling subtree to evaluate. The value must outlive the call.
struct ChildTask {
  const SchemaNode *node;
  const Value *value;
  Path path;
};

struct ProbeResult {
  // Index of the first Valid outcome in declaration order
  std::optional<std::size_t> winner;
  // Outcomes up to and including the winner (all of them if none won)
  std::vector<Outcome> outcomes;
};

/// Schedules sibling subtrees. In async mode, siblings containing
/// asynchronous effects start concurrently; everything is joined in
/// declaration order before the caller continues, so issue order never
/// depends on scheduling.
class SCHEMAKIT_API AsyncCoordinator {
public:
  explicit AsyncCoordinator(const ValidationEngine &engine) : engine_(engine) {}

  std::vector<Outcome> run_all(const std::vector<ChildTask> &tasks) const;

  // Evaluates alternatives until the first Valid one. Concurrent probes
  // after the winner are cancelled: started callbacks finish, their results
  // are discarded.
  ProbeResult probe_first_valid(const std::vector<ChildTask> &tasks) const;

private:
  bool concurrent(const std::vector<ChildTask> &tasks) const;

  const ValidationEngine &engine_;
};

} // namespace engine
} // namespace schemakit
