#pragma once
#include "schemakit/SchemaNode.hpp"
#include "schemakit/engine/Outcome.hpp"
#include "schemakit/export.h"

namespace schemakit {
namespace engine {

class ValidationEngine;

/// Branch selection for Union and DiscriminatedUnion nodes
class SCHEMAKIT_API UnionResolver {
public:
  explicit UnionResolver(const ValidationEngine &engine) : engine_(engine) {}

  // First Valid alternative in declaration order wins; otherwise one
  // InvalidUnion issue carrying every alternative's issues
  Outcome resolve(const SchemaNode &node, const Value &value,
                  const Path &path) const;

  // Direct lookup by discriminator value; never probes other branches
  Outcome resolve_discriminated(const SchemaNode &node, const Value &value,
                                const Path &path) const;

private:
  const ValidationEngine &engine_;
};

} // namespace engine
} // namespace schemakit
