#pragma once
#include "schemakit/Schema.hpp"
#include "schemakit/export.h"

#include <string>
#include <vector>

namespace schemakit {

// Shape derivations over object schemas. Each returns a new object schema
// that keeps the receiver's unknown-key policy and description; a
// non-object receiver throws SchemaError. Field names missing from the
// shape are ignored. None of them descend into nested objects.

/// Adds fields; a field already present is replaced in place
SCHEMAKIT_API Schema extend(const Schema &base, const ShapeSpec &fields);

/// extend(a, b.shape())
SCHEMAKIT_API Schema merge(const Schema &a, const Schema &b);

/// Makes every field optional. Already optional fields are left alone.
SCHEMAKIT_API Schema partial(const Schema &base);
SCHEMAKIT_API Schema partial(const Schema &base,
                             const std::vector<std::string> &fields);

/// Strips one Optional layer from every field
SCHEMAKIT_API Schema required(const Schema &base);
SCHEMAKIT_API Schema required(const Schema &base,
                              const std::vector<std::string> &fields);

/// Keeps the named fields, in shape order
SCHEMAKIT_API Schema pick(const Schema &base,
                          const std::vector<std::string> &fields);

/// Drops the named fields
SCHEMAKIT_API Schema omit(const Schema &base,
                          const std::vector<std::string> &fields);

} // namespace schemakit
