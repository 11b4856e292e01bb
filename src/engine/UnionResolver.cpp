#include "schemakit/engine/UnionResolver.hpp"
#include "schemakit/Logger.hpp"
#include "schemakit/ValueConversion.hpp"
#include "schemakit/engine/AsyncCoordinator.hpp"
#include "schemakit/engine/ValidationEngine.hpp"

#include <fmt/format.h>

namespace schemakit {
namespace engine {

namespace {

std::string quote_option(const Value &v) {
  if (v.is_string())
    return fmt::format("'{}'", v.as_string());
  return v.describe();
}

std::string join_options(const std::vector<Value> &values) {
  std::string out;
  for (const auto &v : values) {
    if (!out.empty())
      out += " | ";
    out += quote_option(v);
  }
  return out;
}

} // namespace

Outcome UnionResolver::resolve(const SchemaNode &node, const Value &value,
                               const Path &path) const {
  const auto &d = node.as<UnionDef>();

  std::vector<ChildTask> tasks;
  tasks.reserve(d.options.size());
  for (const auto &option : d.options) {
    tasks.push_back({option.get(), &value, path});
  }

  ProbeResult probe = AsyncCoordinator(engine_).probe_first_valid(tasks);
  if (probe.winner) {
    SK_LOG_TRACE("UNION", "MATCH", "alternative {} of {} matched at '{}'",
                 *probe.winner, d.options.size(), path_to_string(path));
    return std::move(probe.outcomes.back());
  }

  Issue issue;
  issue.code = IssueCode::InvalidUnion;
  issue.path = path;
  issue.message = "Invalid input";
  for (auto &outcome : probe.outcomes) {
    issue.union_errors.push_back(std::move(outcome.issues));
  }
  SK_LOG_TRACE("UNION", "NOMATCH", "no alternative matched at '{}'",
               path_to_string(path));
  return Outcome::aborted(std::move(issue));
}

Outcome UnionResolver::resolve_discriminated(const SchemaNode &node,
                                             const Value &value,
                                             const Path &path) const {
  if (!value.is_object()) {
    return Outcome::aborted(
        issues::invalid_type(path, "object", received_type_name(value)));
  }

  const auto &d = node.as<DiscriminatedUnionDef>();
  Value tag = value.get(d.discriminator);
  auto branch = d.branches.end();
  if (!tag.is_undefined())
    branch = d.branches.find(discriminator_key(tag));

  if (branch == d.branches.end()) {
    nlohmann::json options = nlohmann::json::array();
    for (const auto &v : d.option_values)
      options.push_back(value_to_json(v));

    Issue issue;
    issue.code = IssueCode::InvalidUnionDiscriminator;
    issue.path = child_path(path, d.discriminator);
    issue.message = fmt::format("Invalid discriminator value. Expected {}",
                                join_options(d.option_values));
    issue.params = {{"options", options}};
    return Outcome::aborted(std::move(issue));
  }

  return engine_.run(*branch->second, value, path);
}

} // namespace engine
} // namespace schemakit
