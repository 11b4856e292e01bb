#include "schemakit/engine/AsyncCoordinator.hpp"
#include "schemakit/Logger.hpp"
#include "schemakit/engine/ValidationEngine.hpp"

#include <future>
#include <memory>
#include <system_error>
#include <utility>

namespace schemakit {
namespace engine {

namespace {

// Returns the budget slot when the worker finishes, however it finishes
struct WorkerSlot {
  std::shared_ptr<WorkerBudget> budget;
  ~WorkerSlot() { budget->release(); }
};

// Starts the task on a worker thread if the call's budget has room. An
// invalid future means the caller evaluates the task inline.
std::future<Outcome> try_spawn(const ValidationEngine &engine,
                               const ChildTask &task) {
  const auto &workers = engine.context().workers;
  if (!workers || !workers->try_acquire())
    return {};

  try {
    return std::async(std::launch::async, [engine, task, workers]() {
      WorkerSlot slot{workers};
      return engine.run(*task.node, *task.value, task.path);
    });
  } catch (const std::system_error &e) {
    workers->release();
    SK_LOG_WARN("ASYNC", "SPAWN",
                "cannot start worker for '{}' ({}), evaluating inline",
                path_to_string(task.path), e.what());
    return {};
  }
}

} // namespace

bool AsyncCoordinator::concurrent(const std::vector<ChildTask> &tasks) const {
  const auto &ctx = engine_.context();
  if (ctx.mode != ExecMode::Async || !ctx.options.parallel)
    return false;

  // A single asynchronous sibling gains nothing from its own thread
  std::size_t async_count = 0;
  for (const auto &task : tasks) {
    if (task.node->has_async)
      ++async_count;
  }
  return async_count > 1;
}

std::vector<Outcome>
AsyncCoordinator::run_all(const std::vector<ChildTask> &tasks) const {
  std::vector<Outcome> results(tasks.size());

  if (!concurrent(tasks)) {
    for (std::size_t i = 0; i < tasks.size(); ++i) {
      results[i] = engine_.run(*tasks[i].node, *tasks[i].value, tasks[i].path);
    }
    return results;
  }

  // Start asynchronous subtrees while the budget allows; everything else,
  // including subtrees over the budget, is evaluated inline meanwhile
  std::vector<std::future<Outcome>> pending(tasks.size());
  std::size_t started = 0;
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    if (!tasks[i].node->has_async)
      continue;
    pending[i] = try_spawn(engine_, tasks[i]);
    if (pending[i].valid())
      ++started;
  }
  SK_LOG_TRACE("ASYNC", "FANOUT", "started {} concurrent subtree(s) of {}",
               started, tasks.size());

  for (std::size_t i = 0; i < tasks.size(); ++i) {
    if (!pending[i].valid())
      results[i] = engine_.run(*tasks[i].node, *tasks[i].value, tasks[i].path);
  }

  // Join in declaration order
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    if (pending[i].valid())
      results[i] = pending[i].get();
  }
  return results;
}

ProbeResult
AsyncCoordinator::probe_first_valid(const std::vector<ChildTask> &tasks) const {
  ProbeResult result;

  if (!concurrent(tasks)) {
    for (std::size_t i = 0; i < tasks.size(); ++i) {
      result.outcomes.push_back(
          engine_.run(*tasks[i].node, *tasks[i].value, tasks[i].path));
      if (result.outcomes.back().is_valid()) {
        result.winner = i;
        break;
      }
    }
    return result;
  }

  auto group = std::make_shared<CancellationToken>(engine_.context().token);
  ValidationEngine probe = engine_.with_token(group);

  std::vector<std::future<Outcome>> pending(tasks.size());
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    if (tasks[i].node->has_async)
      pending[i] = try_spawn(probe, tasks[i]);
  }
  SK_LOG_TRACE("ASYNC", "PROBE", "probing {} alternative(s) concurrently",
               tasks.size());

  for (std::size_t i = 0; i < tasks.size(); ++i) {
    if (result.winner) {
      // Let started probes finish; their outcomes are discarded
      if (pending[i].valid())
        pending[i].wait();
      continue;
    }

    Outcome outcome = pending[i].valid()
                          ? pending[i].get()
                          : probe.run(*tasks[i].node, *tasks[i].value,
                                      tasks[i].path);
    bool won = outcome.is_valid();
    result.outcomes.push_back(std::move(outcome));
    if (won) {
      result.winner = i;
      group->cancel();
      SK_LOG_TRACE("ASYNC", "PROBE",
                   "alternative {} accepted, cancelling remaining probes", i);
    }
  }
  return result;
}

} // namespace engine
} // namespace schemakit
