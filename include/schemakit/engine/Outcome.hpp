#pragma once
#include "schemakit/Issue.hpp"
#include "schemakit/Value.hpp"
#include "schemakit/export.h"

#include <atomic>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace schemakit {
namespace engine {

/// Valid: no issues. Dirty: issues, but the value has the right shape, so
/// enclosing refinements still run. Aborted: the value is unusable.
enum class Status { Valid, Dirty, Aborted };

/// Per-node evaluation result
struct SCHEMAKIT_API Outcome {
  Status status{Status::Valid};
  Value value;
  std::vector<Issue> issues;

  static Outcome valid(Value value) {
    Outcome o;
    o.value = std::move(value);
    return o;
  }

  static Outcome aborted(std::vector<Issue> issues) {
    Outcome o;
    o.status = Status::Aborted;
    o.issues = std::move(issues);
    return o;
  }

  static Outcome aborted(Issue issue) {
    std::vector<Issue> list;
    list.push_back(std::move(issue));
    return aborted(std::move(list));
  }

  bool is_valid() const { return status == Status::Valid; }
  bool is_aborted() const { return status == Status::Aborted; }

  // Records a non-fatal issue
  void add_issue(Issue issue) {
    issues.push_back(std::move(issue));
    if (status == Status::Valid)
      status = Status::Dirty;
  }

  // Folds a child's issues and status into this outcome; the child's value
  // is left for the caller to place
  void absorb(Outcome &child) {
    for (auto &issue : child.issues)
      issues.push_back(std::move(issue));
    child.issues.clear();
    if (child.status == Status::Aborted)
      status = Status::Aborted;
    else if (child.status == Status::Dirty && status == Status::Valid)
      status = Status::Dirty;
  }
};

enum class ExecMode { Sync, Async };

/// Thrown by the synchronous walk when it reaches an asynchronous effect;
/// caught at the entry point and reported as AsyncEffectEncountered
class SCHEMAKIT_API AsyncEffectAbort : public std::exception {
public:
  explicit AsyncEffectAbort(Path path) : path_(std::move(path)) {}

  const char *what() const noexcept override {
    return "asynchronous effect encountered during synchronous validation";
  }
  const Path &path() const { return path_; }

private:
  Path path_;
};

/// Cooperative cancellation for a group of concurrently probed subtrees.
/// A token is cancelled if it or any ancestor was cancelled.
class SCHEMAKIT_API CancellationToken {
public:
  explicit CancellationToken(std::shared_ptr<const CancellationToken> parent =
                                 nullptr)
      : parent_(std::move(parent)) {}

  void cancel() { cancelled_.store(true); }

  bool cancelled() const {
    if (cancelled_.load())
      return true;
    return parent_ && parent_->cancelled();
  }

private:
  std::shared_ptr<const CancellationToken> parent_;
  std::atomic<bool> cancelled_{false};
};

inline std::size_t default_max_concurrency() {
  unsigned n = std::thread::hardware_concurrency();
  return n == 0 ? 2 : n;
}

struct SCHEMAKIT_API AsyncOptions {
  // Start sibling subtrees that contain asynchronous effects concurrently
  bool parallel{true};
  // Worker threads one validate_async call may have running at once, on top
  // of its own thread. Subtrees over the limit are evaluated inline.
  std::size_t max_concurrency{default_max_concurrency()};
};

/// Counts the worker threads of one validate_async call
class SCHEMAKIT_API WorkerBudget {
public:
  explicit WorkerBudget(std::size_t limit) : limit_(limit) {}

  bool try_acquire() {
    std::size_t used = in_use_.load();
    while (used < limit_) {
      if (in_use_.compare_exchange_weak(used, used + 1))
        return true;
    }
    return false;
  }
  void release() { in_use_.fetch_sub(1); }

  std::size_t in_use() const { return in_use_.load(); }
  std::size_t limit() const { return limit_; }

private:
  const std::size_t limit_;
  std::atomic<std::size_t> in_use_{0};
};

/// Per-call execution state threaded through the walk
struct SCHEMAKIT_API ExecContext {
  ExecMode mode{ExecMode::Sync};
  AsyncOptions options;
  std::shared_ptr<const CancellationToken> token;
  // Shared by every level of one call; null in sync mode
  std::shared_ptr<WorkerBudget> workers;

  bool cancelled() const { return token && token->cancelled(); }
};

} // namespace engine
} // namespace schemakit
