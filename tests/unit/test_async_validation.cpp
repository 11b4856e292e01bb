#include "TestFixtures.hpp"
#include "schemakit/Schema.hpp"
#include "schemakit/engine/ValidationEngine.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <gtest/gtest.h>
#include <mutex>
#include <set>
#include <thread>

using namespace schemakit;
using schemakit::test::issue_paths;

namespace {

// Resolves on another thread after `delay`
std::future<bool> delayed(bool answer, std::chrono::milliseconds delay) {
  return std::async(std::launch::async, [answer, delay]() {
    std::this_thread::sleep_for(delay);
    return answer;
  });
}

std::size_t process_thread_count() {
  std::size_t n = 0;
  for (const auto &entry :
       std::filesystem::directory_iterator("/proc/self/task")) {
    (void)entry;
    ++n;
  }
  return n;
}

Schema username_schema() {
  return string().refine_async(
      [](const Value &v) {
        return delayed(v.as_string() != "admin", std::chrono::milliseconds(5));
      },
      "Username is reserved");
}

} // namespace

class AsyncValidationTest : public test::SchemaTest {};

TEST_F(AsyncValidationTest, AsyncRefineAccepts) {
  EXPECT_EQ(username_schema().parse_async("alice").get(), Value("alice"));
}

TEST_F(AsyncValidationTest, AsyncRefineRejectsReservedName) {
  auto result = username_schema().safe_parse_async("admin").get();
  ASSERT_FALSE(result.success);
  ASSERT_TRUE(result.error);
  ASSERT_EQ(result.error->issues().size(), 1);
  EXPECT_EQ(result.error->issues()[0].code, IssueCode::Custom);
  EXPECT_EQ(result.error->issues()[0].message, "Username is reserved");
}

TEST_F(AsyncValidationTest, ParseAsyncFutureRethrows) {
  auto pending = username_schema().parse_async("admin");
  EXPECT_THROW(pending.get(), ValidationError);
}

TEST_F(AsyncValidationTest, ParseAsyncUsesOneThreadPerCall) {
  std::promise<bool> gate;
  std::shared_future<bool> opened = gate.get_future().share();
  std::promise<void> entered;
  auto schema = string().refine_async([&](const Value &) {
    entered.set_value();
    return std::async(std::launch::deferred, [opened]() { return opened.get(); });
  });

  std::size_t before = process_thread_count();
  auto pending = schema.safe_parse_async("x");
  entered.get_future().wait();
  // Only the validation worker exists while the callback is pending
  EXPECT_EQ(process_thread_count(), before + 1);
  gate.set_value(true);

  auto result = pending.get();
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.data, Value("x"));
}

TEST_F(AsyncValidationTest, SyncAndAsyncAgreeWithoutAsyncEffects) {
  auto schema = object({{"name", string().min(2)},
                        {"tags", array(string()).max(2)},
                        {"kind", union_({literal("a"), literal("b")})}},
                       UnknownKeys::Strict);
  auto input = Value::object({{"name", "x"},
                              {"tags", Value::array({"a", 1, "c"})},
                              {"kind", "z"},
                              {"extra", true}});

  auto sync_result = schema.validate(input);
  auto async_result = schema.validate_async(input).get();
  EXPECT_EQ(sync_result, async_result);
  EXPECT_EQ(engine::validate(schema.node(), input), sync_result);
}

TEST_F(AsyncValidationTest, ConcurrentSiblingsKeepDeclarationOrder) {
  // The first field resolves last; issue order must not change
  auto slow = string().refine_async(
      [](const Value &) { return delayed(false, std::chrono::milliseconds(40)); },
      "slow failed");
  auto fast = string().refine_async(
      [](const Value &) { return delayed(false, std::chrono::milliseconds(1)); },
      "fast failed");
  auto schema = object({{"a", slow}, {"b", fast}, {"c", number()}});
  auto input = Value::object({{"a", "x"}, {"b", "y"}, {"c", "z"}});

  for (bool parallel : {true, false}) {
    engine::AsyncOptions options;
    options.parallel = parallel;
    auto result = schema.validate_async(input, options).get();
    EXPECT_EQ(issue_paths(result.issues()),
              (std::vector<std::string>{"a", "b", "c"}));
  }
}

TEST_F(AsyncValidationTest, SiblingsRunConcurrently) {
  std::atomic<int> in_flight{0};
  std::atomic<int> peak{0};
  auto tracked = string().refine_async([&](const Value &) {
    return std::async(std::launch::async, [&]() {
      int now = ++in_flight;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
      --in_flight;
      return true;
    });
  });
  auto schema = array(tracked);
  auto input = Value::array({"a", "b", "c", "d"});

  EXPECT_TRUE(schema.validate_async(input).get().ok());
  EXPECT_GT(peak.load(), 1);
}

TEST_F(AsyncValidationTest, LargeArrayStaysWithinWorkerLimit) {
  std::atomic<int> in_flight{0};
  std::atomic<int> peak{0};
  std::mutex ids_mutex;
  std::set<std::thread::id> threads;
  // The callback itself starts no thread, so every thread seen is the engine's
  auto tracked = string().refine_async([&](const Value &) {
    int now = ++in_flight;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    {
      std::lock_guard<std::mutex> lock(ids_mutex);
      threads.insert(std::this_thread::get_id());
    }
    std::this_thread::sleep_for(std::chrono::microseconds(100));
    --in_flight;
    std::promise<bool> ready;
    ready.set_value(true);
    return ready.get_future();
  });

  ValueArray items(5000, Value("item"));
  engine::AsyncOptions options;
  options.max_concurrency = 4;
  auto result = array(tracked).validate_async(Value(items), options).get();

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value().as_array().size(), 5000u);
  // Four workers plus the thread running the walk
  EXPECT_LE(peak.load(), 5);
  EXPECT_LE(threads.size(), 5u);
}

TEST_F(AsyncValidationTest, ZeroWorkersEvaluatesInline) {
  std::set<std::thread::id> threads;
  auto tracked = string().refine_async([&](const Value &v) {
    threads.insert(std::this_thread::get_id());
    return delayed(v.as_string() != "bad", std::chrono::milliseconds(1));
  }, "bad item");

  engine::AsyncOptions options;
  options.max_concurrency = 0;
  auto input = Value::array({"a", "bad", "c", "bad"});
  auto result = array(tracked).validate_async(input, options).get();

  EXPECT_EQ(issue_paths(result.issues()),
            (std::vector<std::string>{"[1]", "[3]"}));
  EXPECT_EQ(threads.size(), 1u);
}

TEST_F(AsyncValidationTest, ParentEffectsWaitForChildren) {
  std::atomic<bool> child_done{false};
  auto child = string().refine_async([&](const Value &) {
    return std::async(std::launch::async, [&]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      child_done = true;
      return true;
    });
  });
  bool seen_done = false;
  auto schema = object({{"x", child}, {"y", child}})
                    .refine([&](const Value &) {
                      seen_done = child_done.load();
                      return true;
                    });
  EXPECT_TRUE(
      schema.validate_async(Value::object({{"x", "1"}, {"y", "2"}})).get().ok());
  EXPECT_TRUE(seen_done);
}

TEST_F(AsyncValidationTest, AsyncTransformAndSuperRefine) {
  auto schema =
      string()
          .transform_async([](const Value &v, RefinementContext &) {
            auto text = v.as_string();
            return std::async(std::launch::async,
                              [text]() { return Value(text + text); });
          })
          .super_refine_async([](const Value &v, RefinementContext &ctx) {
            bool too_long = v.as_string().size() > 4;
            return std::async(std::launch::async, [too_long, &ctx]() {
              if (too_long)
                ctx.add_issue("Too long after doubling");
            });
          });
  EXPECT_EQ(schema.parse_async("ab").get(), Value("abab"));
  auto result = schema.safe_parse_async("abc").get();
  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error->issues()[0].message, "Too long after doubling");
}

TEST_F(AsyncValidationTest, UnionPrefersFirstAlternativeUnderConcurrency) {
  auto first = string().refine_async([](const Value &) {
    return delayed(true, std::chrono::milliseconds(20));
  });
  auto second = string()
                    .refine_async([](const Value &) {
                      return delayed(true, std::chrono::milliseconds(1));
                    })
                    .transform([](const Value &) { return Value("second"); });
  auto result = union_({first, second}).validate_async("x").get();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value(), Value("x"));
}

TEST_F(AsyncValidationTest, SequentialUnionSkipsAlternativesAfterWinner) {
  std::atomic<int> later_calls{0};
  auto first = string().refine_async([](const Value &) {
    return delayed(true, std::chrono::milliseconds(1));
  });
  auto second = string().refine_async([&](const Value &) {
    ++later_calls;
    return delayed(true, std::chrono::milliseconds(1));
  });

  engine::AsyncOptions options;
  options.parallel = false;
  auto result = union_({first, second}).validate_async("x", options).get();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(later_calls.load(), 0);
}

TEST_F(AsyncValidationTest, UnionFallsThroughToLaterAsyncAlternative) {
  auto reject = string().refine_async(
      [](const Value &) { return delayed(false, std::chrono::milliseconds(10)); },
      "first");
  auto accept = string().refine_async(
      [](const Value &) { return delayed(true, std::chrono::milliseconds(1)); });
  auto result = union_({reject, accept}).validate_async("x").get();
  EXPECT_TRUE(result.ok());
}

TEST_F(AsyncValidationTest, SchemaOutlivesCaller) {
  std::future<Result> pending;
  {
    auto schema = username_schema();
    pending = schema.validate_async("bob");
  }
  EXPECT_TRUE(pending.get().ok());
}

TEST_F(AsyncValidationTest, EngineEntryPointsRejectMissingSchema) {
  EXPECT_THROW(engine::validate_async(nullptr, Value("x")), SchemaError);
  auto result = engine::validate_async(username_schema().node(), "admin").get();
  ASSERT_EQ(result.issues().size(), 1);
  EXPECT_EQ(result.issues()[0].message, "Username is reserved");
}
