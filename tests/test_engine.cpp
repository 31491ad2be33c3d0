#include <gtest/gtest.h>

#include <atomic>

#include "context/context_store.hpp"
#include "core/errors.hpp"
#include "engine/local_engine.hpp"
#include "engine/workflow_context.hpp"

using namespace taskstream;
using namespace taskstream::engine;
using namespace std::chrono_literals;

class LocalEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.worker.threads = 2;
    config_.retry.initial_interval_ms = 1;
    registry_ = std::make_shared<ActivityRegistry>();

    registry_->register_activity("echo", [](const json &payload) {
      return payload;
    });
    registry_->register_activity("whoami", [](const json &) {
      auto ctx = ContextStore::get();
      return json{{"ctx", ctx.to_json()}, {"attempt", attempt()}};
    });
  }

  std::unique_ptr<LocalEngine> make_engine() {
    InterceptorChain interceptors;
    interceptors.add(std::make_shared<ContextInterceptor>(config_));
    return std::make_unique<LocalEngine>(config_, registry_, std::move(interceptors));
  }

  Config config_;
  std::shared_ptr<ActivityRegistry> registry_;
};

TEST_F(LocalEngineTest, UnknownActivityIsRejected) {
  auto engine = make_engine();
  EXPECT_THROW(engine->dispatch(CallerState{}, "missing", json::object()), std::invalid_argument);
}

TEST_F(LocalEngineTest, ActivitySeesCallerContext) {
  auto engine = make_engine();

  auto result = engine->dispatch(CallerState{"t1", "trace-1", std::nullopt}, "whoami", json::object()).get();

  EXPECT_EQ(result["ctx"]["task_id"], "t1");
  EXPECT_EQ(result["ctx"]["trace_id"], "trace-1");
  EXPECT_FALSE(result["ctx"].contains("parent_span_id"));
  EXPECT_EQ(result["attempt"], 1);

  // 调用方线程上没有安装上下文
  EXPECT_FALSE(ContextStore::installed());
}

TEST_F(LocalEngineTest, ActivityWithoutContextSeesNothing) {
  auto engine = make_engine();

  auto result = engine->dispatch(CallerState{}, "whoami", json::object()).get();
  EXPECT_EQ(result["ctx"], json::object());
}

TEST_F(LocalEngineTest, RetriesUntilSuccess) {
  std::atomic<int> calls{0};
  registry_->register_activity("flaky", [&calls](const json &) {
    if (++calls < 3) {
      throw std::runtime_error("transient");
    }
    return json{{"attempt", attempt()}, {"task", ContextStore::get().task_id.value_or("")}};
  });
  auto engine = make_engine();

  auto result = engine->dispatch(CallerState{"t1", std::nullopt, std::nullopt}, "flaky", json::object()).get();

  EXPECT_EQ(result["attempt"], 3);
  EXPECT_EQ(result["task"], "t1");
  EXPECT_EQ(engine->attempts_started(), 3);
}

TEST_F(LocalEngineTest, GivesUpAfterMaxAttempts) {
  registry_->register_activity("broken", [](const json &) -> json {
    throw std::runtime_error("still broken");
  });
  auto engine = make_engine();

  auto future = engine->dispatch(CallerState{}, "broken", json::object());
  try {
    future.get();
    FAIL() << "expected ActivityError";
  } catch (const ActivityError &e) {
    EXPECT_EQ(e.attempts(), 3);
    EXPECT_EQ(e.last_error(), "still broken");
  }
}

TEST_F(LocalEngineTest, NonRetryablePredicateStopsRetries) {
  std::atomic<int> calls{0};
  registry_->register_activity("validate", [&calls](const json &) -> json {
    ++calls;
    throw std::runtime_error("invalid input");
  });
  auto engine = make_engine();

  auto options = engine->default_options();
  options.retry.non_retryable = [](const std::exception &e) {
    return std::string(e.what()).find("invalid") != std::string::npos;
  };

  EXPECT_THROW(engine->dispatch(CallerState{}, "validate", json::object(), options).get(), ActivityError);
  EXPECT_EQ(calls, 1);
}

TEST_F(LocalEngineTest, LogicErrorIsNotRetried) {
  std::atomic<int> calls{0};
  registry_->register_activity("misuse", [&calls](const json &) -> json {
    ++calls;
    throw SessionStateError("publish on closed session");
  });
  auto engine = make_engine();

  EXPECT_THROW(engine->dispatch(CallerState{}, "misuse", json::object()).get(), ActivityError);
  EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, ExponentialBackoffIsCapped) {
  RetryPolicy policy;
  policy.initial_interval = 100ms;
  policy.backoff_coefficient = 2.0;
  policy.max_interval = 300ms;

  EXPECT_EQ(policy.backoff_for(1), 0ms);
  EXPECT_EQ(policy.backoff_for(2), 100ms);
  EXPECT_EQ(policy.backoff_for(3), 200ms);
  EXPECT_EQ(policy.backoff_for(4), 300ms);
  EXPECT_EQ(policy.backoff_for(10), 300ms);
}

TEST(RetryPolicyTest, AgentErrorDecidesRetry) {
  RetryPolicy policy;
  policy.max_attempts = 3;

  EXPECT_TRUE(policy.should_retry(AgentError("rate limited", true), 1));
  EXPECT_FALSE(policy.should_retry(AgentError("bad request", false), 1));
  EXPECT_TRUE(policy.should_retry(PersistenceError("disk full"), 2));
  EXPECT_FALSE(policy.should_retry(PersistenceError("disk full"), 3));
}

TEST(RetryPolicyTest, FromSettings) {
  RetrySettings settings;
  settings.max_attempts = 0;
  settings.initial_interval_ms = 50;
  settings.max_interval_ms = 500;

  auto policy = RetryPolicy::from(settings);
  EXPECT_EQ(policy.max_attempts, 1);
  EXPECT_EQ(policy.initial_interval, 50ms);
  EXPECT_EQ(policy.max_interval, 500ms);
}

TEST(AttemptScopeTest, RestoresPreviousAttempt) {
  EXPECT_EQ(attempt(), 1);
  {
    AttemptScope outer(2);
    EXPECT_EQ(attempt(), 2);
    {
      AttemptScope inner(5);
      EXPECT_EQ(attempt(), 5);
    }
    EXPECT_EQ(attempt(), 2);
  }
  EXPECT_EQ(attempt(), 1);
}

TEST(ActivityRegistryTest, RegisterAndFind) {
  ActivityRegistry registry;
  registry.register_activity("b", [](const json &) {
    return json(1);
  });
  registry.register_activity("a", [](const json &) {
    return json(2);
  });

  EXPECT_TRUE(registry.contains("a"));
  EXPECT_FALSE(registry.find("c").has_value());
  EXPECT_EQ((*registry.find("a"))(json()), 2);
  EXPECT_EQ(registry.names(), (std::vector<ActivityName>{"a", "b"}));
}

// --- WorkflowContext ---

TEST_F(LocalEngineTest, WorkflowRecordsResults) {
  auto engine = make_engine();
  WorkflowContext workflow(*engine, CallerState{"t1", std::nullopt, std::nullopt});

  EXPECT_FALSE(workflow.replaying());
  EXPECT_EQ(workflow.execute_activity("echo", json{{"n", 1}}), (json{{"n", 1}}));
  EXPECT_EQ(workflow.execute_activity("echo", json{{"n", 2}}), (json{{"n", 2}}));

  auto entries = workflow.log()->entries();
  ASSERT_EQ(entries.size(), 2);
  EXPECT_EQ(entries[1].sequence, 1);
  EXPECT_EQ(entries[1].result["n"], 2);
}

TEST_F(LocalEngineTest, ReplayServesRecordedResults) {
  std::atomic<int> calls{0};
  registry_->register_activity("count", [&calls](const json &) {
    return json(++calls);
  });
  auto engine = make_engine();

  WorkflowContext first(*engine, CallerState{});
  first.execute_activity("count", json::object());

  auto log = std::make_shared<ReplayLog>(ReplayLog::from_json(first.log()->to_json()));
  WorkflowContext replay(*engine, CallerState{}, log);
  EXPECT_TRUE(replay.replaying());
  EXPECT_EQ(replay.execute_activity("count", json::object()), 1);

  // 日志之外的调用照常执行
  EXPECT_FALSE(replay.replaying());
  EXPECT_EQ(replay.execute_activity("count", json::object()), 2);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(log->size(), 2);
}

TEST_F(LocalEngineTest, ReplayMismatchIsReported) {
  auto engine = make_engine();
  auto log = std::make_shared<ReplayLog>();
  log->record(0, "echo", json{{"n", 1}});

  WorkflowContext workflow(*engine, CallerState{}, log);
  EXPECT_THROW(workflow.execute_activity("whoami", json::object()), std::logic_error);
}
