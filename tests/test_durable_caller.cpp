#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <set>
#include <thread>

#include "agent/durable_caller.hpp"
#include "context/context_store.hpp"
#include "core/errors.hpp"
#include "engine/local_engine.hpp"
#include "engine/workflow_context.hpp"
#include "llm/scripted_provider.hpp"
#include "tracing/tracer.hpp"

using namespace taskstream;

namespace {

llm::ScriptedTurn turn(std::vector<llm::StreamEvent> chunks) {
  llm::ScriptedTurn t;
  t.chunks = std::move(chunks);
  return t;
}

ExecutionContext task_context(const TaskId &task_id) {
  ExecutionContext ctx;
  ctx.task_id = task_id;
  return ctx;
}

}  // namespace

class DurableCallerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    io_thread_ = std::thread([this]() {
      io_ctx_.run();
    });

    channel_ = std::make_shared<InMemoryStreamChannel>();
    sink_ = std::make_shared<InMemoryMessageSink>();
    streaming_ = std::make_shared<StreamingService>(channel_, sink_);
    provider_ = std::make_shared<llm::ScriptedProvider>(io_ctx_);
    span_sink_ = std::make_shared<tracing::InMemorySpanSink>();
    tracer_ = std::make_shared<tracing::Tracer>(std::vector<std::shared_ptr<tracing::SpanSink>>{span_sink_});
    caller_ = std::make_shared<DurableCaller>(provider_, streaming_, tracer_, "test-model");
  }

  void TearDown() override {
    ContextStore::clear();
    work_guard_.reset();
    io_thread_.join();
  }

  // Envelopes of a task topic, grouped by message id
  std::set<MessageId> streamed_message_ids(const TaskId &task_id) {
    std::set<MessageId> ids;
    for (const auto &entry : channel_->read(streaming_->topic_for(task_id))) {
      ids.insert(entry.payload["message_id"].get<std::string>());
    }
    return ids;
  }

  size_t done_markers(const TaskId &task_id) {
    size_t count = 0;
    for (const auto &entry : channel_->read(streaming_->topic_for(task_id))) {
      if (entry.payload["type"] == "done") ++count;
    }
    return count;
  }

  // Engine running invoke_agent through the caller
  std::unique_ptr<engine::LocalEngine> make_engine() {
    Config config;
    config.worker.threads = 2;
    config.retry.initial_interval_ms = 1;

    auto registry = std::make_shared<engine::ActivityRegistry>();
    registry->register_activity("invoke_agent", [this](const json &payload) {
      std::optional<std::string> token;
      if (payload.contains("resume_token")) {
        token = payload["resume_token"].get<std::string>();
      }
      return caller_->invoke(payload.value("prompt", ""), {}, token).to_json();
    });

    InterceptorChain interceptors;
    interceptors.add(std::make_shared<ContextInterceptor>(config));
    return std::make_unique<engine::LocalEngine>(config, registry, std::move(interceptors));
  }

  asio::io_context io_ctx_;
  asio::executor_work_guard<asio::io_context::executor_type> work_guard_ = asio::make_work_guard(io_ctx_);
  std::thread io_thread_;

  std::shared_ptr<InMemoryStreamChannel> channel_;
  std::shared_ptr<InMemoryMessageSink> sink_;
  std::shared_ptr<StreamingService> streaming_;
  std::shared_ptr<llm::ScriptedProvider> provider_;
  std::shared_ptr<tracing::InMemorySpanSink> span_sink_;
  std::shared_ptr<tracing::Tracer> tracer_;
  std::shared_ptr<DurableCaller> caller_;
};

TEST_F(DurableCallerTest, WithoutTaskIdNothingIsStreamed) {
  provider_->add_turn(turn({llm::TextDelta{"Hel"}, llm::TextDelta{"lo"}, llm::FinishStep{FinishReason::Stop, {}}}));

  auto result = caller_->invoke("hi");

  EXPECT_EQ(result.text, "Hello");
  EXPECT_FALSE(result.streamed());
  EXPECT_EQ(result.attempt, 1);
  EXPECT_TRUE(channel_->topics().empty());
  EXPECT_EQ(sink_->size(), 0);
}

TEST_F(DurableCallerTest, StreamsAndPersistsUnderTask) {
  provider_->add_turn(turn({llm::TextDelta{"Hel"}, llm::TextDelta{"lo"}}));
  ContextScope scope(task_context("t1"));

  auto result = caller_->invoke("hi");

  ASSERT_TRUE(result.streamed());
  EXPECT_EQ(result.text, "Hello");

  auto entries = channel_->read("task:t1");
  ASSERT_EQ(entries.size(), 4);
  EXPECT_EQ(entries.front().payload["type"], "start");
  EXPECT_EQ(entries.back().payload["type"], "done");
  for (const auto &entry : entries) {
    EXPECT_EQ(entry.payload["message_id"], result.message_id);
  }

  auto stored = sink_->get("t1", result.message_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->text(), "Hello");
  EXPECT_EQ(sink_->upsert_calls(), 1);
}

TEST_F(DurableCallerTest, TranslatesEveryChunkKind) {
  TokenUsage usage;
  usage.input_tokens = 12;
  usage.output_tokens = 5;
  provider_->add_turn(turn({
      llm::ThinkingDelta{"look it up"},
      llm::TextDelta{"Searching"},
      llm::ToolCallComplete{"call_1", "search", json{{"q", "weather"}}},
      llm::ToolResultChunk{"call_1", "search", "sunny"},
      llm::GuardrailTripped{"pii", "address removed"},
      llm::TextDelta{"It is sunny"},
      llm::FinishStep{FinishReason::ToolCalls, usage},
  }));
  ContextScope scope(task_context("t1"));

  auto result = caller_->invoke("weather?");

  ASSERT_EQ(result.blocks.size(), 6);
  EXPECT_EQ(std::get<ReasoningContent>(result.blocks[0]).summary, "look it up");
  EXPECT_EQ(std::get<TextContent>(result.blocks[1]).text, "Searching");
  EXPECT_EQ(std::get<ToolRequestContent>(result.blocks[2]).arguments["q"], "weather");
  EXPECT_EQ(std::get<ToolResponseContent>(result.blocks[3]).content, "sunny");
  EXPECT_EQ(std::get<GuardrailContent>(result.blocks[4]).guardrail, "pii");
  EXPECT_EQ(result.text, "SearchingIt is sunny");
  ASSERT_EQ(result.tool_calls.size(), 1);
  EXPECT_EQ(result.tool_calls[0].tool_call_id, "call_1");
  EXPECT_EQ(result.finish_reason, FinishReason::ToolCalls);
  EXPECT_EQ(result.usage.total(), 17);

  auto stored = sink_->get("t1", result.message_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->blocks(), result.blocks);
}

TEST_F(DurableCallerTest, ResumeTokenIsForwardedAndReturned) {
  provider_->add_turn(turn({llm::SessionInfo{"tok-1"}, llm::TextDelta{"again"}}));
  provider_->add_turn(turn({llm::TextDelta{"no token"}}));
  ContextScope scope(task_context("t1"));

  auto first = caller_->invoke("continue", {}, std::string("tok-0"));
  EXPECT_EQ(first.resume_token, "tok-1");

  auto second = caller_->invoke("continue", {}, std::string("tok-1"));
  EXPECT_EQ(second.resume_token, "tok-1");

  auto requests = provider_->requests();
  ASSERT_EQ(requests.size(), 2);
  EXPECT_EQ(requests[0].resume_token, "tok-0");
  EXPECT_EQ(requests[1].resume_token, "tok-1");
  EXPECT_EQ(requests[0].model, "test-model");
}

TEST_F(DurableCallerTest, PriorMessagesReachTheProvider) {
  provider_->add_turn(turn({llm::TextDelta{"ok"}}));
  AccumulatedMessage prior("t1", "m0", Author::User);
  prior.add_block(TextContent{Author::User, "earlier"});

  caller_->invoke("now", {prior});

  auto requests = provider_->requests();
  ASSERT_EQ(requests.size(), 1);
  ASSERT_EQ(requests[0].prior_messages.size(), 1);
  EXPECT_EQ(requests[0].prior_messages[0].text(), "earlier");
}

TEST_F(DurableCallerTest, StreamErrorAbortsSession) {
  provider_->add_turn(turn({llm::TextDelta{"partial"}, llm::StreamError{"overloaded", true}}));
  ContextScope scope(task_context("t1"));

  try {
    caller_->invoke("hi");
    FAIL() << "expected AgentError";
  } catch (const AgentError &e) {
    EXPECT_STREQ(e.what(), "overloaded");
    EXPECT_TRUE(e.retryable());
  }

  EXPECT_EQ(sink_->size(), 0);
  EXPECT_EQ(done_markers("t1"), 0);
  EXPECT_EQ(channel_->size("task:t1"), 2);
}

TEST_F(DurableCallerTest, DanglingToolCallIsFinalized) {
  provider_->add_turn(turn({
      llm::ToolCallDelta{"call_9", "lookup", "{\"id\":"},
      llm::ToolCallDelta{"", "", "7}"},
  }));
  ContextScope scope(task_context("t1"));

  auto result = caller_->invoke("find 7");

  ASSERT_EQ(result.tool_calls.size(), 1);
  EXPECT_EQ(result.tool_calls[0].name, "lookup");
  EXPECT_EQ(result.tool_calls[0].arguments, (json{{"id", 7}}));

  auto entries = channel_->read("task:t1");
  ASSERT_EQ(entries.size(), 3);
  EXPECT_EQ(entries[1].payload["type"], "full");
}

TEST_F(DurableCallerTest, SeedLeadsTheMessage) {
  provider_->add_turn(turn({llm::TextDelta{"answer"}}));
  ContextScope scope(task_context("t1"));

  auto result = caller_->invoke("hi", {}, std::nullopt, ContentBlock{TextContent{Author::Agent, "Draft: "}});

  EXPECT_EQ(result.text, "Draft: answer");
  EXPECT_EQ(sink_->get("t1", result.message_id)->text(), "Draft: answer");
}

TEST_F(DurableCallerTest, InvocationIsTracedUnderParentSpan) {
  provider_->add_turn(turn({llm::TextDelta{"traced"}}));
  ExecutionContext ctx;
  ctx.task_id = "t1";
  ctx.trace_id = "trace-1";
  ctx.parent_span_id = "span-1";
  ContextScope scope(ctx);

  auto result = caller_->invoke("hi");

  auto spans = span_sink_->spans_for_trace("trace-1");
  ASSERT_EQ(spans.size(), 1);
  EXPECT_EQ(spans[0].name, "invoke_agent");
  EXPECT_EQ(spans[0].parent_id, "span-1");
  EXPECT_EQ(spans[0].input["prompt"], "hi");
  EXPECT_EQ(spans[0].output["message_id"], result.message_id);
  EXPECT_FALSE(spans[0].error.has_value());
}

TEST_F(DurableCallerTest, NoSpanWithoutTraceContext) {
  provider_->add_turn(turn({llm::TextDelta{"untraced"}}));
  ContextScope scope(task_context("t1"));

  caller_->invoke("hi");

  EXPECT_EQ(span_sink_->started(), 0);
}

TEST_F(DurableCallerTest, EngineRetryStreamsFreshMessage) {
  provider_->add_turn(turn({llm::TextDelta{"partial"}, llm::StreamError{"overloaded", true}}));
  provider_->add_turn(turn({llm::TextDelta{"complete"}}));
  auto engine = make_engine();

  engine::WorkflowContext workflow(*engine, CallerState{"t1", std::nullopt, std::nullopt});
  auto result = FinalResult::from_json(workflow.execute_activity("invoke_agent", json{{"prompt", "hi"}}));

  EXPECT_EQ(result.attempt, 2);
  EXPECT_EQ(result.text, "complete");

  // 两次尝试各自一条消息，只有成功的那条被持久化
  auto ids = streamed_message_ids("t1");
  EXPECT_EQ(ids.size(), 2);
  EXPECT_TRUE(ids.count(result.message_id));
  EXPECT_EQ(done_markers("t1"), 1);

  auto stored = sink_->list("t1");
  ASSERT_EQ(stored.size(), 1);
  EXPECT_EQ(stored[0].message_id(), result.message_id);
  EXPECT_EQ(engine->attempts_started(), 2);
}

TEST_F(DurableCallerTest, NonRetryableFailureStopsTheEngine) {
  provider_->add_turn(turn({llm::StreamError{"bad request", false}}));
  auto engine = make_engine();

  engine::WorkflowContext workflow(*engine, CallerState{"t1", std::nullopt, std::nullopt});
  try {
    workflow.execute_activity("invoke_agent", json{{"prompt", "hi"}});
    FAIL() << "expected ActivityError";
  } catch (const ActivityError &e) {
    EXPECT_EQ(e.activity(), "invoke_agent");
    EXPECT_EQ(e.attempts(), 1);
    EXPECT_EQ(e.last_error(), "bad request");
  }

  EXPECT_EQ(provider_->requests().size(), 1);
  EXPECT_EQ(sink_->size(), 0);
}

TEST_F(DurableCallerTest, ReplayDoesNotStreamAgain) {
  provider_->add_turn(turn({llm::TextDelta{"once"}}));
  auto engine = make_engine();
  CallerState state{"t1", std::nullopt, std::nullopt};

  engine::WorkflowContext workflow(*engine, state);
  auto original = workflow.execute_activity("invoke_agent", json{{"prompt", "hi"}});
  auto envelopes = channel_->size("task:t1");

  engine::WorkflowContext replayed(*engine, state, std::make_shared<engine::ReplayLog>(*workflow.log()));
  EXPECT_TRUE(replayed.replaying());
  auto again = replayed.execute_activity("invoke_agent", json{{"prompt", "hi"}});

  EXPECT_EQ(again, original);
  EXPECT_EQ(channel_->size("task:t1"), envelopes);
  EXPECT_EQ(provider_->requests().size(), 1);
  EXPECT_EQ(sink_->size(), 1);
}

TEST_F(DurableCallerTest, ResumeTokenThroughEngine) {
  provider_->add_turn(turn({llm::SessionInfo{"tok-2"}, llm::TextDelta{"hi"}}));
  auto engine = make_engine();

  engine::WorkflowContext workflow(*engine, CallerState{"t1", std::nullopt, std::nullopt});
  auto result = FinalResult::from_json(workflow.execute_activity("invoke_agent", json{{"prompt", "hi"}, {"resume_token", "tok-1"}}));

  EXPECT_EQ(result.resume_token, "tok-2");
  EXPECT_EQ(provider_->requests()[0].resume_token, "tok-1");
}

TEST_F(DurableCallerTest, CancelAbortsTheSession) {
  provider_->add_turn(turn({llm::TextDelta{"one"}, llm::TextDelta{"two"}, llm::TextDelta{"three"}}));
  ContextScope scope(task_context("t1"));

  // 第一个增量到达频道时取消
  auto sub = channel_->subscribe("task:t1", [this](const std::string &, const ChannelEntry &entry) {
    if (entry.payload["type"] == "delta") {
      caller_->cancel();
    }
  });

  try {
    caller_->invoke("hi");
    FAIL() << "expected AgentError";
  } catch (const AgentError &e) {
    EXPECT_FALSE(e.retryable());
  }
  channel_->unsubscribe(sub);

  EXPECT_EQ(sink_->size(), 0);
  EXPECT_EQ(done_markers("t1"), 0);
  EXPECT_EQ(channel_->size("task:t1"), 2);
}

TEST_F(DurableCallerTest, CancelDoesNotReachLaterInvocations) {
  provider_->add_turn(turn({llm::TextDelta{"one"}, llm::TextDelta{"two"}, llm::TextDelta{"three"}}));
  provider_->add_turn(turn({llm::TextDelta{"one"}, llm::TextDelta{"two"}, llm::TextDelta{"three"}}));

  std::future<FinalResult> later;

  // a 收到第一个增量时取消，随后在另一个线程上启动 b
  auto sub = channel_->subscribe("task:a", [this, &later](const std::string &, const ChannelEntry &entry) {
    if (entry.payload["type"] != "delta" || later.valid()) return;
    caller_->cancel();
    later = std::async(std::launch::async, [this]() {
      ContextScope scope(task_context("b"));
      return caller_->invoke("hi");
    });
    // b 已经向 provider 发出请求后 a 才继续
    while (provider_->requests().size() < 2) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  });

  {
    ContextScope scope(task_context("a"));
    EXPECT_THROW(caller_->invoke("hi"), AgentError);
  }
  channel_->unsubscribe(sub);

  ASSERT_TRUE(later.valid());
  auto result = later.get();
  EXPECT_EQ(result.text, "onetwothree");

  EXPECT_EQ(done_markers("a"), 0);
  EXPECT_EQ(done_markers("b"), 1);
  ASSERT_EQ(sink_->size(), 1);
  EXPECT_EQ(sink_->list("b").size(), 1);
}
