#include <asio.hpp>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "spdlog/cfg/env.h"
#include "taskstream/taskstream.hpp"

using namespace taskstream;

namespace fs = std::filesystem;

// Script for the agent: the first attempt is cut off, the retry completes
static std::vector<llm::ScriptedTurn> demo_script() {
  llm::ScriptedTurn failing;
  failing.chunk_delay = std::chrono::milliseconds(50);
  failing.chunks = {
      llm::ThinkingDelta{"The user wants the weather. "},
      llm::TextDelta{"Let me check"},
      llm::StreamError{"upstream overloaded", true},
  };

  llm::ScriptedTurn complete;
  complete.chunk_delay = std::chrono::milliseconds(50);
  TokenUsage usage;
  usage.input_tokens = 42;
  usage.output_tokens = 17;
  complete.chunks = {
      llm::SessionInfo{"resume-" + UUID::generate()},
      llm::ThinkingDelta{"The user wants the weather. "},
      llm::ThinkingDelta{"Call the lookup tool."},
      llm::ToolCallComplete{"call_1", "weather", json{{"city", "Hangzhou"}}},
      llm::ToolResultChunk{"call_1", "weather", "22C, light rain"},
      llm::TextDelta{"It is 22C "},
      llm::TextDelta{"with light rain in Hangzhou."},
      llm::FinishStep{FinishReason::Stop, usage},
  };

  return {failing, complete};
}

int main(int argc, char *argv[]) {
  spdlog::cfg::load_env_levels();

  auto config = Config::from_env();
  config.retry.initial_interval_ms = 200;
  if (argc > 1) {
    config.store_dir = argv[1];
  } else {
    config.store_dir = fs::temp_directory_path() / "taskstream-demo";
  }
  init(config);

  std::cout << "taskstream " << version() << "\n";
  std::cout << "Messages stored under " << config.store_dir << "\n\n";

  // Agent capability runs on its own io_context
  asio::io_context io_ctx;
  auto work_guard = asio::make_work_guard(io_ctx);
  std::thread io_thread([&io_ctx]() {
    io_ctx.run();
  });

  auto channel = std::make_shared<InMemoryStreamChannel>();
  auto sink = std::make_shared<JsonMessageSink>(config.store_dir);
  auto streaming = std::make_shared<StreamingService>(channel, sink, config);

  auto provider = std::make_shared<llm::ScriptedProvider>(io_ctx, demo_script());
  auto tracer = std::make_shared<tracing::Tracer>(std::vector<std::shared_ptr<tracing::SpanSink>>{std::make_shared<tracing::LogSpanSink>()});
  DurableCaller caller(provider, streaming, tracer, "demo-model");

  // Live view of the task topic
  TaskId task_id = "task-" + UUID::generate().substr(0, 8);
  channel->subscribe(streaming->topic_for(task_id), [](const std::string &, const ChannelEntry &entry) {
    const auto &p = entry.payload;
    std::string type = p["type"];
    std::cout << "  #" << p["sequence"].get<uint64_t>() << " " << type << " [" << p["message_id"].get<std::string>().substr(0, 8) << "]";
    if (type == "delta") {
      std::cout << " " << p["delta"]["kind"].get<std::string>() << ": " << p["delta"]["text"].get<std::string>();
    } else if (type == "full") {
      std::cout << " " << p["content"]["type"].get<std::string>();
    }
    std::cout << "\n";
  });

  auto sub = ScopedSubscription::on<events::SessionAborted>([](const events::SessionAborted &e) {
    std::cout << "  -- session " << e.message_id.substr(0, 8) << " aborted: " << e.reason << "\n";
  });

  auto registry = std::make_shared<engine::ActivityRegistry>();
  registry->register_activity("invoke_agent", [&caller](const json &payload) {
    return caller.invoke(payload.value("prompt", "")).to_json();
  });

  InterceptorChain interceptors;
  interceptors.add(std::make_shared<ContextInterceptor>(config));
  engine::LocalEngine engine(config, registry, std::move(interceptors));

  CallerState state{task_id, "trace-" + UUID::generate().substr(0, 8), "span-root"};
  engine::WorkflowContext workflow(engine, state);

  std::cout << "Streaming " << streaming->topic_for(task_id) << ":\n";
  int exit_code = 0;
  try {
    auto result = FinalResult::from_json(workflow.execute_activity("invoke_agent", json{{"prompt", "What's the weather in Hangzhou?"}}));

    std::cout << "\nFinal result (attempt " << result.attempt << "):\n";
    std::cout << "  text:         " << result.text << "\n";
    std::cout << "  tool calls:   " << result.tool_calls.size() << "\n";
    std::cout << "  usage:        " << result.usage.total() << " tokens\n";
    std::cout << "  resume token: " << result.resume_token.value_or("-") << "\n";

    // Consumer-side rebuild from the channel
    StreamReader reader;
    reader.poll(*channel, streaming->topic_for(task_id));
    std::cout << "\nReader saw " << reader.messages().size() << " message(s):\n";
    for (const auto &msg : reader.messages()) {
      std::cout << "  " << msg.message_id().substr(0, 8) << " " << (msg.is_final() ? "done" : "incomplete") << ", "
                << msg.blocks().size() << " block(s)\n";
    }

    std::cout << "\nPersisted:\n";
    for (const auto &msg : sink->list(task_id)) {
      std::cout << msg.to_json().dump(2) << "\n";
    }
  } catch (const std::exception &e) {
    std::cerr << "\n[Error: " << e.what() << "]\n";
    exit_code = 1;
  }

  engine.shutdown();
  work_guard.reset();
  io_thread.join();
  shutdown();
  return exit_code;
}
