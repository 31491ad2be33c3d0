#include "llm/scripted_provider.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace taskstream::llm {

namespace {

// Folds a chunk sequence into a non-streaming response
AgentResponse fold_chunks(const std::vector<StreamEvent> &chunks) {
  AgentResponse response;

  for (const auto &chunk : chunks) {
    std::visit(
        [&response](auto &&e) {
          using T = std::decay_t<decltype(e)>;
          auto &blocks = response.blocks;

          if constexpr (std::is_same_v<T, TextDelta>) {
            if (!blocks.empty() && std::holds_alternative<TextContent>(blocks.back())) {
              std::get<TextContent>(blocks.back()).text += e.text;
            } else {
              blocks.push_back(TextContent{Author::Agent, e.text});
            }
          } else if constexpr (std::is_same_v<T, ThinkingDelta>) {
            if (!blocks.empty() && std::holds_alternative<ReasoningContent>(blocks.back())) {
              std::get<ReasoningContent>(blocks.back()).summary += e.text;
            } else {
              blocks.push_back(ReasoningContent{Author::Agent, e.text});
            }
          } else if constexpr (std::is_same_v<T, ToolCallComplete>) {
            blocks.push_back(ToolRequestContent{Author::Agent, e.id, e.name, e.arguments});
          } else if constexpr (std::is_same_v<T, ToolResultChunk>) {
            blocks.push_back(ToolResponseContent{Author::Agent, e.tool_call_id, e.name, e.output});
          } else if constexpr (std::is_same_v<T, GuardrailTripped>) {
            blocks.push_back(GuardrailContent{Author::Agent, e.guardrail, e.message});
          } else if constexpr (std::is_same_v<T, SessionInfo>) {
            response.resume_token = e.resume_token;
          } else if constexpr (std::is_same_v<T, FinishStep>) {
            response.finish_reason = e.reason;
            response.usage = e.usage;
          } else if constexpr (std::is_same_v<T, StreamError>) {
            if (!response.error) {
              response.error = e.message;
              response.retryable = e.retryable;
              response.finish_reason = FinishReason::Error;
            }
          }
          // ToolCallDelta: the complete chunk carries the arguments
        },
        chunk);
  }

  return response;
}

}  // namespace

ScriptedTurn ScriptedTurn::from_json(const json &j) {
  ScriptedTurn turn;
  turn.chunk_delay = std::chrono::milliseconds(j.value("chunk_delay_ms", 0));
  if (j.contains("chunks")) {
    for (const auto &c : j["chunks"]) {
      if (auto chunk = chunk_from_json(c)) {
        turn.chunks.push_back(*chunk);
      } else {
        spdlog::warn("[ScriptedProvider] Skipping unknown chunk: {}", c.dump());
      }
    }
  }
  return turn;
}

ScriptedProvider::ScriptedProvider(asio::io_context &io_ctx, std::vector<ScriptedTurn> turns, std::string name)
    : io_ctx_(io_ctx), name_(std::move(name)), turns_(turns.begin(), turns.end()) {}

std::shared_ptr<ScriptedProvider> ScriptedProvider::from_config(const ProviderConfig &config, asio::io_context &io_ctx) {
  std::vector<ScriptedTurn> turns;
  if (config.options.contains("turns")) {
    for (const auto &t : config.options["turns"]) {
      turns.push_back(ScriptedTurn::from_json(t));
    }
  }
  return std::make_shared<ScriptedProvider>(io_ctx, std::move(turns), config.name.empty() ? "scripted" : config.name);
}

void ScriptedProvider::add_turn(ScriptedTurn turn) {
  std::lock_guard<std::mutex> lock(mutex_);
  turns_.push_back(std::move(turn));
}

std::vector<AgentRequest> ScriptedProvider::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

size_t ScriptedProvider::remaining_turns() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return turns_.size();
}

ScriptedTurn ScriptedProvider::next_turn(const AgentRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.push_back(request);

  if (turns_.empty()) {
    spdlog::warn("[ScriptedProvider] Script exhausted after {} request(s)", requests_.size() - 1);
    ScriptedTurn exhausted;
    exhausted.chunks.push_back(StreamError{"script exhausted", false});
    return exhausted;
  }

  auto turn = std::move(turns_.front());
  turns_.pop_front();
  return turn;
}

std::future<AgentResponse> ScriptedProvider::complete(const AgentRequest &request) {
  auto turn = next_turn(request);
  auto promise = std::make_shared<std::promise<AgentResponse>>();
  auto future = promise->get_future();

  asio::post(io_ctx_, [promise, turn = std::move(turn)]() {
    promise->set_value(fold_chunks(turn.chunks));
  });

  return future;
}

void ScriptedProvider::stream(const AgentRequest &request, StreamCallback callback, std::function<void()> on_complete,
                              CancelToken cancel) {
  auto turn = next_turn(request);

  spdlog::debug("[ScriptedProvider] Streaming {} chunk(s) for model={}", turn.chunks.size(), request.model);

  asio::post(io_ctx_, [self = shared_from_this(), turn = std::move(turn), callback = std::move(callback),
                       on_complete = std::move(on_complete), cancel = std::move(cancel)]() {
    try {
      for (const auto &chunk : turn.chunks) {
        if (cancel && *cancel) {
          spdlog::debug("[ScriptedProvider] Stream cancelled");
          break;
        }
        if (turn.chunk_delay.count() > 0) {
          std::this_thread::sleep_for(turn.chunk_delay);
        }
        callback(chunk);
      }
    } catch (const std::exception &e) {
      spdlog::error("[ScriptedProvider] Stream callback failed: {}", e.what());
    }
    on_complete();
  });
}

}  // namespace taskstream::llm
