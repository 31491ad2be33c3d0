#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include "llm/provider.hpp"

namespace taskstream::llm {

// One scripted answer: the chunks a single stream() or complete() call produces
struct ScriptedTurn {
  std::vector<StreamEvent> chunks;
  std::chrono::milliseconds chunk_delay{0};

  // {"chunks": [...], "chunk_delay_ms": 0}
  static ScriptedTurn from_json(const json &j);
};

// Replays scripted turns on an io_context, one turn per call. Once the
// script is exhausted every call fails with a non-retryable StreamError.
class ScriptedProvider : public Provider, public std::enable_shared_from_this<ScriptedProvider> {
 public:
  ScriptedProvider(asio::io_context &io_ctx, std::vector<ScriptedTurn> turns = {}, std::string name = "scripted");

  // options: {"turns": [ScriptedTurn...]}
  static std::shared_ptr<ScriptedProvider> from_config(const ProviderConfig &config, asio::io_context &io_ctx);

  std::string name() const override {
    return name_;
  }

  std::future<AgentResponse> complete(const AgentRequest &request) override;
  void stream(const AgentRequest &request, StreamCallback callback, std::function<void()> on_complete,
              CancelToken cancel = nullptr) override;

  void add_turn(ScriptedTurn turn);

  // Every request received, in order
  std::vector<AgentRequest> requests() const;

  size_t remaining_turns() const;

 private:
  ScriptedTurn next_turn(const AgentRequest &request);

  asio::io_context &io_ctx_;
  std::string name_;

  mutable std::mutex mutex_;
  std::deque<ScriptedTurn> turns_;
  std::vector<AgentRequest> requests_;
};

}  // namespace taskstream::llm
