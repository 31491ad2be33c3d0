#include "bus/bus.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace taskstream {

Bus &Bus::instance() {
  static Bus instance;
  return instance;
}

void Bus::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = handlers_.begin(); it != handlers_.end();) {
    auto &handlers = it->second;
    handlers.erase(std::remove_if(handlers.begin(), handlers.end(),
                                  [id](const HandlerEntry &entry) {
                                    return entry.id == id;
                                  }),
                   handlers.end());
    it = handlers.empty() ? handlers_.erase(it) : std::next(it);
  }
}

size_t Bus::handler_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto &[type_idx, handlers] : handlers_) {
    count += handlers.size();
  }
  return count;
}

void Bus::dispatch(const std::type_index &type_idx, const std::any &event) {
  std::vector<HandlerEntry> to_call;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(type_idx);
    if (it == handlers_.end()) {
      return;
    }
    to_call = it->second;
  }

  // 会话的 close/abort 也走这里，订阅者的异常不能传回发布方
  for (const auto &entry : to_call) {
    try {
      entry.handler(event);
    } catch (const std::exception &e) {
      spdlog::error("[Bus] Handler #{} for {} threw: {}", entry.id, type_idx.name(), e.what());
    }
  }
}

}  // namespace taskstream
