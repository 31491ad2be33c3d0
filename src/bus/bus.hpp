#pragma once

#include <any>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <vector>

namespace taskstream {

// Type-safe event bus for internal communication
class Bus {
 public:
  using SubscriptionId = uint64_t;

  static Bus &instance();

  // Subscribe to events of type T
  template <typename T>
  SubscriptionId subscribe(std::function<void(const T &)> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    auto type_idx = std::type_index(typeid(T));

    handlers_[type_idx].push_back({id, [handler](const std::any &event) {
                                     handler(std::any_cast<const T &>(event));
                                   }});

    return id;
  }

  // Unsubscribe. Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  // Publish an event. Handlers run outside the lock, in subscription order.
  // A handler that throws is logged and skipped; the rest still run.
  template <typename T>
  void publish(const T &event) {
    dispatch(std::type_index(typeid(T)), std::any(event));
  }

  // Handlers currently subscribed, over all event types
  size_t handler_count() const;

 private:
  Bus() = default;

  struct HandlerEntry {
    SubscriptionId id;
    std::function<void(const std::any &)> handler;
  };

  void dispatch(const std::type_index &type_idx, const std::any &event);

  mutable std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::map<std::type_index, std::vector<HandlerEntry>> handlers_;
};

// Unsubscribes on destruction
class ScopedSubscription {
 public:
  template <typename T>
  static ScopedSubscription on(std::function<void(const T &)> handler) {
    return ScopedSubscription(Bus::instance().subscribe<T>(std::move(handler)));
  }

  explicit ScopedSubscription(Bus::SubscriptionId id) : id_(id) {}
  ~ScopedSubscription() {
    if (id_ != 0) {
      Bus::instance().unsubscribe(id_);
    }
  }

  ScopedSubscription(ScopedSubscription &&other) noexcept : id_(other.id_) {
    other.id_ = 0;
  }
  ScopedSubscription(const ScopedSubscription &) = delete;
  ScopedSubscription &operator=(const ScopedSubscription &) = delete;
  ScopedSubscription &operator=(ScopedSubscription &&) = delete;

 private:
  Bus::SubscriptionId id_;
};

// Streaming lifecycle events
namespace events {

struct SessionOpened {
  std::string task_id;
  std::string message_id;
};

struct SessionClosed {
  std::string task_id;
  std::string message_id;
  size_t blocks;
};

struct SessionAborted {
  std::string task_id;
  std::string message_id;
  std::string reason;
};

struct ContextInstalled {
  std::string task_id;
  std::string activity;
};

}  // namespace events

}  // namespace taskstream
