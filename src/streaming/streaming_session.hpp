#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "core/content.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "streaming/accumulator.hpp"
#include "streaming/channel.hpp"
#include "streaming/stream_event.hpp"

namespace taskstream {

// One streaming session for a single (task_id, message_id) pair.
//
// Lifecycle: Opening -> Open -> Closing -> Closed | Aborted
// - open() mints the message id (unless one was given), installs the seed
//   and publishes the Start marker at sequence 0
// - publish() appends and forwards immediately, in call order. A UTF-8
//   character split across deltas is held back until it is complete.
// - close() persists the final message with one upsert, then publishes Done
// - abort() discards the partial message; nothing is persisted or published
//
// A session has exactly one owner. The destructor aborts a session that is
// still open.
//
// Envelopes reach the channel after the state lock is released, so channel
// subscribers may call message(), state() and is_open(). They must not
// publish to or close the session they are observing.
class StreamingSession {
 public:
  StreamingSession(std::shared_ptr<StreamChannel> channel, std::shared_ptr<MessageSink> sink, std::string topic, TaskId task_id,
                   std::optional<ContentBlock> seed = std::nullopt, std::optional<MessageId> message_id = std::nullopt);
  ~StreamingSession();

  StreamingSession(const StreamingSession &) = delete;
  StreamingSession &operator=(const StreamingSession &) = delete;

  void open();

  // Throws SessionStateError unless the session is open. Done closes the session.
  void publish(const StreamEvent &event);

  // Throws SessionStateError unless the session is open, PersistenceError if
  // the sink fails (the session is then aborted).
  void close();

  // Throws SessionStateError if the session already ended
  void abort(const std::string &reason);

  SessionState state() const;
  bool is_open() const;

  const TaskId &task_id() const {
    return task_id_;
  }
  const MessageId &message_id() const {
    return message_id_;
  }
  const std::string &topic() const {
    return topic_;
  }

  // Snapshot of the message as accumulated so far
  AccumulatedMessage message() const;

  // Sequence number the next envelope will carry
  uint64_t next_sequence() const;

  // Envelopes the channel failed to accept
  size_t publish_failures() const;

 private:
  void require_open(const char *operation) const;
  StreamUpdate next_update(const StreamEvent &event);
  void stage(const StreamEvent &event, std::vector<StreamUpdate> &updates);
  void flush_pending(std::vector<StreamUpdate> &updates);
  void persist_locked(std::unique_lock<std::mutex> &lock);
  void deliver(const std::vector<StreamUpdate> &updates);
  AccumulatedMessage build_message() const;

  std::shared_ptr<StreamChannel> channel_;
  std::shared_ptr<MessageSink> sink_;
  std::string topic_;
  TaskId task_id_;
  MessageId message_id_;
  std::optional<ContentBlock> seed_;

  // Held across staging and delivery so envelopes reach the channel in sequence order
  std::mutex publish_mutex_;

  mutable std::mutex mutex_;
  SessionState state_ = SessionState::Opening;
  ContentAccumulator accumulator_;
  uint64_t next_sequence_ = 0;
  size_t publish_failures_ = 0;

  // Trailing bytes of an incomplete UTF-8 character, not yet on the channel
  std::string pending_text_;
  DeltaKind pending_kind_ = DeltaKind::Text;
};

// Opens sessions against one channel and one sink
class StreamingService {
 public:
  StreamingService(std::shared_ptr<StreamChannel> channel, std::shared_ptr<MessageSink> sink, Config config = Config{});

  // Returns an open session
  std::unique_ptr<StreamingSession> open_session(const TaskId &task_id, std::optional<ContentBlock> seed = std::nullopt,
                                                 std::optional<MessageId> message_id = std::nullopt);

  // Runs fn with an open session. Closes it on normal return, aborts it and
  // rethrows if fn throws. fn may close the session itself by publishing Done.
  template <typename Fn>
  auto with_session(const TaskId &task_id, std::optional<ContentBlock> seed, Fn &&fn) -> std::invoke_result_t<Fn, StreamingSession &> {
    using R = std::invoke_result_t<Fn, StreamingSession &>;

    auto session = open_session(task_id, std::move(seed));
    try {
      if constexpr (std::is_void_v<R>) {
        std::forward<Fn>(fn)(*session);
        if (session->is_open()) {
          session->close();
        }
      } else {
        R result = std::forward<Fn>(fn)(*session);
        if (session->is_open()) {
          session->close();
        }
        return result;
      }
    } catch (const std::exception &e) {
      if (session->is_open()) {
        session->abort(e.what());
      }
      throw;
    } catch (...) {
      if (session->is_open()) {
        session->abort("unknown exception");
      }
      throw;
    }
  }

  std::shared_ptr<StreamChannel> channel() const {
    return channel_;
  }
  std::shared_ptr<MessageSink> sink() const {
    return sink_;
  }

  std::string topic_for(const TaskId &task_id) const {
    return config_.topic_for(task_id);
  }

 private:
  std::shared_ptr<StreamChannel> channel_;
  std::shared_ptr<MessageSink> sink_;
  Config config_;
};

}  // namespace taskstream
