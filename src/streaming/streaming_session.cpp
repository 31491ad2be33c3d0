#include "streaming/streaming_session.hpp"

#include <spdlog/spdlog.h>

#include "bus/bus.hpp"
#include "core/errors.hpp"
#include "core/uuid.hpp"

namespace taskstream {

StreamingSession::StreamingSession(std::shared_ptr<StreamChannel> channel, std::shared_ptr<MessageSink> sink, std::string topic,
                                   TaskId task_id, std::optional<ContentBlock> seed, std::optional<MessageId> message_id)
    : channel_(std::move(channel)),
      sink_(std::move(sink)),
      topic_(std::move(topic)),
      task_id_(std::move(task_id)),
      message_id_(message_id.value_or("")),
      seed_(std::move(seed)) {}

StreamingSession::~StreamingSession() {
  bool open = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    open = state_ == SessionState::Open;
  }
  if (!open) {
    return;
  }

  spdlog::warn("[Stream {}/{}] Session left open, aborting", task_id_, message_id_);
  try {
    abort("session destroyed while open");
  } catch (const std::exception &e) {
    spdlog::error("[Stream {}/{}] Abort on destruction failed: {}", task_id_, message_id_, e.what());
  }
}

void StreamingSession::open() {
  std::lock_guard<std::mutex> order(publish_mutex_);
  std::vector<StreamUpdate> updates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Opening) {
      throw SessionStateError("Cannot open session in state " + to_string(state_));
    }

    if (message_id_.empty()) {
      message_id_ = UUID::generate();
    }
    accumulator_ = ContentAccumulator(seed_);
    state_ = SessionState::Open;

    auto start = StreamUpdate::start(task_id_, message_id_, seed_);
    start.sequence = next_sequence_++;
    updates.push_back(std::move(start));
  }

  deliver(updates);
  spdlog::debug("[Stream {}/{}] Opened on {}{}", task_id_, message_id_, topic_, seed_ ? " (seeded)" : "");
  Bus::instance().publish(events::SessionOpened{task_id_, message_id_});
}

void StreamingSession::publish(const StreamEvent &event) {
  if (std::holds_alternative<Done>(event)) {
    close();
    return;
  }

  std::lock_guard<std::mutex> order(publish_mutex_);
  std::vector<StreamUpdate> updates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open("publish");

    accumulator_.apply(event);
    stage(event, updates);
  }

  deliver(updates);
}

void StreamingSession::close() {
  std::lock_guard<std::mutex> order(publish_mutex_);
  std::vector<StreamUpdate> updates;
  size_t blocks = 0;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    require_open("close");

    flush_pending(updates);
    persist_locked(lock);

    updates.push_back(next_update(Done{}));
    state_ = SessionState::Closed;
    blocks = accumulator_.blocks().size();
  }

  deliver(updates);
  spdlog::debug("[Stream {}/{}] Closed with {} block(s), {} envelope(s), {} publish failure(s)", task_id_, message_id_, blocks,
                next_sequence(), publish_failures());
  Bus::instance().publish(events::SessionClosed{task_id_, message_id_, blocks});
}

void StreamingSession::persist_locked(std::unique_lock<std::mutex> &lock) {
  state_ = SessionState::Closing;

  auto msg = build_message();
  msg.set_final(true);
  msg.set_status(StreamingStatus::Done);

  try {
    sink_->upsert(task_id_, message_id_, msg);
  } catch (const std::exception &e) {
    state_ = SessionState::Aborted;
    pending_text_.clear();
    spdlog::error("[Stream {}/{}] Failed to persist final message: {}", task_id_, message_id_, e.what());

    std::string reason = std::string("persistence failed: ") + e.what();
    lock.unlock();
    Bus::instance().publish(events::SessionAborted{task_id_, message_id_, reason});

    if (dynamic_cast<const PersistenceError *>(&e)) {
      throw;
    }
    throw PersistenceError(reason);
  }
}

void StreamingSession::abort(const std::string &reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Closed || state_ == SessionState::Aborted) {
      throw SessionStateError("Cannot abort session in state " + to_string(state_));
    }
    state_ = SessionState::Aborted;
    pending_text_.clear();
    spdlog::warn("[Stream {}/{}] Aborted after {} event(s): {}", task_id_, message_id_, accumulator_.events_applied(), reason);
  }

  Bus::instance().publish(events::SessionAborted{task_id_, message_id_, reason});
}

SessionState StreamingSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool StreamingSession::is_open() const {
  return state() == SessionState::Open;
}

AccumulatedMessage StreamingSession::message() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return build_message();
}

uint64_t StreamingSession::next_sequence() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_sequence_;
}

size_t StreamingSession::publish_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return publish_failures_;
}

void StreamingSession::require_open(const char *operation) const {
  if (state_ != SessionState::Open) {
    throw SessionStateError(std::string("Cannot ") + operation + " session " + message_id_ + " in state " + to_string(state_));
  }
}

StreamUpdate StreamingSession::next_update(const StreamEvent &event) {
  return StreamUpdate::from_event(task_id_, message_id_, next_sequence_++, event);
}

void StreamingSession::stage(const StreamEvent &event, std::vector<StreamUpdate> &updates) {
  const auto *delta = std::get_if<Delta>(&event);
  if (!delta || delta->kind != pending_kind_) {
    flush_pending(updates);
  }
  if (!delta) {
    updates.push_back(next_update(event));
    return;
  }

  // 多字节字符被拆到两个 delta 时，不完整的尾部留给下一个
  std::string text = pending_text_ + delta->text;
  size_t tail = utf8_incomplete_suffix(text);
  pending_text_ = text.substr(text.size() - tail);
  pending_kind_ = delta->kind;
  text.resize(text.size() - tail);

  if (!text.empty()) {
    updates.push_back(next_update(Delta{delta->kind, std::move(text)}));
  }
}

void StreamingSession::flush_pending(std::vector<StreamUpdate> &updates) {
  if (pending_text_.empty()) {
    return;
  }
  // The character never completed; it goes out as replacement characters
  updates.push_back(next_update(Delta{pending_kind_, std::move(pending_text_)}));
  pending_text_.clear();
}

void StreamingSession::deliver(const std::vector<StreamUpdate> &updates) {
  for (const auto &update : updates) {
    try {
      channel_->publish(topic_, update.to_json());
      spdlog::trace("[Stream {}/{}] #{} {}", task_id_, message_id_, update.sequence, to_string(update.type));
    } catch (const std::exception &e) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        ++publish_failures_;
      }
      spdlog::warn("[Stream {}/{}] Channel publish of #{} failed: {}", task_id_, message_id_, update.sequence, e.what());
    }
  }
}

AccumulatedMessage StreamingSession::build_message() const {
  AccumulatedMessage msg(task_id_, message_id_, Author::Agent);
  msg.set_blocks(accumulator_.blocks());
  return msg;
}

// --- StreamingService ---

StreamingService::StreamingService(std::shared_ptr<StreamChannel> channel, std::shared_ptr<MessageSink> sink, Config config)
    : channel_(std::move(channel)), sink_(std::move(sink)), config_(std::move(config)) {}

std::unique_ptr<StreamingSession> StreamingService::open_session(const TaskId &task_id, std::optional<ContentBlock> seed,
                                                                 std::optional<MessageId> message_id) {
  auto session = std::make_unique<StreamingSession>(channel_, sink_, config_.topic_for(task_id), task_id, std::move(seed),
                                                    std::move(message_id));
  session->open();
  return session;
}

}  // namespace taskstream
