#pragma once

#include <optional>
#include <vector>

#include "core/content.hpp"
#include "streaming/stream_event.hpp"

namespace taskstream {

// Composes StreamEvents into content blocks.
//
// A Delta extends the last block when that block is an open delta block of
// the same kind, otherwise it starts a new block. A Full event is always its
// own block and closes the current delta block. Done changes nothing.
// Empty deltas are dropped.
class ContentAccumulator {
 public:
  ContentAccumulator() = default;

  // A text or reasoning seed stays open for deltas of the same kind
  explicit ContentAccumulator(const std::optional<ContentBlock> &seed);

  void apply(const StreamEvent &event);

  const std::vector<ContentBlock> &blocks() const {
    return blocks_;
  }

  bool empty() const {
    return blocks_.empty();
  }

  size_t events_applied() const {
    return events_applied_;
  }

 private:
  void append_delta(const Delta &delta);

  std::vector<ContentBlock> blocks_;
  bool delta_open_ = false;
  size_t events_applied_ = 0;
};

}  // namespace taskstream
