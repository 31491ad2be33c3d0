#include "streaming/accumulator.hpp"

namespace taskstream {

ContentAccumulator::ContentAccumulator(const std::optional<ContentBlock> &seed) {
  if (seed) {
    blocks_.push_back(*seed);
    delta_open_ = appendable_kind(*seed).has_value();
  }
}

void ContentAccumulator::apply(const StreamEvent &event) {
  std::visit(
      [this](auto &&e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, Delta>) {
          append_delta(e);
        } else if constexpr (std::is_same_v<T, Full>) {
          blocks_.push_back(e.content);
          delta_open_ = false;
        } else if constexpr (std::is_same_v<T, Done>) {
          delta_open_ = false;
        }
      },
      event);
  ++events_applied_;
}

void ContentAccumulator::append_delta(const Delta &delta) {
  if (delta.text.empty()) {
    return;
  }

  if (delta_open_ && !blocks_.empty() && appendable_kind(blocks_.back()) == delta.kind) {
    auto &last = blocks_.back();
    if (auto *text = std::get_if<TextContent>(&last)) {
      text->text += delta.text;
      return;
    }
    if (auto *reasoning = std::get_if<ReasoningContent>(&last)) {
      reasoning->summary += delta.text;
      return;
    }
  }

  switch (delta.kind) {
    case DeltaKind::Text:
      blocks_.push_back(TextContent{Author::Agent, delta.text});
      break;
    case DeltaKind::Reasoning:
      blocks_.push_back(ReasoningContent{Author::Agent, delta.text});
      break;
  }
  delta_open_ = true;
}

}  // namespace taskstream
