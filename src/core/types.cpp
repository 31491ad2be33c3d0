#include "core/types.hpp"

namespace taskstream {

json TokenUsage::to_json() const {
  return {{"input_tokens", input_tokens},
          {"output_tokens", output_tokens},
          {"cache_read_tokens", cache_read_tokens},
          {"cache_write_tokens", cache_write_tokens}};
}

TokenUsage TokenUsage::from_json(const json &j) {
  TokenUsage usage;
  usage.input_tokens = j.value("input_tokens", int64_t(0));
  usage.output_tokens = j.value("output_tokens", int64_t(0));
  usage.cache_read_tokens = j.value("cache_read_tokens", int64_t(0));
  usage.cache_write_tokens = j.value("cache_write_tokens", int64_t(0));
  return usage;
}

std::string to_string(FinishReason reason) {
  switch (reason) {
    case FinishReason::Stop:
      return "stop";
    case FinishReason::ToolCalls:
      return "tool_calls";
    case FinishReason::Length:
      return "length";
    case FinishReason::Error:
      return "error";
    case FinishReason::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

FinishReason finish_reason_from_string(const std::string &str) {
  if (str == "stop" || str == "end_turn") return FinishReason::Stop;
  if (str == "tool_calls" || str == "tool_use") return FinishReason::ToolCalls;
  if (str == "length" || str == "max_tokens") return FinishReason::Length;
  if (str == "error") return FinishReason::Error;
  if (str == "cancelled") return FinishReason::Cancelled;
  return FinishReason::Stop;
}

std::string to_string(Author author) {
  switch (author) {
    case Author::User:
      return "user";
    case Author::Agent:
      return "agent";
  }
  return "agent";
}

Author author_from_string(const std::string &str) {
  if (str == "user") return Author::User;
  return Author::Agent;
}

std::string to_string(DeltaKind kind) {
  switch (kind) {
    case DeltaKind::Text:
      return "text";
    case DeltaKind::Reasoning:
      return "reasoning";
  }
  return "text";
}

std::optional<DeltaKind> delta_kind_from_string(const std::string &str) {
  if (str == "text") return DeltaKind::Text;
  if (str == "reasoning") return DeltaKind::Reasoning;
  return std::nullopt;
}

std::string to_string(StreamingStatus status) {
  switch (status) {
    case StreamingStatus::InProgress:
      return "IN_PROGRESS";
    case StreamingStatus::Done:
      return "DONE";
  }
  return "IN_PROGRESS";
}

StreamingStatus streaming_status_from_string(const std::string &str) {
  if (str == "DONE") return StreamingStatus::Done;
  return StreamingStatus::InProgress;
}

std::string to_string(SessionState state) {
  switch (state) {
    case SessionState::Opening:
      return "opening";
    case SessionState::Open:
      return "open";
    case SessionState::Closing:
      return "closing";
    case SessionState::Closed:
      return "closed";
    case SessionState::Aborted:
      return "aborted";
  }
  return "unknown";
}

namespace {

// Length of the well-formed sequence starting at input[i], or 0 if it is malformed
size_t utf8_sequence_length(const std::string &input, size_t i) {
  auto byte = [&input](size_t k) {
    return static_cast<unsigned char>(input[k]);
  };
  auto continuation = [&input, &byte](size_t k) {
    return k < input.size() && (byte(k) & 0xC0) == 0x80;
  };

  unsigned char c = byte(i);
  if (c <= 0x7F) return 1;

  if ((c & 0xE0) == 0xC0) {
    if (!continuation(i + 1)) return 0;
    uint32_t cp = ((c & 0x1F) << 6) | (byte(i + 1) & 0x3F);
    return cp >= 0x80 ? 2 : 0;
  }
  if ((c & 0xF0) == 0xE0) {
    if (!continuation(i + 1) || !continuation(i + 2)) return 0;
    uint32_t cp = ((c & 0x0F) << 12) | ((byte(i + 1) & 0x3F) << 6) | (byte(i + 2) & 0x3F);
    return (cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF)) ? 3 : 0;
  }
  if ((c & 0xF8) == 0xF0) {
    if (!continuation(i + 1) || !continuation(i + 2) || !continuation(i + 3)) return 0;
    uint32_t cp = ((c & 0x07) << 18) | ((byte(i + 1) & 0x3F) << 12) | ((byte(i + 2) & 0x3F) << 6) | (byte(i + 3) & 0x3F);
    return (cp >= 0x10000 && cp <= 0x10FFFF) ? 4 : 0;
  }
  return 0;
}

}  // namespace

std::string sanitize_utf8(const std::string &input) {
  std::string output;
  output.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    size_t len = utf8_sequence_length(input, i);
    if (len == 0) {
      output.append("\xEF\xBF\xBD");
      i++;
      continue;
    }
    output.append(input, i, len);
    i += len;
  }

  return output;
}

bool is_valid_utf8(const std::string &input) {
  size_t i = 0;
  while (i < input.size()) {
    size_t len = utf8_sequence_length(input, i);
    if (len == 0) return false;
    i += len;
  }
  return true;
}

size_t utf8_incomplete_suffix(const std::string &input) {
  size_t n = input.size();
  for (size_t back = 1; back <= 3 && back <= n; ++back) {
    auto c = static_cast<unsigned char>(input[n - back]);
    if ((c & 0xC0) == 0x80) continue;

    size_t need = 1;
    if ((c & 0xE0) == 0xC0) {
      need = 2;
    } else if ((c & 0xF0) == 0xE0) {
      need = 3;
    } else if ((c & 0xF8) == 0xF0) {
      need = 4;
    }
    return need > back ? back : 0;
  }
  return 0;
}

}  // namespace taskstream
