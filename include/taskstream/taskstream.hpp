#pragma once

// Core types
#include "core/config.hpp"
#include "core/content.hpp"
#include "core/errors.hpp"
#include "core/json_sink.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Event bus
#include "bus/bus.hpp"

// Execution context and boundary interceptors
#include "context/context_store.hpp"
#include "interceptor/interceptor.hpp"

// Streaming
#include "streaming/accumulator.hpp"
#include "streaming/channel.hpp"
#include "streaming/stream_event.hpp"
#include "streaming/stream_reader.hpp"
#include "streaming/streaming_session.hpp"

// Agent capability
#include "llm/provider.hpp"
#include "llm/scripted_provider.hpp"

// Durable invocation
#include "agent/durable_caller.hpp"
#include "tracing/tracer.hpp"

// Local engine
#include "engine/activity.hpp"
#include "engine/local_engine.hpp"
#include "engine/replay_log.hpp"
#include "engine/workflow_context.hpp"

namespace taskstream {

// Initialize logging and the provider registry
void init(const Config &config);

// Flush logs
void shutdown();

// Get version string
std::string version();

}  // namespace taskstream
