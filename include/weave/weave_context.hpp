#pragma once

#include "weave_common_types.hpp" // For TraceContext
#include <cstdint>
#include <memory>
#include <mutex>

namespace Weave {

/**
 * @brief A TraceContext while it is bound. Work handed to other threads with
 * Tracer::wrap() or Tracer::bind() shares this record, so every read and
 * write of `context` goes through `mutex`.
 */
struct BoundContext {
  explicit BoundContext(TraceContext ctx) : context(std::move(ctx)) {}

  mutable std::mutex mutex;
  TraceContext context;
};

namespace context {

// Per-thread slots holding the bound context, one per tracer instance.
// An empty pointer means no span is active for that tracer on this thread.

const std::shared_ptr<BoundContext> &get_current(uint64_t slot);
void set_current(uint64_t slot, std::shared_ptr<BoundContext> bound);

// Hands out a process-unique slot key for a new tracer.
uint64_t allocate_slot();

} // namespace context
} // namespace Weave
