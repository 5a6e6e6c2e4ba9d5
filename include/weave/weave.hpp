#pragma once

// This is the primary include file for using the Weave tracing library.
// It provides the Tracer, the id/format helpers and the WEAVE_SPAN macro.
#include "weave_common_types.hpp" // Provides Trace, TraceContext, SeedContext, kInvalidSpanId
#include "weave_core.hpp"         // Provides Tracer, Span, ContextHandle, ContextBinding
#include "weave_errors.hpp"       // Provides NotInSpanError
#include "weave_ids.hpp"          // Provides the ids:: helpers

namespace Weave {

// --- Helper Macros ---
// Used by WEAVE_SPAN to generate unique variable names.
#define WEAVE_CONCAT_IMPL(a, b) a##b
#define WEAVE_CONCAT(a, b) WEAVE_CONCAT_IMPL(a, b)

// --- User-Facing Macros ---

// Opens a span on `tracer` that stays bound until the end of the enclosing
// block. An optional SeedContext may follow the name.
#define WEAVE_SPAN(tracer, ...)                                                \
  auto WEAVE_CONCAT(weave_span_, __LINE__) = (tracer).start_span(__VA_ARGS__)

} // namespace Weave
