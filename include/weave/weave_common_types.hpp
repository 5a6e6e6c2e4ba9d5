#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace Weave {

// Forward declarations
class Tracer;
class Span;

// --- Identifier Constants ---

constexpr size_t kTraceIdBytes = 16;
constexpr size_t kSpanIdBytes = 8;

/**
 * @brief The reserved all-zero span id meaning "no real parent span".
 * Same length as a generated span id (16 hex characters).
 */
inline constexpr std::string_view kInvalidSpanId = "0000000000000000";

// --- Core Data Structures ---

/**
 * @brief Flat key-value trace state. Keys are unique; iteration order is the
 * map's key order.
 */
using TraceState = std::map<std::string, std::string>;

/**
 * @brief The external-facing subset of a trace context. This is what gets
 * rendered into a traceparent-style string and handed to downstream calls.
 */
struct Trace {
  std::string trace_id;
  uint32_t version = 0;
  std::string parent_id;
  uint32_t trace_flags = 0;

  bool operator==(const Trace &) const = default;
};

/**
 * @brief The full record bound while a span is active.
 *
 * `data` is opaque to the tracer. An empty `std::any` means no data.
 */
struct TraceContext {
  std::string name;
  std::string id;
  std::string parent_id;
  std::string trace_id;
  uint32_t version = 0;
  uint32_t trace_flags = 0;
  std::optional<TraceState> trace_state;
  std::any data;
};

/**
 * @brief Fields a caller supplies to resume an existing trace, typically one
 * received from an inbound header. The span id is never part of a seed.
 */
struct SeedContext {
  std::optional<std::string> parent_id;
  std::string trace_id;
  uint32_t version = 0;
  uint32_t trace_flags = 0;
  std::optional<TraceState> trace_state;
  std::any data;
};

/**
 * @brief Input of ids::build_trace_context: a seed plus the span name.
 */
struct TraceContextFields {
  std::string name;
  std::optional<std::string> parent_id;
  std::string trace_id;
  uint32_t version = 0;
  uint32_t trace_flags = 0;
  std::optional<TraceState> trace_state;
  std::any data;
};

// --- Configuration ---

struct TracerOptions {
  // Writes one line per span start/end to log_stream.
  bool log_spans = false;
  std::ostream *log_stream = nullptr; // nullptr means std::clog

  /**
   * @brief Builds options from the environment. WEAVE_LOG_SPANS set to 1,
   * true, on or yes (any case) enables span logging.
   */
  static TracerOptions from_env();
};

} // namespace Weave
