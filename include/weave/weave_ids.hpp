#pragma once

#include "weave_common_types.hpp" // For Trace, TraceContext, TraceState, kInvalidSpanId
#include <optional>
#include <string>
#include <string_view>

namespace Weave::ids {

/**
 * @brief Generates a random trace id: 16 cryptographically random bytes as
 * 32 lowercase hex characters.
 * @throw std::runtime_error If the random source fails.
 */
std::string generate_trace_id();

/**
 * @brief Generates a random span id: 8 random bytes as 16 lowercase hex
 * characters.
 * @throw std::runtime_error If the random source fails.
 */
std::string generate_span_id();

/**
 * @brief Renders "version-traceId-parentId-traceFlags" with version and flags
 * in natural (unpadded) hexadecimal, following the traceparent layout.
 */
std::string build_trace_string(const Trace &trace);

/**
 * @brief Parses a traceparent-style string back into a Trace.
 *
 * Version and flags are 1-2 hex digits, the trace id 32 hex digits and the
 * parent id 16 hex digits. Hex digits are lowercased.
 * @return std::nullopt on malformed input.
 */
std::optional<Trace> parse_trace_string(std::string_view text);

/**
 * @brief Builds a new TraceContext with a freshly generated span id. A missing
 * parent id becomes kInvalidSpanId; everything else is copied through.
 */
TraceContext build_trace_context(TraceContextFields fields);

// Comma-joined key=value pairs; std::nullopt when there are no entries.
std::optional<std::string> build_trace_state_string(const TraceState &state);

TraceState parse_trace_state_string(std::string_view text);

} // namespace Weave::ids
