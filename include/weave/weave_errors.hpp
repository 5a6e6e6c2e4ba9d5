#pragma once

#include <stdexcept>

namespace Weave {

/**
 * @brief Thrown by every Tracer accessor and mutator that needs an active
 * span when none is bound on the calling branch.
 *
 * Reaching trace data outside of a span is a programming error. Guard with
 * Tracer::is_inside_of_trace_span() or make the call inside Tracer::span().
 */
class NotInSpanError : public std::logic_error {
public:
  NotInSpanError() : std::logic_error("not inside of a trace span") {}
};

} // namespace Weave
