#include "weave/weave.hpp"
#include <future>
#include <iostream>
#include <string>

using namespace Weave;

// Deep inside the call tree: no tracer context is passed in, yet the current
// trace is available.
std::string build_outgoing_header(Tracer &tracer) {
  tracer.set_trace_state_property("vendor", "weave");
  return tracer.get_trace_child_string();
}

void handle_request(Tracer &tracer, const std::string &inbound_traceparent) {
  std::optional<SeedContext> seed;
  if (auto inbound = ids::parse_trace_string(inbound_traceparent)) {
    seed.emplace();
    seed->trace_id = inbound->trace_id;
    seed->parent_id = inbound->parent_id;
    seed->version = inbound->version;
    seed->trace_flags = inbound->trace_flags;
  }

  tracer.span(
      "handle_request",
      [&] {
        std::cout << "  trace:       " << tracer.get_trace_string() << "\n";

        // Hand work to another thread; the span travels with it.
        auto header = std::async(std::launch::async, tracer.wrap([&] {
                                   return tracer.span("call_backend", [&] {
                                     return build_outgoing_header(tracer);
                                   });
                                 }));
        std::cout << "  traceparent: " << header.get() << "\n";
        std::cout << "  tracestate:  "
                  << tracer.get_trace_state_string().value_or("<none>") << "\n";
      },
      seed);
}

// Run this example with:
// ./build/examples/WeaveExample
// Set WEAVE_LOG_SPANS=1 to see span start/end lines.
int main() {
  Tracer tracer(TracerOptions::from_env());

  std::cout << "--- Request without an inbound trace ---\n";
  handle_request(tracer, "");

  std::cout << "\n--- Request resuming an inbound trace ---\n";
  handle_request(tracer,
                 "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01");

  std::cout << "\nOutside of a span: "
            << (tracer.is_inside_of_trace_span() ? "inside" : "outside")
            << "\n";
  try {
    tracer.get_span_id();
  } catch (const NotInSpanError &e) {
    std::cout << "get_span_id() failed: " << e.what() << "\n";
  }
  return 0;
}
