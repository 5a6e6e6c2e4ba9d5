#include <benchmark/benchmark.h>
#include <string>
#include <weave/weave.hpp>

/**
 * @brief BM_Span_Root
 *
 * @Measures: The cost of entering and leaving a root span: a new trace id, a
 * new span id, one allocation for the record and the slot bind/unbind.
 *
 * @What_To_Look_For:
 *   - **`items_per_second`**: Higher is better. Dominated by the random source
 * (two RAND_bytes calls per span).
 */
static void BM_Span_Root(benchmark::State &state) {
  Weave::Tracer tracer;
  for (auto _ : state) {
    int result = tracer.span("root", [] { return 1; });
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Span_Root);

/**
 * @brief BM_Span_Nested
 *
 * @Measures: Entering a span inside an already bound one. Only the span id is
 * generated; the trace id and trace state are copied from the parent.
 * state.range(0) is the number of trace state entries carried along.
 */
static void BM_Span_Nested(benchmark::State &state) {
  Weave::Tracer tracer;
  tracer.span("outer", [&] {
    for (int64_t i = 0; i < state.range(0); ++i) {
      tracer.set_trace_state_property("key" + std::to_string(i), "value");
    }
    for (auto _ : state) {
      int result = tracer.span("inner", [] { return 1; });
      benchmark::DoNotOptimize(result);
    }
  });
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Span_Nested)->Arg(0)->Arg(4)->Arg(16);

// Reads of the bound context from inside a span.
static void BM_Accessor_GetTraceChildString(benchmark::State &state) {
  Weave::Tracer tracer;
  tracer.span("outer", [&] {
    for (auto _ : state) {
      std::string header = tracer.get_trace_child_string();
      benchmark::DoNotOptimize(header);
    }
  });
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Accessor_GetTraceChildString);

static void BM_Accessor_IsInsideOfTraceSpan(benchmark::State &state) {
  Weave::Tracer tracer;
  tracer.span("outer", [&] {
    for (auto _ : state) {
      bool inside = tracer.is_inside_of_trace_span();
      benchmark::DoNotOptimize(inside);
    }
  });
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Accessor_IsInsideOfTraceSpan);

BENCHMARK_MAIN();
