#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <weave/weave_common_types.hpp>
#include <weave/weave_context.hpp>
#include <weave/weave_errors.hpp>
#include <weave/weave_ids.hpp>

namespace Weave {

// --- Branch Hand-off Types ---

/**
 * @brief A shared reference to a bound TraceContext, captured on one branch
 * so the same context can be bound again on another thread or task. All
 * holders see the same record; access to it is serialized.
 *
 * A default-constructed handle refers to no context.
 */
class ContextHandle {
public:
  ContextHandle() = default;

  bool valid() const { return static_cast<bool>(_context); }
  explicit operator bool() const { return valid(); }

private:
  friend class Tracer;
  explicit ContextHandle(std::shared_ptr<BoundContext> bound)
      : _context(std::move(bound)) {}
  std::shared_ptr<BoundContext> _context;
};

/**
 * @brief RAII binding of a context to a tracer's slot on the current thread.
 *
 * Construction binds, destruction (or release()) restores whatever was bound
 * before. Bindings must be released on the thread that created them,
 * innermost first. Discarding the returned object unbinds immediately.
 */
class ContextBinding {
public:
  ContextBinding() = default;
  ContextBinding(ContextBinding &&other) noexcept;
  ContextBinding &operator=(ContextBinding &&other) noexcept;
  ContextBinding(const ContextBinding &) = delete;
  ContextBinding &operator=(const ContextBinding &) = delete;
  ~ContextBinding();

  void release();

private:
  friend class Tracer;
  friend class Span;
  ContextBinding(uint64_t slot, std::shared_ptr<BoundContext> bound);
  uint64_t _slot = 0;
  std::shared_ptr<BoundContext> _previous;
  bool _active = false;
};

// --- Span Object ---

/**
 * @brief A move-only span scope. While alive, its context is the current one
 * for the owning tracer on this thread. Ending it restores the enclosing
 * span's context (or none).
 *
 * id() and name() are empty on a default-constructed or moved-from Span.
 */
class Span {
public:
  Span() = default;
  Span(Span &&other) noexcept;
  Span &operator=(Span &&other) noexcept;
  Span(const Span &) = delete;
  Span &operator=(const Span &) = delete;
  ~Span();

  void end();
  const std::string &id() const { return _id; }
  const std::string &name() const { return _name; }

private:
  friend class Tracer;
  Span(Tracer *tracer, std::shared_ptr<BoundContext> bound);
  Tracer *_tracer = nullptr;
  std::string _id;
  std::string _name;
  ContextBinding _binding;
  bool _is_ended = false;
};

// --- Tracer ---

/**
 * @brief The scope engine. Owns the per-branch "current trace context" slot,
 * derives nested contexts and exposes the accessors that run inside a span.
 *
 * Construct one per process (or per test) and pass it by reference. Two
 * tracers never see each other's spans.
 */
class Tracer {
public:
  explicit Tracer(TracerOptions options = {});

  Tracer(const Tracer &) = delete;
  Tracer &operator=(const Tracer &) = delete;

  /**
   * @brief Runs `work` inside a new span and returns its result.
   *
   * The new context is derived in this order:
   * 1. From `seed` when given (resuming a trace received from elsewhere).
   * 2. From the enclosing span: same trace id, version, flags and a copy of
   *    the trace state; the parent id is the enclosing span's trace id.
   *    Context data is not inherited.
   * 3. Otherwise a new trace with the invalid parent id, version 0, flags 0.
   *
   * The previous binding is restored when `work` returns or throws.
   */
  template <typename Work>
  std::invoke_result_t<Work> span(std::string_view name, Work &&work,
                                  std::optional<SeedContext> seed = std::nullopt) {
    Span scope = start_span(name, std::move(seed));
    return std::invoke(std::forward<Work>(work));
  }

  Span start_span(std::string_view name,
                  std::optional<SeedContext> seed = std::nullopt);

  // Never throws. True when a span is bound and its trace identity is
  // complete.
  bool is_inside_of_trace_span() const;

  // All of the following throw NotInSpanError outside of a span.

  std::string get_span_id() const;
  Trace get_trace() const;
  std::string get_trace_string() const;

  /**
   * @brief The trace to propagate downstream: same as get_trace() but with
   * this span's id as the parent id.
   */
  Trace get_trace_child() const;
  std::string get_trace_child_string() const;

  std::optional<TraceState> get_trace_state() const;
  std::optional<std::string> get_trace_state_string() const;
  void set_trace_state_property(const std::string &key, std::string value);
  void delete_trace_state_property(const std::string &key);

  // Empty std::any when no data was attached.
  std::any get_context_data() const;
  void set_context_data(std::any data);

  /**
   * @brief Typed read of the context data.
   * @return std::nullopt when no data is attached.
   * @throw std::bad_any_cast If the attached data is not a T.
   */
  template <typename T> std::optional<T> get_context_data_as() const {
    std::any data = get_context_data();
    if (!data.has_value())
      return std::nullopt;
    return std::any_cast<T>(data);
  }

  // --- Branch hand-off ---

  // Empty handle outside of a span. Never throws.
  ContextHandle capture() const;
  ContextBinding bind(const ContextHandle &handle);

  /**
   * @brief Wraps `fn` so that, wherever it is invoked, it runs with the
   * context that is current at wrap time. Use it to hand work to another
   * thread or queue.
   */
  template <typename Fn> auto wrap(Fn &&fn) {
    return [this, handle = capture(),
            fn = std::forward<Fn>(fn)](auto &&...args) mutable -> decltype(auto) {
      ContextBinding binding = bind(handle);
      return fn(std::forward<decltype(args)>(args)...);
    };
  }

  const TracerOptions &options() const { return _options; }

private:
  friend class Span;
  BoundContext &current_or_throw() const;
  void log_span_start(const TraceContext &context);
  void log_span_end(const std::string &name, const std::string &id);
  std::ostream &log_stream();

  TracerOptions _options;
  uint64_t _slot;
};

} // namespace Weave
