#include "weave/weave_core.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace Weave {

// --- Configuration ---
TracerOptions TracerOptions::from_env() {
  TracerOptions options;
  if (const char *env_val = std::getenv("WEAVE_LOG_SPANS")) {
    std::string value(env_val);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    options.log_spans =
        value == "1" || value == "true" || value == "on" || value == "yes";
  }
  return options;
}

// --- ContextBinding Implementation ---
ContextBinding::ContextBinding(uint64_t slot,
                               std::shared_ptr<BoundContext> bound)
    : _slot(slot), _previous(context::get_current(slot)), _active(true) {
  context::set_current(_slot, std::move(bound));
}

ContextBinding::ContextBinding(ContextBinding &&other) noexcept
    : _slot(other._slot), _previous(std::move(other._previous)),
      _active(other._active) {
  other._active = false;
}

ContextBinding &ContextBinding::operator=(ContextBinding &&other) noexcept {
  if (this != &other) {
    release();
    _slot = other._slot;
    _previous = std::move(other._previous);
    _active = other._active;
    other._active = false;
  }
  return *this;
}

ContextBinding::~ContextBinding() { release(); }

void ContextBinding::release() {
  if (!_active)
    return;
  _active = false;
  context::set_current(_slot, std::move(_previous));
}

// --- Span Implementation ---
// id and name never change once bound, so they are copied out here.
Span::Span(Tracer *tracer, std::shared_ptr<BoundContext> bound)
    : _tracer(tracer), _id(bound->context.id), _name(bound->context.name),
      _binding(tracer->_slot, std::move(bound)) {}

Span::Span(Span &&other) noexcept
    : _tracer(other._tracer), _id(std::move(other._id)),
      _name(std::move(other._name)), _binding(std::move(other._binding)),
      _is_ended(other._is_ended) {
  other._tracer = nullptr;
  other._id.clear();
  other._name.clear();
  other._is_ended = true;
}

Span &Span::operator=(Span &&other) noexcept {
  if (this != &other) {
    if (!_is_ended && _tracer) {
      end();
    }
    _tracer = other._tracer;
    _id = std::move(other._id);
    _name = std::move(other._name);
    _binding = std::move(other._binding);
    _is_ended = other._is_ended;
    other._tracer = nullptr;
    other._id.clear();
    other._name.clear();
    other._is_ended = true;
  }
  return *this;
}

Span::~Span() {
  if (!_is_ended && _tracer) {
    end();
  }
}

void Span::end() {
  if (_is_ended || !_tracer)
    return;
  _is_ended = true;
  _binding.release();
  _tracer->log_span_end(_name, _id);
}

// --- Tracer Implementation ---
Tracer::Tracer(TracerOptions options)
    : _options(options), _slot(context::allocate_slot()) {}

Span Tracer::start_span(std::string_view name,
                        std::optional<SeedContext> seed) {
  const std::shared_ptr<BoundContext> &parent = context::get_current(_slot);

  TraceContextFields fields;
  fields.name = std::string(name);
  if (seed) {
    fields.parent_id = std::move(seed->parent_id);
    fields.trace_id = std::move(seed->trace_id);
    fields.version = seed->version;
    fields.trace_flags = seed->trace_flags;
    fields.trace_state = std::move(seed->trace_state);
    fields.data = std::move(seed->data);
  } else if (parent) {
    std::lock_guard<std::mutex> lock(parent->mutex);
    const TraceContext &enclosing = parent->context;
    // The child's parent id is the enclosing trace id, not the enclosing
    // span id. Downstream propagation uses get_trace_child() instead.
    fields.parent_id = enclosing.trace_id;
    fields.trace_id = enclosing.trace_id;
    fields.version = enclosing.version;
    fields.trace_flags = enclosing.trace_flags;
    fields.trace_state = enclosing.trace_state;
  } else {
    fields.parent_id = std::string(kInvalidSpanId);
    fields.trace_id = ids::generate_trace_id();
    fields.version = 0;
    fields.trace_flags = 0;
  }

  auto bound = std::make_shared<BoundContext>(
      ids::build_trace_context(std::move(fields)));
  log_span_start(bound->context);
  return Span(this, std::move(bound));
}

bool Tracer::is_inside_of_trace_span() const {
  const std::shared_ptr<BoundContext> &current = context::get_current(_slot);
  if (!current)
    return false;
  std::lock_guard<std::mutex> lock(current->mutex);
  return !current->context.parent_id.empty() &&
         !current->context.trace_id.empty();
}

BoundContext &Tracer::current_or_throw() const {
  const std::shared_ptr<BoundContext> &current = context::get_current(_slot);
  if (!current) {
    throw NotInSpanError();
  }
  return *current;
}

std::string Tracer::get_span_id() const {
  BoundContext &current = current_or_throw();
  std::lock_guard<std::mutex> lock(current.mutex);
  return current.context.id;
}

Trace Tracer::get_trace() const {
  BoundContext &current = current_or_throw();
  std::lock_guard<std::mutex> lock(current.mutex);
  const TraceContext &ctx = current.context;
  return Trace{ctx.trace_id, ctx.version, ctx.parent_id, ctx.trace_flags};
}

std::string Tracer::get_trace_string() const {
  return ids::build_trace_string(get_trace());
}

Trace Tracer::get_trace_child() const {
  BoundContext &current = current_or_throw();
  std::lock_guard<std::mutex> lock(current.mutex);
  const TraceContext &ctx = current.context;
  return Trace{ctx.trace_id, ctx.version, ctx.id, ctx.trace_flags};
}

std::string Tracer::get_trace_child_string() const {
  return ids::build_trace_string(get_trace_child());
}

std::optional<TraceState> Tracer::get_trace_state() const {
  BoundContext &current = current_or_throw();
  std::lock_guard<std::mutex> lock(current.mutex);
  return current.context.trace_state;
}

std::optional<std::string> Tracer::get_trace_state_string() const {
  std::optional<TraceState> state = get_trace_state();
  if (!state)
    return std::nullopt;
  return ids::build_trace_state_string(*state);
}

void Tracer::set_trace_state_property(const std::string &key,
                                      std::string value) {
  BoundContext &current = current_or_throw();
  std::lock_guard<std::mutex> lock(current.mutex);
  std::optional<TraceState> &state = current.context.trace_state;
  if (!state) {
    state.emplace();
  }
  state->insert_or_assign(key, std::move(value));
}

void Tracer::delete_trace_state_property(const std::string &key) {
  BoundContext &current = current_or_throw();
  std::lock_guard<std::mutex> lock(current.mutex);
  if (current.context.trace_state) {
    current.context.trace_state->erase(key);
  }
}

std::any Tracer::get_context_data() const {
  BoundContext &current = current_or_throw();
  std::lock_guard<std::mutex> lock(current.mutex);
  return current.context.data;
}

void Tracer::set_context_data(std::any data) {
  BoundContext &current = current_or_throw();
  std::lock_guard<std::mutex> lock(current.mutex);
  current.context.data = std::move(data);
}

ContextHandle Tracer::capture() const {
  return ContextHandle(context::get_current(_slot));
}

ContextBinding Tracer::bind(const ContextHandle &handle) {
  return ContextBinding(_slot, handle._context);
}

std::ostream &Tracer::log_stream() {
  return _options.log_stream ? *_options.log_stream : std::clog;
}

void Tracer::log_span_start(const TraceContext &context) {
  if (!_options.log_spans)
    return;
  log_stream() << "[Weave] SPAN_START '" << context.name
               << "' trace=" << context.trace_id << " id=" << context.id
               << " parent=" << context.parent_id << "\n";
}

void Tracer::log_span_end(const std::string &name, const std::string &id) {
  if (!_options.log_spans)
    return;
  log_stream() << "[Weave] SPAN_END '" << name << "' id=" << id << "\n";
}

// --- Per-Thread Context Slots ---
namespace context {
namespace {
thread_local std::unordered_map<uint64_t, std::shared_ptr<BoundContext>>
    g_current_contexts;
std::atomic<uint64_t> g_next_slot{1};
} // namespace

const std::shared_ptr<BoundContext> &get_current(uint64_t slot) {
  static const std::shared_ptr<BoundContext> kNoContext;
  auto it = g_current_contexts.find(slot);
  return it != g_current_contexts.end() ? it->second : kNoContext;
}

void set_current(uint64_t slot, std::shared_ptr<BoundContext> bound) {
  if (bound) {
    g_current_contexts.insert_or_assign(slot, std::move(bound));
  } else {
    g_current_contexts.erase(slot);
  }
}

uint64_t allocate_slot() {
  return g_next_slot.fetch_add(1, std::memory_order_relaxed);
}
} // namespace context

} // namespace Weave
