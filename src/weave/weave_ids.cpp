#include "weave/weave_ids.hpp"

#include <array>
#include <charconv>
#include <stdexcept>
#include <utility>
#include <vector>

#include <openssl/rand.h>

namespace Weave::ids {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

bool is_hex_digit(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
         (c >= 'A' && c <= 'F');
}

bool is_hex(std::string_view s) {
  if (s.empty())
    return false;
  for (char c : s) {
    if (!is_hex_digit(c))
      return false;
  }
  return true;
}

std::string to_lower_hex(std::string_view s) {
  std::string out(s);
  for (char &c : out) {
    if (c >= 'A' && c <= 'F')
      c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

std::string to_hex(uint32_t value) {
  std::array<char, 8> buf{};
  auto res = std::to_chars(buf.data(), buf.data() + buf.size(), value, 16);
  return std::string(buf.data(), res.ptr);
}

std::optional<uint32_t> parse_small_hex(std::string_view s) {
  if (s.size() > 2 || !is_hex(s))
    return std::nullopt;
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, 16);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    return std::nullopt;
  return value;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    s.remove_suffix(1);
  return s;
}

/**
 * @brief Generates `length` cryptographically random bytes and renders them
 * as a lowercase hex string of 2 * length characters.
 */
std::string generate_random_bytes_hex_string(size_t length) {
  std::vector<unsigned char> bytes(length);
  if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }

  std::string result;
  result.reserve(length * 2);
  for (unsigned char b : bytes) {
    result += kHexDigits[b >> 4];
    result += kHexDigits[b & 0x0f];
  }
  return result;
}

} // anonymous namespace

std::string generate_trace_id() {
  return generate_random_bytes_hex_string(kTraceIdBytes);
}

std::string generate_span_id() {
  return generate_random_bytes_hex_string(kSpanIdBytes);
}

std::string build_trace_string(const Trace &trace) {
  std::string result = to_hex(trace.version);
  result += '-';
  result += trace.trace_id;
  result += '-';
  result += trace.parent_id;
  result += '-';
  result += to_hex(trace.trace_flags);
  return result;
}

std::optional<Trace> parse_trace_string(std::string_view text) {
  // Format: "V[V]-TTTTTTTTTTTTTTTTTTTTTTTTTTTTTTTT-PPPPPPPPPPPPPPPP-F[F]"
  std::array<std::string_view, 4> fields;
  size_t count = 0;
  size_t start = 0;
  while (true) {
    size_t dash = text.find('-', start);
    if (count == fields.size())
      return std::nullopt; // More than four fields
    fields[count++] = text.substr(start, dash == std::string_view::npos
                                             ? std::string_view::npos
                                             : dash - start);
    if (dash == std::string_view::npos)
      break;
    start = dash + 1;
  }
  if (count != fields.size())
    return std::nullopt;

  auto version = parse_small_hex(fields[0]);
  auto flags = parse_small_hex(fields[3]);
  if (!version || !flags)
    return std::nullopt;
  if (*version == 0xff)
    return std::nullopt; // Version ff is reserved as invalid

  if (fields[1].size() != kTraceIdBytes * 2 || !is_hex(fields[1]))
    return std::nullopt;
  if (fields[2].size() != kSpanIdBytes * 2 || !is_hex(fields[2]))
    return std::nullopt;

  Trace trace;
  trace.version = *version;
  trace.trace_id = to_lower_hex(fields[1]);
  trace.parent_id = to_lower_hex(fields[2]);
  trace.trace_flags = *flags;
  return trace;
}

TraceContext build_trace_context(TraceContextFields fields) {
  TraceContext context;
  context.name = std::move(fields.name);
  context.id = generate_span_id();
  context.parent_id = fields.parent_id ? std::move(*fields.parent_id)
                                       : std::string(kInvalidSpanId);
  context.trace_id = std::move(fields.trace_id);
  context.version = fields.version;
  context.trace_flags = fields.trace_flags;
  context.trace_state = std::move(fields.trace_state);
  context.data = std::move(fields.data);
  return context;
}

std::optional<std::string> build_trace_state_string(const TraceState &state) {
  if (state.empty())
    return std::nullopt;

  std::string result;
  for (const auto &[key, value] : state) {
    if (!result.empty())
      result += ',';
    result += key;
    result += '=';
    result += value;
  }
  return result;
}

TraceState parse_trace_state_string(std::string_view text) {
  TraceState state;
  while (!text.empty()) {
    size_t comma = text.find(',');
    std::string_view member = text.substr(0, comma);
    text = comma == std::string_view::npos ? std::string_view{}
                                           : text.substr(comma + 1);

    size_t eq = member.find('=');
    if (eq == std::string_view::npos)
      continue;
    std::string_view key = trim(member.substr(0, eq));
    std::string_view value = trim(member.substr(eq + 1));
    if (key.empty())
      continue;
    state.insert_or_assign(std::string(key), std::string(value));
  }
  return state;
}

} // namespace Weave::ids
