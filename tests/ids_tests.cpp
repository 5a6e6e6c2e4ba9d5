#include <catch2/catch.hpp>

#include <algorithm>
#include <set>
#include <string>

#include "weave/weave_ids.hpp"

namespace {
bool is_lower_hex(const std::string &s) {
  return std::all_of(s.begin(), s.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
}
} // namespace

TEST_CASE("Weave::ids id generation", "[weave][ids]") {
  using Weave::ids::generate_span_id;
  using Weave::ids::generate_trace_id;

  SECTION("Trace ids are 32 lowercase hex characters") {
    for (int i = 0; i < 100; ++i) {
      std::string id = generate_trace_id();
      REQUIRE(id.size() == 32);
      REQUIRE(is_lower_hex(id));
    }
  }

  SECTION("Span ids are 16 lowercase hex characters") {
    for (int i = 0; i < 100; ++i) {
      std::string id = generate_span_id();
      REQUIRE(id.size() == 16);
      REQUIRE(is_lower_hex(id));
    }
  }

  SECTION("Generated ids do not repeat") {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
      REQUIRE(seen.insert(generate_span_id()).second);
    }
  }
}

TEST_CASE("Weave::ids::build_trace_string", "[weave][ids][format]") {
  using Weave::Trace;
  using Weave::ids::build_trace_string;

  SECTION("Joins the four fields with dashes") {
    REQUIRE(build_trace_string(Trace{"T", 0, "P", 1}) == "0-T-P-1");
  }

  SECTION("Renders version and flags in unpadded hex") {
    REQUIRE(build_trace_string(Trace{"abc", 255, "def", 10}) == "ff-abc-def-a");
    REQUIRE(build_trace_string(Trace{"abc", 16, "def", 1}) == "10-abc-def-1");
  }
}

TEST_CASE("Weave::ids::parse_trace_string", "[weave][ids][format]") {
  using Weave::ids::parse_trace_string;

  const std::string trace_id = "4bf92f3577b34da6a3ce929d0e0e4736";
  const std::string parent_id = "00f067aa0ba902b7";

  SECTION("Parses a padded traceparent header") {
    auto trace = parse_trace_string("00-" + trace_id + "-" + parent_id + "-01");
    REQUIRE(trace.has_value());
    REQUIRE(trace->version == 0);
    REQUIRE(trace->trace_id == trace_id);
    REQUIRE(trace->parent_id == parent_id);
    REQUIRE(trace->trace_flags == 1);
  }

  SECTION("Parses the unpadded form produced by build_trace_string") {
    Weave::Trace expected{trace_id, 0, parent_id, 1};
    auto trace = parse_trace_string(Weave::ids::build_trace_string(expected));
    REQUIRE(trace.has_value());
    REQUIRE(*trace == expected);
  }

  SECTION("Lowercases hex digits") {
    auto trace = parse_trace_string("0-4BF92F3577B34DA6A3CE929D0E0E4736-" +
                                    parent_id + "-1");
    REQUIRE(trace.has_value());
    REQUIRE(trace->trace_id == trace_id);
  }

  SECTION("Rejects malformed input") {
    REQUIRE_FALSE(parse_trace_string("").has_value());
    REQUIRE_FALSE(parse_trace_string("00-" + trace_id + "-" + parent_id).has_value());
    REQUIRE_FALSE(
        parse_trace_string("00-" + trace_id + "-" + parent_id + "-01-ff").has_value());
    REQUIRE_FALSE(parse_trace_string("00-abc-" + parent_id + "-01").has_value());
    REQUIRE_FALSE(parse_trace_string("00-" + trace_id + "-xyz0000000000000-01").has_value());
    REQUIRE_FALSE(parse_trace_string("100-" + trace_id + "-" + parent_id + "-01").has_value());
    REQUIRE_FALSE(parse_trace_string("00-" + trace_id + "-" + parent_id + "-").has_value());
  }

  SECTION("Rejects the reserved version ff") {
    REQUIRE_FALSE(parse_trace_string("ff-" + trace_id + "-" + parent_id + "-01").has_value());
    REQUIRE_FALSE(parse_trace_string("FF-" + trace_id + "-" + parent_id + "-01").has_value());
    REQUIRE(parse_trace_string("fe-" + trace_id + "-" + parent_id + "-01").has_value());
  }
}

TEST_CASE("Weave::ids::build_trace_context", "[weave][ids][context]") {
  using Weave::TraceContextFields;
  using Weave::ids::build_trace_context;

  TraceContextFields fields;
  fields.name = "aName";
  fields.trace_id = "aTraceId";
  fields.version = 0;
  fields.trace_flags = 0;
  fields.trace_state = Weave::TraceState{{"aTraceState", "aTraceStateValue"}};
  fields.data = std::string("payload");

  SECTION("No parent id yields the invalid span id and a fresh id") {
    auto context = build_trace_context(fields);
    REQUIRE(context.parent_id == Weave::kInvalidSpanId);
    REQUIRE(context.id.size() == 16);
    REQUIRE(context.name == "aName");
    REQUIRE(context.trace_id == "aTraceId");
    REQUIRE(context.trace_state == fields.trace_state);
    REQUIRE(std::any_cast<std::string>(context.data) == "payload");
  }

  SECTION("A supplied parent id passes through unchanged") {
    fields.parent_id = "aParentId";
    auto context = build_trace_context(fields);
    REQUIRE(context.parent_id == "aParentId");
    REQUIRE_FALSE(context.id.empty());
  }

  SECTION("Absent trace state and data stay absent") {
    fields.trace_state.reset();
    fields.data.reset();
    auto context = build_trace_context(fields);
    REQUIRE_FALSE(context.trace_state.has_value());
    REQUIRE_FALSE(context.data.has_value());
  }

  SECTION("Every call assigns a new span id") {
    REQUIRE(build_trace_context(fields).id != build_trace_context(fields).id);
  }
}

TEST_CASE("Weave::ids trace state strings", "[weave][ids][state]") {
  using Weave::TraceState;
  using Weave::ids::build_trace_state_string;
  using Weave::ids::parse_trace_state_string;

  SECTION("Empty state renders as nothing") {
    REQUIRE_FALSE(build_trace_state_string(TraceState{}).has_value());
  }

  SECTION("Pairs are joined with commas") {
    TraceState state{{"a", "1"}, {"b", "2"}};
    REQUIRE(build_trace_state_string(state) == std::optional<std::string>("a=1,b=2"));
  }

  SECTION("Parsing splits members and trims whitespace") {
    TraceState state = parse_trace_state_string(" a=1 ,b=2,c=x=y");
    REQUIRE(state == TraceState{{"a", "1"}, {"b", "2"}, {"c", "x=y"}});
  }

  SECTION("Parsing skips members without a key") {
    TraceState state = parse_trace_state_string("novalue,=orphan,,k=v");
    REQUIRE(state == TraceState{{"k", "v"}});
  }

  SECTION("Later duplicates win") {
    REQUIRE(parse_trace_state_string("k=1,k=2") == TraceState{{"k", "2"}});
  }
}
