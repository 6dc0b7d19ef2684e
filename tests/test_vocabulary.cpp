/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp types
 */

#include "meshlink/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected carries a value or an error", "[vocabulary][expected]") {
  auto ok = meshlink::expected<uint32_t, meshlink::LinkError>::success(7U);
  REQUIRE(ok.has_value());
  REQUIRE(static_cast<bool>(ok));
  REQUIRE(ok.value() == 7U);

  auto err = meshlink::expected<uint32_t, meshlink::LinkError>::error(
      meshlink::LinkError::kPayloadTooLarge);
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == meshlink::LinkError::kPayloadTooLarge);
  REQUIRE(err.value_or(3U) == 3U);
  REQUIRE(ok.value_or(3U) == 7U);
}

TEST_CASE("expected void", "[vocabulary][expected]") {
  auto ok = meshlink::expected<void, meshlink::ConfigError>::success();
  REQUIRE(ok.has_value());
  auto err = meshlink::expected<void, meshlink::ConfigError>::error(
      meshlink::ConfigError::kParseError);
  REQUIRE(!err);
  REQUIRE(err.get_error() == meshlink::ConfigError::kParseError);
}

TEST_CASE("expected copy keeps the payload", "[vocabulary][expected]") {
  using R = meshlink::expected<std::string, meshlink::LinkError>;
  R a = R::success(std::string("ttyACM0"));
  R b = a;
  REQUIRE(b.value() == "ttyACM0");
  R c = R::error(meshlink::LinkError::kChannelClosed);
  b = c;
  REQUIRE(!b.has_value());
  REQUIRE(b.get_error() == meshlink::LinkError::kChannelClosed);
}

TEST_CASE("link error names", "[vocabulary]") {
  REQUIRE(std::string(meshlink::LinkErrorName(
              meshlink::LinkError::kChannelIoFailure)) == "ChannelIOFailure");
  REQUIRE(std::string(meshlink::LinkErrorName(
              meshlink::LinkError::kSendRejected)) == "SendRejected");
}

// ============================================================================
// optional<T>
// ============================================================================

TEST_CASE("optional empty and engaged", "[vocabulary][optional]") {
  meshlink::optional<int> none;
  REQUIRE(!none.has_value());
  REQUIRE(none.value_or(-1) == -1);

  meshlink::optional<int> some(5);
  REQUIRE(some.has_value());
  REQUIRE(some.value() == 5);
  some.reset();
  REQUIRE(!some.has_value());
}

// ============================================================================
// FixedFunction
// ============================================================================

namespace {
int Twice(int x) { return x * 2; }
}  // namespace

TEST_CASE("FixedFunction stores lambdas and pointers",
          "[vocabulary][fixed_function]") {
  int hits = 0;
  meshlink::FixedFunction<void()> inc([&hits]() { ++hits; });
  REQUIRE(static_cast<bool>(inc));
  inc();
  inc();
  REQUIRE(hits == 2);

  meshlink::FixedFunction<int(int)> fn(&Twice);
  REQUIRE(fn(21) == 42);

  meshlink::FixedFunction<void()> empty;
  REQUIRE(!empty);
}

TEST_CASE("FixedFunction move transfers the target",
          "[vocabulary][fixed_function]") {
  int hits = 0;
  meshlink::FixedFunction<void()> a([&hits]() { ++hits; });
  meshlink::FixedFunction<void()> b(std::move(a));
  REQUIRE(!a);
  b();
  REQUIRE(hits == 1);

  meshlink::FixedFunction<void()> c;
  c = std::move(b);
  REQUIRE(!b);
  c();
  REQUIRE(hits == 2);
}

// ============================================================================
// FixedString
// ============================================================================

TEST_CASE("FixedString literal and truncation", "[vocabulary][fixed_string]") {
  meshlink::FixedString<16> s("ttyUSB1");
  REQUIRE(s.size() == 7U);
  REQUIRE(s == "ttyUSB1");
  REQUIRE(s != "ttyUSB2");

  meshlink::FixedString<4> t(meshlink::TruncateToCapacity, "abcdefgh");
  REQUIRE(t.size() == 4U);
  REQUIRE(t == "abcd");

  t.assign(meshlink::TruncateToCapacity, "xy");
  REQUIRE(t == "xy");
  t.clear();
  REQUIRE(t.empty());
  REQUIRE(meshlink::FixedString<4>::capacity() == 4U);
}

TEST_CASE("FixedString compares across capacities",
          "[vocabulary][fixed_string]") {
  meshlink::FixedString<8> a("red");
  meshlink::FixedString<32> b("red");
  meshlink::FixedString<32> c("green");
  REQUIRE(a == b);
  REQUIRE(a != c);
}

// ============================================================================
// FixedVector
// ============================================================================

TEST_CASE("FixedVector reports overflow", "[vocabulary][fixed_vector]") {
  meshlink::FixedVector<int, 3> v;
  REQUIRE(v.empty());
  REQUIRE(v.push_back(1));
  REQUIRE(v.push_back(2));
  REQUIRE(v.emplace_back(3));
  REQUIRE(v.full());
  REQUIRE(!v.push_back(4));
  REQUIRE(v.size() == 3U);

  int sum = 0;
  for (int x : v) {
    sum += x;
  }
  REQUIRE(sum == 6);

  REQUIRE(v.erase_unordered(0U));
  REQUIRE(v.size() == 2U);
  REQUIRE(v[0] == 3);
  REQUIRE(!v.erase_unordered(5U));
}

TEST_CASE("FixedVector copies and moves non-trivial elements",
          "[vocabulary][fixed_vector]") {
  meshlink::FixedVector<std::string, 4> a;
  REQUIRE(a.push_back("one"));
  REQUIRE(a.push_back("two"));

  meshlink::FixedVector<std::string, 4> b = a;
  REQUIRE(b.size() == 2U);
  REQUIRE(b[1] == "two");

  meshlink::FixedVector<std::string, 4> c(std::move(a));
  REQUIRE(c.size() == 2U);
  REQUIRE(a.empty());
  c.clear();
  REQUIRE(c.empty());
}

// ============================================================================
// NewType / ScopeGuard
// ============================================================================

TEST_CASE("SessionId compares by value", "[vocabulary][newtype]") {
  meshlink::SessionId none;
  meshlink::SessionId a(1U);
  meshlink::SessionId b(2U);
  REQUIRE(none.value() == 0U);
  REQUIRE(a != b);
  REQUIRE(a < b);
  REQUIRE(a == meshlink::SessionId(1U));
}

TEST_CASE("ScopeGuard runs unless released", "[vocabulary][scope_guard]") {
  int runs = 0;
  {
    meshlink::ScopeGuard g(meshlink::FixedFunction<void()>([&runs]() {
      ++runs;
    }));
  }
  REQUIRE(runs == 1);
  {
    meshlink::ScopeGuard g(meshlink::FixedFunction<void()>([&runs]() {
      ++runs;
    }));
    g.release();
  }
  REQUIRE(runs == 1);
  {
    MESHLINK_SCOPE_EXIT(runs += 10);
  }
  REQUIRE(runs == 11);
}
