/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "meshlink/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace {

// Restores the global threshold when a test leaves.
struct LevelRestore {
  meshlink::log::Level saved = meshlink::log::GetLevel();
  ~LevelRestore() { meshlink::log::SetLevel(saved); }
};

}  // namespace

TEST_CASE("log - set and get level", "[log]") {
  LevelRestore restore;
  meshlink::log::SetLevel(meshlink::log::Level::kError);
  REQUIRE(meshlink::log::GetLevel() == meshlink::log::Level::kError);
  meshlink::log::SetLevel(meshlink::log::Level::kOff);
  REQUIRE(meshlink::log::GetLevel() == meshlink::log::Level::kOff);
}

TEST_CASE("log - init and shutdown", "[log]") {
  meshlink::log::Init();
  REQUIRE(meshlink::log::IsInitialized());
  meshlink::log::Shutdown();
  REQUIRE(!meshlink::log::IsInitialized());
}

TEST_CASE("log - parse level names", "[log]") {
  using meshlink::log::Level;
  Level out = Level::kOff;
  REQUIRE(meshlink::log::ParseLevel("debug", out));
  REQUIRE(out == Level::kDebug);
  REQUIRE(meshlink::log::ParseLevel("INFO", out));
  REQUIRE(out == Level::kInfo);
  REQUIRE(meshlink::log::ParseLevel("Warning", out));
  REQUIRE(out == Level::kWarn);
  REQUIRE(meshlink::log::ParseLevel("error", out));
  REQUIRE(out == Level::kError);
  REQUIRE(meshlink::log::ParseLevel("off", out));
  REQUIRE(out == Level::kOff);
}

TEST_CASE("log - bad level name leaves output untouched", "[log]") {
  using meshlink::log::Level;
  Level out = Level::kWarn;
  REQUIRE(!meshlink::log::ParseLevel("verbose", out));
  REQUIRE(!meshlink::log::ParseLevel("", out));
  REQUIRE(!meshlink::log::ParseLevel("inf", out));
  REQUIRE(!meshlink::log::ParseLevel("infos", out));
  REQUIRE(!meshlink::log::ParseLevel(nullptr, out));
  REQUIRE(out == Level::kWarn);
}

TEST_CASE("log - macros at every threshold", "[log]") {
  LevelRestore restore;
  meshlink::log::SetLevel(meshlink::log::Level::kDebug);
  MESHLINK_LOG_DEBUG("TEST", "debug %d", 1);
  MESHLINK_LOG_INFO("TEST", "info %s", "msg");
  MESHLINK_LOG_WARN("TEST", "warn");
  MESHLINK_LOG_ERROR("TEST", "error %d %d", 1, 2);

  meshlink::log::SetLevel(meshlink::log::Level::kOff);
  MESHLINK_LOG_ERROR("TEST", "suppressed");
  REQUIRE(meshlink::log::GetLevel() == meshlink::log::Level::kOff);
}

TEST_CASE("log - line longer than the buffer is truncated", "[log]") {
  LevelRestore restore;
  meshlink::log::SetLevel(meshlink::log::Level::kDebug);
  std::string long_msg(MESHLINK_LOG_LINE_SIZE * 2U, 'x');
  MESHLINK_LOG_INFO("TEST", "%s", long_msg.c_str());
  REQUIRE(meshlink::log::GetLevel() == meshlink::log::Level::kDebug);
}
