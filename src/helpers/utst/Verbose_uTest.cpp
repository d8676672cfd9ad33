/**
 * @file Verbose_uTest.cpp
 * @brief Unit tests for swapcheck::helpers::verbose::Verbose.
 */

#include "src/helpers/inc/Verbose.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

using swapcheck::helpers::verbose::MAX_VERBOSITY;
using swapcheck::helpers::verbose::Verbose;

namespace {

std::string readAll(std::FILE* f) {
  std::string out;
  std::rewind(f);
  char buf[256];
  std::size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
    out.append(buf, n);
  }
  return out;
}

} // namespace

/** @test Level is clamped to the valid range. */
TEST(VerboseTest, LevelClamped) {
  EXPECT_EQ(Verbose{-4}.level(), 0);
  EXPECT_EQ(Verbose{2}.level(), 2);
  EXPECT_EQ(Verbose{12}.level(), MAX_VERBOSITY);
}

/** @test Default-constructed printer is silent. */
TEST(VerboseTest, DefaultSilent) {
  const Verbose V{};
  EXPECT_FALSE(V.enabled(0));
}

/** @test Only messages at or below the level are written. */
TEST(VerboseTest, Gating) {
  std::FILE* sink = std::tmpfile();
  ASSERT_NE(sink, nullptr);

  const Verbose V{2, sink};
  V.log(1, "stage {}", 1);
  V.log(2, "detail {}", "x");
  V.log(3, "raw line");

  EXPECT_EQ(readAll(sink), "stage 1\ndetail x\n");
  std::fclose(sink);
}
