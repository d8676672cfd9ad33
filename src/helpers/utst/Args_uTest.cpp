/**
 * @file Args_uTest.cpp
 * @brief Unit tests for swapcheck::helpers::args.
 */

#include "src/helpers/inc/Args.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using swapcheck::helpers::args::ArgMap;
using swapcheck::helpers::args::lastValue;
using swapcheck::helpers::args::occurrences;
using swapcheck::helpers::args::parseArgs;
using swapcheck::helpers::args::ParsedArgs;

namespace {

enum Key : std::uint8_t { K_WARN = 0, K_CRIT = 1, K_VERBOSE = 2, K_STRICT = 3, K_MEAS = 4 };

ArgMap testMap() {
  ArgMap map;
  map[K_WARN] = {"--warning", 'w', 1, false, "warn", "RANGE"};
  map[K_CRIT] = {"--critical", 'c', 1, false, "crit", "RANGE"};
  map[K_VERBOSE] = {"--verbose", 'v', 0, false, "verbose"};
  map[K_STRICT] = {"--strict", '\0', 0, false, "strict"};
  map[K_MEAS] = {"--measurement", 'm', 1, false, "measurement", "NAME"};
  return map;
}

} // namespace

class ArgsTest : public ::testing::Test {
protected:
  ArgMap map_ = testMap();
  ParsedArgs pargs_{};
  std::string error_{};

  bool parse(std::vector<std::string_view> args) {
    return parseArgs(args, map_, pargs_, error_);
  }
};

/* ----------------------------- Option Forms ----------------------------- */

/** @test Long option with separate value. */
TEST_F(ArgsTest, LongSeparateValue) {
  ASSERT_TRUE(parse({"--warning", "80"}));
  EXPECT_EQ(lastValue(pargs_, K_WARN).value_or(""), "80");
}

/** @test Long option with '=' value. */
TEST_F(ArgsTest, LongEqualsValue) {
  ASSERT_TRUE(parse({"--critical=90"}));
  EXPECT_EQ(lastValue(pargs_, K_CRIT).value_or(""), "90");
}

/** @test Short option with separate and attached values. */
TEST_F(ArgsTest, ShortValueForms) {
  ASSERT_TRUE(parse({"-w", "80", "-c90"}));
  EXPECT_EQ(lastValue(pargs_, K_WARN).value_or(""), "80");
  EXPECT_EQ(lastValue(pargs_, K_CRIT).value_or(""), "90");
}

/** @test Values starting with '-' are taken literally. */
TEST_F(ArgsTest, NegativeLookingValue) {
  ASSERT_TRUE(parse({"-w", "-5:"}));
  EXPECT_EQ(lastValue(pargs_, K_WARN).value_or(""), "-5:");
}

/** @test Bundled switches count every occurrence. */
TEST_F(ArgsTest, BundledSwitches) {
  ASSERT_TRUE(parse({"-vvv"}));
  EXPECT_EQ(occurrences(pargs_, K_VERBOSE), 3U);
}

/** @test Switches and value options can share a cluster. */
TEST_F(ArgsTest, SwitchThenValueInCluster) {
  ASSERT_TRUE(parse({"-vmswap_usage"}));
  EXPECT_EQ(occurrences(pargs_, K_VERBOSE), 1U);
  EXPECT_EQ(lastValue(pargs_, K_MEAS).value_or(""), "swap_usage");
}

/** @test Repeated value option keeps the last value. */
TEST_F(ArgsTest, LastValueWins) {
  ASSERT_TRUE(parse({"--warning=70", "-w", "80"}));
  EXPECT_EQ(occurrences(pargs_, K_WARN), 2U);
  EXPECT_EQ(lastValue(pargs_, K_WARN).value_or(""), "80");
}

/** @test Absent flag has no value. */
TEST_F(ArgsTest, AbsentFlag) {
  ASSERT_TRUE(parse({}));
  EXPECT_FALSE(lastValue(pargs_, K_WARN).has_value());
  EXPECT_EQ(occurrences(pargs_, K_VERBOSE), 0U);
}

/* ----------------------------- Errors ----------------------------- */

/** @test Unknown long option is rejected. */
TEST_F(ArgsTest, UnknownLongOption) {
  EXPECT_FALSE(parse({"--bogus"}));
  EXPECT_NE(error_.find("--bogus"), std::string::npos);
}

/** @test Unknown short option is rejected. */
TEST_F(ArgsTest, UnknownShortOption) {
  EXPECT_FALSE(parse({"-x"}));
  EXPECT_NE(error_.find("-x"), std::string::npos);
}

/** @test Missing value at end of arguments. */
TEST_F(ArgsTest, MissingValue) {
  EXPECT_FALSE(parse({"--warning"}));
  EXPECT_NE(error_.find("requires a value"), std::string::npos);
  EXPECT_FALSE(parse({"-c"}));
}

/** @test Switch given a value with '='. */
TEST_F(ArgsTest, SwitchWithValue) {
  EXPECT_FALSE(parse({"--strict=yes"}));
  EXPECT_NE(error_.find("does not take a value"), std::string::npos);
}

/** @test Stray positional argument. */
TEST_F(ArgsTest, PositionalRejected) {
  EXPECT_FALSE(parse({"-w", "80", "extra"}));
  EXPECT_NE(error_.find("extra"), std::string::npos);
}

/** @test Missing required flag. */
TEST_F(ArgsTest, RequiredFlag) {
  map_[K_MEAS].required = true;
  EXPECT_FALSE(parse({"-w", "80"}));
  EXPECT_NE(error_.find("--measurement"), std::string::npos);
}
