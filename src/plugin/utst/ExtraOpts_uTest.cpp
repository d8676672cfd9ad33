/**
 * @file ExtraOpts_uTest.cpp
 * @brief Unit tests for swapcheck::plugin --extra-opts handling.
 *
 * Notes:
 *  - INI files are written to a mkdtemp() directory.
 *  - Every test that relies on default-location search sets
 *    MP_CONFIG_FILE so the host configuration is never read.
 */

#include "src/plugin/inc/ExtraOpts.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

using swapcheck::plugin::candidateConfigFiles;
using swapcheck::plugin::entriesToArgs;
using swapcheck::plugin::expandExtraOpts;
using swapcheck::plugin::ExtraOptsTarget;
using swapcheck::plugin::IniEntries;
using swapcheck::plugin::loadIniSection;
using swapcheck::plugin::parseExtraOptsTarget;

namespace {

constexpr std::string_view SWITCHES[] = {"verbose", "strict"};

} // namespace

class ExtraOptsTest : public ::testing::Test {
protected:
  std::string dir_{};
  std::string ini_{};

  void SetUp() override {
    char tmpl[] = "/tmp/swapcheck-ini-XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    dir_ = tmpl;
    ini_ = dir_ + "/plugins.ini";
    writeIni("[check_swap]\n"
             "measurement = swap_usage\n"
             "warning = 80\n"
             "critical = 90\n"
             "verbose = 2\n"
             "\n"
             "[other]\n"
             "m = used_swap_blocks\n"
             "strict = yes\n"
             "\n"
             "[bad_switch]\n"
             "verbose = sometimes\n");
  }

  void TearDown() override {
    ::unsetenv("MP_CONFIG_FILE");
    ::unlink(ini_.c_str());
    ::rmdir(dir_.c_str());
  }

  void writeIni(const std::string& content) {
    std::FILE* f = std::fopen(ini_.c_str(), "w");
    ASSERT_NE(f, nullptr);
    std::fputs(content.c_str(), f);
    std::fclose(f);
  }
};

/* ----------------------------- Target Parsing ----------------------------- */

/** @test Section and file forms. */
TEST(ExtraOptsTargetTest, Forms) {
  ExtraOptsTarget s = parseExtraOptsTarget("", "check_swap");
  EXPECT_EQ(s.section, "check_swap");
  EXPECT_EQ(s.file, "");

  s = parseExtraOptsTarget("mysection", "check_swap");
  EXPECT_EQ(s.section, "mysection");
  EXPECT_EQ(s.file, "");

  s = parseExtraOptsTarget("@/etc/x.ini", "check_swap");
  EXPECT_EQ(s.section, "check_swap");
  EXPECT_EQ(s.file, "/etc/x.ini");

  s = parseExtraOptsTarget("sec@/etc/x.ini", "check_swap");
  EXPECT_EQ(s.section, "sec");
  EXPECT_EQ(s.file, "/etc/x.ini");
}

/** @test Search order puts the environment first. */
TEST(ExtraOptsTargetTest, CandidateOrder) {
  const std::vector<std::string> FILES = candidateConfigFiles("/custom.ini", "/a:/b");
  ASSERT_GE(FILES.size(), 7U);
  EXPECT_EQ(FILES[0], "/custom.ini");
  EXPECT_EQ(FILES[1], "/a/monitoring-plugins.ini");
  EXPECT_EQ(FILES[2], "/a/plugins.ini");
  EXPECT_EQ(FILES[3], "/a/nagios-plugins.ini");
  EXPECT_EQ(FILES[4], "/b/monitoring-plugins.ini");
  EXPECT_EQ(FILES[7], "/etc/monitoring-plugins/monitoring-plugins.ini");
}

/** @test Without environment only the standard locations remain. */
TEST(ExtraOptsTargetTest, CandidateDefaultsOnly) {
  const std::vector<std::string> FILES = candidateConfigFiles(nullptr, nullptr);
  ASSERT_FALSE(FILES.empty());
  EXPECT_EQ(FILES.front(), "/etc/monitoring-plugins/monitoring-plugins.ini");
  EXPECT_EQ(FILES.back(), "/etc/opt/nagios/plugins.ini");
}

/* ----------------------------- Conversion ----------------------------- */

/** @test Entries become option tokens. */
TEST(ExtraOptsConvertTest, EntriesToArgs) {
  const IniEntries ENTRIES = {
      {"measurement", "swap_usage"}, {"w", "80"}, {"verbose", "3"}, {"strict", "off"},
      {"usage", ""}};
  std::vector<std::string> out;
  std::string error;
  ASSERT_TRUE(entriesToArgs(ENTRIES, SWITCHES, out, error)) << error;
  const std::vector<std::string> EXPECTED = {"--measurement=swap_usage", "-w80", "--verbose",
                                             "--verbose", "--verbose", "--usage"};
  EXPECT_EQ(out, EXPECTED);
}

/** @test Switch with a nonsense value is rejected. */
TEST(ExtraOptsConvertTest, BadSwitchValue) {
  const IniEntries ENTRIES = {{"verbose", "maybe"}};
  std::vector<std::string> out;
  std::string error;
  EXPECT_FALSE(entriesToArgs(ENTRIES, SWITCHES, out, error));
  EXPECT_NE(error.find("verbose"), std::string::npos);
}

/* ----------------------------- Loading ----------------------------- */

/** @test Section entries keep file order. */
TEST_F(ExtraOptsTest, LoadSection) {
  IniEntries entries;
  std::string error;
  ASSERT_TRUE(loadIniSection(ini_, "check_swap", entries, error)) << error;
  ASSERT_EQ(entries.size(), 4U);
  EXPECT_EQ(entries[0].first, "measurement");
  EXPECT_EQ(entries[0].second, "swap_usage");
  EXPECT_EQ(entries[3].first, "verbose");
}

/** @test Missing section and missing file are errors. */
TEST_F(ExtraOptsTest, LoadErrors) {
  IniEntries entries;
  std::string error;
  EXPECT_FALSE(loadIniSection(ini_, "nope", entries, error));
  EXPECT_NE(error.find("[nope]"), std::string::npos);

  EXPECT_FALSE(loadIniSection(dir_ + "/missing.ini", "check_swap", entries, error));
  EXPECT_FALSE(error.empty());
}

/** @test Malformed INI is reported, not thrown. */
TEST_F(ExtraOptsTest, MalformedIni) {
  writeIni("[check_swap\nwarning = 80\n");
  IniEntries entries;
  std::string error;
  EXPECT_FALSE(loadIniSection(ini_, "check_swap", entries, error));
  EXPECT_FALSE(error.empty());
}

/* ----------------------------- Expansion ----------------------------- */

/** @test Loaded options precede the command line. */
TEST_F(ExtraOptsTest, ExpandExplicitFile) {
  const std::vector<std::string> ARGS = {"-w", "70", "--extra-opts=@" + ini_};
  std::vector<std::string> out;
  std::string error;
  ASSERT_TRUE(expandExtraOpts(ARGS, "check_swap", SWITCHES, out, error)) << error;
  const std::vector<std::string> EXPECTED = {"--measurement=swap_usage", "--warning=80",
                                             "--critical=90", "--verbose", "--verbose",
                                             "-w", "70"};
  EXPECT_EQ(out, EXPECTED);
}

/** @test Named section. */
TEST_F(ExtraOptsTest, ExpandNamedSection) {
  const std::vector<std::string> ARGS = {"--extra-opts=other@" + ini_};
  std::vector<std::string> out;
  std::string error;
  ASSERT_TRUE(expandExtraOpts(ARGS, "check_swap", SWITCHES, out, error)) << error;
  const std::vector<std::string> EXPECTED = {"-mused_swap_blocks", "--strict"};
  EXPECT_EQ(out, EXPECTED);
}

/** @test Bare flag searches MP_CONFIG_FILE with the default section. */
TEST_F(ExtraOptsTest, ExpandDefaultSearch) {
  ASSERT_EQ(::setenv("MP_CONFIG_FILE", ini_.c_str(), 1), 0);
  const std::vector<std::string> ARGS = {"--extra-opts"};
  std::vector<std::string> out;
  std::string error;
  ASSERT_TRUE(expandExtraOpts(ARGS, "check_swap", SWITCHES, out, error)) << error;
  ASSERT_FALSE(out.empty());
  EXPECT_EQ(out.front(), "--measurement=swap_usage");
}

/** @test Arguments without --extra-opts pass through untouched. */
TEST_F(ExtraOptsTest, NoExtraOpts) {
  const std::vector<std::string> ARGS = {"-m", "swap_usage", "--extra-optsX"};
  std::vector<std::string> out;
  std::string error;
  ASSERT_TRUE(expandExtraOpts(ARGS, "check_swap", SWITCHES, out, error));
  EXPECT_EQ(out, ARGS);
}

/** @test Failures carry the --extra-opts prefix. */
TEST_F(ExtraOptsTest, ExpandErrors) {
  std::vector<std::string> out;
  std::string error;
  EXPECT_FALSE(
      expandExtraOpts({"--extra-opts=missing@" + ini_}, "check_swap", SWITCHES, out, error));
  EXPECT_EQ(error.rfind("--extra-opts:", 0), 0U);

  EXPECT_FALSE(
      expandExtraOpts({"--extra-opts=bad_switch@" + ini_}, "check_swap", SWITCHES, out, error));
  EXPECT_NE(error.find("verbose"), std::string::npos);
}
