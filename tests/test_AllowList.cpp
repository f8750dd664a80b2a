#include <gtest/gtest.h>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/AllowList.h"
#include "utils/Logger.h"
#include "TestSupport.h"

TEST(AllowList, SplitsCommaSeparatedAndTrims) {
  auto parts = AllowList::splitRaw(" /a , /b,/c ");
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0], "/a");
  EXPECT_EQ(parts[1], "/b");
  EXPECT_EQ(parts[2], "/c");
}

TEST(AllowList, DropsEmptySegments) {
  auto parts = AllowList::splitRaw("/a,, ,/b,");
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], "/a");
  EXPECT_EQ(parts[1], "/b");
}

TEST(AllowList, JsonArrayIsTakenVerbatim) {
  auto parts = AllowList::splitRaw(R"(["/x, with comma", "/y"])");
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], "/x, with comma");
  EXPECT_EQ(parts[1], "/y");
}

TEST(AllowList, JsonArrayWithNonStringsFallsBackToCommaSplit) {
  auto parts = AllowList::splitRaw("[1,2]");
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], "[1");
  EXPECT_EQ(parts[1], "2]");
}

TEST(AllowList, AbsentOrBlankInputPermitsNothing) {
  EXPECT_TRUE(AllowList::parse(std::nullopt).empty());
  EXPECT_TRUE(AllowList::parse(std::string("   ")).empty());
  EXPECT_TRUE(AllowList::parse(std::string("[]")).empty());
}

TEST(AllowList, EntriesAreCanonical) {
  TempDir tmp("allowlist_canon");
  tmp.mkdir("a/b");
  std::string raw = (tmp.path() / "a" / "." / "b" / "..").string() + "," + (tmp.path() / "a/b/").string();

  AllowList list = AllowList::parse(raw);
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list.entries()[0], tmp.path() / "a");
  EXPECT_EQ(list.entries()[1], tmp.path() / "a" / "b");
}

TEST(AllowList, ResolvesSymlinkedEntries) {
  TempDir tmp("allowlist_link");
  tmp.mkdir("real");
  fs::create_directory_symlink(tmp.path() / "real", tmp.path() / "alias");

  AllowList list = AllowList::parse((tmp.path() / "alias").string());
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list.entries()[0], tmp.path() / "real");
}

TEST(AllowList, SkipsDanglingSymlinkEntry) {
  TempDir tmp("allowlist_dangling");
  tmp.mkdir("ok");
  fs::create_directory_symlink(tmp.path() / "gone", tmp.path() / "dangling");

  std::string raw = (tmp.path() / "dangling").string() + "," + (tmp.path() / "ok").string();
  AllowList list = AllowList::parse(raw);
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list.entries()[0], tmp.path() / "ok");
}

TEST(AllowList, WarnsAboutSkippedEntries) {
  TempDir tmp("allowlist_warn");
  tmp.mkdir("ok");
  fs::create_directory_symlink(tmp.path() / "gone", tmp.path() / "dangling");

  std::vector<std::string> warnings;
  Logger& logger = Logger::getInstance();
  logger.setLevel(LogLevel::INFO);
  logger.setCallback([&warnings](LogLevel level, const std::string& message) {
    if (level == LogLevel::WARNING) warnings.push_back(message);
  });

  std::string raw = (tmp.path() / "dangling").string() + ",," + (tmp.path() / "ok").string();
  AllowList list = AllowList::parse(raw);
  logger.setCallback(nullptr);

  EXPECT_EQ(list.size(), 1u);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("Ignoring allowed directory"), std::string::npos);
  EXPECT_NE(warnings[0].find("dangling"), std::string::npos);
}

TEST(AllowList, KeepsMissingDirectoriesLexically) {
  TempDir tmp("allowlist_missing");
  AllowList list = AllowList::parse((tmp.path() / "not-yet").string());
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list.entries()[0], tmp.path() / "not-yet");
}

#ifndef _WIN32
TEST(AllowList, ExpandsHomeShorthand) {
  TempDir tmp("allowlist_home");
  tmp.mkdir("Desktop");

  const char* saved = std::getenv("HOME");
  std::string previous = saved ? saved : "";
  setenv("HOME", tmp.path().c_str(), 1);

  AllowList list = AllowList::parse(std::string("~/Desktop"));

  if (saved) setenv("HOME", previous.c_str(), 1); else unsetenv("HOME");

  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list.entries()[0], tmp.path() / "Desktop");
}
#endif

TEST(AllowList, ToStringsPreservesOrder) {
  AllowList list({fs::path("/b"), fs::path("/a")});
  auto strings = list.toStrings();
  ASSERT_EQ(strings.size(), 2u);
  EXPECT_EQ(strings[0], "/b");
  EXPECT_EQ(strings[1], "/a");
}
