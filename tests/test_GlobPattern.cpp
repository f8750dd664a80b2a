#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <string>

#include "utils/GlobPattern.h"

TEST(GlobPattern, StarStaysWithinSegment) {
  GlobPattern g("*.md");
  EXPECT_TRUE(g.matches("README.md"));
  EXPECT_FALSE(g.matches("docs/README.md"));
  EXPECT_FALSE(g.matches("README.mdx"));
}

TEST(GlobPattern, DoubleStarCrossesSegments) {
  GlobPattern g("**/*.md");
  EXPECT_TRUE(g.matches("README.md"));
  EXPECT_TRUE(g.matches("docs/README.md"));
  EXPECT_TRUE(g.matches("a/b/c/notes.md"));
  EXPECT_FALSE(g.matches("a/b/c/notes.txt"));
}

TEST(GlobPattern, QuestionMarkAndClasses) {
  EXPECT_TRUE(GlobPattern("file?.txt").matches("file1.txt"));
  EXPECT_FALSE(GlobPattern("file?.txt").matches("file10.txt"));
  EXPECT_TRUE(GlobPattern("[ab]*.log").matches("a1.log"));
  EXPECT_FALSE(GlobPattern("[ab]*.log").matches("c1.log"));
  EXPECT_TRUE(GlobPattern("[!ab]*.log").matches("c1.log"));
  EXPECT_TRUE(GlobPattern("v[0-9].txt").matches("v7.txt"));
}

TEST(GlobPattern, PunctuationIsLiteral) {
  EXPECT_TRUE(GlobPattern("a+b(1).txt").matches("a+b(1).txt"));
  EXPECT_FALSE(GlobPattern("a.txt").matches("abtxt"));
}

TEST(GlobPattern, MalformedPatternsThrow) {
  EXPECT_THROW(GlobPattern(""), std::invalid_argument);
  EXPECT_THROW(GlobPattern("[abc"), std::invalid_argument);
}

TEST(GlobPattern, DoubleStarMatchesZeroOrMoreSegments) {
  GlobPattern g("src/**/test_*.cpp");
  EXPECT_TRUE(g.matches("src/test_a.cpp"));
  EXPECT_TRUE(g.matches("src/x/y/test_b.cpp"));
  EXPECT_FALSE(g.matches("lib/test_a.cpp"));
  EXPECT_TRUE(GlobPattern("docs/**").matches("docs/a/b.txt"));
}

TEST(GlobPattern, ManyStarsStayFastOnNearMisses) {
  GlobPattern g("*a*a*a*a*a*a*a*a*a*a*a*a*b");
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(g.matches(std::string(200, 'a')));
  EXPECT_TRUE(g.matches(std::string(200, 'a') + "b"));

  GlobPattern deep("**/**/**/**/**/**/x");
  EXPECT_FALSE(deep.matches("a/a/a/a/a/a/a/a/a/a/a/a/a/a/a/a/a/a/a/a/y"));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
}
