#include <gtest/gtest.h>

#include "Resolver/Levenshtein.h"

// -----------------------------------------------------------------------------
// Basic Distance Tests
// -----------------------------------------------------------------------------

TEST(LevenshteinTest, IdenticalStringsHaveZeroDistance) {
  Levenshtein lev("hello");
  EXPECT_EQ(lev.distance("hello"), 0);
  EXPECT_EQ(levenshtein("abc", "abc"), 0);
}

TEST(LevenshteinTest, BothEmptyIsZero) {
  EXPECT_EQ(levenshtein("", ""), 0);
}

TEST(LevenshteinTest, EmptyGoalReturnsSourceLength) {
  Levenshtein lev("");
  EXPECT_EQ(lev.distance("hello"), 5);
  EXPECT_EQ(lev.distance(""), 0);
}

TEST(LevenshteinTest, EmptySourceReturnsGoalLength) {
  Levenshtein lev("hello");
  EXPECT_EQ(lev.distance(""), 5);
  EXPECT_EQ(levenshtein("", "abc"), 3);
}

TEST(LevenshteinTest, SingleEdits) {
  EXPECT_EQ(levenshtein("cat", "bat"), 1);   // substitution
  EXPECT_EQ(levenshtein("cat", "cats"), 1);  // insertion
  EXPECT_EQ(levenshtein("cats", "cat"), 1);  // deletion
}

TEST(LevenshteinTest, MultipleEdits) {
  EXPECT_EQ(levenshtein("kitten", "sitting"), 3);  // k->s, e->i, +g
  EXPECT_EQ(levenshtein("sitting", "kitten"), 3);
}

TEST(LevenshteinTest, CompletelyDifferent) {
  EXPECT_EQ(levenshtein("abc", "xyz"), 3);
}

TEST(LevenshteinTest, NewlineAsCharacter) {
  Levenshtein lev("aaa\nbbb");
  EXPECT_EQ(lev.distance("aaa\nbbb"), 0);
  EXPECT_EQ(lev.distance("aaabbb"), 1);
  EXPECT_EQ(lev.distance("aaa\nccc"), 3);
}

TEST(LevenshteinTest, GoalIsReusableAcrossQueries) {
  Levenshtein lev("hello world");
  EXPECT_EQ(lev.distance("hello earth"), 4);
  EXPECT_EQ(lev.distance("hello venus"), 5);
  EXPECT_EQ(lev.distance("hello earth"), 4);
}

// -----------------------------------------------------------------------------
// Similarity ratio
// -----------------------------------------------------------------------------

TEST(LevenshteinTest, SimilarityBounds) {
  EXPECT_DOUBLE_EQ(similarity("", ""), 1.0);
  EXPECT_DOUBLE_EQ(similarity("abc", "abc"), 1.0);
  EXPECT_DOUBLE_EQ(similarity("abc", "xyz"), 0.0);
  EXPECT_DOUBLE_EQ(similarity("", "abcd"), 0.0);
}

TEST(LevenshteinTest, SimilarityUsesLongerLength) {
  // distance 1 over max length 4
  EXPECT_DOUBLE_EQ(similarity("cats", "cat"), 0.75);
  EXPECT_DOUBLE_EQ(Levenshtein("cat").similarity("cats"), 0.75);
}

TEST(LevenshteinTest, TypoIsHighlySimilar) {
  double s = similarity("console.log(\"hello world\");", "console.log(\"hello wrld\");");
  EXPECT_GT(s, 0.95);
}
