#include <gtest/gtest.h>

#include <string>

#include "lua_exports.h"
#include "Resolver/StrategyName.h"

using namespace std;

class LuaExportsTest : public ::testing::Test {
protected:
  // Exported parameters are process-wide; every test starts from the defaults
  void SetUp() override { reset(); }
  void TearDown() override { reset(); }

  static void reset() {
    *fuzzypatch_get_params() = ResolverParamsFFI{};
    fuzzypatch_apply_params();
  }

  static constexpr const char* content =
      "function render() {\n"
      "  const el = document.getElementById(\"app\");\n"
      "  el.innerHTML = \"<h1>Hello</h1>\";\n"
      "  return el;\n"
      "}";
  static constexpr const char* search =
      "function render() {\n"
      "  const element = getById(\"app\");\n"
      "  element.html = \"<h1>Greetings</h1>\";\n"
      "  return el;\n"
      "}";
};

TEST_F(LuaExportsTest, NullArgumentReportsFailure) {
  const FuzzyPatchResultFFI* r = fuzzypatch_replace(nullptr, "a", "b", 0);
  EXPECT_EQ(r->ok, 0);
  EXPECT_EQ(r->content, nullptr);
  ASSERT_NE(r->message, nullptr);
  EXPECT_STREQ(r->message, "fuzzypatch_replace: null argument");

  EXPECT_EQ(fuzzypatch_replace("a", nullptr, "b", 0)->ok, 0);
  EXPECT_EQ(fuzzypatch_replace("a", "a", nullptr, 0)->ok, 0);
}

TEST_F(LuaExportsTest, StrategyNamesByIndex) {
  EXPECT_EQ(fuzzypatch_strategy_count(), STRATEGY_COUNT);
  EXPECT_EQ(FUZZYPATCH_STRATEGY_COUNT, STRATEGY_COUNT);
  EXPECT_STREQ(fuzzypatch_strategy_name(0), "exact");
  EXPECT_STREQ(fuzzypatch_strategy_name(STRATEGY_COUNT - 1), "multi-occurrence");
  EXPECT_EQ(fuzzypatch_strategy_name(-1), nullptr);
  EXPECT_EQ(fuzzypatch_strategy_name(STRATEGY_COUNT), nullptr);
}

TEST_F(LuaExportsTest, ReplaceReportsStrategyAndContent) {
  const FuzzyPatchResultFFI* r = fuzzypatch_replace("foo bar foo", "foo", "baz", 1);
  ASSERT_EQ(r->ok, 1);
  EXPECT_STREQ(r->content, "baz bar baz");
  EXPECT_STREQ(r->strategy, "exact");
  EXPECT_EQ(r->message, nullptr);
}

TEST_F(LuaExportsTest, FailureCarriesMessage) {
  const FuzzyPatchResultFFI* r = fuzzypatch_replace("hello world", "completely different", "x", 0);
  EXPECT_EQ(r->ok, 0);
  ASSERT_NE(r->message, nullptr);
  EXPECT_NE(string(r->message).find("Search block not found"), string::npos);
}

TEST_F(LuaExportsTest, AppliedParamsAffectNextReplace) {
  EXPECT_DOUBLE_EQ(fuzzypatch_get_params()->block_anchor_similarity, 0.0);
  EXPECT_STREQ(fuzzypatch_replace(content, search, "X", 0)->strategy, "block-anchor");

  // Edited but not yet applied: no effect
  fuzzypatch_get_params()->block_anchor_similarity = 0.8;
  EXPECT_STREQ(fuzzypatch_replace(content, search, "X", 0)->strategy, "block-anchor");

  fuzzypatch_apply_params();
  EXPECT_STREQ(fuzzypatch_replace(content, search, "X", 0)->strategy, "context-aware");
}

TEST_F(LuaExportsTest, ResultStaysValidUntilNextCall) {
  const FuzzyPatchResultFFI* first = fuzzypatch_replace("alpha beta", "beta", "gamma", 0);
  string firstContent = first->content;
  EXPECT_EQ(firstContent, "alpha gamma");
  EXPECT_STREQ(first->content, "alpha gamma");

  const FuzzyPatchResultFFI* second = fuzzypatch_replace("one two", "two", "three", 0);
  EXPECT_EQ(first, second);
  EXPECT_STREQ(second->content, "one three");
}
