#include <gtest/gtest.h>

#include "Resolver/Resolver.h"
#include "Utils/Lines.h"
#include "Utils/TestUtils.h"

using namespace std;

class ConfigurationTest : public ::testing::Test {
protected:
  // Anchors agree, interior heavily reworded
  static EditRequest reworded() {
    Lines content = {
      "function render() {",
      "  const el = document.getElementById(\"app\");",
      "  el.innerHTML = \"<h1>Hello</h1>\";",
      "  return el;",
      "}",
    };
    Lines search = {
      "function render() {",
      "  const element = getById(\"app\");",
      "  element.html = \"<h1>Greetings</h1>\";",
      "  return el;",
      "}",
    };
    return EditRequest(content.flatten(), search.flatten(), "function render() {}");
  }

  // Anchors agree, one-character typo inside
  static EditRequest typo() {
    Lines content = {"function greet() {", "  console.log(\"hello world\");", "  return true;", "}"};
    Lines search = {"function greet() {", "  console.log(\"hello wrld\");", "  return true;", "}"};
    return EditRequest(content.flatten(), search.flatten(), "function greet() {}");
  }

  static StrategyName strategyFor(const Resolver& resolver, const EditRequest& req,
                                  const optional<ResolverParams>& params = nullopt) {
    return expectOk(resolver.replace(req, params)).strategy;
  }
};

// =============================================================================
// Defaults and merge
// =============================================================================

TEST_F(ConfigurationTest, Defaults) {
  ResolverParams params;
  EXPECT_DOUBLE_EQ(params.contextSimilarityThreshold, 0.5);
  EXPECT_DOUBLE_EQ(params.contextMatchRatio, 0.5);
  EXPECT_DOUBLE_EQ(params.blockAnchorSimilarity, 0.0);
  EXPECT_EQ(params.previewLines, 5);
}

TEST_F(ConfigurationTest, MergeUsesOverrideWhenGiven) {
  ResolverParams defaults(0.1, 0.2, 0.3, 4);
  ResolverParams merged = ResolverParams::merge(defaults, nullopt);
  EXPECT_DOUBLE_EQ(merged.contextSimilarityThreshold, 0.1);
  EXPECT_EQ(merged.previewLines, 4);

  merged = ResolverParams::merge(defaults, ResolverParams(0.9, 0.8, 0.7, 6));
  EXPECT_DOUBLE_EQ(merged.contextSimilarityThreshold, 0.9);
  EXPECT_DOUBLE_EQ(merged.contextMatchRatio, 0.8);
  EXPECT_DOUBLE_EQ(merged.blockAnchorSimilarity, 0.7);
  EXPECT_EQ(merged.previewLines, 6);
}

// =============================================================================
// Thresholds
// =============================================================================

TEST_F(ConfigurationTest, DefaultBlockAnchorIsAnchorOnly) {
  Resolver resolver;
  EXPECT_EQ(strategyFor(resolver, typo()), StrategyName::BlockAnchor);
  EXPECT_EQ(strategyFor(resolver, reworded()), StrategyName::BlockAnchor);
}

TEST_F(ConfigurationTest, InteriorSimilarityFloorLeavesRewordingToContextAware) {
  Resolver resolver(ResolverParams(0.5, 0.5, 0.8));
  EXPECT_EQ(strategyFor(resolver, typo()), StrategyName::BlockAnchor);
  EXPECT_EQ(strategyFor(resolver, reworded()), StrategyName::ContextAware);
}

TEST_F(ConfigurationTest, StrictBlockAnchorLeavesTypoToContextAware) {
  Resolver resolver(ResolverParams(0.5, 0.5, 1.0));
  EXPECT_EQ(strategyFor(resolver, typo()), StrategyName::ContextAware);
}

TEST_F(ConfigurationTest, StrictLineSimilarityRejectsRewording) {
  Resolver resolver(ResolverParams(0.99, 0.5, 0.8));
  EXPECT_FALSE(isOk(resolver.replace(reworded())));
}

TEST_F(ConfigurationTest, LowerMatchRatioAcceptsFewerSimilarLines) {
  // Only "return el;" survives the strict threshold: 1 of 3 interior lines
  Resolver resolver(ResolverParams(0.99, 0.3, 0.8));
  EXPECT_EQ(strategyFor(resolver, reworded()), StrategyName::ContextAware);
}

TEST_F(ConfigurationTest, PerCallOverrideBeatsDefaults) {
  Resolver resolver;
  EXPECT_EQ(strategyFor(resolver, reworded()), StrategyName::BlockAnchor);
  EXPECT_EQ(strategyFor(resolver, reworded(), ResolverParams(0.5, 0.5, 0.8)),
            StrategyName::ContextAware);
  // Defaults untouched afterwards
  EXPECT_EQ(strategyFor(resolver, reworded()), StrategyName::BlockAnchor);
}

TEST_F(ConfigurationTest, TryStrategyHonoursOverride) {
  Resolver resolver;
  EditRequest req = reworded();
  EXPECT_TRUE(holds_alternative<Matched>(resolver.tryStrategy(StrategyName::BlockAnchor, req)));
  EXPECT_TRUE(holds_alternative<Bail>(
      resolver.tryStrategy(StrategyName::BlockAnchor, req, ResolverParams(0.5, 0.5, 0.8))));
}

TEST_F(ConfigurationTest, TryStrategyWithNoneBails) {
  Resolver resolver;
  EXPECT_TRUE(holds_alternative<Bail>(resolver.tryStrategy(StrategyName::None, typo())));
}

// =============================================================================
// Strategy names
// =============================================================================

TEST_F(ConfigurationTest, StrategyNamesRoundTrip) {
  ASSERT_EQ(STRATEGIES.size(), static_cast<size_t>(STRATEGY_COUNT));
  for (const auto& entry : STRATEGIES) {
    auto parsed = parseStrategyName(strategyName(entry.name));
    ASSERT_TRUE(parsed.has_value()) << strategyName(entry.name);
    EXPECT_EQ(*parsed, entry.name);
  }
}

TEST_F(ConfigurationTest, StrategyNameStrings) {
  EXPECT_STREQ(strategyName(StrategyName::Exact), "exact");
  EXPECT_STREQ(strategyName(StrategyName::WhitespaceNormalized), "whitespace-normalized");
  EXPECT_STREQ(strategyName(StrategyName::MultiOccurrence), "multi-occurrence");
  EXPECT_STREQ(strategyName(StrategyName::None), "none");
  EXPECT_EQ(parseStrategyName("fuzzy"), nullopt);
  EXPECT_EQ(parseStrategyName("none"), nullopt);
}

TEST_F(ConfigurationTest, CascadeOrderIsFixed) {
  vector<StrategyName> order;
  for (const auto& entry : STRATEGIES) order.push_back(entry.name);
  EXPECT_EQ(order, (vector<StrategyName>{
    StrategyName::Exact,
    StrategyName::LineTrimmed,
    StrategyName::BlockAnchor,
    StrategyName::WhitespaceNormalized,
    StrategyName::IndentationFlexible,
    StrategyName::EscapeNormalized,
    StrategyName::TrimmedBoundary,
    StrategyName::ContextAware,
    StrategyName::MultiOccurrence,
  }));
}
