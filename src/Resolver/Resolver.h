#pragma once

#include <array>
#include <optional>
#include <string>

#include "EditRequest.h"
#include "ResolverParams.h"
#include "Strategies.h"
#include "StrategyName.h"

struct StrategyEntry {
  StrategyName name;
  MatchFn match;
};

// Cascade order. The first matcher reporting Matched wins.
inline constexpr std::array<StrategyEntry, STRATEGY_COUNT> STRATEGIES = {{
    {StrategyName::Exact, Strategies::exact},
    {StrategyName::LineTrimmed, Strategies::lineTrimmed},
    {StrategyName::BlockAnchor, Strategies::blockAnchor},
    {StrategyName::WhitespaceNormalized, Strategies::whitespaceNormalized},
    {StrategyName::IndentationFlexible, Strategies::indentationFlexible},
    {StrategyName::EscapeNormalized, Strategies::escapeNormalized},
    {StrategyName::TrimmedBoundary, Strategies::trimmedBoundary},
    {StrategyName::ContextAware, Strategies::contextAware},
    {StrategyName::MultiOccurrence, Strategies::multiOccurrence},
}};

// Applies a search/replace edit to in-memory text, tolerating the drift an
// LLM-proposed search block tends to have (indentation, spacing, escaped
// newlines, reworded interiors). Holds no state across calls; safe to share
// between threads.
struct Resolver {
  ResolverParams defaultParams;

  explicit Resolver(ResolverParams params = {}) : defaultParams(params) {}

  ReplaceOutcome replace(const EditRequest& req,
                         const std::optional<ResolverParams>& paramsOverride = std::nullopt) const;

  // Run a single stage in isolation
  MatchOutcome tryStrategy(StrategyName name, const EditRequest& req,
                           const std::optional<ResolverParams>& paramsOverride = std::nullopt) const;
};

// Default-parameter convenience
ReplaceOutcome replace(const std::string& content, const std::string& searchBlock,
                       const std::string& replaceBlock, bool replaceAll = false);

// "Search block not found..." plus the first previewLines lines of the block
std::string notFoundMessage(const std::string& searchBlock, int previewLines);
