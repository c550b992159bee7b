#pragma once

#include <optional>

// Tunables shared by the fuzzy matchers.
// Can be set as defaults on the Resolver and optionally overridden per-call.
struct ResolverParams {
  // Context-aware: an interior line counts as similar at or above this ratio,
  // and at least contextMatchRatio of the interior lines must be similar.
  double contextSimilarityThreshold = 0.5;
  double contextMatchRatio = 0.5;

  // Block-anchor: mean interior similarity the single anchored block needs.
  // 0 accepts on anchors alone, whatever the interior says.
  double blockAnchorSimilarity = 0.0;

  // Lines of the search block quoted in the failure message
  int previewLines = 5;

  ResolverParams() = default;

  ResolverParams(double contextSimilarityThreshold, double contextMatchRatio,
                 double blockAnchorSimilarity = 0.0, int previewLines = 5)
      : contextSimilarityThreshold(contextSimilarityThreshold),
        contextMatchRatio(contextMatchRatio),
        blockAnchorSimilarity(blockAnchorSimilarity),
        previewLines(previewLines) {}

  // For simple structs, we just use the override directly if provided
  static ResolverParams merge(const ResolverParams& defaults,
                              const std::optional<ResolverParams>& override) {
    return override.value_or(defaults);
  }
};
