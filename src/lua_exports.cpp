// src/lua_exports.cpp

#include "lua_exports.h"
#include "Resolver/Resolver.h"
#include "Resolver/ResolverParams.h"
#include "Resolver/StrategyName.h"
#include "Utils/Debug.h"
#include <string>
#include <variant>

// Global storage
static ResolverParamsFFI g_params_ffi;
static Resolver g_resolver;

static void sync_params() {
  ResolverParams p;
  p.contextSimilarityThreshold = g_params_ffi.context_similarity_threshold;
  p.contextMatchRatio = g_params_ffi.context_match_ratio;
  p.blockAnchorSimilarity = g_params_ffi.block_anchor_similarity;
  p.previewLines = g_params_ffi.preview_lines;
  g_resolver = Resolver(p);
}

extern "C" {
const int FUZZYPATCH_STRATEGY_COUNT = STRATEGY_COUNT;

ResolverParamsFFI *fuzzypatch_get_params() { return &g_params_ffi; }
void fuzzypatch_apply_params() { sync_params(); }

int fuzzypatch_strategy_count() { return FUZZYPATCH_STRATEGY_COUNT; }

const char *fuzzypatch_strategy_name(int index) {
  if (index < 0 || index >= FUZZYPATCH_STRATEGY_COUNT)
    return nullptr;
  return strategyName(static_cast<StrategyName>(index));
}

const FuzzyPatchResultFFI *fuzzypatch_replace(const char *content,
                                              const char *search,
                                              const char *replace,
                                              int replace_all) {
  static std::string content_storage;
  static std::string message_storage;
  static FuzzyPatchResultFFI result;

  if (!content || !search || !replace) {
    message_storage = "fuzzypatch_replace: null argument";
    result = FuzzyPatchResultFFI{0, nullptr, nullptr, message_storage.c_str()};
    return &result;
  }

  ReplaceOutcome outcome = g_resolver.replace(
      EditRequest(content, search, replace, replace_all != 0));
  debug("ffi replace:", outcome);

  if (auto *r = std::get_if<ReplaceResult>(&outcome)) {
    content_storage = std::move(r->content);
    result = FuzzyPatchResultFFI{1, content_storage.c_str(), strategyName(r->strategy), nullptr};
  } else {
    message_storage = std::get<ReplaceFailure>(outcome).message;
    result = FuzzyPatchResultFFI{0, nullptr, nullptr, message_storage.c_str()};
  }
  return &result;
}

const char *fuzzypatch_debug_output() {
  static std::string debug_storage;
  debug_storage = take_debug_output();
  return debug_storage.c_str();
}
}
