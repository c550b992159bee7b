#pragma once

// C ABI loaded by editor plugins through the LuaJIT FFI.

struct ResolverParamsFFI {
  double context_similarity_threshold = 0.5;
  double context_match_ratio = 0.5;
  double block_anchor_similarity = 0.0;
  int preview_lines = 5;
};

struct FuzzyPatchResultFFI {
  int ok = 0;
  const char *content = nullptr;
  const char *strategy = nullptr;
  const char *message = nullptr;
};

extern "C" {
extern const int FUZZYPATCH_STRATEGY_COUNT;

// Edit in place, then call fuzzypatch_apply_params
ResolverParamsFFI *fuzzypatch_get_params();
void fuzzypatch_apply_params();

int fuzzypatch_strategy_count();
// nullptr when index is out of range
const char *fuzzypatch_strategy_name(int index);

// Result (and its strings) stay valid until the next call.
const FuzzyPatchResultFFI *fuzzypatch_replace(const char *content,
                                              const char *search,
                                              const char *replace,
                                              int replace_all);

// Drains the debug buffer
const char *fuzzypatch_debug_output();
}
