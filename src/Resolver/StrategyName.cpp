#include "StrategyName.h"

#include <array>

using namespace std;

#define STRING_VALUE(name, str) str,
static constexpr array<const char*, STRATEGY_COUNT> g_strategy_names = {
    FUZZYPATCH_STRATEGIES(STRING_VALUE)
};
#undef STRING_VALUE

const char* strategyName(StrategyName s) {
  size_t i = static_cast<size_t>(s);
  if (i >= g_strategy_names.size()) return "none";
  return g_strategy_names[i];
}

optional<StrategyName> parseStrategyName(string_view name) {
  for (size_t i = 0; i < g_strategy_names.size(); i++) {
    if (name == g_strategy_names[i]) {
      return static_cast<StrategyName>(i);
    }
  }
  return nullopt;
}
