#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

#include "XMacroStrategyDefinitions.h"

static constexpr int STRATEGY_COUNT = 9;

#define ENUM_VALUE(name, str) name,
enum class StrategyName : uint8_t {
    FUZZYPATCH_STRATEGIES(ENUM_VALUE)
    None
};
#undef ENUM_VALUE

static_assert(STRATEGY_COUNT == static_cast<uint8_t>(StrategyName::None), "strategy counts do not match");

// "exact", "line-trimmed", ... ; "none" for StrategyName::None
const char* strategyName(StrategyName s);

std::optional<StrategyName> parseStrategyName(std::string_view name);

inline std::ostream& operator<<(std::ostream& os, StrategyName s) {
  return os << strategyName(s);
}
