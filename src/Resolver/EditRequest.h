#pragma once

#include <ostream>
#include <string>
#include <variant>

#include "StrategyName.h"
#include "Utils/StringUtils.h"

// One proposed edit against the current text of a file.
struct EditRequest {
  std::string content;       // full current file text
  std::string searchBlock;
  std::string replaceBlock;
  bool replaceAll = false;

  EditRequest(std::string content, std::string searchBlock,
              std::string replaceBlock, bool replaceAll = false)
      : content(std::move(content)), searchBlock(std::move(searchBlock)),
        replaceBlock(std::move(replaceBlock)), replaceAll(replaceAll) {}
};

struct ReplaceResult {
  std::string content;
  StrategyName strategy;

  ReplaceResult(std::string c, StrategyName s) : content(std::move(c)), strategy(s) {}

  friend std::ostream& operator<<(std::ostream& os, const ReplaceResult& r) {
    return os << "ok(" << r.strategy << "): " << makePrintable(r.content);
  }
};

// The caller keeps its original content; nothing was applied.
struct ReplaceFailure {
  std::string message;

  explicit ReplaceFailure(std::string m) : message(std::move(m)) {}

  friend std::ostream& operator<<(std::ostream& os, const ReplaceFailure& f) {
    return os << "failure: " << makePrintable(f.message);
  }
};

using ReplaceOutcome = std::variant<ReplaceResult, ReplaceFailure>;

inline bool isOk(const ReplaceOutcome& outcome) {
  return std::holds_alternative<ReplaceResult>(outcome);
}

inline std::ostream& operator<<(std::ostream& os, const ReplaceOutcome& outcome) {
  std::visit([&os](const auto& alt) { os << alt; }, outcome);
  return os;
}
