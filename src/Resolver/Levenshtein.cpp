#include "Levenshtein.h"

#include <algorithm>

using namespace std;

Levenshtein::Levenshtein(string goal) : goal_(std::move(goal)) {
  // Distance from empty string to goal[0..j] is always j insertions
  baseRow_.resize(goal_.size() + 1);
  for (size_t j = 0; j <= goal_.size(); ++j) {
    baseRow_[j] = static_cast<int>(j);
  }
}

int Levenshtein::distance(string_view source) const {
  if (source == goal_) return 0;
  if (source.empty()) return static_cast<int>(goal_.size());
  if (goal_.empty()) return static_cast<int>(source.size());

  vector<int> prevRow = baseRow_;
  vector<int> currRow(goal_.size() + 1);

  for (size_t i = 0; i < source.size(); ++i) {
    // Cost to transform source[0..i] to empty goal: (i+1) deletions
    currRow[0] = static_cast<int>(i + 1);

    for (size_t j = 0; j < goal_.size(); ++j) {
      int deleteCost = prevRow[j + 1] + 1;  // Delete source[i]
      int insertCost = currRow[j] + 1;      // Insert goal[j]
      int replaceCost = prevRow[j] + (source[i] == goal_[j] ? 0 : 1);

      currRow[j + 1] = min({deleteCost, insertCost, replaceCost});
    }

    swap(prevRow, currRow);
  }

  return prevRow[goal_.size()];
}

double Levenshtein::similarity(string_view source) const {
  size_t longest = max({source.size(), goal_.size(), size_t{1}});
  return 1.0 - static_cast<double>(distance(source)) / static_cast<double>(longest);
}

int levenshtein(string_view a, string_view b) {
  return Levenshtein(string(b)).distance(a);
}

double similarity(string_view a, string_view b) {
  return Levenshtein(string(b)).similarity(a);
}
