#pragma once

#include <string>
#include <string_view>
#include <vector>

// -----------------------------------------------------------------------------
// Levenshtein Distance
// -----------------------------------------------------------------------------
//
// Unit cost for insertion, deletion and substitution, computed over bytes.
// Two rolling DP rows, O(|source| * |goal|) time and O(|goal|) memory.
//
// The class form fixes the goal so one search line can be compared against
// many candidate content lines without rebuilding the base row.
//
// -----------------------------------------------------------------------------

class Levenshtein {
public:
  explicit Levenshtein(std::string goal);

  // Compute Levenshtein distance from source to goal.
  int distance(std::string_view source) const;

  // 1 - distance / max(|source|, |goal|, 1), in [0, 1].
  double similarity(std::string_view source) const;

  const std::string& goal() const { return goal_; }

private:
  std::string goal_;
  std::vector<int> baseRow_;  // DP row for empty source string
};

int levenshtein(std::string_view a, std::string_view b);

double similarity(std::string_view a, std::string_view b);
