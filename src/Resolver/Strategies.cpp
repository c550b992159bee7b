// The nine matchers of the cascade, strictest first.
//
// Line-oriented matchers normalize every content line and every search line
// the same way, then look for the search lines as a contiguous run. A run is
// mapped back to a byte span over the untouched content, so bytes outside the
// span are never rewritten.

#include "Strategies.h"

#include <algorithm>

#include "Levenshtein.h"
#include "Normalize.h"
#include "Utils/Debug.h"
#include "Utils/Lines.h"
#include "Utils/StringUtils.h"

using namespace std;

namespace {

// A terminating newline on the search block is not a line of its own.
Lines searchLinesOf(const string& search) {
  Lines lines = Lines::unflatten(search);
  if (lines.size() > 1 && lines.back().empty()) {
    lines.pop_back();
  }
  return lines;
}

// Byte span of content lines [first, first + count)
MatchSpan lineSpan(const Lines& lines, const vector<size_t>& offsets,
                   size_t first, size_t count) {
  size_t last = first + count - 1;
  size_t end = offsets[last] + lines[last].size();
  // CRLF: leave the '\r' with the line terminator
  if (!lines[last].empty() && lines[last].back() == '\r') {
    end--;
  }
  return MatchSpan(offsets[first], end);
}

vector<MatchSpan> occurrenceSpans(const string& content, const string& needle) {
  vector<MatchSpan> spans;
  if (needle.empty()) return spans;
  size_t pos = 0;
  while ((pos = content.find(needle, pos)) != string::npos) {
    spans.emplace_back(pos, pos + needle.size());
    pos += needle.size();
  }
  return spans;
}

// Whitespace-only blocks would match any blank line; only exact text may place them.
bool isBlank(const Lines& lines) {
  return all_of(lines.begin(), lines.end(),
                [](const string& line) { return trim(line).empty(); });
}

template <typename Normalizer>
Lines normalizeAll(const Lines& lines, Normalizer normalize) {
  Lines result;
  result.reserve(lines.size());
  for (const auto& line : lines) {
    result.push_back(normalize(line));
  }
  return result;
}

// CRLF: the '\r' belongs to the line terminator, not the line
string withoutCarriageReturn(const string& line) {
  if (!line.empty() && line.back() == '\r') {
    return line.substr(0, line.size() - 1);
  }
  return line;
}

// Unique run of search lines among content lines, both sides normalized.
template <typename Normalizer>
MatchOutcome uniqueLineMatch(const string& content, const Lines& searchLines,
                             Normalizer normalize) {
  Lines contentLines = Lines::unflatten(content);
  size_t n = searchLines.size();
  if (isBlank(searchLines)) return Bail{"search block is blank"};
  if (n > contentLines.size()) return Bail{"search block longer than content"};

  auto normalizeLine = [&normalize](const string& line) {
    return normalize(withoutCarriageReturn(line));
  };
  Lines normSearch = normalizeAll(searchLines, normalizeLine);
  Lines normContent = normalizeAll(contentLines, normalizeLine);

  vector<size_t> starts;
  for (size_t i = 0; i + n <= normContent.size(); i++) {
    if (equal(normSearch.begin(), normSearch.end(), normContent.begin() + i)) {
      starts.push_back(i);
    }
  }

  if (starts.empty()) return Bail{"no matching line run"};
  if (starts.size() > 1) {
    return Bail{to_string(starts.size()) + " matching line runs"};
  }

  vector<size_t> offsets = Lines::lineOffsets(content);
  return Matched{{lineSpan(contentLines, offsets, starts[0], n)}, nullopt};
}

string trimLine(const string& line) {
  return trim(line);
}

// Anchored candidates for block-anchor and context-aware: blocks of the same
// line count whose trimmed first and last lines equal the search anchors.
struct AnchorScan {
  Lines searchLines;
  Lines contentLines;
  Lines trimmedContent;
  vector<size_t> offsets;
  vector<Levenshtein> interior;  // trimmed interior search lines as goals
  vector<size_t> candidates;     // starting content line of each anchored block

  explicit AnchorScan(const EditRequest& req)
      : searchLines(searchLinesOf(req.searchBlock)),
        contentLines(Lines::unflatten(req.content)),
        trimmedContent(normalizeAll(contentLines, trimLine)),
        offsets(Lines::lineOffsets(req.content)) {
    size_t n = searchLines.size();
    if (n < 2 || n > contentLines.size() || isBlank(searchLines)) return;

    for (size_t k = 1; k + 1 < n; k++) {
      interior.emplace_back(trim(searchLines[k]));
    }

    string first = trim(searchLines.front());
    string last = trim(searchLines.back());
    for (size_t i = 0; i + n <= trimmedContent.size(); i++) {
      if (trimmedContent[i] == first && trimmedContent[i + n - 1] == last) {
        candidates.push_back(i);
      }
    }
  }

  // Similarity of interior line k (0-based, excluding the anchor) of the block
  // starting at content line `start`. Two blank lines are identical.
  double interiorSimilarity(size_t start, size_t k) const {
    const string& line = trimmedContent[start + 1 + k];
    if (line.empty() && interior[k].goal().empty()) return 1.0;
    return interior[k].similarity(line);
  }

  MatchSpan span(size_t start) const {
    return lineSpan(contentLines, offsets, start, searchLines.size());
  }
};

} // namespace

namespace Strategies {

MatchOutcome exact(const EditRequest& req, const ResolverParams&) {
  if (req.searchBlock.empty()) return Bail{"empty search block"};

  vector<MatchSpan> spans = occurrenceSpans(req.content, req.searchBlock);
  if (spans.empty()) return Bail{"no exact occurrence"};
  if (req.replaceAll || spans.size() == 1) {
    return Matched{std::move(spans), nullopt};
  }
  // Duplicates are left to multi-occurrence at the end of the cascade
  return Bail{to_string(spans.size()) + " exact occurrences"};
}

MatchOutcome lineTrimmed(const EditRequest& req, const ResolverParams&) {
  string trimmedSearch = Normalize::trimLines(req.searchBlock);
  if (trimmedSearch.empty()) return Bail{"search block is blank"};
  return uniqueLineMatch(req.content, Lines::unflatten(trimmedSearch), trimLine);
}

MatchOutcome blockAnchor(const EditRequest& req, const ResolverParams& params) {
  AnchorScan scan(req);
  size_t n = scan.searchLines.size();
  if (n < 3) return Bail{"fewer than 3 search lines"};
  if (scan.candidates.size() != 1) {
    return Bail{to_string(scan.candidates.size()) + " anchored blocks"};
  }

  size_t start = scan.candidates[0];
  double total = 0.0;
  for (size_t k = 0; k < scan.interior.size(); k++) {
    total += scan.interiorSimilarity(start, k);
  }
  double mean = total / static_cast<double>(scan.interior.size());
  if (mean < params.blockAnchorSimilarity) {
    return Bail{"interior similarity " + to_string(mean) + " below threshold"};
  }

  return Matched{{scan.span(start)}, nullopt};
}

MatchOutcome whitespaceNormalized(const EditRequest& req, const ResolverParams&) {
  return uniqueLineMatch(req.content, searchLinesOf(req.searchBlock),
                         Normalize::collapseInternalWhitespace);
}

MatchOutcome indentationFlexible(const EditRequest& req, const ResolverParams&) {
  return uniqueLineMatch(req.content, searchLinesOf(req.searchBlock),
                         Normalize::stripLeadingIndent);
}

MatchOutcome escapeNormalized(const EditRequest& req, const ResolverParams&) {
  // Plain text never reaches the decoded comparison
  if (!Normalize::hasEscapeSequences(req.searchBlock)) {
    return Bail{"no escape sequences"};
  }

  string decoded = Normalize::decodeEscapes(req.searchBlock);
  vector<MatchSpan> spans = occurrenceSpans(req.content, decoded);
  if (spans.size() != 1) {
    return Bail{to_string(spans.size()) + " decoded occurrences"};
  }
  return Matched{std::move(spans), Normalize::decodeEscapes(req.replaceBlock)};
}

MatchOutcome trimmedBoundary(const EditRequest& req, const ResolverParams&) {
  string trimmed = Normalize::trimBlock(req.searchBlock);
  if (trimmed == req.searchBlock) return Bail{"nothing to trim"};
  if (trimmed.empty()) return Bail{"search block is blank"};

  vector<MatchSpan> spans = occurrenceSpans(req.content, trimmed);
  if (spans.size() != 1) {
    return Bail{to_string(spans.size()) + " trimmed occurrences"};
  }
  return Matched{std::move(spans), nullopt};
}

MatchOutcome contextAware(const EditRequest& req, const ResolverParams& params) {
  AnchorScan scan(req);
  if (scan.searchLines.size() < 2) return Bail{"fewer than 2 search lines"};

  vector<size_t> accepted;
  for (size_t start : scan.candidates) {
    size_t interiorCount = scan.interior.size();
    size_t similar = 0;
    for (size_t k = 0; k < interiorCount; k++) {
      if (scan.interiorSimilarity(start, k) >= params.contextSimilarityThreshold) {
        similar++;
      }
    }
    // No interior: anchors alone decide
    if (static_cast<double>(similar) >=
        params.contextMatchRatio * static_cast<double>(interiorCount)) {
      accepted.push_back(start);
    }
  }

  debug("context-aware:", scan.candidates.size(), "anchored,", accepted.size(), "accepted");
  if (accepted.size() != 1) {
    return Bail{to_string(accepted.size()) + " similar anchored blocks"};
  }
  return Matched{{scan.span(accepted[0])}, nullopt};
}

MatchOutcome multiOccurrence(const EditRequest& req, const ResolverParams&) {
  vector<MatchSpan> spans = occurrenceSpans(req.content, req.searchBlock);
  if (spans.empty()) return NotFound{};
  return Matched{std::move(spans), nullopt};
}

string apply(const string& content, const Matched& match, const string& replaceBlock) {
  const string& replacement = match.replacement ? *match.replacement : replaceBlock;

  string result;
  result.reserve(content.size() + match.spans.size() * replacement.size());
  size_t prev = 0;
  for (const auto& span : match.spans) {
    result.append(content, prev, span.start - prev);
    result += replacement;
    prev = span.end;
  }
  result.append(content, prev, string::npos);
  return result;
}

} // namespace Strategies
