#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "EditRequest.h"
#include "ResolverParams.h"
#include "StrategyName.h"

// Half-open byte range [start, end) into EditRequest::content.
struct MatchSpan {
  size_t start;
  size_t end;

  MatchSpan(size_t s, size_t e) : start(s), end(e) {}

  bool operator==(const MatchSpan& other) const = default;
};

// Spans are sorted and non-overlapping. replacement, when set, is used instead
// of the request's replaceBlock (escape-normalized decodes it).
struct Matched {
  std::vector<MatchSpan> spans;
  std::optional<std::string> replacement;
};

// Declined: no candidate, or more than one where uniqueness is required.
struct Bail {
  std::string reason;
};

// Only the last stage reports this; the cascade is exhausted.
struct NotFound {};

using MatchOutcome = std::variant<Matched, Bail, NotFound>;

using MatchFn = MatchOutcome (*)(const EditRequest&, const ResolverParams&);

// Each matcher only reads the request; none of them mutate content.
namespace Strategies {

MatchOutcome exact(const EditRequest& req, const ResolverParams& params);
MatchOutcome lineTrimmed(const EditRequest& req, const ResolverParams& params);
MatchOutcome blockAnchor(const EditRequest& req, const ResolverParams& params);
MatchOutcome whitespaceNormalized(const EditRequest& req, const ResolverParams& params);
MatchOutcome indentationFlexible(const EditRequest& req, const ResolverParams& params);
MatchOutcome escapeNormalized(const EditRequest& req, const ResolverParams& params);
MatchOutcome trimmedBoundary(const EditRequest& req, const ResolverParams& params);
MatchOutcome contextAware(const EditRequest& req, const ResolverParams& params);
MatchOutcome multiOccurrence(const EditRequest& req, const ResolverParams& params);

// Splice the matched spans out of content.
std::string apply(const std::string& content, const Matched& match,
                  const std::string& replaceBlock);

} // namespace Strategies
