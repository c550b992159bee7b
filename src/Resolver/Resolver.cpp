#include "Resolver.h"

#include <algorithm>
#include <sstream>

#include "Utils/Debug.h"
#include "Utils/Lines.h"
#include "Utils/StringUtils.h"

using namespace std;

ReplaceOutcome Resolver::replace(const EditRequest& req,
                                 const optional<ResolverParams>& paramsOverride) const {
  ResolverParams params = ResolverParams::merge(defaultParams, paramsOverride);

  debug("resolve:", makePrintable(req.searchBlock), "replaceAll =", req.replaceAll);

  if (req.searchBlock.empty()) {
    debug("  empty search block");
    return ReplaceFailure(notFoundMessage(req.searchBlock, params.previewLines));
  }

  for (const auto& entry : STRATEGIES) {
    MatchOutcome outcome = entry.match(req, params);

    if (auto* matched = get_if<Matched>(&outcome)) {
      debug("  matched by", entry.name, "spans =", matched->spans.size());
      return ReplaceResult(Strategies::apply(req.content, *matched, req.replaceBlock),
                           entry.name);
    }
    if (auto* bail = get_if<Bail>(&outcome)) {
      debug("  bail", entry.name, "-", bail->reason);
      continue;
    }
    debug("  not found after", entry.name);
    break;
  }

  return ReplaceFailure(notFoundMessage(req.searchBlock, params.previewLines));
}

MatchOutcome Resolver::tryStrategy(StrategyName name, const EditRequest& req,
                                   const optional<ResolverParams>& paramsOverride) const {
  ResolverParams params = ResolverParams::merge(defaultParams, paramsOverride);
  for (const auto& entry : STRATEGIES) {
    if (entry.name == name) return entry.match(req, params);
  }
  return Bail{"unknown strategy"};
}

ReplaceOutcome replace(const string& content, const string& searchBlock,
                       const string& replaceBlock, bool replaceAll) {
  static const Resolver resolver;
  return resolver.replace(EditRequest(content, searchBlock, replaceBlock, replaceAll));
}

string notFoundMessage(const string& searchBlock, int previewLines) {
  Lines lines = Lines::unflatten(searchBlock);
  size_t shown = min(lines.size(), static_cast<size_t>(max(previewLines, 0)));

  ostringstream oss;
  oss << "Search block not found in content. Search block preview:";
  for (size_t i = 0; i < shown; i++) {
    oss << '\n' << lines[i];
  }
  if (lines.size() > shown) {
    oss << "\n... (" << lines.size() - shown << " more lines)";
  }
  return oss.str();
}
