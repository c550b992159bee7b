// SINGLE SOURCE OF TRUTH for the cascade order. Earlier entries win.
// Format: X(EnumName, StringName)

#define FUZZYPATCH_STRATEGIES(X) \
    X(Exact, "exact") \
    X(LineTrimmed, "line-trimmed") \
    X(BlockAnchor, "block-anchor") \
    X(WhitespaceNormalized, "whitespace-normalized") \
    X(IndentationFlexible, "indentation-flexible") \
    X(EscapeNormalized, "escape-normalized") \
    X(TrimmedBoundary, "trimmed-boundary") \
    X(ContextAware, "context-aware") \
    X(MultiOccurrence, "multi-occurrence")
