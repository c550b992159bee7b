#pragma once

#include <optional>
#include <string>

// Pre-checks on replacement text before it reaches the resolver or the disk.
// A positive result means the proposer malfunctioned; the edit is refused.
namespace ContentGuard {

// At least three distinct raw instruction markers (<edit path=, </edit>, <end>,
// <bash>, <say>), case-insensitive.
bool hasActionTagCorruption(const std::string& text);

// Literal "\n" used as real line structure rather than inside a string literal
// or comment. Returns a short description of the pattern found.
std::optional<std::string> detectEscapedNewlineCorruption(const std::string& text);

// Blank out string literals and comments, keeping newlines and length.
std::string stripLiteralsAndComments(const std::string& text);

} // namespace ContentGuard
