#pragma once

#include <string>

// Pure text transforms shared by the matchers. Every matcher works as
// "normalize both sides, then compare".
namespace Normalize {

// Trim each line, then drop fully blank lines at the start and end of the block.
std::string trimLines(const std::string& s);

// Runs of horizontal whitespace (spaces, tabs, '\r', '\f', '\v') inside a line
// become one space.
std::string collapseInternalWhitespace(const std::string& line);

// Leading whitespace only. Trailing whitespace is kept verbatim.
std::string stripLeadingIndent(const std::string& line);

// True when s contains a literal backslash escape: \n \t \r \\ \" \' \`
bool hasEscapeSequences(const std::string& s);

// Literal two-character escapes -> the characters they stand for.
// Unknown escapes (e.g. "\d") are left as written.
std::string decodeEscapes(const std::string& s);

// Trim leading/trailing whitespace, newlines included, of the whole block.
std::string trimBlock(const std::string& s);

} // namespace Normalize
