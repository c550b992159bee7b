#include "ContentGuard.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

#include "Utils/StringUtils.h"

using namespace std;

namespace {

string toLower(const string& s) {
  string result = s;
  transform(result.begin(), result.end(), result.begin(),
            [](unsigned char c) { return static_cast<char>(tolower(c)); });
  return result;
}

bool isWordChar(char c) {
  return isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// <edit\s+path\s*=
bool hasEditPathTag(const string& lower) {
  size_t pos = 0;
  while ((pos = lower.find("<edit", pos)) != string::npos) {
    size_t i = pos + 5;
    size_t ws = i;
    while (i < lower.size() && isSpace(lower[i])) i++;
    if (i > ws && lower.compare(i, 4, "path") == 0) {
      i += 4;
      while (i < lower.size() && isSpace(lower[i])) i++;
      if (i < lower.size() && lower[i] == '=') return true;
    }
    pos++;
  }
  return false;
}

size_t skipHorizontal(const string& s, size_t i) {
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) i++;
  return i;
}

bool literalNewlineAt(const string& s, size_t i) {
  return i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'n';
}

constexpr array<string_view, 11> STATEMENT_KEYWORDS = {
  "const", "let", "var", "if", "for", "while", "return",
  "function", "class", "import", "export",
};

enum class ScanState { Code, Single, Double, Template, LineComment, BlockComment };

} // namespace

namespace ContentGuard {

bool hasActionTagCorruption(const string& text) {
  string lower = toLower(text);
  int count = hasEditPathTag(lower) ? 1 : 0;
  for (const char* tag : {"</edit>", "<end>", "<bash>", "<say>"}) {
    if (lower.find(tag) != string::npos) count++;
  }
  return count >= 3;
}

string stripLiteralsAndComments(const string& text) {
  string out;
  out.reserve(text.size());
  ScanState state = ScanState::Code;
  size_t i = 0;

  auto blank = [&out](char c) { out += c == '\n' ? '\n' : ' '; };

  while (i < text.size()) {
    char ch = text[i];
    bool hasNext = i + 1 < text.size();
    char next = hasNext ? text[i + 1] : '\0';

    switch (state) {
      case ScanState::Code:
        if (ch == '\'' && hasNext) {
          state = ScanState::Single;
        } else if (ch == '"') {
          state = ScanState::Double;
        } else if (ch == '`') {
          state = ScanState::Template;
        } else if (ch == '/' && next == '/') {
          state = ScanState::LineComment;
          out += "  ";
          i += 2;
          continue;
        } else if (ch == '/' && next == '*') {
          state = ScanState::BlockComment;
          out += "  ";
          i += 2;
          continue;
        } else {
          out += ch;
          i++;
          continue;
        }
        out += ' ';
        i++;
        continue;

      case ScanState::Single:
      case ScanState::Double:
      case ScanState::Template: {
        char quote = state == ScanState::Single ? '\'' : state == ScanState::Double ? '"' : '`';
        if (ch == '\\') {
          out += hasNext ? "  " : " ";
          i += 2;
          continue;
        }
        if (ch == quote) {
          state = ScanState::Code;
          out += ' ';
        } else {
          blank(ch);
        }
        i++;
        continue;
      }

      case ScanState::LineComment:
        if (ch == '\n') state = ScanState::Code;
        blank(ch);
        i++;
        continue;

      case ScanState::BlockComment:
        if (ch == '*' && next == '/') {
          state = ScanState::Code;
          out += "  ";
          i += 2;
          continue;
        }
        blank(ch);
        i++;
        continue;
    }
  }

  return out;
}

optional<string> detectEscapedNewlineCorruption(const string& text) {
  if (text.find("\\n") == string::npos) {
    return nullopt;
  }

  string structural = stripLiteralsAndComments(text);

  int withIndent = 0;
  int chained = 0;
  int beforeKeyword = 0;

  for (size_t i = 0; i < structural.size(); i++) {
    if (!literalNewlineAt(structural, i)) continue;

    // \n followed by 2+ spaces/tabs and a non-space
    size_t after = skipHorizontal(structural, i + 2);
    if (after - (i + 2) >= 2 && after < structural.size() && !isSpace(structural[after])) {
      withIndent++;
    }

    // \n [ \t]* keyword\b
    for (string_view kw : STATEMENT_KEYWORDS) {
      if (structural.compare(after, kw.size(), kw) == 0) {
        size_t end = after + kw.size();
        if (end >= structural.size() || !isWordChar(structural[end])) {
          beforeKeyword++;
          break;
        }
      }
    }
  }

  // Runs of three or more \n separated only by horizontal whitespace
  for (size_t i = 0; i < structural.size();) {
    if (!literalNewlineAt(structural, i)) {
      i++;
      continue;
    }
    int run = 0;
    size_t j = i;
    while (literalNewlineAt(structural, j)) {
      run++;
      j = skipHorizontal(structural, j + 2);
    }
    if (run >= 3) chained++;
    i = j;
  }

  if (withIndent >= 2) {
    return "literal \"\\n\" used for structural line breaks/indentation";
  }
  if (chained > 0) {
    return "multiple chained literal \"\\n\" sequences detected";
  }
  if (beforeKeyword >= 2) {
    return "literal \"\\n\" used between code statements";
  }
  return nullopt;
}

} // namespace ContentGuard
