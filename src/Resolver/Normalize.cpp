#include "Normalize.h"

#include <optional>

#include "Utils/Lines.h"
#include "Utils/StringUtils.h"

using namespace std;

namespace Normalize {

string trimLines(const string& s) {
  Lines lines = Lines::unflatten(s);
  for (auto& line : lines) {
    line = trim(line);
  }

  size_t first = 0;
  size_t last = lines.size();
  while (first < last && lines[first].empty()) first++;
  while (last > first && lines[last - 1].empty()) last--;

  return Lines(lines.begin() + first, lines.begin() + last).flatten();
}

string collapseInternalWhitespace(const string& line) {
  string result;
  result.reserve(line.size());
  bool inRun = false;
  for (char c : line) {
    if (isHorizontalSpace(c)) {
      if (!inRun) result += ' ';
      inRun = true;
    } else {
      result += c;
      inRun = false;
    }
  }
  return result;
}

string stripLeadingIndent(const string& line) {
  size_t i = 0;
  while (i < line.size() && isHorizontalSpace(line[i])) i++;
  return line.substr(i);
}

static optional<char> decodeEscape(char c) {
  switch (c) {
    case 'n': return '\n';
    case 't': return '\t';
    case 'r': return '\r';
    case '\\': return '\\';
    case '"': return '"';
    case '\'': return '\'';
    case '`': return '`';
    default: return nullopt;
  }
}

bool hasEscapeSequences(const string& s) {
  for (size_t i = 0; i + 1 < s.size(); i++) {
    if (s[i] == '\\' && decodeEscape(s[i + 1])) return true;
  }
  return false;
}

string decodeEscapes(const string& s) {
  string result;
  result.reserve(s.size());
  for (size_t i = 0; i < s.size(); i++) {
    if (s[i] == '\\' && i + 1 < s.size()) {
      if (auto decoded = decodeEscape(s[i + 1])) {
        result += *decoded;
        i++;
        continue;
      }
    }
    result += s[i];
  }
  return result;
}

string trimBlock(const string& s) {
  return trim(s);
}

} // namespace Normalize
