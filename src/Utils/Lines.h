#pragma once

#include <string>
#include <vector>

struct Lines : std::vector<std::string> {
  using std::vector<std::string>::vector;

  std::string flatten() const {
    std::string result;
    for (size_t i = 0; i < size(); i++) {
      if (i > 0)
        result += '\n';
      result += (*this)[i];
    }
    return result;
  }

  // Splits on '\n' only. "a\n" -> {"a", ""}, "" -> {""}.
  static Lines unflatten(const std::string& text) {
    Lines result;
    size_t start = 0;
    size_t pos;
    while ((pos = text.find('\n', start)) != std::string::npos) {
      result.push_back(text.substr(start, pos - start));
      start = pos + 1;
    }
    result.push_back(text.substr(start));
    return result;
  }

  // Byte offset at which each line of unflatten(text) starts.
  static std::vector<size_t> lineOffsets(const std::string& text) {
    std::vector<size_t> offsets{0};
    for (size_t i = 0; i < text.size(); i++) {
      if (text[i] == '\n') offsets.push_back(i + 1);
    }
    return offsets;
  }
};
