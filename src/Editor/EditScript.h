#pragma once

#include <filesystem>
#include <string>
#include <vector>

struct SearchReplaceBlock {
  std::string search;
  std::string replace;

  SearchReplaceBlock(std::string s, std::string r)
      : search(std::move(s)), replace(std::move(r)) {}
};

// One <edit path="..."> instruction: every block targets the same file and is
// applied in order.
struct EditAction {
  std::string path;
  bool replaceAll = false;
  std::vector<SearchReplaceBlock> blocks;
};

// Parse <edit> instructions out of free text. Tolerates the usual proposer
// slips: file= for path=, unquoted paths, chatter between tags, a truncated
// </edit, a stray </search> after </replace>. Edits without a path or without
// a complete search/replace pair are skipped.
std::vector<EditAction> parseEditScript(const std::string& text);

// Throws std::runtime_error when the file cannot be read.
std::vector<EditAction> loadEditScript(const std::filesystem::path& path);
