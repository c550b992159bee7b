#include "FileEditor.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "ContentGuard.h"
#include "Utils/Debug.h"

using namespace std;
namespace fs = std::filesystem;

const char* editStatusName(EditStatus status) {
  switch (status) {
    case EditStatus::Applied: return "applied";
    case EditStatus::AlreadyApplied: return "already_applied";
    case EditStatus::NoMatch: return "no_match";
    case EditStatus::Error: return "error";
  }
  return "error";
}

string readFileContent(const fs::path& path) {
  ifstream in(path, ios::binary);
  if (!in) throw runtime_error("Can't read " + path.string());
  ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void writeFileContent(const fs::path& path, const string& content) {
  ofstream out(path, ios::binary | ios::trunc);
  if (!out) throw runtime_error("Can't write " + path.string());
  out << content;
  out.flush();
  if (!out) throw runtime_error("Write failed: " + path.string());
}

FileEditor::FileEditor(fs::path workDir, Resolver resolver)
    : workDir_(fs::absolute(workDir).lexically_normal()),
      resolver_(std::move(resolver)) {}

fs::path FileEditor::resolvePath(const string& path) const {
  fs::path p(path);
  fs::path full = (p.is_absolute() ? p : workDir_ / p).lexically_normal();

  fs::path rel = full.lexically_relative(workDir_);
  if (rel.empty() || *rel.begin() == "..") {
    throw runtime_error("Path outside working directory: " + path);
  }
  return full;
}

string FileEditor::readFile(const string& path) {
  fs::path full = resolvePath(path);
  string content = readFileContent(full);
  snapshots_[full.string()] = content;
  return content;
}

optional<string> FileEditor::snapshot(const string& path) const {
  auto it = snapshots_.find(resolvePath(path).string());
  if (it == snapshots_.end()) return nullopt;
  return it->second;
}

EditResult FileEditor::applySearchReplace(const string& path,
                                          const vector<SearchReplaceBlock>& blocks,
                                          bool replaceAll) {
  if (blocks.empty()) {
    return EditResult(false, EditStatus::Error, path, "No search/replace blocks provided");
  }

  fs::path full;
  try {
    full = resolvePath(path);
  } catch (const runtime_error& e) {
    return EditResult(false, EditStatus::Error, path, e.what());
  }
  if (!fs::is_regular_file(full)) {
    return EditResult(false, EditStatus::Error, path, "File not found: " + path);
  }

  for (const auto& block : blocks) {
    if (ContentGuard::hasActionTagCorruption(block.replace)) {
      return EditResult(false, EditStatus::Error, path,
                        path + ": Blocked corrupted edit: replace block contains raw action tags");
    }
  }

  // Read immediately before resolving so the match never runs on stale text
  const string original = readFileContent(full);
  string content = original;
  vector<StrategyName> strategies;

  for (const auto& block : blocks) {
    ReplaceOutcome outcome =
        resolver_.replace(EditRequest(content, block.search, block.replace, replaceAll));

    if (auto* failure = get_if<ReplaceFailure>(&outcome)) {
      debug("no match:", path);
      return EditResult(false, EditStatus::NoMatch, path, path + ": " + failure->message);
    }

    auto& result = get<ReplaceResult>(outcome);
    strategies.push_back(result.strategy);
    content = std::move(result.content);
  }

  if (content == original) {
    debug("already applied:", path);
    EditResult res(true, EditStatus::AlreadyApplied, path, "Edit already applied");
    res.strategies = std::move(strategies);
    return res;
  }

  if (!dryRun_) {
    writeFileContent(full, content);
    snapshots_[full.string()] = content;
    if (listener_) {
      listener_(EditApplied{path, original, content});
    }
  }

  debug("modified:", path, dryRun_ ? "(dry run)" : "");
  EditResult res(true, EditStatus::Applied, path, "Modified: " + path);
  res.strategies = std::move(strategies);
  return res;
}

bool FileEditor::createFile(const string& path, const string& content) {
  if (ContentGuard::hasActionTagCorruption(content)) {
    debug("blocked create, raw action tags:", path);
    return false;
  }
  if (auto reason = ContentGuard::detectEscapedNewlineCorruption(content)) {
    debug("blocked create:", path, *reason);
    return false;
  }

  fs::path full;
  try {
    full = resolvePath(path);
  } catch (const runtime_error& e) {
    debug(e.what());
    return false;
  }

  if (!dryRun_) {
    if (full.has_parent_path()) {
      fs::create_directories(full.parent_path());
    }
    writeFileContent(full, content);
  }
  snapshots_[full.string()] = content;
  return true;
}
