#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "EditScript.h"
#include "Resolver/Resolver.h"
#include "Resolver/StrategyName.h"

enum class EditStatus {
  Applied,
  AlreadyApplied,
  NoMatch,
  Error,
};

const char* editStatusName(EditStatus status);

struct EditResult {
  bool success = false;
  EditStatus status = EditStatus::Error;
  std::string path;
  std::string message;
  std::vector<StrategyName> strategies;  // one per applied block

  EditResult(bool success, EditStatus status, std::string path, std::string message)
      : success(success), status(status), path(std::move(path)), message(std::move(message)) {}
};

// Emitted after content actually changed on disk.
struct EditApplied {
  std::string path;
  std::string beforeContent;
  std::string afterContent;
};

// File layer around the resolver: reads content right before resolving,
// guards replacement text, writes the result and keeps per-file snapshots.
// Not synchronised; callers serialise edits to the same file.
class FileEditor {
public:
  explicit FileEditor(std::filesystem::path workDir = std::filesystem::current_path(),
                      Resolver resolver = Resolver());

  // Absolute, normalised path. Throws std::runtime_error when the path
  // escapes the working directory.
  std::filesystem::path resolvePath(const std::string& path) const;

  // Read a file and store its snapshot. Throws std::runtime_error on failure.
  std::string readFile(const std::string& path);

  std::optional<std::string> snapshot(const std::string& path) const;

  EditResult applySearchReplace(const std::string& path,
                                const std::vector<SearchReplaceBlock>& blocks,
                                bool replaceAll = false);

  EditResult applyEdit(const EditAction& action) {
    return applySearchReplace(action.path, action.blocks, action.replaceAll);
  }

  bool createFile(const std::string& path, const std::string& content);

  void setListener(std::function<void(const EditApplied&)> listener) {
    listener_ = std::move(listener);
  }

  // Resolve but never write
  void setDryRun(bool dryRun) { dryRun_ = dryRun; }

  const std::filesystem::path& workDir() const { return workDir_; }

private:
  std::filesystem::path workDir_;
  Resolver resolver_;
  std::unordered_map<std::string, std::string> snapshots_;
  std::function<void(const EditApplied&)> listener_;
  bool dryRun_ = false;
};

// Throws std::runtime_error when the file cannot be written.
void writeFileContent(const std::filesystem::path& path, const std::string& content);

// Throws std::runtime_error when the file cannot be read.
std::string readFileContent(const std::filesystem::path& path);
