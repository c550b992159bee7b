#include <filesystem>
#include <stdexcept>

#include "CommandLine.h"
#include "Editor/EditScript.h"
#include "Editor/FileEditor.h"
#include "Utils/Debug.h"

using namespace std;
namespace fs = std::filesystem;

static int usage(ostream& err) {
  err << "usage: fuzzypatch [--workdir DIR] [--dry-run] [--debug] <edit-script>\n"
      << "       fuzzypatch [--workdir DIR] [--dry-run] [--debug] [--replace-all]"
      << " --inline <file> <search-file> <replace-file>\n";
  return 2;
}

static void printResult(ostream& out, const EditResult& r) {
  if (!r.success) {
    out << editStatusName(r.status) << " " << r.message << endl;
    return;
  }
  out << editStatusName(r.status) << " " << r.path;
  for (StrategyName s : r.strategies) {
    out << " " << s;
  }
  out << endl;
}

int runCommandLine(const vector<string>& args, ostream& out, ostream& err) {
  fs::path workDir = fs::current_path();
  bool dryRun = false;
  bool dumpDebug = false;
  bool replaceAll = false;
  bool inlineMode = false;
  vector<string> positional;

  for (size_t i = 0; i < args.size(); i++) {
    const string& arg = args[i];
    if (arg == "--workdir") {
      if (++i >= args.size()) return usage(err);
      workDir = args[i];
    } else if (arg == "--dry-run") {
      dryRun = true;
    } else if (arg == "--debug") {
      dumpDebug = true;
    } else if (arg == "--replace-all") {
      replaceAll = true;
    } else if (arg == "--inline") {
      inlineMode = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      return usage(err);
    } else {
      positional.push_back(arg);
    }
  }

  if (inlineMode ? positional.size() != 3 : positional.size() != 1) {
    return usage(err);
  }

  int exitCode = 0;
  try {
    FileEditor editor(workDir);
    editor.setDryRun(dryRun);

    vector<EditAction> actions;
    if (inlineMode) {
      EditAction action;
      action.path = positional[0];
      action.replaceAll = replaceAll;
      action.blocks.emplace_back(readFileContent(positional[1]), readFileContent(positional[2]));
      actions.push_back(std::move(action));
    } else {
      actions = loadEditScript(positional[0]);
      if (actions.empty()) {
        err << "no edits found in " << positional[0] << endl;
        exitCode = 1;
      }
    }

    for (const auto& action : actions) {
      EditResult r = editor.applyEdit(action);
      printResult(out, r);
      if (!r.success) exitCode = 1;
    }
  } catch (const runtime_error& e) {
    err << e.what() << endl;
    exitCode = 1;
  }

  if (dumpDebug) {
    err << take_debug_output();
  }
  return exitCode;
}
