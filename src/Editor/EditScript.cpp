#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "EditScript.h"
#include "Utils/Debug.h"
#include "Utils/StringUtils.h"

using namespace std;

static string toLower(string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

// tag only when followed by whitespace, '>' or end ("<edit" but not "<editor")
static size_t findTag(const string& lower, const string& tag, size_t from) {
  size_t pos = from;
  while ((pos = lower.find(tag, pos)) != string::npos) {
    size_t after = pos + tag.size();
    if (after >= lower.size() || lower[after] == '>' || isSpace(lower[after])) {
      return pos;
    }
    pos = after;
  }
  return string::npos;
}

static size_t findEditOpen(const string& lower, size_t from) {
  return findTag(lower, "<edit", from);
}

static size_t findEditClose(const string& lower, size_t from) {
  return findTag(lower, "</edit", from);
}

// Parses name=value pairs of an opening tag into the action.
static void parseAttributes(const string& tag, EditAction& action) {
  size_t i = 0;
  while (i < tag.size()) {
    while (i < tag.size() && isSpace(tag[i])) i++;
    size_t nameStart = i;
    while (i < tag.size() && !isSpace(tag[i]) && tag[i] != '=') i++;
    string name = toLower(tag.substr(nameStart, i - nameStart));
    while (i < tag.size() && isSpace(tag[i])) i++;
    if (i >= tag.size() || tag[i] != '=') {
      if (name.empty()) i++;
      continue;
    }
    i++;
    while (i < tag.size() && isSpace(tag[i])) i++;

    string value;
    if (i < tag.size() && (tag[i] == '"' || tag[i] == '\'')) {
      char quote = tag[i++];
      size_t end = tag.find(quote, i);
      if (end == string::npos) end = tag.size();
      value = tag.substr(i, end - i);
      i = end + 1;
    } else {
      size_t valueStart = i;
      while (i < tag.size() && !isSpace(tag[i])) i++;
      value = tag.substr(valueStart, i - valueStart);
    }

    if (name == "path" || name == "file") {
      action.path = value;
    } else if (name == "replaceall" || name == "replace_all") {
      action.replaceAll = toLower(value) == "true";
    }
  }
}

static string stripTagNewlines(string body) {
  if (startsWith(body, "\r\n")) {
    body.erase(0, 2);
  } else if (startsWith(body, "\n")) {
    body.erase(0, 1);
  }
  if (!body.empty() && body.back() == '\n') {
    body.pop_back();
    if (!body.empty() && body.back() == '\r') body.pop_back();
  }
  return body;
}

// Search/replace pairs inside one edit body.
static vector<SearchReplaceBlock> parseBlocks(const string& body) {
  vector<SearchReplaceBlock> blocks;
  string lower = toLower(body);
  size_t pos = 0;

  while (true) {
    size_t searchOpen = lower.find("<search>", pos);
    if (searchOpen == string::npos) break;
    size_t searchStart = searchOpen + 8;
    size_t searchClose = lower.find("</search>", searchStart);
    if (searchClose == string::npos) break;

    size_t replaceOpen = lower.find("<replace>", searchClose);
    if (replaceOpen == string::npos) break;
    size_t replaceStart = replaceOpen + 9;
    // A replace body may be closed by </search> instead of </replace>
    size_t replaceClose = lower.find("</replace>", replaceStart);
    size_t closeLen = 10;
    size_t strayClose = lower.find("</search>", replaceStart);
    if (strayClose < replaceClose) {
      replaceClose = strayClose;
      closeLen = 9;
    }
    size_t next = replaceClose == string::npos ? body.size() : replaceClose + closeLen;
    if (replaceClose == string::npos) replaceClose = body.size();

    blocks.emplace_back(
        stripTagNewlines(body.substr(searchStart, searchClose - searchStart)),
        stripTagNewlines(body.substr(replaceStart, replaceClose - replaceStart)));
    pos = next;
  }
  return blocks;
}

vector<EditAction> parseEditScript(const string& text) {
  vector<EditAction> actions;
  string lower = toLower(text);
  size_t pos = 0;

  while ((pos = findEditOpen(lower, pos)) != string::npos) {
    size_t tagEnd = text.find('>', pos);
    if (tagEnd == string::npos) break;

    EditAction action;
    parseAttributes(text.substr(pos + 5, tagEnd - pos - 5), action);

    size_t bodyStart = tagEnd + 1;
    size_t bodyEnd = min(findEditClose(lower, bodyStart), findEditOpen(lower, bodyStart));
    if (bodyEnd == string::npos) bodyEnd = text.size();
    string body = text.substr(bodyStart, bodyEnd - bodyStart);

    // <edit>src/file.ts <search>...
    if (action.path.empty()) {
      size_t firstTag = body.find('<');
      action.path = trim(string_view(body).substr(0, firstTag == string::npos ? body.size() : firstTag));
    }

    action.blocks = parseBlocks(body);
    pos = bodyEnd;

    if (action.path.empty() || action.blocks.empty()) {
      debug("skipping edit: path =", action.path, "blocks =", action.blocks.size());
      continue;
    }
    actions.push_back(std::move(action));
  }
  return actions;
}

vector<EditAction> loadEditScript(const filesystem::path& path) {
  ifstream in(path, ios::binary);
  if (!in) throw runtime_error("Can't read edit script: " + path.string());

  ostringstream ss;
  ss << in.rdbuf();
  return parseEditScript(ss.str());
}
