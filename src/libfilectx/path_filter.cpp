// SPDX-License-Identifier: MIT
#include "filectx/path_filter.hpp"

#include <re2/re2.h>

#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include "logger.hpp"
#include "utils.hpp"

namespace xpto::filectx {

namespace fs = std::filesystem;

filter_rules default_filter_rules() {
  filter_rules rules{};
  rules.ignore_patterns = {
    "*.pyc", "__pycache__", ".git",  ".gitignore", "node_modules",
    ".vscode", ".idea",     "*.log", "*.tmp",      ".DS_Store",
    "venv",  ".env",        "*.so",  "*.dll",      "*.exe",
    "*.bin", "*.zip",       "*.tar.gz", "*.jpg",   "*.jpeg",
    "*.png", "*.gif",       "*.bmp", "*.ico",      "*.svg",
    "*.mp3", "*.mp4",       "*.avi", "*.mov",      "*.wav",
    "*.pdf"};

  rules.text_extensions = {
    ".py",     ".js",    ".ts",     ".jsx",        ".tsx",      ".html",
    ".css",    ".scss",  ".json",   ".xml",        ".yaml",     ".yml",
    ".md",     ".txt",   ".ini",    ".cfg",        ".conf",     ".sh",
    ".bat",    ".ps1",   ".sql",    ".r",          ".cpp",      ".c",
    ".h",      ".hpp",   ".java",   ".go",         ".rs",       ".php",
    ".rb",     ".swift", ".kt",     ".scala",      ".clj",      ".hs",
    ".elm",    ".dart",  ".vue",    ".svelte",     ".astro",    ".dockerfile",
    ".makefile", ".toml"};

  // Built-in subset of the usual extension map; /etc/mime.types adds more.
  rules.mime_types = {
    {".bat", "text/plain"},
    {".c", "text/plain"},
    {".css", "text/css"},
    {".csv", "text/csv"},
    {".etx", "text/x-setext"},
    {".h", "text/plain"},
    {".htm", "text/html"},
    {".html", "text/html"},
    {".ics", "text/calendar"},
    {".js", "text/javascript"},
    {".ksh", "text/plain"},
    {".markdown", "text/markdown"},
    {".md", "text/markdown"},
    {".mjs", "text/javascript"},
    {".pl", "text/plain"},
    {".py", "text/x-python"},
    {".rtx", "text/richtext"},
    {".sgm", "text/x-sgml"},
    {".sgml", "text/x-sgml"},
    {".text", "text/plain"},
    {".tsv", "text/tab-separated-values"},
    {".txt", "text/plain"},
    {".vcf", "text/x-vcard"},
    {".xml", "text/xml"},
    {".gif", "image/gif"},
    {".jpg", "image/jpeg"},
    {".json", "application/json"},
    {".pdf", "application/pdf"},
    {".png", "image/png"},
    {".tar", "application/x-tar"},
    {".wasm", "application/wasm"},
    {".zip", "application/zip"},
  };
  return rules;
}

std::optional<std::size_t> load_mime_types(
    const fs::path& file, filter_rules& rules) {
  std::ifstream in{file};
  if (!in) {
    LOG_WARN("Can't open MIME table {}", file);
    return std::nullopt;
  }

  std::size_t count{0};
  std::string line;
  while (std::getline(in, line)) {
    if (auto hash = line.find('#'); hash != std::string::npos)
      line.erase(hash);

    std::istringstream words{line};
    std::string type;
    if (!(words >> type)) continue;

    std::string ext;
    while (words >> ext) {
      rules.mime_types["." + ext] = type;
      ++count;
    }
  }
  LOG_DEBUG("Loaded {} extensions from {}", count, file);
  return count;
}

std::string glob_to_regex(std::string_view glob) {
  std::string res;
  std::size_t i{0};
  const std::size_t n{glob.size()};

  while (i < n) {
    char c = glob[i++];
    if (c == '*') {
      res += ".*";
    } else if (c == '?') {
      res += '.';
    } else if (c == '[') {
      // Find the closing bracket; a ']' right after '[' or '[!' is literal
      std::size_t j{i};
      if (j < n && glob[j] == '!') ++j;
      if (j < n && glob[j] == ']') ++j;
      while (j < n && glob[j] != ']') ++j;
      if (j >= n) {
        res += "\\[";
        continue;
      }
      std::string_view stuff{glob.substr(i, j - i)};
      i = j + 1;
      res += '[';
      if (stuff.front() == '!') {
        res += '^';
        stuff.remove_prefix(1);
      } else if (stuff.front() == '^') {
        res += '\\';
      }
      for (char s : stuff) {
        if (s == '\\' || s == '[') res += '\\';
        res += s;
      }
      res += ']';
    } else {
      res += RE2::QuoteMeta(std::string(1, c));
    }
  }
  return res;
}

/// path_filter

path_filter::path_filter(filter_rules rules) : rules_{std::move(rules)} {
  RE2::Options opts{};
  opts.set_encoding(RE2::Options::EncodingLatin1);  // paths are bytes
  opts.set_dot_nl(true);
  opts.set_log_errors(false);

  ignore_res_.reserve(rules_.ignore_patterns.size());
  for (const auto& pattern : rules_.ignore_patterns) {
    auto re = std::make_unique<RE2>(glob_to_regex(pattern), opts);
    if (!re->ok())
      utils::throwf("Invalid ignore pattern '{}': {}", pattern, re->error());
    ignore_res_.push_back(std::move(re));
  }
}

path_filter::path_filter(path_filter&&) noexcept = default;
path_filter& path_filter::operator=(path_filter&&) noexcept = default;
path_filter::~path_filter() = default;

bool path_filter::matches_any(const std::string& text) const {
  for (const auto& re : ignore_res_) {
    if (RE2::FullMatch(text, *re)) return true;
  }
  return false;
}

bool path_filter::should_ignore(const fs::path& path) const {
  return matches_any(path.string()) || matches_any(path.filename().string());
}

std::optional<std::string> path_filter::mime_type(const fs::path& path) const {
  auto ext = path.extension().string();
  if (ext.empty()) return std::nullopt;

  if (auto it = rules_.mime_types.find(ext); it != rules_.mime_types.end())
    return it->second;
  if (auto it = rules_.mime_types.find(utils::to_lower(ext));
      it != rules_.mime_types.end())
    return it->second;
  return std::nullopt;
}

bool path_filter::is_text(const fs::path& path) const {
  if (rules_.text_extensions.contains(
          utils::to_lower(path.extension().string())))
    return true;

  auto mime = mime_type(path);
  return mime && mime->starts_with("text/");
}

bool path_filter::admits(
    const fs::path& root, const fs::path& relative_path) const {
  fs::path dir{root};
  for (const auto& component : relative_path.parent_path()) {
    dir /= component;
    if (should_ignore(dir)) {
      LOG_TRACE("{} is inside ignored directory {}", relative_path, dir);
      return false;
    }
  }
  auto full = root / relative_path;
  return !should_ignore(full) && is_text(full);
}

}  // namespace xpto::filectx
