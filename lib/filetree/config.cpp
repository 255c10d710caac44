/**
 * @file config.cpp
 * @brief Implementation of environment and ignore-file configuration loading
 */

#include "config.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace {

// Boolean variables use two different conventions: INCLUDE_HIDDEN is on
// unless explicitly switched off, READ_BINARY is off unless switched on.
bool isFalseWord(const std::string &value) {
  return value == "0" || value == "false" || value == "False";
}

bool isTrueWord(const std::string &value) {
  return value == "1" || value == "true" || value == "True";
}

} // namespace

std::vector<std::string> Config::defaultExcludes() {
  return {".git", "node_modules", "__pycache__", ".venv", ".mypy_cache"};
}

std::optional<std::string> Config::systemEnvironment(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr)
    return std::nullopt;
  return std::string(value);
}

/**
 * @brief Builds a configuration from environment variables
 *
 * Every variable is optional. Colour names are trimmed and lower-cased, icon
 * strings are taken verbatim. EXCLUDES is a comma separated list; when it is
 * set it replaces the defaults entirely, so an empty EXCLUDES disables
 * pattern exclusion.
 *
 * @param lookup Variable reader
 * @return Config Unfinalized configuration
 *
 * @throws ConfigError for a malformed MAX_BYTES
 */
Config Config::fromEnvironment(const EnvLookup &lookup) {
  Config config;

  if (auto v = lookup("ROOT_DIR"))
    config.root = *v;
  if (auto v = lookup("OUTPUT"))
    config.output_file = *v;
  if (auto v = lookup("EXCLUDES"))
    config.excludes = splitList(*v);
  if (auto v = lookup("INCLUDE_HIDDEN"))
    config.include_hidden = !isFalseWord(*v);
  if (auto v = lookup("MAX_BYTES"))
    config.max_bytes = parseByteLimit(*v, "MAX_BYTES");
  if (auto v = lookup("READ_BINARY"))
    config.read_binary = isTrueWord(*v);

  if (auto v = lookup("SELECT_COLOR"))
    config.select_color = toLower(trim(*v));
  if (auto v = lookup("UNSELECT_COLOR"))
    config.unselect_color = toLower(trim(*v));
  if (auto v = lookup("ICON_SELECTED"))
    config.icon_selected = *v;
  if (auto v = lookup("ICON_UNSELECTED"))
    config.icon_unselected = *v;
  if (auto v = lookup("ICON_MIXED"))
    config.icon_mixed = *v;

  if (auto v = lookup("LOG_FILE"))
    config.log_file = *v;
  if (auto v = lookup("LOG_LEVEL"))
    config.log_level = toLower(trim(*v));

  return config;
}

/**
 * @brief Resolves the root directory and loads the ignore file
 *
 * Steps:
 * 1. Make root absolute
 * 2. Fail with ConfigError if it is missing or not a directory
 * 3. Canonicalize (resolves symlinks and "..")
 * 4. Append patterns from root/.filetreeignore
 *
 * @throws ConfigError if the root directory is unusable
 */
void Config::finalize() {
  namespace fs = std::filesystem;
  std::error_code ec;

  fs::path absolute = fs::absolute(root, ec);
  if (ec)
    throw ConfigError("Cannot resolve root directory " + root.string() +
                      ": " + ec.message());

  if (!fs::exists(absolute, ec))
    throw ConfigError("Root directory does not exist: " + absolute.string());

  if (!fs::is_directory(absolute, ec))
    throw ConfigError("Root is not a directory: " + absolute.string());

  fs::path canonical = fs::canonical(absolute, ec);
  root = ec ? absolute.lexically_normal() : canonical;

  auto extra = readIgnoreFile(root / IGNORE_FILE_NAME);
  if (!extra.empty()) {
    spdlog::debug("Loaded {} pattern(s) from {}", extra.size(),
                  (root / IGNORE_FILE_NAME).string());
  }
  excludes.insert(excludes.end(), extra.begin(), extra.end());
}

std::size_t parseByteLimit(const std::string &text, const std::string &source) {
  std::string value = trim(text);
  if (value.empty() ||
      !std::all_of(value.begin(), value.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw ConfigError(source + " must be a non-negative integer, got '" +
                      text + "'");
  }

  try {
    unsigned long long parsed = std::stoull(value);
    if (parsed >= std::numeric_limits<std::size_t>::max())
      throw std::out_of_range(source);
    return static_cast<std::size_t>(parsed);
  } catch (const std::out_of_range &) {
    throw ConfigError(source + " is too large: " + value);
  }
}

std::vector<std::string> readIgnoreFile(const std::filesystem::path &file) {
  std::vector<std::string> patterns;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec))
    return patterns;

  std::ifstream in(file);
  if (!in) {
    spdlog::warn("Cannot open ignore file {}", file.string());
    return patterns;
  }

  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;
    patterns.push_back(line);
  }
  return patterns;
}
