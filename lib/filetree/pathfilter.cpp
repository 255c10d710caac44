/**
 * @file pathfilter.cpp
 * @brief Implementation of root-relative glob and hidden-file exclusion
 */

#include "pathfilter.hpp"

#include <fnmatch.h>

PathFilter::PathFilter(std::filesystem::path root,
                       std::vector<std::string> patterns, bool include_hidden)
    : m_root(root.lexically_normal()), m_patterns(std::move(patterns)),
      m_include_hidden(include_hidden) {
  // "/a/b/" and "/a/b" must compare equal against entry paths
  if (!m_root.has_filename() && m_root.has_relative_path())
    m_root = m_root.parent_path();
}

std::vector<std::string>
PathFilter::relativeParts(const std::filesystem::path &path) const {
  std::vector<std::string> parts;

  auto rel = path.lexically_normal().lexically_relative(m_root);
  if (rel.empty() || rel == ".")
    return parts;

  for (const auto &part : rel) {
    const std::string name = part.string();
    if (name == "..")
      return {}; // outside the root
    if (name.empty() || name == ".")
      continue;
    parts.push_back(name);
  }
  return parts;
}

bool PathFilter::matchesAny(const std::string &candidate) const {
  for (const auto &pattern : m_patterns) {
    if (fnmatch(pattern.c_str(), candidate.c_str(), FNM_NOESCAPE) == 0)
      return true;
  }
  return false;
}

/**
 * @brief Checks a path and all of its ancestors against the patterns
 *
 * Candidates per prefix length i (1..n):
 * - the i-th component on its own ("node_modules")
 * - components 1..i joined with '/' ("web/node_modules")
 *
 * For i == 1 both candidates are the same string and it is tested once.
 */
bool PathFilter::isExcludedByPattern(const std::filesystem::path &path) const {
  if (m_patterns.empty())
    return false;

  const auto parts = relativeParts(path);
  std::string joined;

  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      joined += '/';
    joined += parts[i];

    if (matchesAny(parts[i]))
      return true;
    if (i > 0 && matchesAny(joined))
      return true;
  }
  return false;
}

bool PathFilter::isHidden(const std::filesystem::path &path) const {
  for (const auto &part : relativeParts(path)) {
    if (part[0] == '.')
      return true;
  }
  return false;
}

bool PathFilter::shouldSkip(const std::filesystem::path &path) const {
  if (!m_include_hidden && isHidden(path))
    return true;

  if (path.lexically_normal() != m_root && isExcludedByPattern(path))
    return true;

  return false;
}

std::string PathFilter::relativePath(const std::filesystem::path &path) const {
  std::string result;
  for (const auto &part : relativeParts(path)) {
    if (!result.empty())
      result += '/';
    result += part;
  }
  return result;
}
