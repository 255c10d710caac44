/**
 * @file pathfilter.hpp
 * @brief Exclusion rules for filesystem entries below the root directory
 *
 * This header defines the PathFilter class which decides whether an entry is
 * left out of the browser and the generated document, based on exclude glob
 * patterns and the hidden-file policy.
 */

#ifndef PATHFILTER_HPP
#define PATHFILTER_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "config.hpp"

/**
 * @class PathFilter
 * @brief Decides whether a path is excluded from consideration
 *
 * All checks are root-relative: the components of the root path itself never
 * count as hidden and are never matched against patterns.
 *
 * Pattern matching uses fnmatch(3) without FNM_PATHNAME, so '*' also matches
 * '/', and with FNM_NOESCAPE, so a backslash is an ordinary character.
 * Matching is case-sensitive.
 *
 * @see Config::excludes
 * @see Config::include_hidden
 */
class PathFilter {
private:
  /** @brief Canonical root directory */
  std::filesystem::path m_root;

  /** @brief Exclude glob patterns */
  std::vector<std::string> m_patterns;

  /** @brief Whether hidden entries are kept */
  bool m_include_hidden;

  /**
   * @brief Splits a path into its components relative to the root
   *
   * @return Components below root; empty for root itself and for paths
   *         outside the root
   */
  std::vector<std::string> relativeParts(const std::filesystem::path &path) const;

  /**
   * @brief Tests one candidate string against every pattern
   */
  bool matchesAny(const std::string &candidate) const;

public:
  /**
   * @brief Constructs a filter from explicit settings
   *
   * @param root Root directory; paths are interpreted relative to it
   * @param patterns Exclude glob patterns
   * @param include_hidden If false, dot-prefixed entries are skipped
   */
  PathFilter(std::filesystem::path root, std::vector<std::string> patterns,
             bool include_hidden);

  /**
   * @brief Constructs a filter from a finalized configuration
   */
  explicit PathFilter(const Config &config)
      : PathFilter(config.root, config.excludes, config.include_hidden) {}

  /**
   * @brief Checks a path and all of its ancestors against the patterns
   *
   * For every prefix of the root-relative path, from the first component
   * down to the full path, both the last component of the prefix and the
   * slash-joined prefix are tested against every pattern. Returns on the
   * first match, so a pattern that matches a directory excludes its whole
   * subtree.
   *
   * Example with pattern "node_modules": "web/node_modules/react/index.js"
   * is excluded because the prefix "web/node_modules" ends in a match.
   * Example with pattern "docs/*.md": "docs/a.md" is excluded through the
   * joined-prefix candidate.
   *
   * @param path Absolute path at or below the root
   * @return true if any prefix matches a pattern
   */
  bool isExcludedByPattern(const std::filesystem::path &path) const;

  /**
   * @brief Checks whether any root-relative component starts with '.'
   *
   * The current-directory marker "." is ignored.
   */
  bool isHidden(const std::filesystem::path &path) const;

  /**
   * @brief Combined exclusion decision used by every traversal
   *
   * @return true if the path is hidden while hidden entries are disabled, or
   *         if the path is not the root and is excluded by a pattern
   */
  bool shouldSkip(const std::filesystem::path &path) const;

  /**
   * @brief Root-relative path with forward slashes ("src/a.go")
   *
   * @return Empty string for the root itself
   */
  std::string relativePath(const std::filesystem::path &path) const;

  const std::filesystem::path &root() const { return m_root; }
};

#endif // PATHFILTER_HPP
