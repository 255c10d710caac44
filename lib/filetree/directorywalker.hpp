/**
 * @file directorywalker.hpp
 * @brief Filtered, sorted directory listing and depth-first traversal
 *
 * This header defines the DirectoryWalker class, the single traversal used by
 * both the interactive tree model and the document builder, so that both see
 * the same entries in the same order.
 */

#ifndef DIRECTORYWALKER_HPP
#define DIRECTORYWALKER_HPP

#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

#include "pathfilter.hpp"

/**
 * @struct DirEntry
 * @brief One surviving entry of a directory listing
 */
struct DirEntry {
  /** @brief Full path of the entry */
  std::filesystem::path path;

  /** @brief File name component, used for display and sorting */
  std::string name;

  /** @brief True for directories (symlinks are followed) */
  bool is_directory = false;
};

/**
 * @class DirectoryWalker
 * @brief Lists and walks directories through a PathFilter
 *
 * Every listing drops the entries the filter skips and is sorted with
 * directories before files, each group ordered by case-insensitive name
 * (ties broken by the exact name so the order is total).
 *
 * Listing failures are never fatal: the directory is reported as empty and a
 * warning is logged.
 *
 * @see PathFilter
 * @see TreeModel::populate()
 * @see DocumentBuilder::build()
 */
class DirectoryWalker {
private:
  /** @brief Filter applied to every entry */
  const PathFilter &m_filter;

  /**
   * @brief Sorts entries directories-first, then by folded name
   */
  static void sortEntries(std::vector<DirEntry> &entries);

public:
  /** @brief Called for every file visited by walkFiles() */
  using Visitor = std::function<void(const DirEntry &entry)>;

  /** @brief Optional selection filter for walkFiles() */
  using SelectionPredicate =
      std::function<bool(const std::filesystem::path &path)>;

  /**
   * @brief Constructs a walker over the given filter
   *
   * @note The filter reference must outlive the walker
   */
  explicit DirectoryWalker(const PathFilter &filter) : m_filter(filter) {}

  /**
   * @brief Lists one directory
   *
   * @param dir Directory to list
   * @param ec Set when the directory cannot be opened or read; the entries
   *           read before the failure are discarded
   * @return std::vector<DirEntry> Filtered, sorted entries
   */
  std::vector<DirEntry> list(const std::filesystem::path &dir,
                             std::error_code &ec) const;

  /**
   * @brief Lists one directory, logging and swallowing failures
   *
   * @return std::vector<DirEntry> Filtered, sorted entries, empty on failure
   */
  std::vector<DirEntry> list(const std::filesystem::path &dir) const;

  /**
   * @brief Visits every non-excluded file below a directory, depth-first
   *
   * Within one directory, files are visited after the subdirectories (and
   * everything below them), following the listing order. Directories are
   * never passed to the visitor.
   *
   * @param dir Start directory
   * @param visit Called once per visited file
   * @param selected If set, only files for which it returns true are visited;
   *                 the walk still descends into every directory
   */
  void walkFiles(const std::filesystem::path &dir, const Visitor &visit,
                 const SelectionPredicate &selected = nullptr) const;

  const PathFilter &filter() const { return m_filter; }
};

#endif // DIRECTORYWALKER_HPP
