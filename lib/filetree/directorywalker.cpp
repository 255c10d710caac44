/**
 * @file directorywalker.cpp
 * @brief Implementation of the shared directory traversal
 */

#include "directorywalker.hpp"
#include "textdecoding.hpp"

#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

/**
 * @brief Lists one directory
 *
 * Implementation details:
 * 1. Iterates with the error_code overloads, so no exception escapes
 * 2. Asks the PathFilter about every entry and drops skipped ones
 * 3. Determines the directory flag by following symlinks; an entry whose
 *    status cannot be read is treated as a file (its read fails later and
 *    is reported inline)
 * 4. Sorts the survivors
 *
 * @see sortEntries()
 */
std::vector<DirEntry> DirectoryWalker::list(const std::filesystem::path &dir,
                                            std::error_code &ec) const {
  namespace fs = std::filesystem;
  std::vector<DirEntry> results;
  ec.clear();

  fs::directory_iterator it(dir, ec);
  if (ec)
    return results;

  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec)
      break;

    const auto &entry = *it;
    if (m_filter.shouldSkip(entry.path()))
      continue;

    std::error_code status_ec;
    bool is_dir = entry.is_directory(status_ec);

    results.push_back({entry.path(), entry.path().filename().string(),
                       is_dir && !status_ec});
  }

  if (ec) {
    results.clear();
    return results;
  }

  sortEntries(results);
  return results;
}

std::vector<DirEntry>
DirectoryWalker::list(const std::filesystem::path &dir) const {
  std::error_code ec;
  auto entries = list(dir, ec);
  if (ec) {
    spdlog::warn("Cannot list directory {}: {}", dir.string(), ec.message());
  }
  return entries;
}

void DirectoryWalker::walkFiles(const std::filesystem::path &dir,
                                const Visitor &visit,
                                const SelectionPredicate &selected) const {
  for (const auto &entry : list(dir)) {
    if (entry.is_directory) {
      walkFiles(entry.path, visit, selected);
    } else if (!selected || selected(entry.path)) {
      visit(entry);
    }
  }
}

/**
 * @brief Sorts entries directories-first, then by folded name
 *
 * Sorting logic:
 * - Directory vs file: directory comes first
 * - Same type: foldCase() keys compared (Unicode aware), exact name as tie
 *   breaker
 *
 * Keys are computed once per entry, not per comparison.
 */
void DirectoryWalker::sortEntries(std::vector<DirEntry> &entries) {
  std::vector<std::pair<std::wstring, DirEntry>> keyed;
  keyed.reserve(entries.size());
  for (auto &entry : entries) {
    keyed.emplace_back(foldCase(entry.name), std::move(entry));
  }

  std::sort(keyed.begin(), keyed.end(), [](const auto &a, const auto &b) {
    if (a.second.is_directory != b.second.is_directory) {
      return a.second.is_directory;
    }
    if (a.first != b.first)
      return a.first < b.first;
    return a.second.name < b.second.name;
  });

  for (size_t i = 0; i < entries.size(); ++i) {
    entries[i] = std::move(keyed[i].second);
  }
}
