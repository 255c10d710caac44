/**
 * @file utils.hpp
 * @brief Utility functions and helpers for filetree
 *
 * This header provides common utility functions used throughout the project,
 * including safe array access, string trimming and case folding, and byte
 * formatting.
 *
 * Key utilities:
 * - safe_at: Bounds-checked vector element access
 * - trim / toLower: ASCII string helpers
 * - splitList: Comma separated list parsing
 * - formatBytes: Human-readable file size formatting
 *
 * @see safe_at()
 * @see formatBytes()
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef> // size_t
#include <cstdio>
#include <string>
#include <vector>

/**
 * @brief Safely accesses a vector element with bounds checking
 *
 * Returns nullptr if the index is out of bounds, preventing undefined
 * behavior from invalid array access. Useful in UI code where indices come
 * from user input.
 *
 * @tparam T The type of elements stored in the vector
 * @param vec The vector to access
 * @param index The index to access (can be negative or out of bounds)
 *
 * @return const T* Pointer to the element, or nullptr if out of bounds
 */
template <typename T>
const T *safe_at(const std::vector<T> &vec, int index) {
  if (index < 0 || static_cast<size_t>(index) >= vec.size())
    return nullptr;
  return &vec[static_cast<size_t>(index)];
}

/**
 * @brief Removes leading and trailing ASCII whitespace
 */
inline std::string trim(const std::string &s) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::find_if_not(s.begin(), s.end(), is_space);
  auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (begin >= end)
    return "";
  return std::string(begin, end);
}

/**
 * @brief Lower-cases ASCII letters, leaving other bytes untouched
 *
 * Used for case-insensitive name ordering and extension lookup. Non-ASCII
 * bytes of UTF-8 names are kept as they are.
 */
inline std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

/**
 * @brief Splits a comma separated list
 *
 * Every item is trimmed and empty items are dropped, so "a, ,b," yields
 * {"a", "b"}.
 */
inline std::vector<std::string> splitList(const std::string &s,
                                          char separator = ',') {
  std::vector<std::string> items;
  std::string current;
  for (char c : s) {
    if (c == separator) {
      current = trim(current);
      if (!current.empty())
        items.push_back(current);
      current.clear();
    } else {
      current += c;
    }
  }
  current = trim(current);
  if (!current.empty())
    items.push_back(current);
  return items;
}

/**
 * @brief Formats byte count into human-readable size string
 *
 * Uses binary units (1024 bytes = 1 KB) with one decimal place.
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1048576) → "1.0 MB"
 */
inline std::string formatBytes(long long bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
  return std::string(buf);
}

#endif // UTILS_HPP
