#ifndef ISELECTIONSOURCE_HPP
#define ISELECTIONSOURCE_HPP

#include <filesystem>

#include "treenode.hpp"

/**
 * @brief Answers selection queries for arbitrary paths below the root
 *
 * Implemented by TreeModel; consumed by DocumentBuilder, which walks the
 * filesystem on its own and asks about every path it meets.
 */
class ISelectionSource {
public:
  virtual bool effectiveSelection(const std::filesystem::path &path) const = 0;
  virtual SelectionState displayState(const std::filesystem::path &path) const = 0;
  virtual ~ISelectionSource() = default;
};

#endif // ISELECTIONSOURCE_HPP
