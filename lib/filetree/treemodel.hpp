/**
 * @file treemodel.hpp
 * @brief Lazily populated selection tree mirroring the filesystem
 *
 * This header defines the TreeModel class which owns the materialized node
 * hierarchy behind the interactive browser and answers effective-selection
 * queries for the document builder.
 */

#ifndef TREEMODEL_HPP
#define TREEMODEL_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "directorywalker.hpp"
#include "iselectionsource.hpp"
#include "treenode.hpp"

/**
 * @class TreeModel
 * @brief Owns the node hierarchy and its selection state
 *
 * The root node is created at construction, selected by default. Children
 * are created on first populate() of their parent and live until refresh().
 *
 * Selection rules:
 * - setSelected() applies a value to a node and its whole materialized
 *   subtree (downward propagation)
 * - propagateUp() infers each ancestor's value from its children: uniform
 *   children set the ancestor, diverging children mark it Mixed and leave its
 *   stored value alone (upward propagation)
 * - effectiveSelection() answers for any path, materialized or not, by
 *   inheriting from the nearest materialized ancestor
 *
 * TreeModel is not thread-safe. All mutating calls must come from a single
 * owner.
 *
 * @see TreeNode
 * @see DirectoryWalker
 * @see ISelectionSource
 */
class TreeModel : public ISelectionSource {
private:
  /** @brief Traversal used to list directories */
  const DirectoryWalker &m_walker;

  /** @brief Root node, never replaced */
  std::unique_ptr<TreeNode> m_root;

  /** @brief Materialized nodes by normalized path string */
  std::unordered_map<std::string, TreeNode *> m_index;

  static std::string key(const std::filesystem::path &path);

  void collectVisible(TreeNode &node, std::vector<TreeNode *> &out);

public:
  /**
   * @brief Creates the model with a root node for the walker's root
   *
   * The root is not populated yet; call populate(root()) or refresh().
   *
   * @param walker Traversal used for every listing; must outlive the model
   * @param root_selected Initial selection of the root
   */
  explicit TreeModel(const DirectoryWalker &walker, bool root_selected = true);

  TreeNode &root() { return *m_root; }
  const TreeNode &root() const { return *m_root; }

  /**
   * @brief Materializes the children of a directory node
   *
   * Does nothing for files and for nodes that were already populated. The
   * new children inherit the node's current selected value. A listing
   * failure leaves the node populated with no children.
   *
   * @param node Node to populate
   */
  void populate(TreeNode &node);

  /**
   * @brief Sets a node and its materialized subtree to one value
   *
   * Clears the Mixed flag on every touched node. Does not materialize
   * anything.
   */
  void setSelected(TreeNode &node, bool value);

  /**
   * @brief Re-derives the selection of every ancestor of a node
   *
   * Walks from the node's parent up to the root. At each ancestor, if all
   * children share one non-mixed value the ancestor takes it; otherwise the
   * ancestor is marked Mixed and keeps its stored value.
   *
   * @param node Node whose ancestors are updated
   */
  void propagateUp(TreeNode &node);

  /**
   * @brief Flips a node's selection and updates its ancestors
   *
   * A Mixed node becomes selected.
   */
  void toggle(TreeNode &node);

  void selectAll() { setSelected(*m_root, true); }
  void selectNone() { setSelected(*m_root, false); }

  /**
   * @brief Discards every node except the root and repopulates it
   *
   * The root keeps its current selected value and is left expanded.
   */
  void refresh();

  /**
   * @brief Looks up the materialized node for a path
   *
   * @return TreeNode* The node, or nullptr if not materialized
   */
  TreeNode *find(const std::filesystem::path &path) const;

  /**
   * @brief Populates every ancestor of a path and returns its node
   *
   * Used to address an entry that the browser has not expanded yet.
   *
   * @param path Absolute path below the root
   * @return TreeNode* The node, or nullptr if the path is outside the root,
   *         excluded, or does not exist
   */
  TreeNode *materialize(const std::filesystem::path &path);

  /**
   * @brief Effective selection of any path
   *
   * The node's own value if materialized, otherwise the value of the nearest
   * materialized ancestor. Paths outside the root default to true.
   */
  bool effectiveSelection(const std::filesystem::path &path) const override;

  /**
   * @brief Three-valued state for display
   *
   * Mixed only for a materialized node flagged Mixed; otherwise derived from
   * effectiveSelection().
   */
  SelectionState displayState(const std::filesystem::path &path) const override;

  /**
   * @brief Nodes shown by the browser, in display order
   *
   * The root followed, depth-first, by the children of every expanded node.
   */
  std::vector<TreeNode *> visibleNodes();

  /** @brief Number of materialized nodes, root included */
  size_t nodeCount() const { return m_index.size(); }
};

#endif // TREEMODEL_HPP
