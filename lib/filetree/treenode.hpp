#ifndef TREENODE_HPP
#define TREENODE_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

/**
 * @enum SelectionState
 * @brief Three-valued selection shown for a tree entry
 *
 * Mixed marks a directory whose materialized children disagree.
 */
enum class SelectionState { Selected, Unselected, Mixed };

/**
 * @class TreeNode
 * @brief One materialized filesystem entry of the selection tree
 *
 * Children are owned through unique_ptr so that parent back-pointers and
 * pointers held by the browser stay valid while siblings are added.
 * Nodes are created and mutated by TreeModel only.
 *
 * @see TreeModel
 */
class TreeNode {
private:
  std::filesystem::path m_path;
  bool m_isDir;
  bool m_selected;
  bool m_mixed = false;
  bool m_populated = false;
  bool m_expanded = false;
  TreeNode *m_parent;
  std::vector<std::unique_ptr<TreeNode>> m_children;

  friend class TreeModel;

public:
  TreeNode(std::filesystem::path p, bool isDir, bool selected,
           TreeNode *parent = nullptr)
      : m_path(std::move(p)), m_isDir(isDir), m_selected(selected),
        m_parent(parent) {}

  TreeNode(const TreeNode &) = delete;
  TreeNode &operator=(const TreeNode &) = delete;

  const std::filesystem::path &getPath() const { return m_path; }
  bool isDirectory() const { return m_isDir; }
  bool isSelected() const { return m_selected; }
  bool isMixed() const { return m_mixed; }
  bool isPopulated() const { return m_populated; }
  TreeNode *getParent() const { return m_parent; }

  const std::vector<std::unique_ptr<TreeNode>> &getChildren() const {
    return m_children;
  }

  std::string getDisplayName() const {
    std::string name = m_path.filename().string();
    if (name.empty()) {
      // Filesystem root
      return m_path.string();
    }
    return name;
  }

  SelectionState getState() const {
    if (m_mixed)
      return SelectionState::Mixed;
    return m_selected ? SelectionState::Selected : SelectionState::Unselected;
  }

  // Expansion is presentation state owned by the browser.
  bool isExpanded() const { return m_expanded; }
  void setExpanded(bool expanded) { m_expanded = expanded && m_isDir; }

  int depth() const {
    int depth = 0;
    const TreeNode *cur = m_parent;
    while (cur) {
      cur = cur->m_parent;
      depth++;
    }
    return depth;
  }
};

#endif // TREENODE_HPP
