/**
 * @file treemodel.cpp
 * @brief Implementation of the selection tree and its propagation rules
 */

#include "treemodel.hpp"

#include <spdlog/spdlog.h>

TreeModel::TreeModel(const DirectoryWalker &walker, bool root_selected)
    : m_walker(walker),
      m_root(std::make_unique<TreeNode>(walker.filter().root(), true,
                                        root_selected)) {
  m_index[key(m_root->getPath())] = m_root.get();
}

std::string TreeModel::key(const std::filesystem::path &path) {
  return path.lexically_normal().string();
}

/**
 * @brief Materializes the children of a directory node
 *
 * Implementation details:
 * 1. Skips files and already populated nodes, so a directory is listed at
 *    most once until refresh()
 * 2. Lists through the DirectoryWalker (filtered and sorted)
 * 3. Creates one child per entry with the parent's current selection
 * 4. Registers each child in the path index
 */
void TreeModel::populate(TreeNode &node) {
  if (!node.m_isDir || node.m_populated)
    return;

  auto entries = m_walker.list(node.m_path);
  node.m_children.reserve(entries.size());

  for (const auto &entry : entries) {
    auto child = std::make_unique<TreeNode>(entry.path, entry.is_directory,
                                            node.m_selected, &node);
    m_index[key(child->m_path)] = child.get();
    node.m_children.push_back(std::move(child));
  }

  node.m_populated = true;
  spdlog::debug("Populated {} ({} entries)", node.m_path.string(),
                node.m_children.size());
}

void TreeModel::setSelected(TreeNode &node, bool value) {
  node.m_selected = value;
  node.m_mixed = false;

  for (auto &child : node.m_children) {
    setSelected(*child, value);
  }
}

void TreeModel::propagateUp(TreeNode &node) {
  TreeNode *cur = &node;

  while (cur->m_parent != nullptr) {
    TreeNode *parent = cur->m_parent;

    bool all_selected = true;
    bool all_unselected = true;
    for (const auto &child : parent->m_children) {
      if (child->m_mixed) {
        all_selected = false;
        all_unselected = false;
        break;
      }
      all_selected = all_selected && child->m_selected;
      all_unselected = all_unselected && !child->m_selected;
    }

    if (all_selected || all_unselected) {
      parent->m_selected = all_selected;
      parent->m_mixed = false;
    } else {
      // Stored value stays as it was; only the display state changes.
      parent->m_mixed = true;
    }

    cur = parent;
  }
}

void TreeModel::toggle(TreeNode &node) {
  bool value = node.m_mixed ? true : !node.m_selected;
  setSelected(node, value);
  propagateUp(node);
}

/**
 * @brief Discards every node except the root and repopulates it
 *
 * Steps:
 * 1. Drop all children (and with them every descendant)
 * 2. Reset the path index to the root only
 * 3. Re-list the root from disk; the root's selected value is kept, so the
 *    fresh children inherit it
 */
void TreeModel::refresh() {
  const bool root_selected = m_root->m_selected;

  m_root->m_children.clear();
  m_root->m_populated = false;
  m_root->m_mixed = false;
  m_root->m_selected = root_selected;

  m_index.clear();
  m_index[key(m_root->m_path)] = m_root.get();

  populate(*m_root);
  m_root->setExpanded(true);
}

TreeNode *TreeModel::find(const std::filesystem::path &path) const {
  auto it = m_index.find(key(path));
  if (it == m_index.end())
    return nullptr;
  return it->second;
}

TreeNode *TreeModel::materialize(const std::filesystem::path &path) {
  auto rel = path.lexically_normal().lexically_relative(m_root->m_path);
  if (rel.empty() || *rel.begin() == "..")
    return nullptr;

  TreeNode *cur = m_root.get();
  for (const auto &part : rel) {
    if (part.empty() || part == ".")
      continue;

    populate(*cur);
    TreeNode *next = nullptr;
    for (auto &child : cur->m_children) {
      if (child->m_path.filename() == part) {
        next = child.get();
        break;
      }
    }
    if (next == nullptr)
      return nullptr;
    cur = next;
  }
  return cur;
}

bool TreeModel::effectiveSelection(const std::filesystem::path &path) const {
  auto cur = path.lexically_normal();

  while (true) {
    if (const TreeNode *node = find(cur))
      return node->m_selected;

    if (cur == m_root->m_path)
      break;

    auto parent = cur.parent_path();
    if (parent == cur || parent.empty())
      break; // walked past the filesystem root: not below our root
    cur = parent;
  }
  return true;
}

SelectionState TreeModel::displayState(const std::filesystem::path &path) const {
  if (const TreeNode *node = find(path))
    return node->getState();
  return effectiveSelection(path) ? SelectionState::Selected
                                  : SelectionState::Unselected;
}

std::vector<TreeNode *> TreeModel::visibleNodes() {
  std::vector<TreeNode *> out;
  collectVisible(*m_root, out);
  return out;
}

void TreeModel::collectVisible(TreeNode &node, std::vector<TreeNode *> &out) {
  out.push_back(&node);
  if (!node.m_expanded)
    return;
  for (auto &child : node.m_children) {
    collectVisible(*child, out);
  }
}
