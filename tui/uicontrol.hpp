/**
 * @file uicontrol.hpp
 * @brief UI action definitions and keyboard shortcut mappings
 *
 * This header defines the action system for the file tree browser, including
 * action identifiers, keyboard shortcuts, footer labels, and a helper that
 * builds the footer line.
 *
 * The action system provides a centralized mapping between:
 * - Action identifiers (ActionID enum)
 * - Keyboard shortcuts (single characters; Enter and Space included)
 * - Footer display strings
 *
 * @see ActionID
 * @see ActionInfo
 * @see ActionMap
 */

#ifndef UI_CONTROL_HPP
#define UI_CONTROL_HPP

#include <map>
#include <string>
#include <vector>

/**
 * @struct ActionInfo
 * @brief Information about a UI action including shortcut and footer label
 */
struct ActionInfo {
  /** @brief Single character keyboard shortcut for this action */
  char m_shortcut;

  /** @brief Key name shown in the footer (e.g., "space") */
  std::string m_key_label;

  /** @brief Short description shown next to the key */
  std::string m_title;
};

/**
 * @enum ActionID
 * @brief Enumeration of all user intents of the browser
 *
 * Available Actions:
 * - ExpandCollapse: Expand or collapse the directory under the cursor
 * - ToggleSelection: Flip the selection of the entry under the cursor
 * - SelectAll / SelectNone: Apply a selection to the whole tree
 * - Generate: Export the Markdown document (asks for confirmation)
 * - Refresh: Reload the tree from disk
 * - Quit: Exit the application
 */
enum class ActionID {
  ExpandCollapse,
  ToggleSelection,
  SelectAll,
  SelectNone,
  Generate,
  Refresh,
  Quit
};

/**
 * @brief Global mapping of actions to their shortcuts and footer labels
 *
 * Current Mappings:
 * - ExpandCollapse: Enter
 * - ToggleSelection: Space
 * - SelectAll: 'a'
 * - SelectNone: 'n'
 * - Generate: 'g'
 * - Refresh: 'r'
 * - Quit: 'q'
 *
 * @note Shortcuts are case-sensitive
 */
inline const std::map<ActionID, ActionInfo> ActionMap = {
    {ActionID::ExpandCollapse, {'\n', "enter", "Expand/Collapse"}},
    {ActionID::ToggleSelection, {' ', "space", "Toggle selection"}},
    {ActionID::SelectAll, {'a', "a", "Select all"}},
    {ActionID::SelectNone, {'n', "n", "Select none"}},
    {ActionID::Generate, {'g', "g", "Generate Markdown"}},
    {ActionID::Refresh, {'r', "r", "Reload tree"}},
    {ActionID::Quit, {'q', "q", "Quit"}}};

/**
 * @brief Builds the footer entries ("q Quit", "space Toggle selection", ...)
 *
 * @return std::vector<std::string> One entry per action, in ActionID order
 */
inline std::vector<std::string> getFooterEntries() {
  std::vector<std::string> entries;
  entries.reserve(ActionMap.size());
  for (const auto &[id, info] : ActionMap) {
    entries.push_back(info.m_key_label + " " + info.m_title);
  }
  return entries;
}

#endif // UI_CONTROL_HPP
