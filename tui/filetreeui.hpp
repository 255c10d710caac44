/**
 * @file filetreeui.hpp
 * @brief Terminal tree browser for selecting files to export, using FTXUI
 *
 * This header defines the FileTreeUI class which shows the root directory as
 * an expandable tree, lets the operator mark entries, and exports the
 * Markdown document on request.
 *
 * Key features:
 * - Lazy expansion: a directory is listed the first time it is opened
 * - Selection markers and colours per state (selected, unselected, mixed)
 * - Select all / select none / reload from disk
 * - Confirmation dialog before the export
 * - Full-screen terminal UI using FTXUI library
 *
 * @see TreeModel
 * @see DocumentBuilder
 */

#ifndef FILETREEUI_HPP
#define FILETREEUI_HPP

#include "config.hpp"
#include "directorywalker.hpp"
#include "documentbuilder.hpp"
#include "pathfilter.hpp"
#include "treemodel.hpp"
#include "uicontrol.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace ftxui;

/**
 * @class FileTreeUI
 * @brief Interactive front end feeding user intents to the TreeModel
 *
 * Architecture:
 * - Single-threaded: every intent runs to completion inside the FTXUI event
 *   handler, so the TreeModel has exactly one owner
 * - The visible rows are the model's visibleNodes(), rebuilt after every
 *   mutation and rendered through an FTXUI Menu
 * - The export uses a DocumentBuilder over the same DirectoryWalker
 *
 * @see TreeModel
 * @see ActionMap
 */
class FileTreeUI {
private:
  // ===== Core =====

  /** @brief Finalized configuration */
  const Config &m_config;

  /** @brief Exclusion rules */
  PathFilter m_filter;

  /** @brief Traversal shared by model and export */
  DirectoryWalker m_walker;

  /** @brief Selection tree */
  TreeModel m_model;

  // ===== UI State =====

  /** @brief Index of the row under the cursor */
  int m_selected = 0;

  /** @brief Nodes currently shown, in display order */
  std::vector<TreeNode *> m_rows;

  /** @brief Row labels rendered by the menu */
  std::vector<std::string> m_row_labels;

  /** @brief Current status message displayed in the UI */
  std::string m_current_status = "Ready.";

  /** @brief Path of the written document, empty until an export succeeds */
  std::string m_written_path;

  // ===== UI Components =====

  /** @brief Tree list component */
  Component m_tree_menu;

  /** @brief Whole screen layout */
  Component m_document;

  /** @brief FTXUI fullscreen terminal screen instance */
  ScreenInteractive m_screen = ScreenInteractive::Fullscreen();

  // ===== Rows =====

  /**
   * @brief Rebuilds m_rows and m_row_labels from the model
   *
   * Keeps the cursor on the same node when it is still visible, otherwise
   * clamps it to the list.
   */
  void rebuildRows();

  /**
   * @brief Label for one row: indentation, expander, glyph and name
   */
  std::string rowLabel(const TreeNode &node) const;

  /** @brief Node under the cursor (the root if the list is empty) */
  TreeNode &currentNode();

  // ===== Actions =====

  void expandCollapse();
  void toggleSelection();
  void selectAll();
  void selectNone();
  void refresh();

  /**
   * @brief Runs the export flow
   *
   * Shows the include-unselected dialog; on Yes/No builds the document,
   * writes it to Config::outputPath() and leaves the event loop. Cancel
   * abandons the export without writing anything. A write failure is shown
   * in the status line and the browser stays open.
   */
  void generate();

  /**
   * @brief Asks whether unselected entries appear in the exported tree
   *
   * @return true (Yes), false (No), or std::nullopt (Cancel / ESC)
   */
  std::optional<bool> showIncludeDialog();

  // ===== Setup =====

  void setupTreePanel();
  void setupMainLayout();

  /** @brief Colour decorator for a selection state */
  Decorator styleFor(SelectionState state) const;

  /**
   * @brief Maps a configured colour name to an FTXUI colour
   *
   * Accepts the basic terminal colour names, grey/gray shades
   * ("grey50") and "#rrggbb".
   */
  static Color parseColor(const std::string &name, Color fallback);

public:
  /**
   * @brief Constructs the browser for a finalized configuration
   *
   * @note The configuration must outlive the browser
   */
  explicit FileTreeUI(const Config &config);

  /**
   * @brief Populates the root and builds all components
   *
   * Must be called before run().
   */
  void initialize();

  /**
   * @brief Handles global keyboard shortcuts
   *
   * @param key The character code of the pressed key
   * @return true if the shortcut was handled, false if not recognized
   */
  bool handleGlobalShortcut(char key);

  /**
   * @brief Starts the main UI event loop
   *
   * Blocks until the operator quits or an export succeeds.
   */
  void run();

  /** @brief Path of the written document, empty if nothing was exported */
  const std::string &writtenPath() const { return m_written_path; }
};

#endif // FILETREEUI_HPP
