/**
 * @file filetreeui.cpp
 * @brief Implementation of the FileTreeUI class
 *
 * Key implementation areas:
 * - Row building from the TreeModel
 * - Tree panel rendering with selection colours
 * - Selection and expansion intents
 * - Export flow with confirmation dialog
 * - Keyboard shortcut dispatch
 *
 * @see FileTreeUI
 * @see filetreeui.hpp
 */

#include "filetreeui.hpp"
#include "utils.hpp"

#include <ftxui/screen/terminal.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <map>

FileTreeUI::FileTreeUI(const Config &config)
    : m_config(config), m_filter(config), m_walker(m_filter),
      m_model(m_walker, true) {}

// ============================================================================
// ROWS
// ============================================================================

/**
 * @brief Rebuilds the visible rows after a model change
 *
 * The cursor follows its node: if the node under the cursor is still
 * visible its new index is used, otherwise the index is clamped.
 */
void FileTreeUI::rebuildRows() {
  const TreeNode *cursor_node = nullptr;
  if (auto *row = safe_at(m_rows, m_selected))
    cursor_node = *row;

  m_rows = m_model.visibleNodes();

  m_row_labels.clear();
  m_row_labels.reserve(m_rows.size());
  for (const auto *node : m_rows) {
    m_row_labels.push_back(rowLabel(*node));
  }

  auto it = std::find(m_rows.begin(), m_rows.end(), cursor_node);
  if (it != m_rows.end()) {
    m_selected = static_cast<int>(it - m_rows.begin());
  } else {
    m_selected = std::clamp(m_selected, 0,
                            std::max(0, static_cast<int>(m_rows.size()) - 1));
  }
}

std::string FileTreeUI::rowLabel(const TreeNode &node) const {
  std::string label(static_cast<size_t>(node.depth()) * 2, ' ');

  if (node.isDirectory()) {
    label += node.isExpanded() ? "▾ " : "▸ ";
  } else {
    label += "  ";
  }

  switch (node.getState()) {
  case SelectionState::Selected:
    label += m_config.icon_selected;
    break;
  case SelectionState::Mixed:
    label += m_config.icon_mixed;
    break;
  case SelectionState::Unselected:
    label += m_config.icon_unselected;
    break;
  }

  return label + " " + node.getDisplayName();
}

TreeNode &FileTreeUI::currentNode() {
  if (auto *row = safe_at(m_rows, m_selected))
    return **row;
  return m_model.root();
}

// ============================================================================
// ACTIONS
// ============================================================================

/**
 * @brief Expands or collapses the directory under the cursor
 *
 * The first expansion populates the node from disk; later expansions reuse
 * the cached children.
 */
void FileTreeUI::expandCollapse() {
  TreeNode &node = currentNode();
  if (!node.isDirectory()) {
    m_current_status = "File: " + node.getPath().string();
    return;
  }

  if (node.isExpanded()) {
    node.setExpanded(false);
  } else {
    m_model.populate(node);
    node.setExpanded(true);
    m_current_status = std::to_string(node.getChildren().size()) +
                       " entries in " + node.getDisplayName();
  }
  rebuildRows();
}

void FileTreeUI::toggleSelection() {
  m_model.toggle(currentNode());
  rebuildRows();
}

void FileTreeUI::selectAll() {
  m_model.selectAll();
  m_current_status = "All entries selected.";
  rebuildRows();
}

void FileTreeUI::selectNone() {
  m_model.selectNone();
  m_current_status = "Selection cleared.";
  rebuildRows();
}

void FileTreeUI::refresh() {
  m_model.refresh();
  m_selected = 0;
  m_rows.clear();
  rebuildRows();
  m_current_status = "Reloaded " +
                     std::to_string(m_model.root().getChildren().size()) +
                     " entries from disk.";
}

/**
 * @brief Runs the export flow
 *
 * Implementation flow:
 * 1. Ask whether unselected entries are listed in the tree (or cancel)
 * 2. Build the document with the configured limits
 * 3. Write it to root/output_file
 * 4. Leave the event loop; main() reports the written path
 *
 * Build and write errors are reported in the status line only.
 */
void FileTreeUI::generate() {
  auto include_unselected = showIncludeDialog();
  if (!include_unselected.has_value()) {
    m_current_status = "Ready.";
    return;
  }

  try {
    DocumentBuilder builder(m_config, m_walker, m_model);
    std::string document = builder.build(m_config.root, *include_unselected);

    const auto out_path = m_config.outputPath();
    DocumentBuilder::writeDocument(out_path, document);

    m_written_path = out_path.string();
    m_current_status = "✓ Wrote " + m_written_path + " (" +
                       formatBytes(static_cast<long long>(document.size())) +
                       ")";
    m_screen.Exit();
  } catch (const std::exception &e) {
    spdlog::error("Export failed: {}", e.what());
    m_current_status = "✗ Error: " + std::string(e.what());
  }
}

/**
 * @brief Asks whether unselected entries appear in the exported tree
 *
 * Dialog contents:
 * - Question text
 * - Output path (yellow)
 * - Instructions: 'y' yes, 'n' no, 'c' or ESC cancel
 *
 * @return true (Yes), false (No), std::nullopt (Cancel)
 */
std::optional<bool> FileTreeUI::showIncludeDialog() {
  std::optional<bool> answer;
  auto dialog_screen = ScreenInteractive::TerminalOutput();

  auto dialog_renderer = Renderer([&] {
    return vbox(
               {text("Should unselected files/folders be visible in the file "
                     "tree?") |
                    bold | hcenter,
                separator(),
                text("Output: " + m_config.outputPath().string()) |
                    color(Color::Yellow),
                separator(),
                hbox({text("'y'") | bold | color(Color::Green),
                      text(" Yes   ") | color(Color::GrayLight),
                      text("'n'") | bold | color(Color::Red),
                      text(" No   ") | color(Color::GrayLight),
                      text("'c'") | bold, text(" or ") | color(Color::GrayLight),
                      text("ESC") | bold,
                      text(" Cancel") | color(Color::GrayLight)}) |
                    hcenter}) |
           border | center;
  });

  auto dialog_handler = CatchEvent(dialog_renderer, [&](Event event) {
    if (event == Event::Character('y') || event == Event::Character('Y')) {
      answer = true;
      dialog_screen.Exit();
      return true;
    }
    if (event == Event::Character('n') || event == Event::Character('N')) {
      answer = false;
      dialog_screen.Exit();
      return true;
    }
    if (event == Event::Character('c') || event == Event::Character('C') ||
        event == Event::Escape) {
      answer.reset();
      dialog_screen.Exit();
      return true;
    }
    return false;
  });

  dialog_screen.Loop(dialog_handler);
  return answer;
}

// ============================================================================
// UI SETUP
// ============================================================================

void FileTreeUI::initialize() {
  m_model.populate(m_model.root());
  m_model.root().setExpanded(true);
  rebuildRows();

  setupTreePanel();
  setupMainLayout();

  spdlog::info("Browsing {}", m_config.root.string());
}

/**
 * @brief Initializes the tree panel component
 *
 * Rendering features:
 * - One row per visible node, coloured by its selection state
 * - Highlights the cursor row with inverted colours
 *
 * Event handling:
 * - Enter: expand/collapse
 * - Space: toggle selection
 * - Other characters: global shortcut handler
 */
void FileTreeUI::setupTreePanel() {
  auto menu_option = MenuOption::Vertical();
  menu_option.entries_option.transform = [this](const EntryState &state) {
    auto row = text(state.label);

    if (auto *node = safe_at(m_rows, state.index)) {
      row = row | styleFor((*node)->getState());
    }

    if (state.focused) {
      row = row | inverted;
    }
    return row;
  };

  m_tree_menu = Menu(&m_row_labels, &m_selected, menu_option);

  m_tree_menu = m_tree_menu | CatchEvent([this](Event event) {
                  if (event == Event::Return) {
                    expandCollapse();
                    return true;
                  }
                  if (event.is_character()) {
                    return handleGlobalShortcut(event.character()[0]);
                  }
                  return false;
                });
}

/**
 * @brief Sets up the main UI layout structure
 *
 * 1. Root label
 * 2. Tree panel with scroll indicator, sized to the terminal
 * 3. Footer with the shortcuts from ActionMap
 * 4. Status bar
 */
void FileTreeUI::setupMainLayout() {
  auto footer = getFooterEntries();

  m_document = Renderer(m_tree_menu, [this, footer] {
    int terminal_height = Terminal::Size().dimy;
    int available_height = std::max(5, terminal_height - 8);

    Elements keys;
    for (const auto &entry : footer) {
      keys.push_back(text(entry) | color(Color::GrayLight));
      keys.push_back(text("  "));
    }

    return vbox({text("Root: " + m_config.root.string()) | bold |
                     color(Color::Green),
                 separator(),
                 m_tree_menu->Render() | vscroll_indicator | frame |
                     size(HEIGHT, EQUAL, available_height),
                 separator(), hbox(std::move(keys)) | hcenter,
                 text("STATUS: " + m_current_status) |
                     color(Color::GrayLight) | hcenter}) |
           border;
  });
}

Decorator FileTreeUI::styleFor(SelectionState state) const {
  switch (state) {
  case SelectionState::Selected: {
    Color c = parseColor(m_config.select_color, Color::Green);
    return [c](Element e) { return e | color(c) | bold; };
  }
  case SelectionState::Mixed:
    return color(Color::Yellow);
  case SelectionState::Unselected:
  default:
    return color(parseColor(m_config.unselect_color, Color::GrayDark));
  }
}

Color FileTreeUI::parseColor(const std::string &name, Color fallback) {
  static const std::map<std::string, Color> named = {
      {"black", Color::Black},     {"red", Color::Red},
      {"green", Color::Green},     {"yellow", Color::Yellow},
      {"blue", Color::Blue},       {"magenta", Color::Magenta},
      {"cyan", Color::Cyan},       {"white", Color::White},
      {"grey", Color::GrayDark},   {"gray", Color::GrayDark},
      {"grey50", Color::GrayDark}, {"gray50", Color::GrayDark},
      {"grey70", Color::GrayLight}, {"gray70", Color::GrayLight}};

  auto it = named.find(name);
  if (it != named.end())
    return it->second;

  if (name.size() == 7 && name[0] == '#') {
    char *end = nullptr;
    unsigned long rgb = std::strtoul(name.c_str() + 1, &end, 16);
    if (end != nullptr && *end == '\0') {
      return Color::RGB(static_cast<uint8_t>((rgb >> 16) & 0xFF),
                        static_cast<uint8_t>((rgb >> 8) & 0xFF),
                        static_cast<uint8_t>(rgb & 0xFF));
    }
  }
  return fallback;
}

// ============================================================================
// MAIN LOOP
// ============================================================================

void FileTreeUI::run() {
  auto global_handler = CatchEvent(m_document, [this](Event event) {
    if (event.is_character()) {
      return handleGlobalShortcut(event.character()[0]);
    }
    return false;
  });

  m_screen.Loop(global_handler);
}

// ============================================================================
// KEYBOARD SHORTCUTS AND ACTIONS
// ============================================================================

/**
 * @brief Handles global keyboard shortcuts
 *
 * Looks the key up in ActionMap and runs the corresponding intent. Every
 * intent completes before the next event is processed.
 *
 * @param key_pressed The character key that was pressed
 * @return true if the shortcut was recognized and handled, false otherwise
 */
bool FileTreeUI::handleGlobalShortcut(char key_pressed) {
  for (const auto &pair : ActionMap) {
    if (key_pressed != pair.second.m_shortcut)
      continue;

    switch (pair.first) {
    case ActionID::Quit:
      m_screen.Exit();
      return true;

    case ActionID::ExpandCollapse:
      expandCollapse();
      return true;

    case ActionID::ToggleSelection:
      toggleSelection();
      return true;

    case ActionID::SelectAll:
      selectAll();
      return true;

    case ActionID::SelectNone:
      selectNone();
      return true;

    case ActionID::Generate:
      generate();
      return true;

    case ActionID::Refresh:
      refresh();
      return true;
    }
  }
  return false;
}
