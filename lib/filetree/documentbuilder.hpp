/**
 * @file documentbuilder.hpp
 * @brief Markdown export of the directory tree and the selected files
 *
 * This header defines the DocumentBuilder class which renders an ASCII tree
 * of the root directory followed by the contents of every selected file in
 * fenced code blocks.
 */

#ifndef DOCUMENTBUILDER_HPP
#define DOCUMENTBUILDER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "config.hpp"
#include "directorywalker.hpp"
#include "iselectionsource.hpp"

/**
 * @class DocumentBuilder
 * @brief Synthesizes the exported document in one pass
 *
 * The builder walks the filesystem itself through the DirectoryWalker; the
 * selection source is only asked about paths. A path therefore does not need
 * to be materialized in the interactive tree to appear in the document, and
 * a deselected directory does not hide a selected file below it.
 *
 * Document layout:
 * @code
 * # File Tree for `project`
 *
 * project
 * ├── ◉ src
 * │   └── ◉ a.go
 * └── ◉ README.md
 *
 * ---
 *
 * ## Selected files
 *
 *
 * ### `src/a.go`
 *
 * ```go
 * fmt.Println(1)
 * ```
 * @endcode
 *
 * Per-file failures (unreadable files) produce an inline notice and never
 * abort the build.
 *
 * @see DirectoryWalker
 * @see ISelectionSource
 * @see BinaryContentInspector
 */
class DocumentBuilder {
private:
  /** @brief Glyphs and default limits */
  const Config &m_config;

  /** @brief Traversal shared with the tree model */
  const DirectoryWalker &m_walker;

  /** @brief Effective selection for every path */
  const ISelectionSource &m_selection;

  /**
   * @brief Appends the tree lines for one directory, recursively
   *
   * @param dir Directory whose entries are rendered
   * @param prefix Indentation built from the ancestors' last-sibling status
   * @param include_unselected Also list entries that are not selected
   * @param lines Output lines
   */
  void renderTree(const std::filesystem::path &dir, const std::string &prefix,
                  bool include_unselected,
                  std::vector<std::string> &lines) const;

  /**
   * @brief Appends the subsection for one selected file
   */
  void renderFile(const DirEntry &file, const std::filesystem::path &root,
                  std::size_t max_bytes, bool embed_binary,
                  std::vector<std::string> &lines) const;

  /**
   * @brief Maps a requested export root onto the filter's spelling
   *
   * @throws std::invalid_argument if the root is outside the filter root
   */
  std::filesystem::path resolveRoot(const std::filesystem::path &root) const;

  /** @brief Selection marker for a state */
  const std::string &glyphFor(SelectionState state) const;

public:
  /** @brief Notice emitted instead of binary content */
  static constexpr const char *BINARY_NOTICE =
      "_Binary file — content not embedded._";

  /**
   * @brief Constructs a builder
   *
   * @note All references must outlive the builder
   */
  DocumentBuilder(const Config &config, const DirectoryWalker &walker,
                  const ISelectionSource &selection)
      : m_config(config), m_walker(walker), m_selection(selection) {}

  /**
   * @brief Builds the document with explicit limits
   *
   * @param root Directory to export; the filter root or a directory below
   *        it, in any spelling ("." and symlinked paths included)
   * @param include_unselected If true, unselected entries are listed in the
   *        tree (with the unselected marker); file contents are always
   *        limited to selected files
   * @param max_bytes Maximum bytes embedded per file
   * @param embed_binary If false, binary files get a placeholder notice
   * @return std::string Complete document text
   *
   * @throws std::invalid_argument if root is outside the filter root
   */
  std::string build(const std::filesystem::path &root, bool include_unselected,
                    std::size_t max_bytes, bool embed_binary) const;

  /**
   * @brief Builds the document with the configured limits
   *
   * Uses Config::max_bytes and Config::read_binary.
   */
  std::string build(const std::filesystem::path &root,
                    bool include_unselected) const {
    return build(root, include_unselected, m_config.max_bytes,
                 m_config.read_binary);
  }

  /**
   * @brief Writes a document as a single file, replacing any previous one
   *
   * @param path Destination file
   * @param text Document text
   *
   * @throws std::runtime_error if the file cannot be written
   */
  static void writeDocument(const std::filesystem::path &path,
                            const std::string &text);

  /**
   * @brief Name shown for the root in the title and the tree
   *
   * The last path component; for a filesystem root the path itself.
   */
  static std::string rootName(const std::filesystem::path &root);
};

#endif // DOCUMENTBUILDER_HPP
