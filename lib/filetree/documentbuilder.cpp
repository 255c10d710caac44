/**
 * @file documentbuilder.cpp
 * @brief Implementation of the Markdown export
 *
 * Key implementation areas:
 * - Title and ASCII tree rendering
 * - Bounded, binary-aware file reading
 * - Fenced content with truncation notice
 * - Writing the finished document
 */

#include "documentbuilder.hpp"
#include "binaryinspector.hpp"
#include "languagetable.hpp"
#include "textdecoding.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t READ_CHUNK = 64 * 1024;

/**
 * @brief Reads at most limit bytes from a file
 *
 * @param path File to read
 * @param limit Maximum number of bytes
 * @param data Receives the bytes read
 * @param error Receives a reason on failure
 * @return true on success (including a short read at end of file)
 */
bool readBounded(const std::filesystem::path &path, std::size_t limit,
                 std::string &data, std::string &error) {
  // Opening a FIFO or a device would block or never reach end of file
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if (!ec && std::filesystem::exists(status) &&
      !std::filesystem::is_regular_file(status)) {
    error = "not a regular file";
    return false;
  }

  errno = 0;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    error = "cannot open " + path.string();
    if (errno != 0)
      error += ": " + std::error_code(errno, std::generic_category()).message();
    return false;
  }

  data.clear();
  while (data.size() < limit) {
    std::size_t want = std::min(READ_CHUNK, limit - data.size());
    std::size_t old_size = data.size();
    data.resize(old_size + want);
    in.read(&data[old_size], static_cast<std::streamsize>(want));
    data.resize(old_size + static_cast<std::size_t>(in.gcount()));

    if (in.bad()) {
      error = "read failed for " + path.string();
      return false;
    }
    if (in.eof())
      break;
  }
  return true;
}

} // namespace

std::string DocumentBuilder::rootName(const std::filesystem::path &root) {
  auto normal = root.lexically_normal();
  if (!normal.has_filename() && normal.has_relative_path())
    normal = normal.parent_path();

  std::string name = normal.filename().string();
  return name.empty() ? normal.string() : name;
}

/**
 * @brief Spells a requested root the way the filter and the model do
 *
 * Both sides are resolved with weakly_canonical; the relative part is then
 * appended to the filter root, so "." or a symlinked spelling of the root
 * yields exactly PathFilter::root().
 */
std::filesystem::path
DocumentBuilder::resolveRoot(const std::filesystem::path &root) const {
  namespace fs = std::filesystem;
  const fs::path &base = m_walker.filter().root();

  std::error_code ec;
  fs::path wanted = fs::absolute(root, ec);
  if (ec)
    wanted = root;
  wanted = fs::weakly_canonical(wanted, ec);
  if (ec)
    wanted = fs::absolute(root).lexically_normal();

  fs::path canonical_base = fs::weakly_canonical(base, ec);
  if (ec)
    canonical_base = base;

  fs::path rel = wanted.lexically_relative(canonical_base);
  if (rel.empty() || *rel.begin() == "..") {
    throw std::invalid_argument("Export root " + root.string() +
                                " is outside " + base.string());
  }
  if (rel == ".")
    return base;
  return base / rel;
}

const std::string &DocumentBuilder::glyphFor(SelectionState state) const {
  switch (state) {
  case SelectionState::Selected:
    return m_config.icon_selected;
  case SelectionState::Mixed:
    return m_config.icon_mixed;
  case SelectionState::Unselected:
  default:
    return m_config.icon_unselected;
  }
}

/**
 * @brief Builds the document with explicit limits
 *
 * Implementation flow:
 * 1. Title line and the root name
 * 2. renderTree() over the root
 * 3. Section separator and "Selected files" heading
 * 4. walkFiles() over the root, renderFile() for each selected file
 *
 * Lines are joined with '\n' and no trailing newline is added.
 *
 * @throws std::invalid_argument if root is not at or below the filter root
 */
std::string DocumentBuilder::build(const std::filesystem::path &requested_root,
                                   bool include_unselected,
                                   std::size_t max_bytes,
                                   bool embed_binary) const {
  const std::filesystem::path root = resolveRoot(requested_root);
  std::vector<std::string> lines;
  const std::string name = rootName(root);

  lines.push_back("# File Tree for `" + name + "`\n");
  lines.push_back(name);
  renderTree(root, "", include_unselected, lines);

  lines.push_back("\n---\n");
  lines.push_back("## Selected files\n");

  std::size_t file_count = 0;
  m_walker.walkFiles(
      root,
      [&](const DirEntry &file) {
        renderFile(file, root, max_bytes, embed_binary, lines);
        file_count++;
      },
      [this](const std::filesystem::path &path) {
        return m_selection.effectiveSelection(path);
      });

  std::string document;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0)
      document += '\n';
    document += lines[i];
  }

  spdlog::info("Built document for {}: {} file(s), {} bytes", root.string(),
               file_count, document.size());
  return document;
}

/**
 * @brief Appends the tree lines for one directory, recursively
 *
 * Line format: prefix, connector ("└── " for the last entry of the listing,
 * "├── " otherwise), glyph, a space and the entry name.
 *
 * An entry is listed when unselected entries are requested, when it is
 * effectively selected, or when it is a Mixed directory (it contains
 * selected files). The recursion into a directory happens whether or not its
 * own line was emitted; the "last" status always refers to the full
 * filtered listing.
 */
void DocumentBuilder::renderTree(const std::filesystem::path &dir,
                                 const std::string &prefix,
                                 bool include_unselected,
                                 std::vector<std::string> &lines) const {
  const auto entries = m_walker.list(dir);

  for (size_t i = 0; i < entries.size(); ++i) {
    const auto &entry = entries[i];
    const bool last = (i + 1 == entries.size());

    const bool selected = m_selection.effectiveSelection(entry.path);
    const SelectionState state = m_selection.displayState(entry.path);

    if (include_unselected || selected || state == SelectionState::Mixed) {
      lines.push_back(prefix + (last ? "└── " : "├── ") + glyphFor(state) +
                      " " + entry.name);
    }

    if (entry.is_directory) {
      renderTree(entry.path, prefix + (last ? "    " : "│   "),
                 include_unselected, lines);
    }
  }
}

/**
 * @brief Appends the subsection for one selected file
 *
 * Steps:
 * 1. Heading with the root-relative path
 * 2. Read up to max_bytes + 1 bytes (the extra byte detects truncation)
 * 3. Sniff the first 8 KiB; binary files get BINARY_NOTICE unless embedding
 *    is enabled
 * 4. Cut to max_bytes, decode lossy, strip trailing newlines and fence it
 * 5. Truncation notice if the file was longer than max_bytes
 *
 * A read failure emits an "_Error reading file: ..._" notice instead.
 */
void DocumentBuilder::renderFile(const DirEntry &file,
                                 const std::filesystem::path &root,
                                 std::size_t max_bytes, bool embed_binary,
                                 std::vector<std::string> &lines) const {
  const std::string rel =
      file.path.lexically_relative(root).generic_string();
  lines.push_back("\n### `" + rel + "`\n");

  std::string data;
  std::string error;
  if (!readBounded(file.path, max_bytes + 1, data, error)) {
    spdlog::warn("Error reading {}: {}", file.path.string(), error);
    lines.push_back("_Error reading file: " + error + "_");
    return;
  }

  std::string_view sample(data.data(),
                          std::min(data.size(), BinaryContentInspector::SAMPLE_SIZE));
  if (BinaryContentInspector::sniff(sample) && !embed_binary) {
    lines.push_back(BINARY_NOTICE);
    return;
  }

  const bool truncated = data.size() > max_bytes;
  if (truncated)
    data.resize(max_bytes);

  std::string text = isValidUtf8(data) ? std::move(data) : decodeUtf8Lossy(data);
  auto end = text.find_last_not_of('\n');
  text.erase(end == std::string::npos ? 0 : end + 1);

  lines.push_back("```" + languageFor(file.path));
  lines.push_back(text);
  lines.push_back("```");

  if (truncated) {
    lines.push_back("_...truncated at " + std::to_string(max_bytes) +
                    " bytes_");
  }
}

void DocumentBuilder::writeDocument(const std::filesystem::path &path,
                                    const std::string &text) {
  errno = 0;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    std::string reason =
        errno != 0 ? std::error_code(errno, std::generic_category()).message()
                   : "cannot open file";
    throw std::runtime_error("Cannot write " + path.string() + ": " + reason);
  }

  out << text;
  out.flush();
  if (!out)
    throw std::runtime_error("Cannot write " + path.string());

  spdlog::info("Wrote {} ({} bytes)", path.string(), text.size());
}
