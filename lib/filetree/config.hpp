/**
 * @file config.hpp
 * @brief Runtime configuration shared by every filetree component
 *
 * This header defines the Config value that is built once at startup from
 * environment variables, command line overrides and the optional
 * .filetreeignore file, and is then passed to every component that needs it.
 *
 * @see Config
 * @see ConfigError
 */

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @class ConfigError
 * @brief Raised when the configuration cannot be used
 *
 * A ConfigError is fatal: the executables report it and exit with a non-zero
 * status before any traversal begins.
 */
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @struct Config
 * @brief Explicit configuration value for one filetree session
 *
 * Holds the root directory, the output file name, exclusion settings, size
 * limits and the presentation settings used by the interactive browser.
 * Defaults match the values documented for the environment variables.
 *
 * Typical construction:
 * @code
 * Config config = Config::fromEnvironment();
 * applyCommandLine(config, options);   // optional overrides
 * config.finalize();                   // resolves root, reads ignore file
 * @endcode
 *
 * @see Config::fromEnvironment()
 * @see Config::finalize()
 */
struct Config {
  /** @brief Lookup function used to read environment variables */
  using EnvLookup =
      std::function<std::optional<std::string>(const std::string &name)>;

  /** @brief Name of the optional ignore file inside the root directory */
  static constexpr const char *IGNORE_FILE_NAME = ".filetreeignore";

  /** @brief Root directory of the browsed subtree (absolute after finalize) */
  std::filesystem::path root = ".";

  /** @brief Name of the generated document, written inside root */
  std::string output_file = "FILETREE.md";

  /** @brief Exclude glob patterns, in the order they were configured */
  std::vector<std::string> excludes = defaultExcludes();

  /** @brief Whether entries with a leading dot are shown */
  bool include_hidden = true;

  /** @brief Maximum number of bytes embedded per file */
  std::size_t max_bytes = 300000;

  /** @brief Whether files detected as binary are embedded anyway */
  bool read_binary = false;

  // Presentation settings, consumed by the interactive browser only.
  std::string select_color = "green";
  std::string unselect_color = "grey50";
  std::string icon_selected = "◉";
  std::string icon_unselected = "◯";
  std::string icon_mixed = "◐";

  /** @brief Optional log file; empty means no file logging */
  std::string log_file;

  /** @brief spdlog level name (trace, debug, info, warn, err, critical, off) */
  std::string log_level = "warn";

  /**
   * @brief Returns the built-in exclude patterns
   *
   * @return std::vector<std::string> .git, node_modules, __pycache__, .venv
   *         and .mypy_cache
   */
  static std::vector<std::string> defaultExcludes();

  /**
   * @brief Builds a configuration from environment variables
   *
   * Recognised variables: ROOT_DIR, OUTPUT, EXCLUDES, INCLUDE_HIDDEN,
   * MAX_BYTES, READ_BINARY, SELECT_COLOR, UNSELECT_COLOR, ICON_SELECTED,
   * ICON_UNSELECTED, ICON_MIXED, LOG_FILE and LOG_LEVEL. Unset variables keep
   * their defaults. EXCLUDES replaces the built-in pattern list.
   *
   * @param lookup Variable reader; defaults to std::getenv
   * @return Config Configuration that still needs finalize()
   *
   * @throws ConfigError if MAX_BYTES is not a non-negative integer
   */
  static Config fromEnvironment(const EnvLookup &lookup = systemEnvironment);

  /**
   * @brief Reads a variable from the process environment
   */
  static std::optional<std::string> systemEnvironment(const std::string &name);

  /**
   * @brief Resolves the root directory and loads the ignore file
   *
   * Makes root absolute and canonical, then appends every pattern found in
   * root/.filetreeignore (blank lines and lines starting with '#' skipped).
   *
   * @throws ConfigError if root does not exist or is not a directory
   */
  void finalize();

  /**
   * @brief Full path of the generated document
   */
  std::filesystem::path outputPath() const { return root / output_file; }
};

/**
 * @brief Parses a byte limit such as "300000"
 *
 * @param text Decimal digits, surrounding whitespace allowed
 * @param source Name used in the error message (e.g. "MAX_BYTES")
 * @return std::size_t Parsed value
 *
 * @throws ConfigError if text is empty, negative or not a number
 */
std::size_t parseByteLimit(const std::string &text, const std::string &source);

/**
 * @brief Reads exclude patterns from an ignore file
 *
 * One pattern per line. Lines are trimmed; empty lines and lines starting
 * with '#' are skipped. A missing or unreadable file yields no patterns.
 *
 * @param file Path of the ignore file
 * @return std::vector<std::string> Patterns in file order
 */
std::vector<std::string> readIgnoreFile(const std::filesystem::path &file);

#endif // CONFIG_HPP
