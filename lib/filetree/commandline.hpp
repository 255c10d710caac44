/**
 * @file commandline.hpp
 * @brief Command line overrides shared by the filetree executables
 */

#ifndef COMMANDLINE_HPP
#define COMMANDLINE_HPP

#include <string>
#include <vector>

#include "config.hpp"

/**
 * @struct CommandLineOptions
 * @brief Flags that are not part of Config
 */
struct CommandLineOptions {
  /** @brief -h/--help was given */
  bool show_help = false;

  /** @brief -u/--include-unselected (export front end only) */
  bool include_unselected = false;

  /** @brief --stdout: print the document instead of writing it */
  bool to_stdout = false;

  /** @brief -x/--deselect: root-relative paths to leave out */
  std::vector<std::string> deselect;
};

/**
 * @brief Applies command line arguments on top of a configuration
 *
 * Recognised options:
 * - -p, --path DIR           root directory
 * - -o, --output FILE        output file name inside root
 * - -e, --exclude PATTERN    extra exclude pattern (repeatable)
 * - --hidden / --no-hidden   include or skip dot entries
 * - --max-bytes N            bytes embedded per file
 * - --binary                 embed binary files
 * - -h, --help               show usage
 *
 * With export_flags set, -u/--include-unselected, -x/--deselect PATH and
 * --stdout are accepted as well.
 *
 * @param config Configuration to modify (normally from the environment)
 * @param args Arguments without the program name
 * @param export_flags Accept the non-interactive export flags
 * @return CommandLineOptions Flags that do not belong in Config
 *
 * @throws ConfigError for an unknown option or a missing value
 */
CommandLineOptions applyCommandLine(Config &config,
                                    const std::vector<std::string> &args,
                                    bool export_flags);

/**
 * @brief Usage text for --help
 */
std::string usage(const std::string &program, bool export_flags);

#endif // COMMANDLINE_HPP
