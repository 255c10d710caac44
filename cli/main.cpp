#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "commandline.hpp"
#include "config.hpp"
#include "directorywalker.hpp"
#include "documentbuilder.hpp"
#include "logging.hpp"
#include "pathfilter.hpp"
#include "treemodel.hpp"
#include "utils.hpp"

/**
 * @class Application
 * @brief Non-interactive export of a directory to the Markdown document
 *
 * Builds the same pipeline as the interactive browser (PathFilter,
 * DirectoryWalker, TreeModel, DocumentBuilder) from a finalized Config, with
 * the whole tree selected. Entries given with -x/--deselect are unselected
 * before the export, exactly as if the operator had toggled them.
 *
 * Output goes either to root/output_file or, with --stdout, to standard
 * output. Progress messages are logged, never printed, so that --stdout
 * output stays clean.
 *
 * Error handling
 *  - ConfigError and write failures propagate to main(), which maps them to
 *    exit codes 2 and 1.
 *  - Unreadable directories and files never abort the export; they are
 *    logged and rendered as described by DocumentBuilder.
 *
 * Application is not thread-safe.
 */
class Application {
private:
  const Config &m_config;
  PathFilter m_filter;
  DirectoryWalker m_walker;
  TreeModel m_model;

public:
  explicit Application(const Config &config)
      : m_config(config), m_filter(config), m_walker(m_filter),
        m_model(m_walker, true) {}

  int run(const CommandLineOptions &options) {
    m_model.populate(m_model.root());
    deselect(options.deselect);

    DocumentBuilder builder(m_config, m_walker, m_model);
    std::string document =
        builder.build(m_config.root, options.include_unselected);

    if (options.to_stdout) {
      std::cout << document << std::endl;
      return 0;
    }

    const auto out_path = m_config.outputPath();
    DocumentBuilder::writeDocument(out_path, document);
    spdlog::info("Document size: {}",
                 formatBytes(static_cast<long long>(document.size())));
    std::cout << "Wrote " << out_path.string() << std::endl;
    return 0;
  }

private:
  void deselect(const std::vector<std::string> &paths) {
    for (const auto &rel : paths) {
      TreeNode *node = m_model.materialize(m_config.root / rel);
      if (node == nullptr) {
        spdlog::warn("Cannot deselect '{}': not found below {}", rel,
                     m_config.root.string());
        continue;
      }
      m_model.setSelected(*node, false);
      m_model.propagateUp(*node);
      spdlog::debug("Deselected {}", node->getPath().string());
    }
  }
};

int main(int argc, char *argv[]) {
  try {
    Config config = Config::fromEnvironment();

    std::vector<std::string> args(argv + 1, argv + argc);
    CommandLineOptions options = applyCommandLine(config, args, true);
    if (options.show_help) {
      std::cout << usage(argv[0], true);
      return 0;
    }

    setupLogging(config, LogTarget::Terminal);
    config.finalize();

    Application app(config);
    return app.run(options);
  } catch (const ConfigError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
