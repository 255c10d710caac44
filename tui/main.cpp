#include "commandline.hpp"
#include "config.hpp"
#include "filetreeui.hpp"
#include "logging.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
  try {
    Config config = Config::fromEnvironment();

    std::vector<std::string> args(argv + 1, argv + argc);
    CommandLineOptions options = applyCommandLine(config, args, false);
    if (options.show_help) {
      std::cout << usage(argv[0], false);
      return 0;
    }

    // The terminal belongs to the UI from here on
    setupLogging(config, LogTarget::FileOnly);
    config.finalize();

    std::string written;
    {
      FileTreeUI ui(config);
      ui.initialize();
      ui.run();
      written = ui.writtenPath();
    }

    if (!written.empty()) {
      std::cout << "Wrote " << written << std::endl;
    }
  } catch (const ConfigError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    // Screen is restored by the time the exception gets here
    spdlog::error("{}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
