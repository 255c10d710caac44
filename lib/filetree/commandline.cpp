#include "commandline.hpp"

CommandLineOptions applyCommandLine(Config &config,
                                    const std::vector<std::string> &args,
                                    bool export_flags) {
  CommandLineOptions options;

  auto value_of = [&](size_t &i) -> const std::string & {
    if (i + 1 >= args.size()) {
      throw ConfigError("Missing value for " + args[i]);
    }
    return args[++i];
  };

  // Simple argument parser
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];

    if (arg == "-h" || arg == "--help") {
      options.show_help = true;
    } else if (arg == "-p" || arg == "--path") {
      config.root = value_of(i);
    } else if (arg == "-o" || arg == "--output") {
      config.output_file = value_of(i);
    } else if (arg == "-e" || arg == "--exclude") {
      config.excludes.push_back(value_of(i));
    } else if (arg == "--hidden") {
      config.include_hidden = true;
    } else if (arg == "--no-hidden") {
      config.include_hidden = false;
    } else if (arg == "--max-bytes") {
      config.max_bytes = parseByteLimit(value_of(i), "--max-bytes");
    } else if (arg == "--binary") {
      config.read_binary = true;
    } else if (export_flags &&
               (arg == "-u" || arg == "--include-unselected")) {
      options.include_unselected = true;
    } else if (export_flags && (arg == "-x" || arg == "--deselect")) {
      options.deselect.push_back(value_of(i));
    } else if (export_flags && arg == "--stdout") {
      options.to_stdout = true;
    } else {
      throw ConfigError("Unknown option: " + arg);
    }
  }

  return options;
}

std::string usage(const std::string &program, bool export_flags) {
  std::string text = "Usage: " + program + " [options]\n"
                     "  -p, --path DIR         root directory (ROOT_DIR)\n"
                     "  -o, --output FILE      output file name (OUTPUT)\n"
                     "  -e, --exclude PATTERN  extra exclude pattern\n"
                     "      --hidden           include dot entries\n"
                     "      --no-hidden        skip dot entries\n"
                     "      --max-bytes N      bytes embedded per file (MAX_BYTES)\n"
                     "      --binary           embed binary files (READ_BINARY)\n";
  if (export_flags) {
    text += "  -u, --include-unselected  list unselected entries in the tree\n"
            "  -x, --deselect PATH    leave a root-relative path out\n"
            "      --stdout           print the document instead of writing it\n";
  }
  text += "  -h, --help             show this help\n";
  return text;
}
