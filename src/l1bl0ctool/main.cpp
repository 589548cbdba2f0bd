#include <cstdlib>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include <l1bl0c/util/env_config.hpp>

#include "commands/info.hpp"
#include "commands/locate.hpp"
#include "commands/map.hpp"
#include "verbosity.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

void apply_verbosity() { l1bl0ctool::cli::apply_verbosity(args::get(verbosity_flag), l1bl0c::util::env_config("L1BL0C")); }
} // namespace cli

namespace {
int g_exit_code = 0;
} // namespace

void cmd_info(args::Subparser& parser) {
  cli::apply_verbosity();

  args::Flag search_paths(parser, "search-paths", "show composed library search paths", {'s', "search-paths"});
  parser.Parse();

  g_exit_code = l1bl0ctool::commands::info(search_paths);
}

void cmd_map(args::Subparser& parser) {
  cli::apply_verbosity();

  args::PositionalList<std::string> names(parser, "names", "generic library names (e.g. c, ssl)");
  parser.Parse();

  g_exit_code = l1bl0ctool::commands::map(names);
}

void cmd_locate(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlagList<std::string> dirs(parser, "dir", "directory to search (repeatable, in order)", {'d', "dir"});
  args::Flag system(parser, "system", "also search L1BL0C_LIBRARY_PATH and system directories", {"system"});
  args::Flag strict(parser, "strict", "exit with failure when a library is not found", {"strict"});
  args::PositionalList<std::string> names(parser, "names", "generic library names (e.g. c, ssl)");
  parser.Parse();

  g_exit_code = l1bl0ctool::commands::locate(names, dirs, system, strict);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser(
      "l1bl0c - platform identity and native library resolution",
      "classify the host platform and resolve generic library names to files"
  );
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command info_cmd(commands, "info", "show the resolved platform identity", &cmd_info);
  args::Command map_cmd(commands, "map", "map generic library names to platform file names", &cmd_map);
  args::Command locate_cmd(commands, "locate", "resolve library names against search directories", &cmd_locate);

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help) {
    std::cout << parser;
  } catch (args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  return g_exit_code;
}
