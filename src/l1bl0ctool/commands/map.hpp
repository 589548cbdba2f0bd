#pragma once

#include <string>

#include <args.hxx>

namespace l1bl0ctool::commands {

/**
 * map command - print platform file names for generic library names
 *
 * @param names_list generic library names (e.g. "c", "ssl")
 * @return exit code (0 for success, 1 on failure)
 */
int map(args::PositionalList<std::string>& names_list);

} // namespace l1bl0ctool::commands
