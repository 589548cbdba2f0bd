#pragma once

#include <string>

#include <args.hxx>

namespace l1bl0ctool::commands {

/**
 * locate command - resolve generic library names against search directories
 *
 * @param names_list generic library names to resolve
 * @param dirs_flag directories to search, in priority order
 * @param system_flag append L1BL0C_LIBRARY_PATH and the system library directories (optional)
 * @param strict_flag fail when a name only resolves to the unresolved fallback (optional)
 * @return exit code (0 for success, 1 on failure or, with strict, when a library is not found)
 */
int locate(
    args::PositionalList<std::string>& names_list,
    args::ValueFlagList<std::string>& dirs_flag,
    args::Flag& system_flag,
    args::Flag& strict_flag
);

} // namespace l1bl0ctool::commands
