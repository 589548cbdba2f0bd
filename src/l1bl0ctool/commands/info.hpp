#pragma once

#include <args.hxx>

namespace l1bl0ctool::commands {

/**
 * info command - print the resolved platform identity
 *
 * @param search_paths_flag also print the composed library search paths (optional)
 * @return exit code (0 for success, 1 if the platform cannot be resolved)
 */
int info(args::Flag& search_paths_flag);

} // namespace l1bl0ctool::commands
