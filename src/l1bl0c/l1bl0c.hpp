#pragma once

// platform identity and native library resolution

#include "l1bl0c/core/result.hpp"
#include "l1bl0c/library/library_locator.hpp"
#include "l1bl0c/library/library_strategy.hpp"
#include "l1bl0c/library/name_mapper.hpp"
#include "l1bl0c/library/search_paths.hpp"
#include "l1bl0c/platform/cpu_arch.hpp"
#include "l1bl0c/platform/host_environment.hpp"
#include "l1bl0c/platform/os_family.hpp"
#include "l1bl0c/platform/platform.hpp"
#include "l1bl0c/util/env_config.hpp"
