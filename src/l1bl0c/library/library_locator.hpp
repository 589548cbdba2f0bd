#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace l1bl0c::platform {
class platform_identity;
}

namespace l1bl0c::library {

/**
 * @brief return the first directory entry that holds the mapped library file
 *
 * the generic name is mapped with the identity's name mapper, then each directory is checked in
 * order for a regular file of that name. empty directory entries are skipped.
 * @return absolute path of the first hit, otherwise the mapped file name
 */
std::string locate_in_directories(
    const platform::platform_identity& identity, std::string_view generic_name,
    const std::vector<std::string>& search_paths
);

/**
 * @brief search for lib<name>.so and lib<name>.so.<N>, preferring the highest N
 *
 * matches from all directories are pooled. any versioned file outranks the unversioned one and a
 * higher version outranks a lower one. on equal rank the earlier directory in search_paths wins.
 * @return absolute path of the best match, otherwise the mapped file name
 */
std::string locate_versioned_shared_object(
    const platform::platform_identity& identity, std::string_view generic_name,
    const std::vector<std::string>& search_paths
);

struct shared_object_match {
  bool versioned = false;
  unsigned long version = 0;
};

// classify file_name against lib<generic_name>.so[.<digits>]; nullopt when it does not match
std::optional<shared_object_match> match_shared_object(std::string_view file_name, std::string_view generic_name);

} // namespace l1bl0c::library
