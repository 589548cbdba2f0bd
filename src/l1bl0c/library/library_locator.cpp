#include "l1bl0c/library/library_locator.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <system_error>

#include <redlog.hpp>

#include "l1bl0c/platform/platform.hpp"
#include "l1bl0c/util/string_utils.hpp"

namespace l1bl0c::library {

namespace fs = std::filesystem;

namespace {

struct candidate {
  fs::path path;
  shared_object_match match;
};

bool outranks(const shared_object_match& lhs, const shared_object_match& rhs) {
  if (lhs.versioned != rhs.versioned) {
    return lhs.versioned;
  }
  return lhs.version > rhs.version;
}

std::string absolute_string(const fs::path& path) {
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  return ec ? path.string() : absolute.string();
}

// entries of dir sorted by file name; missing or unreadable directories yield nothing
std::vector<fs::path> sorted_entries(const std::string& dir, redlog::logger& log) {
  std::vector<fs::path> entries;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    log.dbg("skipping unreadable directory", redlog::field("dir", dir), redlog::field("error", ec.message()));
    return entries;
  }

  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      log.dbg("directory listing interrupted", redlog::field("dir", dir), redlog::field("error", ec.message()));
      break;
    }
    entries.push_back(it->path());
  }

  std::sort(entries.begin(), entries.end(), [](const fs::path& lhs, const fs::path& rhs) {
    return lhs.filename() < rhs.filename();
  });
  return entries;
}

} // namespace

std::optional<shared_object_match> match_shared_object(std::string_view file_name, std::string_view generic_name) {
  std::string base = "lib";
  base.append(generic_name).append(".so");

  if (file_name.substr(0, base.size()) != base) {
    return std::nullopt;
  }
  std::string_view rest = file_name.substr(base.size());
  if (rest.empty()) {
    return shared_object_match{};
  }
  if (rest.front() != '.') {
    return std::nullopt;
  }

  std::string_view digits = rest.substr(1);
  if (!util::all_digits(digits)) {
    return std::nullopt;
  }

  shared_object_match match;
  match.versioned = true;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), match.version);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    redlog::get_logger("l1bl0c.locator")
        .dbg("skipping shared object with out-of-range version", redlog::field("file", std::string(file_name)));
    return std::nullopt;
  }
  return match;
}

std::string locate_in_directories(
    const platform::platform_identity& identity, std::string_view generic_name,
    const std::vector<std::string>& search_paths
) {
  auto log = redlog::get_logger("l1bl0c.locator");
  std::string mapped = identity.map_library_name(generic_name);

  for (const auto& dir : search_paths) {
    if (dir.empty()) {
      continue;
    }
    fs::path library_file = fs::path(dir) / mapped;
    std::error_code ec;
    if (fs::is_regular_file(library_file, ec)) {
      std::string resolved = absolute_string(library_file);
      log.trc("located library", redlog::field("name", std::string(generic_name)), redlog::field("path", resolved));
      return resolved;
    }
  }

  log.dbg(
      "library not found in search paths, deferring to system loader", redlog::field("name", std::string(generic_name)),
      redlog::field("mapped", mapped), redlog::field("searched", search_paths.size())
  );
  return mapped;
}

std::string locate_versioned_shared_object(
    const platform::platform_identity& identity, std::string_view generic_name,
    const std::vector<std::string>& search_paths
) {
  auto log = redlog::get_logger("l1bl0c.locator");

  std::vector<candidate> matches;
  for (const auto& dir : search_paths) {
    if (dir.empty()) {
      continue;
    }
    for (const auto& entry : sorted_entries(dir, log)) {
      auto match = match_shared_object(entry.filename().string(), generic_name);
      if (!match) {
        continue;
      }
      std::error_code ec;
      if (!fs::is_regular_file(entry, ec)) {
        log.ped("ignoring non-regular match", redlog::field("path", entry.string()));
        continue;
      }
      log.ped(
          "shared object candidate", redlog::field("path", entry.string()), redlog::field("versioned", match->versioned),
          redlog::field("version", match->version)
      );
      matches.push_back(candidate{entry, *match});
    }
  }

  const candidate* best = nullptr;
  for (const auto& match : matches) {
    if (best == nullptr || outranks(match.match, best->match)) {
      best = &match;
    }
  }

  if (best == nullptr) {
    std::string mapped = identity.map_library_name(generic_name);
    log.dbg(
        "no shared object found, deferring to system loader", redlog::field("name", std::string(generic_name)),
        redlog::field("mapped", mapped), redlog::field("searched", search_paths.size())
    );
    return mapped;
  }

  std::string resolved = absolute_string(best->path);
  log.trc(
      "located shared object", redlog::field("name", std::string(generic_name)), redlog::field("path", resolved),
      redlog::field("candidates", matches.size())
  );
  return resolved;
}

} // namespace l1bl0c::library
