#pragma once

#include <string>
#include <vector>

namespace l1bl0c::util {

// reads typed settings from environment variables named <prefix>_<name>
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  bool has(const std::string& name) const;

  // splits on delimiter, trims items and drops empty ones
  std::vector<std::string> get_list(const std::string& name, char delimiter = ',') const;

  std::string build_env_name(const std::string& name) const;

private:
  std::string prefix_;
  std::string get_env_value(const std::string& name) const;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> int env_config::get<int>(const std::string& name, int default_value) const;

} // namespace l1bl0c::util
