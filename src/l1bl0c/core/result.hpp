#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace l1bl0c::core {

// only host resolution can fail; library naming and lookup degrade to a mapped name instead
enum class error_code { ok, unknown_address_width };

inline std::string_view to_string(error_code code) {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::unknown_address_width:
    return "unknown_address_width";
  }
  return "unrecognized";
}

struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }

  // "<code>: <message>", or just the code name when there is no message
  std::string describe() const {
    std::string text(to_string(code));
    if (!message.empty()) {
      text.append(": ").append(message);
    }
    return text;
  }
};

// value is only meaningful when status_info.ok()
template <typename T> struct result {
  T value{};
  status status_info{};

  bool ok() const noexcept { return status_info.ok(); }
};

template <typename T> result<T> ok_result(T value) { return result<T>{std::move(value), status{}}; }

template <typename T> result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, status{code, std::move(message)}};
}

} // namespace l1bl0c::core
