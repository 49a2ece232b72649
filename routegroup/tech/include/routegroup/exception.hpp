#pragma once

#include <fmt/core.h>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <exception>
#include <utility>

namespace routegroup {

// Exception with an inline message buffer, so that copying or throwing it never allocates.
// Messages longer than kMsgMaxLen are truncated and end with "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 255;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_msg, str, N);
  }

  template <typename... Args>
  explicit exception(fmt::format_string<Args...> fmt, Args&&... args) {
    const auto res = fmt::format_to_n(_msg, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (res.size > kMsgMaxLen) {
      static constexpr char kEllipsis[] = "...";
      std::memcpy(_msg + kMsgMaxLen - (sizeof(kEllipsis) - 1U), kEllipsis, sizeof(kEllipsis));
    } else {
      *res.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _msg; }

 private:
  char _msg[kMsgMaxLen + 1];
};

}  // namespace routegroup
