#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace routegroup {

struct ServeMuxConfig {
  enum class DuplicatePathPolicy : std::uint8_t { Overwrite, Reject };

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  // Behavior when a path is bound twice.
  //   Overwrite: the last bound handler wins, a warning is logged.
  //   Reject   : the second bind throws std::invalid_argument.
  // Default: Overwrite
  ServeMuxConfig& withDuplicatePathPolicy(DuplicatePathPolicy policy);

  // Body of the 404 response sent for paths with no bound handler.
  ServeMuxConfig& withNotFoundBody(std::string_view body);

  DuplicatePathPolicy duplicatePathPolicy{DuplicatePathPolicy::Overwrite};

  std::string notFoundBody{"404 page not found"};
};

}  // namespace routegroup
