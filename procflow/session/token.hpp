#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace procflow::session
{
  /// Extracts the `exp` claim (seconds since the unix epoch) from a JWT style access token.  The
  /// signature is not verified; we only need to know whether the engine will still accept it.
  /// Returns nullopt if the token is not a JWT or carries no numeric `exp` claim.  Claims beyond
  /// the range of int64_t saturate to its limits.
  std::optional<int64_t>
  token_expiry(std::string_view token);

}  // namespace procflow::session
