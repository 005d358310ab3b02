#include "token.hpp"

#include <procflow/flow/payload_codec.hpp>
#include <procflow/util/logging.hpp>
#include <procflow/util/str.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>

namespace procflow::session
{
  static auto logcat = log::Cat("session");

  std::optional<int64_t>
  token_expiry(std::string_view token)
  {
    // header.claims.signature
    const auto parts = split(TrimWhitespace(token), ".");
    if (parts.size() != 3)
    {
      log::debug(logcat, "access token has {} parts, not a jwt", parts.size());
      return std::nullopt;
    }

    const auto maybe_claims = flow::decode_transport(parts[1]);
    if (not maybe_claims)
    {
      log::debug(logcat, "access token claims are not base64");
      return std::nullopt;
    }

    const auto claims = nlohmann::json::parse(*maybe_claims, nullptr, false);
    if (claims.is_discarded() or not claims.is_object())
    {
      log::debug(logcat, "access token claims are not a json object");
      return std::nullopt;
    }

    const auto itr = claims.find("exp");
    if (itr == claims.end())
      return std::nullopt;
    constexpr auto max_exp = std::numeric_limits<int64_t>::max();
    constexpr auto min_exp = std::numeric_limits<int64_t>::min();
    if (itr->is_number_unsigned())
    {
      const auto exp = itr->get<uint64_t>();
      return exp > static_cast<uint64_t>(max_exp) ? max_exp : static_cast<int64_t>(exp);
    }
    if (itr->is_number_integer())
      return itr->get<int64_t>();
    if (itr->is_number_float())
    {
      // 2^63 and -2^63 are exact as doubles; anything at or beyond them saturates
      const auto exp = itr->get<double>();
      if (std::isnan(exp))
        return std::nullopt;
      if (exp >= static_cast<double>(max_exp))
        return max_exp;
      if (exp <= static_cast<double>(min_exp))
        return min_exp;
      return static_cast<int64_t>(exp);
    }
    if (itr->is_string())
    {
      int64_t exp;
      if (parse_int(itr->get<std::string>(), exp))
        return exp;
    }
    log::debug(logcat, "access token exp claim is not a number");
    return std::nullopt;
  }

}  // namespace procflow::session
