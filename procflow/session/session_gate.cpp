#include "session_gate.hpp"

#include "token.hpp"

#include <procflow/util/logging.hpp>

#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace procflow::session
{
  static auto logcat = log::Cat("session");

  std::string_view
  ToString(SessionStatus status)
  {
    switch (status)
    {
      case SessionStatus::allowed:
        return "allowed";
      case SessionStatus::expired:
        return "expired";
      case SessionStatus::indeterminate:
        return "indeterminate";
    }
    return "unknown";
  }

  SessionGate::SessionGate(std::shared_ptr<TokenSource> tokens, Duration_t leeway, Clock clock)
      : _tokens{std::move(tokens)}, _leeway{leeway}, _clock{std::move(clock)}
  {
    if (not _clock)
      throw std::invalid_argument{"session gate needs a clock"};
    if (_leeway < 0s)
      throw std::invalid_argument{"session expiry leeway cannot be negative"};
  }

  std::optional<std::string>
  SessionGate::access_token() const
  {
    if (not _tokens)
      return std::nullopt;
    auto token = _tokens->access_token();
    if (token and token->empty())
      return std::nullopt;
    return token;
  }

  SessionStatus
  SessionGate::evaluate(bool check_token_expiry) const
  {
    if (not check_token_expiry)
      return SessionStatus::allowed;

    const auto token = access_token();
    if (not token)
    {
      log::debug(logcat, "no access token, session is over");
      return SessionStatus::expired;
    }

    const auto maybe_exp = token_expiry(*token);
    if (not maybe_exp)
    {
      log::debug(logcat, "access token has no usable expiry claim");
      return SessionStatus::indeterminate;
    }

    // anything before the epoch is long expired; clamping keeps the time math below in range
    const auto expires = from_unix_seconds(std::max<int64_t>(*maybe_exp, 0));
    if (expires == TimePoint_t::max())
    {
      log::trace(logcat, "access token expiry {} is beyond any clock we have", *maybe_exp);
      return SessionStatus::allowed;
    }

    const auto now = _clock();
    if (expires <= now + _leeway)
    {
      log::info(logcat, "access token expired {}", short_time_from(expires, now));
      return SessionStatus::expired;
    }
    log::trace(logcat, "access token expires {}", short_time_from(expires, now));
    return SessionStatus::allowed;
  }

  std::optional<bool>
  SessionGate::is_continuation_allowed(bool check_token_expiry) const
  {
    switch (evaluate(check_token_expiry))
    {
      case SessionStatus::allowed:
        return true;
      case SessionStatus::expired:
        return false;
      case SessionStatus::indeterminate:
        break;
    }
    return std::nullopt;
  }

}  // namespace procflow::session
