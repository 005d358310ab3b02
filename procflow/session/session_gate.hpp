#pragma once

#include <procflow/util/formattable.hpp>
#include <procflow/util/time.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace procflow::session
{
  /// host side source of the current access token
  class TokenSource
  {
   public:
    virtual ~TokenSource() = default;

    /// the access token to send to the engine, if the user is logged in
    virtual std::optional<std::string>
    access_token() const = 0;
  };

  /// a token source for a token that never changes (e.g. one given on the command line)
  class StaticTokenSource : public TokenSource
  {
    std::optional<std::string> _token;

   public:
    explicit StaticTokenSource(std::optional<std::string> token) : _token{std::move(token)}
    {}

    std::optional<std::string>
    access_token() const override
    {
      return _token;
    }
  };

  enum class SessionStatus
  {
    allowed,
    expired,
    /// the token does not say when it expires; the caller has to pick a policy
    indeterminate,
  };

  std::string_view
  ToString(SessionStatus status);

  /// Decides whether continuing a flow is currently permitted, going by the expiry claim of the
  /// access token.
  class SessionGate
  {
   public:
    using Clock = std::function<TimePoint_t()>;

    /// `tokens` may be null, which is the same as never having a token.  a token expiring within
    /// `leeway` of now counts as expired.
    explicit SessionGate(
        std::shared_ptr<TokenSource> tokens, Duration_t leeway = 0s, Clock clock = time_point_now);

    SessionStatus
    evaluate(bool check_token_expiry) const;

    /// true/false when the gate can decide, nullopt when it is indeterminate
    std::optional<bool>
    is_continuation_allowed(bool check_token_expiry) const;

    std::optional<std::string>
    access_token() const;

   private:
    const std::shared_ptr<TokenSource> _tokens;
    const Duration_t _leeway;
    const Clock _clock;
  };

}  // namespace procflow::session

namespace procflow
{
  template <>
  inline constexpr bool IsToStringFormattable<session::SessionStatus> = true;
}  // namespace procflow
