#pragma once

#include "formattable.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace procflow
{
  /// every way a flow operation can end without a result.
  enum class ErrorKind
  {
    /// malformed or unrecognized instruction payload
    decode_failure,
    /// no handler registered for the decoded step
    unknown_step,
    /// the step handler reported failure; opaque to the core
    handler_failure,
    /// the step result could not be serialized
    encode_failure,
    /// the remote engine rejected the transition or the request never made it
    transition_submit_failure,
    /// the session gate could not decide from the token
    session_indeterminate,
    /// the session token has expired or is missing
    session_expired,
    /// the transport to the remote engine failed
    transport_failure,
    /// the remote engine replied with something we could not use
    bad_response,
    /// a continuation was already in flight
    busy,
  };

  std::string_view
  ToString(ErrorKind kind);

  template <>
  inline constexpr bool IsToStringFormattable<ErrorKind> = true;

  struct Error
  {
    ErrorKind kind;
    std::string message;
    /// set when this error wraps a lower level one, e.g. a submit failure caused by an
    /// expired session
    std::optional<ErrorKind> cause = std::nullopt;

    std::string
    ToString() const;
  };

  template <>
  inline constexpr bool IsToStringFormattable<Error> = true;

  /// result of an asynchronous operation: either the value or why there is none.
  template <typename T>
  using Result = std::variant<T, Error>;

  template <typename T>
  bool
  is_ok(const Result<T>& result)
  {
    return std::holds_alternative<T>(result);
  }

  template <typename T>
  const Error*
  error_of(const Result<T>& result)
  {
    return std::get_if<Error>(&result);
  }

}  // namespace procflow
