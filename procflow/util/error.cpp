#include "error.hpp"

#include <fmt/format.h>

namespace procflow
{
  std::string_view
  ToString(ErrorKind kind)
  {
    switch (kind)
    {
      case ErrorKind::decode_failure:
        return "DecodeFailure";
      case ErrorKind::unknown_step:
        return "UnknownStep";
      case ErrorKind::handler_failure:
        return "HandlerFailure";
      case ErrorKind::encode_failure:
        return "EncodeFailure";
      case ErrorKind::transition_submit_failure:
        return "TransitionSubmitFailure";
      case ErrorKind::session_indeterminate:
        return "SessionIndeterminate";
      case ErrorKind::session_expired:
        return "SessionExpired";
      case ErrorKind::transport_failure:
        return "TransportFailure";
      case ErrorKind::bad_response:
        return "BadResponse";
      case ErrorKind::busy:
        return "Busy";
    }
    return "Unknown";
  }

  std::string
  Error::ToString() const
  {
    std::string out{procflow::ToString(kind)};
    if (cause)
      out += fmt::format(" ({})", *cause);
    if (not message.empty())
      out += fmt::format(": {}", message);
    return out;
  }
}  // namespace procflow
