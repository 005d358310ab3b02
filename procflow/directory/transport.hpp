#pragma once

#include <procflow/util/formattable.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace procflow::directory
{
  enum class Method
  {
    get,
    post,
  };

  std::string_view
  ToString(Method method);

  /// one rest style call to the remote process engine
  struct Request
  {
    Method method = Method::get;
    /// path plus query string, already percent-encoded
    std::string path;
    std::optional<nlohmann::json> body;
    /// access token sent as the bearer credential
    std::optional<std::string> bearer;

    /// the json envelope we put on the wire
    nlohmann::json
    to_json() const;

    std::string
    ToString() const;
  };

  /// called once per request.  `ok` is false if the request never got a reply (e.g. timeout), in
  /// which case `data` holds whatever the transport knows about the failure.  otherwise `data` is
  /// the reply: the status code followed by the json body.
  using ReplyHandler = std::function<void(bool ok, std::vector<std::string> data)>;

  /// how requests get to the engine
  class Transport
  {
   public:
    virtual ~Transport() = default;

    /// send a request; `handler` may be called from any thread
    virtual void
    request(Request req, ReplyHandler handler) = 0;
  };

}  // namespace procflow::directory

namespace procflow
{
  template <>
  inline constexpr bool IsToStringFormattable<directory::Method> = true;
  template <>
  inline constexpr bool IsToStringFormattable<directory::Request> = true;
}  // namespace procflow
