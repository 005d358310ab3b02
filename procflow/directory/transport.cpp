#include "transport.hpp"

#include <fmt/format.h>

namespace procflow::directory
{
  std::string_view
  ToString(Method method)
  {
    switch (method)
    {
      case Method::get:
        return "GET";
      case Method::post:
        return "POST";
    }
    return "GET";
  }

  nlohmann::json
  Request::to_json() const
  {
    nlohmann::json j{{"method", directory::ToString(method)}, {"path", path}};
    if (body)
      j["body"] = *body;
    if (bearer)
      j["authorization"] = fmt::format("Bearer {}", *bearer);
    return j;
  }

  std::string
  Request::ToString() const
  {
    return fmt::format("{} {}", method, path);
  }

}  // namespace procflow::directory
