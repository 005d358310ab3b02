#pragma once

#include <trompeloeil.hpp>

#include <procflow/directory/transport.hpp>

#include <nlohmann/json.hpp>
#include <oxenc/base64.h>

#include <deque>
#include <string>
#include <utility>
#include <vector>

namespace mocks
{
  class MockTransport : public procflow::directory::Transport
  {
   public:
    MAKE_MOCK2(
        request,
        void(procflow::directory::Request, procflow::directory::ReplyHandler),
        override);
  };

  /// answers requests from a queue of canned replies; requests made with the queue empty are held
  /// until the test replies to them.
  class FakeTransport : public procflow::directory::Transport
  {
   public:
    std::vector<procflow::directory::Request> requests;
    std::deque<std::pair<bool, std::vector<std::string>>> replies;
    std::deque<procflow::directory::ReplyHandler> held;

    void
    request(procflow::directory::Request req, procflow::directory::ReplyHandler handler) override
    {
      requests.push_back(std::move(req));
      if (replies.empty())
      {
        held.push_back(std::move(handler));
        return;
      }
      auto [ok, data] = std::move(replies.front());
      replies.pop_front();
      handler(ok, std::move(data));
    }

    void
    reply_with(const nlohmann::json& body, int status = 200)
    {
      replies.emplace_back(true, std::vector<std::string>{std::to_string(status), body.dump()});
    }

    void
    fail_with(std::string why)
    {
      replies.emplace_back(false, std::vector<std::string>{std::move(why)});
    }

    /// answer the oldest held request
    void
    answer(const nlohmann::json& body, int status = 200)
    {
      auto handler = std::move(held.front());
      held.pop_front();
      handler(true, {std::to_string(status), body.dump()});
    }
  };

  /// base64url, unpadded, the way jwt segments are encoded
  inline std::string
  b64url(std::string_view data)
  {
    auto b64 = oxenc::to_base64(data);
    while (not b64.empty() and b64.back() == '=')
      b64.pop_back();
    for (auto& c : b64)
    {
      if (c == '+')
        c = '-';
      else if (c == '/')
        c = '_';
    }
    return b64;
  }

  /// an unsigned jwt carrying `claims`
  inline std::string
  make_jwt(const nlohmann::json& claims)
  {
    return b64url(R"({"alg":"HS256","typ":"JWT"})") + "." + b64url(claims.dump()) + ".c2lnbmF0dXJl";
  }

  /// an instance as the engine sends it
  inline nlohmann::json
  instance_json(std::string id, std::string action = "review")
  {
    return nlohmann::json{
        {"id", std::move(id)}, {"action", std::move(action)}, {"metadata", {{"screen", "summary"}}}};
  }

}  // namespace mocks
