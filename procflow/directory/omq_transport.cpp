#include "omq_transport.hpp"

#include <procflow/util/logging.hpp>

#include <stdexcept>

namespace procflow::directory
{
  static auto logcat = log::Cat("omq-transport");

  OmqTransport::OmqTransport(
      std::shared_ptr<oxenmq::OxenMQ> omq, oxenmq::address remote, Duration_t timeout)
      : m_OMQ{std::move(omq)}, m_Remote{std::move(remote)}, m_Timeout{timeout}
  {
    if (not m_OMQ)
      throw std::invalid_argument{"oxenmq transport needs an oxenmq instance"};
  }

  void
  OmqTransport::ConnectAsync()
  {
    log::info(logcat, "connecting to process engine via omq at {}", m_Remote.full_address());
    auto conn = m_OMQ->connect_remote(
        m_Remote,
        [](oxenmq::ConnectionID) { log::debug(logcat, "connected to process engine"); },
        [remote = m_Remote.full_address()](oxenmq::ConnectionID, std::string_view why) {
          log::warning(logcat, "failed to connect to process engine at {}: {}", remote, why);
        });
    std::lock_guard lock{m_Access};
    m_Connection = conn;
  }

  bool
  OmqTransport::connected() const
  {
    std::lock_guard lock{m_Access};
    return m_Connection.has_value();
  }

  void
  OmqTransport::request(Request req, ReplyHandler handler)
  {
    std::optional<oxenmq::ConnectionID> conn;
    {
      std::lock_guard lock{m_Access};
      conn = m_Connection;
    }
    if (not conn)
    {
      log::warning(logcat, "cannot send {}: not connected to the process engine", req);
      handler(false, {"not connected"});
      return;
    }

    log::debug(logcat, "engine request: {}", req);
    m_OMQ->request(
        *conn,
        REST_REQUEST_COMMAND,
        [handler = std::move(handler)](bool success, std::vector<std::string> data) {
          handler(success, std::move(data));
        },
        req.to_json().dump(),
        oxenmq::send_option::request_timeout{m_Timeout});
  }

}  // namespace procflow::directory
