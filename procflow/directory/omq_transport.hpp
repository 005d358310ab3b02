#pragma once

#include "transport.hpp"

#include <procflow/util/time.hpp>

#include <oxenmq/address.h>
#include <oxenmq/oxenmq.h>

#include <memory>
#include <mutex>
#include <optional>

namespace procflow::directory
{
  /// name of the engine's oxenmq command that proxies rest calls
  inline constexpr auto REST_REQUEST_COMMAND = "rest.request";

  /// The OmqTransport uses oxenmq to make requests to the remote process engine.
  class OmqTransport : public Transport, public std::enable_shared_from_this<OmqTransport>
  {
   public:
    /// `omq` must be started before requests are made
    OmqTransport(std::shared_ptr<oxenmq::OxenMQ> omq, oxenmq::address remote, Duration_t timeout);

    /// connect to the engine async; requests made before the connection is up are queued by
    /// oxenmq
    void
    ConnectAsync();

    bool
    connected() const;

    void
    request(Request req, ReplyHandler handler) override;

   private:
    const std::shared_ptr<oxenmq::OxenMQ> m_OMQ;
    const oxenmq::address m_Remote;
    const Duration_t m_Timeout;

    mutable std::mutex m_Access;
    std::optional<oxenmq::ConnectionID> m_Connection;
  };

}  // namespace procflow::directory
