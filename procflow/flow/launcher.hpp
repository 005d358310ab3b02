#pragma once

#include "orchestrator.hpp"
#include "state_bus.hpp"

#include <procflow/directory/directory_service.hpp>
#include <procflow/ev/ev.hpp>
#include <procflow/model/process.hpp>
#include <procflow/session/session_gate.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace procflow::flow
{
  /// notification payload key naming the process to open
  inline constexpr auto NOTIFICATION_PROCESS_KEY = "processId";
  /// optional notification payload key overriding whether the token expiry is checked
  inline constexpr auto NOTIFICATION_CHECK_EXPIRY_KEY = "checkTokenExpiry";

  struct LauncherOptions
  {
    /// whether notifications check the token expiry unless they say otherwise
    bool check_token_expiry = true;
    /// open a notification's process when the session gate cannot decide
    bool allow_indeterminate = false;
  };

  /// The entry points a host wires its triggers to: banner taps, notification taps (live or
  /// stored until after login) and auto-redirect instructions from the engine.  Each ends in
  /// either a presentFlow/sessionEnded outcome on the bus or a continuation run.
  class FlowLauncher : public std::enable_shared_from_this<FlowLauncher>
  {
   public:
    using Done = ContinuationOrchestrator::FinishHook;

    FlowLauncher(
        EventLoop_ptr loop,
        std::shared_ptr<directory::DirectoryService> directory,
        std::shared_ptr<ContinuationOrchestrator> orchestrator,
        std::shared_ptr<FlowStateBus> bus,
        std::shared_ptr<session::SessionGate> gate,
        LauncherOptions opts);

    /// start or resume a known process instance and present (or auto-redirect) the result
    void
    open_process(std::string instance_id, Done done = nullptr);

    /// start or resume the process `name` of a context, e.g. from a banner tap
    void
    start_context_process(
        std::string name, nlohmann::json data, bool check_token_expiry, Done done = nullptr);

    /// act on a notification tap.  returns false (and does nothing) if the payload does not name
    /// a process.
    bool
    handle_notification(const nlohmann::json& payload, Done done = nullptr);

    /// keep a notification to act on later, replacing any stored one
    void
    store_notification(nlohmann::json payload);

    bool
    has_stored_notification() const;

    /// act on the stored notification, if any, and forget it.  returns false if there was none
    /// or it was unusable.
    bool
    resume_stored_notification(Done done = nullptr);

    /// run the instance's auto-redirect instruction through the orchestrator
    void
    handle_auto_redirect(const model::ProcessInstance& instance, Done done = nullptr);

   private:
    /// present a freshly fetched instance, or run its auto-redirect
    void
    present(model::ProcessInstance instance, Done done);

    void
    report(const Done& done, Result<model::ProcessInstance> result) const;

    const EventLoop_ptr _loop;
    const std::shared_ptr<directory::DirectoryService> _directory;
    const std::shared_ptr<ContinuationOrchestrator> _orchestrator;
    const std::shared_ptr<FlowStateBus> _bus;
    const std::shared_ptr<session::SessionGate> _gate;
    const LauncherOptions _opts;

    mutable std::mutex _stored_mutex;
    std::optional<nlohmann::json> _stored;
  };

}  // namespace procflow::flow
