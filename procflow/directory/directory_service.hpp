#pragma once

#include "transport.hpp"

#include <procflow/ev/ev.hpp>
#include <procflow/model/process.hpp>
#include <procflow/session/session_gate.hpp>
#include <procflow/util/error.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace procflow::directory
{
  using Filters = std::map<std::string, std::string>;

  template <typename T>
  using Callback = std::function<void(Result<T>)>;

  struct DirectoryOptions
  {
    /// go ahead with a request when the session gate cannot tell whether the token expired
    bool allow_indeterminate = false;
  };

  /// request paths for the engine's rest api.  segments and query values are percent-encoded;
  /// filters come out in key order.
  std::string
  context_processes_path(std::string_view context, const Filters& filters = {});

  std::string
  resume_process_path(std::string_view instance_id);

  std::string
  transition_path(std::string_view process_id, std::string_view transition_id);

  /// Thin client for the remote process engine.  Every operation is a single shot: no retries and
  /// no caching.  Completions are always delivered on the ui event loop, and errors are reported
  /// through the result, never thrown.
  class DirectoryService : public std::enable_shared_from_this<DirectoryService>
  {
   public:
    DirectoryService(
        EventLoop_ptr loop,
        std::shared_ptr<Transport> transport,
        std::shared_ptr<session::SessionGate> gate,
        DirectoryOptions opts = {});

    /// every flow of `context`, optionally narrowed by `filters`
    void
    get_context_processes(
        std::string context,
        Filters filters,
        bool check_token_expiry,
        Callback<model::ContextFlows> done);

    /// start the process named `name` with `data`, or resume the one already running
    void
    start_or_resume_context_process(
        std::string name, nlohmann::json data, bool check_token_expiry, Callback<model::ProcessInstance> done);

    /// resume a known process instance
    void
    start_or_resume_process(std::string instance_id, Callback<model::ProcessInstance> done);

    /// report a step result to advance a process; any failure comes back as a
    /// transition_submit_failure with the underlying kind as its cause
    void
    submit_transition(model::TransitionRequest request, Callback<model::ProcessInstance> done);

   private:
    /// the error to fail with if the session gate says no
    std::optional<Error>
    check_session(bool check_token_expiry) const;

    template <typename T>
    void
    send(
        Request req,
        std::function<T(const nlohmann::json&)> parse,
        Callback<T> done);

    template <typename T>
    void
    deliver(Callback<T> done, Result<T> result) const;

    const EventLoop_ptr _loop;
    const std::shared_ptr<Transport> _transport;
    const std::shared_ptr<session::SessionGate> _gate;
    const DirectoryOptions _opts;
  };

}  // namespace procflow::directory
