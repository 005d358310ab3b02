#pragma once

#include "payload_codec.hpp"
#include "screen_host.hpp"
#include "state_bus.hpp"
#include "step_registry.hpp"

#include <procflow/ev/ev.hpp>
#include <procflow/model/process.hpp>
#include <procflow/util/error.hpp>
#include <procflow/util/formattable.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace procflow::flow
{
  /// where a continuation run is.  every run ends in done_success or done_failure and then drops
  /// back to idle.
  enum class ContinuationState
  {
    idle,
    decoding,
    dismissing,
    awaiting_handler,
    submitting,
    done_success,
    done_failure,
  };

  std::string_view
  ToString(ContinuationState state);

  /// completion of a transition submission: the process' next state or why there is none
  using SubmitResult = std::function<void(Result<model::ProcessInstance>)>;
  /// sends a transition to the remote engine; supplied by whoever triggers the continuation
  using SubmitTransition = std::function<void(model::TransitionRequest, SubmitResult)>;

  /// an instruction to run the next step of a process
  struct InboundInstruction
  {
    std::string transition_id;
    std::string process_id;
    /// opaque, transport encoded step instruction
    std::string payload;
    SubmitTransition submit;
  };

  struct OrchestratorOptions
  {
    /// instruction keys to decode; stepName is always included
    std::vector<std::string> step_keys;
    /// how long a step handler may take; zero waits forever
    std::chrono::milliseconds handler_timeout{0};
    /// how many auto-redirects returned by transition submissions one run follows before giving up
    unsigned max_chained_redirects = 8;
  };

  /// Runs one step of a remote process to completion: decodes the instruction, clears the screen
  /// and puts up an interstitial, lets the registered handler do its external interaction, submits
  /// the result to the engine and publishes the next process state on the flow bus.  A next state
  /// that carries an auto-redirect is not published: its instruction runs straight away, through
  /// the same submitter, and the finish hook only sees the end of the chain.
  ///
  /// All of the work happens on the ui event loop.  At most one run is in flight at a time; an
  /// instruction arriving while one is in flight is rejected.  Failures end the run silently: they
  /// are logged, the interstitial comes down and nothing is published.
  class ContinuationOrchestrator : public std::enable_shared_from_this<ContinuationOrchestrator>
  {
   public:
    using FinishHook = std::function<void(const Result<model::ProcessInstance>&)>;
    using FailureObserver = std::function<void(const Error&)>;

    ContinuationOrchestrator(
        EventLoop_ptr loop,
        std::shared_ptr<StepRegistry> registry,
        std::shared_ptr<ScreenHost> screens,
        std::shared_ptr<FlowStateBus> bus,
        OrchestratorOptions opts);

    ContinuationOrchestrator(const ContinuationOrchestrator&) = delete;
    ContinuationOrchestrator(ContinuationOrchestrator&&) = delete;

    /// start a continuation run; callable from any thread.  `on_finished` (optional) is called on
    /// the ui loop with the run's terminal result.
    void
    continue_flow(InboundInstruction instruction, FinishHook on_finished = nullptr);

    ContinuationState
    state() const;

    /// true while a run is in flight
    bool
    busy() const;

    /// set a host observer told about handler and transition submission failures, for hosts that
    /// want to surface them.  the core itself stays silent.
    void
    set_failure_observer(FailureObserver observer);

   private:
    struct Run;

    void
    start(std::shared_ptr<Run> run);

    void
    dismiss_current(std::shared_ptr<Run> run);

    void
    await_handler(std::shared_ptr<Run> run);

    void
    on_step_done(
        std::shared_ptr<Run> run, std::optional<StepParams> result, std::string reason);

    void
    on_submitted(std::shared_ptr<Run> run, Result<model::ProcessInstance> result);

    /// take the interstitial down (if it is up), then finish
    void
    fail_after_dismissal(std::shared_ptr<Run> run, Error err);

    /// run the auto-redirect of the instance a submission returned
    void
    follow_redirect(std::shared_ptr<Run> run, const model::ProcessInstance& instance);

    /// back to idle, then publish a successful result and tell the run's finish hook
    void
    finish(std::shared_ptr<Run> run, Result<model::ProcessInstance> result);

    void
    enter(ContinuationState next);

    const EventLoop_ptr _loop;
    const std::shared_ptr<StepRegistry> _registry;
    const std::shared_ptr<ScreenHost> _screens;
    const std::shared_ptr<FlowStateBus> _bus;
    const OrchestratorOptions _opts;

    std::atomic<ContinuationState> _state{ContinuationState::idle};
    FailureObserver _failure_observer;
    uint64_t _runs = 0;
  };

}  // namespace procflow::flow

namespace procflow
{
  template <>
  inline constexpr bool IsToStringFormattable<flow::ContinuationState> = true;
}  // namespace procflow
