#include "orchestrator.hpp"

#include <procflow/util/logging.hpp>
#include <procflow/util/time.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace procflow::flow
{
  static auto logcat = log::Cat("flow-orchestrator");

  std::string_view
  ToString(ContinuationState state)
  {
    switch (state)
    {
      case ContinuationState::idle:
        return "idle";
      case ContinuationState::decoding:
        return "decoding";
      case ContinuationState::dismissing:
        return "dismissing";
      case ContinuationState::awaiting_handler:
        return "awaiting-handler";
      case ContinuationState::submitting:
        return "submitting";
      case ContinuationState::done_success:
        return "done-success";
      case ContinuationState::done_failure:
        return "done-failure";
    }
    return "unknown";
  }

  struct ContinuationOrchestrator::Run
  {
    uint64_t id;
    InboundInstruction inbound;
    FinishHook on_finished;
    StepInstruction instruction;
    std::shared_ptr<StepHandler> handler;
    bool interstitial_shown = false;
    /// auto-redirects followed to get here
    unsigned redirects = 0;
  };

  ContinuationOrchestrator::ContinuationOrchestrator(
      EventLoop_ptr loop,
      std::shared_ptr<StepRegistry> registry,
      std::shared_ptr<ScreenHost> screens,
      std::shared_ptr<FlowStateBus> bus,
      OrchestratorOptions opts)
      : _loop{std::move(loop)}
      , _registry{std::move(registry)}
      , _screens{std::move(screens)}
      , _bus{std::move(bus)}
      , _opts{std::move(opts)}
  {
    if (not(_loop and _registry and _screens and _bus))
      throw std::invalid_argument{"continuation orchestrator is missing a collaborator"};
  }

  ContinuationState
  ContinuationOrchestrator::state() const
  {
    return _state.load();
  }

  bool
  ContinuationOrchestrator::busy() const
  {
    return state() != ContinuationState::idle;
  }

  void
  ContinuationOrchestrator::set_failure_observer(FailureObserver observer)
  {
    _loop->call([self = shared_from_this(), observer = std::move(observer)]() {
      self->_failure_observer = observer;
    });
  }

  void
  ContinuationOrchestrator::enter(ContinuationState next)
  {
    const auto prev = _state.exchange(next);
    log::trace(logcat, "continuation {} -> {}", prev, next);
  }

  void
  ContinuationOrchestrator::continue_flow(InboundInstruction instruction, FinishHook on_finished)
  {
    auto run = std::make_shared<Run>();
    run->inbound = std::move(instruction);
    run->on_finished = std::move(on_finished);
    _loop->call([self = shared_from_this(), run]() { self->start(run); });
  }

  void
  ContinuationOrchestrator::start(std::shared_ptr<Run> run)
  {
    if (busy())
    {
      log::warning(
          logcat,
          "continuation for process {} rejected: a continuation is already {}",
          run->inbound.process_id,
          state());
      if (run->on_finished)
        run->on_finished(Error{ErrorKind::busy, "a continuation is already in flight"});
      return;
    }

    run->id = ++_runs;
    _registry->freeze();

    enter(ContinuationState::decoding);
    auto maybe_instruction = decode_instruction(run->inbound.payload, _opts.step_keys);
    if (not maybe_instruction)
    {
      log::error(
          logcat,
          "continuation {} for process {}: unsupported instruction payload",
          run->id,
          run->inbound.process_id);
      finish(run, Error{ErrorKind::decode_failure, "unsupported instruction payload"});
      return;
    }
    run->instruction = std::move(*maybe_instruction);

    run->handler = _registry->resolve(run->instruction.step_id);
    if (not run->handler)
    {
      log::error(
          logcat,
          "continuation {} for process {}: no handler for step {}",
          run->id,
          run->inbound.process_id,
          run->instruction.step_id);
      finish(run, Error{ErrorKind::unknown_step, run->instruction.step_id});
      return;
    }

    log::info(
        logcat,
        "continuation {} running step {} for process {} (transition {})",
        run->id,
        run->instruction.step_id,
        run->inbound.process_id,
        run->inbound.transition_id);
    dismiss_current(std::move(run));
  }

  void
  ContinuationOrchestrator::dismiss_current(std::shared_ptr<Run> run)
  {
    enter(ContinuationState::dismissing);
    // no animation: the step ui must not overlap whatever we are taking down
    _screens->dismiss_top(false, [self = shared_from_this(), run]() {
      self->_loop->call([self, run]() {
        self->_screens->show_interstitial();
        run->interstitial_shown = true;
        self->await_handler(run);
      });
    });
  }

  void
  ContinuationOrchestrator::await_handler(std::shared_ptr<Run> run)
  {
    enter(ContinuationState::awaiting_handler);

    StepCompletion done{[self = shared_from_this(), run](
                            std::optional<StepParams> result, std::string reason) {
      self->_loop->call([self, run, result, reason]() { self->on_step_done(run, result, reason); });
    }};

    if (_opts.handler_timeout > 0ms)
    {
      _loop->call_later(
          _opts.handler_timeout,
          [done, run, timeout = _opts.handler_timeout]() {
            if (done.fired())
              return;
            const auto& step = run->instruction.step_id;
            log::warning(
                logcat, "step {} handler timed out after {}", step, procflow::ToString(timeout));
            // fire first so anything the handler reports while tearing down is dropped
            done.fail("step handler timed out");
            try
            {
              run->handler->cancel();
            }
            catch (const std::exception& ex)
            {
              log::error(logcat, "step {} handler failed to cancel: {}", step, ex.what());
            }
          });
    }

    try
    {
      run->handler->perform(run->inbound.payload, done);
    }
    catch (const std::exception& ex)
    {
      log::error(logcat, "step {} handler threw: {}", run->instruction.step_id, ex.what());
      if (not done.fired())
        done.fail(ex.what());
    }
  }

  void
  ContinuationOrchestrator::on_step_done(
      std::shared_ptr<Run> run, std::optional<StepParams> result, std::string reason)
  {
    if (not result)
    {
      log::error(
          logcat,
          "continuation {}: step {} failed: {}",
          run->id,
          run->instruction.step_id,
          reason);
      fail_after_dismissal(std::move(run), Error{ErrorKind::handler_failure, std::move(reason)});
      return;
    }

    auto maybe_payload = encode_result(*result);
    if (not maybe_payload)
    {
      log::error(
          logcat,
          "continuation {}: result of step {} cannot be encoded",
          run->id,
          run->instruction.step_id);
      fail_after_dismissal(
          std::move(run), Error{ErrorKind::encode_failure, "step result cannot be encoded"});
      return;
    }

    enter(ContinuationState::submitting);
    if (not run->inbound.submit)
    {
      fail_after_dismissal(
          std::move(run),
          Error{ErrorKind::transition_submit_failure, "no transition submitter given"});
      return;
    }

    model::TransitionRequest request{
        run->inbound.transition_id, run->inbound.process_id, std::move(*maybe_payload)};
    log::debug(
        logcat,
        "continuation {}: submitting transition {} for process {}",
        run->id,
        request.transition_id,
        request.process_id);

    auto submitted = std::make_shared<std::atomic<bool>>(false);
    SubmitResult on_reply = [self = shared_from_this(), run, submitted](
                                Result<model::ProcessInstance> reply) {
      if (submitted->exchange(true))
      {
        log::warning(logcat, "transition submitter called back more than once, ignoring");
        return;
      }
      self->_loop->call([self, run, reply]() { self->on_submitted(run, reply); });
    };

    try
    {
      run->inbound.submit(std::move(request), on_reply);
    }
    catch (const std::exception& ex)
    {
      log::error(logcat, "continuation {}: transition submitter threw: {}", run->id, ex.what());
      on_reply(Error{ErrorKind::transition_submit_failure, ex.what()});
    }
  }

  void
  ContinuationOrchestrator::on_submitted(
      std::shared_ptr<Run> run, Result<model::ProcessInstance> result)
  {
    if (auto* err = error_of(result))
    {
      log::error(
          logcat,
          "continuation {}: transition {} for process {} failed: {}",
          run->id,
          run->inbound.transition_id,
          run->inbound.process_id,
          *err);
      auto failure = err->kind == ErrorKind::transition_submit_failure
          ? *err
          : Error{ErrorKind::transition_submit_failure, err->message, err->kind};
      fail_after_dismissal(std::move(run), std::move(failure));
      return;
    }

    _screens->hide_interstitial([self = shared_from_this(), run, result]() {
      self->_loop->call([self, run, result]() {
        run->interstitial_shown = false;
        const auto& instance = std::get<model::ProcessInstance>(result);
        log::info(logcat, "continuation {} done, next state {}", run->id, instance);
        if (instance.auto_redirect)
          self->follow_redirect(run, instance);
        else
          self->finish(run, result);
      });
    });
  }

  void
  ContinuationOrchestrator::fail_after_dismissal(std::shared_ptr<Run> run, Error err)
  {
    if (_failure_observer
        and (err.kind == ErrorKind::handler_failure
             or err.kind == ErrorKind::transition_submit_failure))
      _failure_observer(err);

    if (not run->interstitial_shown)
    {
      finish(std::move(run), std::move(err));
      return;
    }
    _screens->hide_interstitial([self = shared_from_this(), run, err]() {
      self->_loop->call([self, run, err]() {
        run->interstitial_shown = false;
        self->finish(run, err);
      });
    });
  }

  void
  ContinuationOrchestrator::follow_redirect(
      std::shared_ptr<Run> run, const model::ProcessInstance& instance)
  {
    if (run->redirects >= _opts.max_chained_redirects)
    {
      log::error(
          logcat,
          "continuation {}: process {} redirected {} times in a row, giving up",
          run->id,
          instance.id,
          run->redirects);
      finish(
          std::move(run),
          Error{
              ErrorKind::bad_response,
              fmt::format("more than {} chained auto-redirects", _opts.max_chained_redirects)});
      return;
    }

    log::info(
        logcat,
        "continuation {}: {} redirects through transition {}",
        run->id,
        instance,
        instance.auto_redirect->transition_id);
    enter(ContinuationState::done_success);
    enter(ContinuationState::idle);

    auto next = std::make_shared<Run>();
    next->inbound = InboundInstruction{
        instance.auto_redirect->transition_id,
        instance.id,
        instance.auto_redirect->payload,
        run->inbound.submit};
    next->on_finished = std::move(run->on_finished);
    next->redirects = run->redirects + 1;
    start(std::move(next));
  }

  void
  ContinuationOrchestrator::finish(std::shared_ptr<Run> run, Result<model::ProcessInstance> result)
  {
    enter(is_ok(result) ? ContinuationState::done_success : ContinuationState::done_failure);
    enter(ContinuationState::idle);
    if (auto* instance = std::get_if<model::ProcessInstance>(&result))
      _bus->publish(PresentFlow{*instance});
    if (run->on_finished)
      run->on_finished(result);
  }

}  // namespace procflow::flow
