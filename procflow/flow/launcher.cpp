#include "launcher.hpp"

#include <procflow/util/logging.hpp>
#include <procflow/util/str.hpp>

#include <stdexcept>

namespace procflow::flow
{
  static auto logcat = log::Cat("flow-launcher");

  FlowLauncher::FlowLauncher(
      EventLoop_ptr loop,
      std::shared_ptr<directory::DirectoryService> directory,
      std::shared_ptr<ContinuationOrchestrator> orchestrator,
      std::shared_ptr<FlowStateBus> bus,
      std::shared_ptr<session::SessionGate> gate,
      LauncherOptions opts)
      : _loop{std::move(loop)}
      , _directory{std::move(directory)}
      , _orchestrator{std::move(orchestrator)}
      , _bus{std::move(bus)}
      , _gate{std::move(gate)}
      , _opts{opts}
  {
    if (not(_loop and _directory and _orchestrator and _bus and _gate))
      throw std::invalid_argument{"flow launcher is missing a collaborator"};
  }

  void
  FlowLauncher::report(const Done& done, Result<model::ProcessInstance> result) const
  {
    if (done)
      done(result);
  }

  void
  FlowLauncher::open_process(std::string instance_id, Done done)
  {
    log::info(logcat, "opening process {}", instance_id);
    _directory->start_or_resume_process(
        instance_id,
        [self = shared_from_this(), instance_id, done](Result<model::ProcessInstance> result) {
          if (auto* err = error_of(result))
          {
            log::warning(logcat, "cannot open process {}: {}", instance_id, *err);
            self->report(done, *err);
            return;
          }
          self->present(std::get<model::ProcessInstance>(std::move(result)), done);
        });
  }

  void
  FlowLauncher::start_context_process(
      std::string name, nlohmann::json data, bool check_token_expiry, Done done)
  {
    log::info(logcat, "starting process {}", name);
    _directory->start_or_resume_context_process(
        name,
        std::move(data),
        check_token_expiry,
        [self = shared_from_this(), name, done](Result<model::ProcessInstance> result) {
          if (auto* err = error_of(result))
          {
            log::warning(logcat, "cannot start process {}: {}", name, *err);
            if (err->kind == ErrorKind::session_expired)
              self->_bus->publish(SessionEnded{});
            self->report(done, *err);
            return;
          }
          self->present(std::get<model::ProcessInstance>(std::move(result)), done);
        });
  }

  void
  FlowLauncher::present(model::ProcessInstance instance, Done done)
  {
    if (instance.auto_redirect)
    {
      handle_auto_redirect(instance, std::move(done));
      return;
    }
    log::debug(logcat, "presenting {}", instance);
    _bus->publish(PresentFlow{instance});
    report(done, std::move(instance));
  }

  void
  FlowLauncher::handle_auto_redirect(const model::ProcessInstance& instance, Done done)
  {
    if (not instance.auto_redirect)
    {
      log::warning(logcat, "{} has no auto-redirect instruction", instance);
      report(done, Error{ErrorKind::decode_failure, "no auto-redirect instruction"});
      return;
    }

    log::info(
        logcat,
        "auto-redirecting {} through transition {}",
        instance,
        instance.auto_redirect->transition_id);
    InboundInstruction inbound{
        instance.auto_redirect->transition_id,
        instance.id,
        instance.auto_redirect->payload,
        [directory = _directory](model::TransitionRequest request, SubmitResult on_result) {
          directory->submit_transition(std::move(request), std::move(on_result));
        }};
    _orchestrator->continue_flow(
        std::move(inbound),
        [self = shared_from_this(), done = std::move(done)](
            const Result<model::ProcessInstance>& result) {
          if (auto* err = error_of(result); err and err->cause == ErrorKind::session_expired)
            self->_bus->publish(SessionEnded{});
          self->report(done, result);
        });
  }

  /// the notification's checkTokenExpiry, if it has a usable one
  static std::optional<bool>
  notification_check_expiry(const nlohmann::json& payload)
  {
    auto itr = payload.find(NOTIFICATION_CHECK_EXPIRY_KEY);
    if (itr == payload.end())
      return std::nullopt;
    if (itr->is_boolean())
      return itr->get<bool>();
    if (itr->is_string())
    {
      const auto str = lowercase_ascii_string(itr->get<std::string>());
      if (str == "true" or str == "1")
        return true;
      if (str == "false" or str == "0")
        return false;
    }
    log::debug(logcat, "ignoring unusable {} in notification", NOTIFICATION_CHECK_EXPIRY_KEY);
    return std::nullopt;
  }

  bool
  FlowLauncher::handle_notification(const nlohmann::json& payload, Done done)
  {
    if (not payload.is_object())
    {
      log::warning(logcat, "notification payload is not an object");
      return false;
    }
    auto itr = payload.find(NOTIFICATION_PROCESS_KEY);
    if (itr == payload.end() or not itr->is_string() or itr->get<std::string>().empty())
    {
      log::warning(logcat, "notification payload does not name a process");
      return false;
    }
    auto instance_id = itr->get<std::string>();
    const bool check = notification_check_expiry(payload).value_or(_opts.check_token_expiry);

    switch (_gate->evaluate(check))
    {
      case session::SessionStatus::expired:
        log::info(logcat, "session is over, not opening process {}", instance_id);
        _loop->call([self = shared_from_this(), done]() {
          self->_bus->publish(SessionEnded{});
          self->report(done, Error{ErrorKind::session_expired, "access token expired"});
        });
        return true;
      case session::SessionStatus::indeterminate:
        if (not _opts.allow_indeterminate)
        {
          log::info(logcat, "cannot tell if the session is still valid, not opening {}", instance_id);
          _loop->call([self = shared_from_this(), done]() {
            self->report(done, Error{ErrorKind::session_indeterminate, "access token has no expiry"});
          });
          return true;
        }
        break;
      case session::SessionStatus::allowed:
        break;
    }

    open_process(std::move(instance_id), std::move(done));
    return true;
  }

  void
  FlowLauncher::store_notification(nlohmann::json payload)
  {
    std::lock_guard lock{_stored_mutex};
    if (_stored)
      log::debug(logcat, "replacing stored notification");
    _stored = std::move(payload);
  }

  bool
  FlowLauncher::has_stored_notification() const
  {
    std::lock_guard lock{_stored_mutex};
    return _stored.has_value();
  }

  bool
  FlowLauncher::resume_stored_notification(Done done)
  {
    std::optional<nlohmann::json> stored;
    {
      std::lock_guard lock{_stored_mutex};
      stored.swap(_stored);
    }
    if (not stored)
      return false;
    log::debug(logcat, "resuming stored notification");
    return handle_notification(*stored, std::move(done));
  }

}  // namespace procflow::flow
