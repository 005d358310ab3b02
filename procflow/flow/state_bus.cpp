#include "state_bus.hpp"

#include <procflow/util/logging.hpp>

namespace procflow::flow
{
  static auto logcat = log::Cat("flow-bus");

  void
  FlowStateBus::set_listener(Listener listener)
  {
    std::lock_guard lock{_mutex};
    _listener = std::move(listener);
  }

  void
  FlowStateBus::clear_listener()
  {
    std::lock_guard lock{_mutex};
    _listener = nullptr;
  }

  bool
  FlowStateBus::has_listener() const
  {
    std::lock_guard lock{_mutex};
    return static_cast<bool>(_listener);
  }

  bool
  FlowStateBus::publish(const FlowOutcome& outcome) const
  {
    Listener listener;
    {
      std::lock_guard lock{_mutex};
      listener = _listener;
    }
    if (not listener)
    {
      log::debug(logcat, "no flow listener, dropping outcome");
      return false;
    }
    if (auto* present = std::get_if<PresentFlow>(&outcome))
      log::debug(logcat, "publishing present {}", present->instance);
    else
      log::debug(logcat, "publishing session ended");
    listener(outcome);
    return true;
  }

}  // namespace procflow::flow
