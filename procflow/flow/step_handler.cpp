#include "step_handler.hpp"

#include <procflow/util/logging.hpp>

namespace procflow::flow
{
  static auto logcat = log::Cat("step-handler");

  StepCompletion::StepCompletion(Handler handler) : _state{std::make_shared<State>()}
  {
    _state->handler = std::move(handler);
  }

  void
  StepCompletion::complete(StepParams result) const
  {
    deliver(std::move(result), "");
  }

  void
  StepCompletion::fail(std::string reason) const
  {
    deliver(std::nullopt, std::move(reason));
  }

  bool
  StepCompletion::fired() const
  {
    return _state->fired.load();
  }

  void
  StepCompletion::deliver(std::optional<StepParams> result, std::string reason) const
  {
    if (_state->fired.exchange(true))
    {
      log::warning(logcat, "step handler called back more than once, ignoring");
      return;
    }
    auto handler = std::move(_state->handler);
    _state->handler = nullptr;
    if (handler)
      handler(std::move(result), std::move(reason));
  }

}  // namespace procflow::flow
