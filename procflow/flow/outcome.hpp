#pragma once

#include <procflow/model/process.hpp>

#include <variant>

namespace procflow::flow
{
  /// present this process instance on screen
  struct PresentFlow
  {
    model::ProcessInstance instance;
  };

  /// the session is over; tear down whatever flow is presented
  struct SessionEnded
  {};

  /// the externally observable results of running flows.
  using FlowOutcome = std::variant<PresentFlow, SessionEnded>;

}  // namespace procflow::flow
