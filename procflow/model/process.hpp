#pragma once

#include <procflow/util/formattable.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace procflow::model
{
  /// a server-pushed instruction telling us the next step must run right away instead of
  /// presenting the process.
  struct AutoRedirect
  {
    std::string transition_id;
    /// opaque, transport encoded step instruction
    std::string payload;

    bool
    operator==(const AutoRedirect& other) const
    {
      return transition_id == other.transition_id and payload == other.payload;
    }
  };

  /// one in-progress run of a remote process.  immutable once received; every transition hands us
  /// a new one.
  struct ProcessInstance
  {
    std::string id;
    std::string action;
    /// whatever the host ui needs to render the current step; opaque to us.
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<AutoRedirect> auto_redirect;

    std::string
    ToString() const;

    bool
    operator==(const ProcessInstance& other) const
    {
      return id == other.id and action == other.action and metadata == other.metadata
          and auto_redirect == other.auto_redirect;
    }
  };

  /// a named group of processes inside a business context
  struct ContextFlow
  {
    std::string name;
    std::vector<ProcessInstance> processes;
  };

  /// every flow in a context, in the order the engine gave them.  the first one is the default
  /// selection.
  struct ContextFlows
  {
    std::string context;
    std::vector<ContextFlow> flows;

    const ContextFlow*
    default_flow() const
    {
      return flows.empty() ? nullptr : &flows.front();
    }

    bool
    empty() const
    {
      return flows.empty();
    }
  };

  /// what we send back to the engine to advance a process once a step has a result
  struct TransitionRequest
  {
    std::string transition_id;
    std::string process_id;
    /// transport encoded step result
    std::string payload;
  };

  // json (de)serialization; from_json throws (nlohmann::json::exception or std::invalid_argument)
  // on malformed input.
  void
  to_json(nlohmann::json& j, const AutoRedirect& r);
  void
  from_json(const nlohmann::json& j, AutoRedirect& r);

  void
  to_json(nlohmann::json& j, const ProcessInstance& p);
  void
  from_json(const nlohmann::json& j, ProcessInstance& p);

  void
  to_json(nlohmann::json& j, const ContextFlow& f);
  void
  from_json(const nlohmann::json& j, ContextFlow& f);

  void
  to_json(nlohmann::json& j, const ContextFlows& f);
  void
  from_json(const nlohmann::json& j, ContextFlows& f);

  void
  to_json(nlohmann::json& j, const TransitionRequest& t);

}  // namespace procflow::model

namespace procflow
{
  template <>
  inline constexpr bool IsToStringFormattable<model::ProcessInstance> = true;
}  // namespace procflow
