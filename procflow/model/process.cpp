#include "process.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace procflow::model
{
  std::string
  ProcessInstance::ToString() const
  {
    return fmt::format("[process id={} action={}{}]", id, action, auto_redirect ? " redirect" : "");
  }

  void
  to_json(nlohmann::json& j, const AutoRedirect& r)
  {
    j = nlohmann::json{{"transitionId", r.transition_id}, {"payload", r.payload}};
  }

  void
  from_json(const nlohmann::json& j, AutoRedirect& r)
  {
    j.at("transitionId").get_to(r.transition_id);
    j.at("payload").get_to(r.payload);
  }

  void
  to_json(nlohmann::json& j, const ProcessInstance& p)
  {
    j = nlohmann::json{{"id", p.id}, {"action", p.action}, {"metadata", p.metadata}};
    if (p.auto_redirect)
      j["autoRedirect"] = *p.auto_redirect;
  }

  void
  from_json(const nlohmann::json& j, ProcessInstance& p)
  {
    j.at("id").get_to(p.id);
    if (p.id.empty())
      throw std::invalid_argument{"process instance without an id"};

    p.action = j.value("action", std::string{});

    if (auto it = j.find("metadata"); it != j.end() and not it->is_null())
    {
      if (not it->is_object())
        throw std::invalid_argument{"process metadata must be an object"};
      p.metadata = *it;
    }
    else
      p.metadata = nlohmann::json::object();

    if (auto it = j.find("autoRedirect"); it != j.end() and not it->is_null())
      p.auto_redirect = it->get<AutoRedirect>();
    else
      p.auto_redirect.reset();
  }

  void
  to_json(nlohmann::json& j, const ContextFlow& f)
  {
    j = nlohmann::json{{"name", f.name}, {"processes", f.processes}};
  }

  void
  from_json(const nlohmann::json& j, ContextFlow& f)
  {
    j.at("name").get_to(f.name);
    f.processes = j.value("processes", std::vector<ProcessInstance>{});
  }

  void
  to_json(nlohmann::json& j, const ContextFlows& f)
  {
    j = nlohmann::json{{"context", f.context}, {"flows", f.flows}};
  }

  void
  from_json(const nlohmann::json& j, ContextFlows& f)
  {
    f.context = j.value("context", std::string{});
    j.at("flows").get_to(f.flows);
  }

  void
  to_json(nlohmann::json& j, const TransitionRequest& t)
  {
    j = nlohmann::json{
        {"transitionId", t.transition_id}, {"processId", t.process_id}, {"payload", t.payload}};
  }

}  // namespace procflow::model
