#include "step_registry.hpp"

#include <procflow/util/logging.hpp>

#include <algorithm>
#include <stdexcept>

namespace procflow::flow
{
  static auto logcat = log::Cat("step-registry");

  void
  StepRegistry::add(std::string step_id, std::shared_ptr<StepHandler> handler)
  {
    if (step_id.empty())
      throw std::invalid_argument{"cannot register a step without an id"};
    if (not handler)
      throw std::invalid_argument{"cannot register a null step handler for " + step_id};

    std::lock_guard lock{_mutex};
    if (_frozen)
      throw std::logic_error{"step registry is frozen, cannot register " + step_id};

    auto [itr, inserted] = _handlers.insert_or_assign(step_id, std::move(handler));
    if (inserted)
      log::debug(logcat, "registered step {}", itr->first);
    else
      log::info(logcat, "step {} overridden", itr->first);
  }

  bool
  StepRegistry::remove(const std::string& step_id)
  {
    std::lock_guard lock{_mutex};
    if (_frozen)
      throw std::logic_error{"step registry is frozen, cannot remove " + step_id};
    return _handlers.erase(step_id) > 0;
  }

  std::shared_ptr<StepHandler>
  StepRegistry::resolve(const std::string& step_id) const
  {
    std::lock_guard lock{_mutex};
    if (auto itr = _handlers.find(step_id); itr != _handlers.end())
      return itr->second;
    return nullptr;
  }

  bool
  StepRegistry::has(const std::string& step_id) const
  {
    std::lock_guard lock{_mutex};
    return _handlers.count(step_id) > 0;
  }

  std::vector<std::string>
  StepRegistry::step_ids() const
  {
    std::vector<std::string> ids;
    {
      std::lock_guard lock{_mutex};
      ids.reserve(_handlers.size());
      for (const auto& item : _handlers)
        ids.push_back(item.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
  }

  void
  StepRegistry::freeze()
  {
    std::lock_guard lock{_mutex};
    if (not _frozen)
      log::debug(logcat, "step registry frozen with {} steps", _handlers.size());
    _frozen = true;
  }

  bool
  StepRegistry::frozen() const
  {
    std::lock_guard lock{_mutex};
    return _frozen;
  }

}  // namespace procflow::flow
