#pragma once

#include "step_handler.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace procflow::flow
{
  /// open map from step identifier to the handler that performs it.  the host adds or overrides
  /// entries before the first continuation runs; the orchestrator freezes the registry then.
  class StepRegistry
  {
   public:
    /// register a handler for a step, replacing any existing one.
    /// throws std::logic_error once frozen, std::invalid_argument on an empty id or null handler.
    void
    add(std::string step_id, std::shared_ptr<StepHandler> handler);

    /// remove a step.  returns true if there was one.  throws std::logic_error once frozen.
    bool
    remove(const std::string& step_id);

    /// get the handler for a step or nullptr if no such step is registered
    std::shared_ptr<StepHandler>
    resolve(const std::string& step_id) const;

    bool
    has(const std::string& step_id) const;

    /// all registered step ids, sorted
    std::vector<std::string>
    step_ids() const;

    void
    freeze();

    bool
    frozen() const;

   private:
    mutable std::mutex _mutex;
    std::unordered_map<std::string, std::shared_ptr<StepHandler>> _handlers;
    bool _frozen = false;
  };

}  // namespace procflow::flow
