#pragma once

#include "outcome.hpp"

#include <functional>
#include <mutex>

namespace procflow::flow
{
  /// single slot broadcast channel for flow outcomes.  only the most recently set listener gets
  /// outcomes, and publishing with nobody listening drops the outcome.  the owner controls its
  /// lifecycle: set a listener when the host's navigation is ready, clear it on logout.
  class FlowStateBus
  {
   public:
    using Listener = std::function<void(const FlowOutcome&)>;

    FlowStateBus() = default;
    FlowStateBus(const FlowStateBus&) = delete;
    FlowStateBus(FlowStateBus&&) = delete;

    /// replace the current listener
    void
    set_listener(Listener listener);

    void
    clear_listener();

    bool
    has_listener() const;

    /// deliver an outcome to the current listener, if any.  returns true if it was delivered.
    /// the listener is invoked on the calling thread without any lock held, so it may publish or
    /// swap listeners itself.
    bool
    publish(const FlowOutcome& outcome) const;

   private:
    mutable std::mutex _mutex;
    Listener _listener;
  };

}  // namespace procflow::flow
