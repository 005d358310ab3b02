#pragma once

#include <functional>

namespace procflow::flow
{
  /// the host application's screen stack as far as continuing a flow needs it.  every call is
  /// made on the ui event loop; completion callbacks may fire from any thread.
  class ScreenHost
  {
   public:
    virtual ~ScreenHost() = default;

    /// dismiss whatever screen is on top and call `on_dismissed` once it is gone.  must call back
    /// even when there is nothing to dismiss.
    virtual void
    dismiss_top(bool animated, std::function<void()> on_dismissed) = 0;

    /// put up the neutral, input blocking interstitial
    virtual void
    show_interstitial() = 0;

    /// take the interstitial down and call `on_hidden` once it is gone
    virtual void
    hide_interstitial(std::function<void()> on_hidden) = 0;
  };

}  // namespace procflow::flow
