#pragma once

#include <procflow/flow/screen_host.hpp>

#include <functional>
#include <string>
#include <vector>

namespace mocks
{
  /// records what the engine did to the screen stack.  dismissal can be held to check that
  /// nothing else happens before the host acknowledges it.
  class RecordingScreenHost : public procflow::flow::ScreenHost
  {
   public:
    std::vector<std::string> events;
    bool interstitial_up = false;

    bool hold_dismiss = false;
    std::function<void()> held_dismiss;

    void
    dismiss_top(bool animated, std::function<void()> on_dismissed) override
    {
      events.push_back(animated ? "dismiss-animated" : "dismiss");
      if (hold_dismiss)
        held_dismiss = std::move(on_dismissed);
      else
        on_dismissed();
    }

    void
    show_interstitial() override
    {
      events.push_back("show-interstitial");
      interstitial_up = true;
    }

    void
    hide_interstitial(std::function<void()> on_hidden) override
    {
      events.push_back("hide-interstitial");
      interstitial_up = false;
      on_hidden();
    }

    /// acknowledge a held dismissal
    void
    release_dismiss()
    {
      auto f = std::move(held_dismiss);
      held_dismiss = nullptr;
      if (f)
        f();
    }
  };

}  // namespace mocks
