#pragma once

#include "payload_codec.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace procflow::flow
{
  /// the other end of a step handler's asynchronous work.  copies share state and only the first
  /// complete() or fail() across all copies is delivered; later ones are dropped with a warning.
  class StepCompletion
  {
   public:
    using Handler = std::function<void(std::optional<StepParams>, std::string)>;

    explicit StepCompletion(Handler handler);

    /// the step produced its result
    void
    complete(StepParams result) const;

    /// the step could not be performed
    void
    fail(std::string reason) const;

    /// true once complete() or fail() was called on any copy
    bool
    fired() const;

   private:
    struct State
    {
      std::atomic<bool> fired{false};
      Handler handler;
    };

    void
    deliver(std::optional<StepParams> result, std::string reason) const;

    std::shared_ptr<State> _state;
  };

  /// something that can perform one kind of step: present a verification ui, open a web view,
  /// call out to a third party sdk.  implementations must eventually call back on `done` exactly
  /// once, from any thread.
  class StepHandler
  {
   public:
    virtual ~StepHandler() = default;

    /// perform the step described by `payload`, the raw (still transport encoded) instruction.
    virtual void
    perform(std::string_view payload, StepCompletion done) = 0;

    /// the wait for the step in flight was given up on; take down whatever ui it still shows.
    /// calls to that step's completion after this are dropped.
    virtual void
    cancel()
    {}
  };

}  // namespace procflow::flow
