#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <utility>

namespace procflow
{
  using namespace std::chrono_literals;

  using loop_time_t = std::chrono::milliseconds;

  /// The host's ui thread as the flow engine sees it.  Screen changes, handler invocations and
  /// state transitions all happen on this loop; replies from the engine and completions from step
  /// handlers arrive on other threads and are handed over with call() or call_soon().
  class EventLoop
  {
   public:
    virtual ~EventLoop() = default;

    /// the libuv backed loop used outside of tests
    static std::shared_ptr<EventLoop>
    create();

    /// blocks the calling thread, which becomes the loop thread, until stop()
    virtual void
    run() = 0;

    /// safe from any thread; queued work that has not started yet is dropped
    virtual void
    stop() = 0;

    virtual bool
    running() const = 0;

    /// true on the loop thread, and on any thread before run() has claimed one
    virtual bool
    inEventLoop() const = 0;

    /// runs `f` now when already on the loop thread, otherwise queues it
    template <typename Callable>
    void
    call(Callable&& f)
    {
      if (not inEventLoop())
      {
        call_soon(std::forward<Callable>(f));
        return;
      }
      f();
      wakeup();
    }

    /// always queues, even from the loop thread.  queued calls run in order.
    virtual void
    call_soon(std::function<void(void)> f) = 0;

    /// one shot timer; from another thread the delay counts from the moment of the call
    virtual void
    call_later(loop_time_t delay, std::function<void(void)> callback) = 0;

    /// nudge the loop so it picks up queued work
    virtual void
    wakeup() = 0;
  };

  using EventLoop_ptr = std::shared_ptr<EventLoop>;

}  // namespace procflow
