#pragma once

#include <procflow/ev/ev.hpp>

#include <deque>
#include <functional>
#include <map>

namespace mocks
{
  /// single threaded stand-in for the ui loop.  everything counts as being in the loop, so
  /// call() runs inline; call_soon() queues until drain() and timers fire on advance().
  class ManualLoop : public procflow::EventLoop
  {
    std::deque<std::function<void(void)>> _queue;
    std::multimap<procflow::loop_time_t, std::function<void(void)>> _timers;
    procflow::loop_time_t _now{0};
    bool _running = false;

   public:
    void
    run() override
    {
      _running = true;
      drain();
    }

    bool
    running() const override
    {
      return _running;
    }

    void
    wakeup() override
    {}

    void
    call_soon(std::function<void(void)> f) override
    {
      _queue.push_back(std::move(f));
    }

    void
    call_later(procflow::loop_time_t delay, std::function<void(void)> callback) override
    {
      _timers.emplace(_now + delay, std::move(callback));
    }

    void
    stop() override
    {
      _running = false;
    }

    bool
    inEventLoop() const override
    {
      return true;
    }

    /// run queued calls (including ones they queue) until there are none; returns how many ran
    size_t
    drain()
    {
      size_t ran = 0;
      while (not _queue.empty())
      {
        auto f = std::move(_queue.front());
        _queue.pop_front();
        f();
        ++ran;
      }
      return ran;
    }

    /// move the clock forward, firing due timers in order
    void
    advance(procflow::loop_time_t by)
    {
      _now += by;
      while (not _timers.empty() and _timers.begin()->first <= _now)
      {
        auto f = std::move(_timers.begin()->second);
        _timers.erase(_timers.begin());
        f();
        drain();
      }
      drain();
    }

    size_t
    pending_timers() const
    {
      return _timers.size();
    }

    size_t
    queued() const
    {
      return _queue.size();
    }
  };

}  // namespace mocks
