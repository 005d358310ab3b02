#pragma once
#include "ev.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace uvw
{
  class AsyncHandle;
  class Loop;
}  // namespace uvw

namespace procflow::uv
{
  /// EventLoop on a uvw loop.  Cross thread work goes through a mutex guarded queue that an async
  /// handle drains on the loop thread.
  class Loop : public procflow::EventLoop
  {
   public:
    Loop();

    void
    run() override;

    void
    stop() override;

    bool
    running() const override;

    bool
    inEventLoop() const override;

    void
    call_soon(std::function<void(void)> f) override;

    void
    call_later(loop_time_t delay, std::function<void(void)> callback) override;

    void
    wakeup() override;

   private:
    /// runs everything queued so far, including calls queued by the calls it runs
    void
    flush_pending();

    void
    start_timer(loop_time_t delay, std::function<void(void)> callback);

    std::shared_ptr<uvw::Loop> _uv;
    std::shared_ptr<uvw::AsyncHandle> _wakeup;
    std::optional<std::thread::id> _loop_thread;
    std::atomic<bool> _running{true};

    std::mutex _pending_mutex;
    std::deque<std::function<void(void)>> _pending;
  };

}  // namespace procflow::uv
