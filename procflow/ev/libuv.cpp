#include "libuv.hpp"

#include <procflow/util/logging.hpp>

#include <uvw.hpp>

#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace procflow::uv
{
  static auto logcat = log::Cat("ui-loop");

  Loop::Loop() : _uv{uvw::Loop::create()}
  {
    if (not _uv)
      throw std::runtime_error{"Failed to construct libuv loop"};
    _wakeup = _uv->resource<uvw::AsyncHandle>();
    if (not _wakeup)
      throw std::runtime_error{"Failed to create libuv async"};
    _wakeup->on<uvw::AsyncEvent>([this](const auto&, auto&) { flush_pending(); });
  }

  void
  Loop::flush_pending()
  {
    for (;;)
    {
      std::function<void(void)> next;
      {
        std::lock_guard lock{_pending_mutex};
        if (_pending.empty())
          return;
        next = std::move(_pending.front());
        _pending.pop_front();
      }
      next();
    }
  }

  void
  Loop::run()
  {
    _loop_thread = std::this_thread::get_id();
    log::debug(logcat, "ui loop running");
    // pick up whatever was queued before we got here
    _wakeup->send();
    _uv->run();
    _uv->close();
    _uv.reset();
    log::info(logcat, "ui loop has stopped");
  }

  void
  Loop::stop()
  {
    if (not _running)
      return;
    if (not inEventLoop())
    {
      call_soon([this] { stop(); });
      return;
    }

    log::info(logcat, "stopping ui loop");
    _uv->walk([](auto&& handle) {
      if constexpr (not std::is_pointer_v<std::remove_reference_t<decltype(handle)>>)
        handle.close();
    });
    _uv->stop();
    _running = false;
  }

  bool
  Loop::running() const
  {
    return _running;
  }

  bool
  Loop::inEventLoop() const
  {
    return not _loop_thread or *_loop_thread == std::this_thread::get_id();
  }

  void
  Loop::wakeup()
  {
    _wakeup->send();
  }

  void
  Loop::call_soon(std::function<void(void)> f)
  {
    {
      std::lock_guard lock{_pending_mutex};
      _pending.push_back(std::move(f));
    }
    _wakeup->send();
  }

  void
  Loop::start_timer(loop_time_t delay, std::function<void(void)> callback)
  {
    auto timer = _uv->resource<uvw::TimerHandle>();
    timer->on<uvw::TimerEvent>([f = std::move(callback)](const auto&, auto& handle) {
      handle.stop();
      handle.close();
      f();
    });
    timer->start(delay, 0ms);
  }

  void
  Loop::call_later(loop_time_t delay, std::function<void(void)> callback)
  {
    if (inEventLoop())
    {
      start_timer(delay, std::move(callback));
      return;
    }

    const auto due = std::chrono::steady_clock::now() + delay;
    call_soon([this, due, f = std::move(callback)]() mutable {
      auto left = std::chrono::duration_cast<loop_time_t>(due - std::chrono::steady_clock::now());
      if (left > 0ms)
        start_timer(left, std::move(f));
      else
        f();
    });
  }

}  // namespace procflow::uv
