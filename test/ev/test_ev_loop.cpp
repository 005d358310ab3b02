#include <procflow/ev/ev.hpp>

#include <catch2/catch.hpp>

#include <atomic>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace procflow;
using namespace std::literals;

namespace
{
  struct RunningLoop
  {
    EventLoop_ptr loop = EventLoop::create();
    std::thread thread;

    RunningLoop()
    {
      thread = std::thread{[l = loop] { l->run(); }};
      // wait for the loop thread to claim the loop before handing it work
      std::promise<void> started;
      auto f = started.get_future();
      loop->call_soon([&started] { started.set_value(); });
      f.wait();
    }

    ~RunningLoop()
    {
      loop->stop();
      thread.join();
    }
  };
}  // namespace

TEST_CASE("Calls made before the loop starts run inline", "[ev]")
{
  auto loop = EventLoop::create();
  bool ran = false;
  loop->call([&] { ran = true; });
  CHECK(ran);
  CHECK(loop->running());
}

TEST_CASE("call_soon from another thread runs on the loop thread", "[ev]")
{
  RunningLoop rl;

  std::promise<std::pair<std::thread::id, bool>> p;
  auto f = p.get_future();
  rl.loop->call_soon([&] {
    p.set_value({std::this_thread::get_id(), rl.loop->inEventLoop()});
  });

  REQUIRE(f.wait_for(5s) == std::future_status::ready);
  auto [id, in_loop] = f.get();
  CHECK(id == rl.thread.get_id());
  CHECK(in_loop);
  CHECK_FALSE(rl.loop->inEventLoop());
}

TEST_CASE("Queued calls keep their order", "[ev]")
{
  RunningLoop rl;

  std::vector<int> order;
  std::promise<void> done;
  auto f = done.get_future();
  for (int i = 0; i < 5; i++)
    rl.loop->call_soon([&order, i] { order.push_back(i); });
  rl.loop->call_soon([&] { done.set_value(); });

  REQUIRE(f.wait_for(5s) == std::future_status::ready);
  CHECK(order == std::vector<int>{0, 1, 2, 3, 4});
}

TEST_CASE("call_later fires after its delay", "[ev]")
{
  RunningLoop rl;

  std::promise<void> fired;
  auto f = fired.get_future();
  const auto start = std::chrono::steady_clock::now();
  rl.loop->call_later(50ms, [&] { fired.set_value(); });

  REQUIRE(f.wait_for(5s) == std::future_status::ready);
  CHECK(std::chrono::steady_clock::now() - start >= 40ms);
}

TEST_CASE("Stopping from another thread ends run()", "[ev]")
{
  auto loop = EventLoop::create();
  std::promise<void> started;
  auto f = started.get_future();
  loop->call_soon([&started] { started.set_value(); });

  std::atomic<bool> returned{false};
  std::thread thread{[&] {
    loop->run();
    returned = true;
  }};
  REQUIRE(f.wait_for(5s) == std::future_status::ready);

  loop->stop();
  thread.join();
  CHECK(returned);
  CHECK_FALSE(loop->running());
}
