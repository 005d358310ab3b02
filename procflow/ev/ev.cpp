#include "ev.hpp"
#include "libuv.hpp"

#include <memory>

namespace procflow
{
  EventLoop_ptr
  EventLoop::create()
  {
    return std::make_shared<procflow::uv::Loop>();
  }
}  // namespace procflow
