#pragma once

// Header for making log statements such as procflow::log::info(cat, ...) work.

#include <oxen/log.hpp>

namespace procflow
{
  namespace log = oxen::log;
}  // namespace procflow
