#pragma once
#include "fs.hpp"

#include <string>
#include <string_view>

namespace procflow::util
{
  /// Reads a binary file from disk into a string.  Throws on error.
  std::string
  file_to_string(const fs::path& filename);

}  // namespace procflow::util
