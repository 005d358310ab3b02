#pragma once

#include <filesystem>
#include <fstream>

namespace fs
{
  using namespace std::filesystem;
  using ifstream = std::ifstream;
  using ofstream = std::ofstream;
}  // namespace fs
