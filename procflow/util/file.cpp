#include "file.hpp"

#include <fstream>
#include <ios>
#include <stdexcept>
#include <system_error>

namespace procflow::util
{
  static std::streampos
  file_reader_impl(const fs::path& filename, fs::ifstream& in)
  {
    in.exceptions(std::ifstream::failbit | std::ifstream::badbit);
    in.open(filename, std::ios::binary | std::ios::in);
    in.seekg(0, std::ios::end);
    auto size = in.tellg();
    in.seekg(0, std::ios::beg);
    return size;
  }

  std::string
  file_to_string(const fs::path& filename)
  {
    fs::ifstream in;
    std::string contents;
    auto size = file_reader_impl(filename, in);
    contents.resize(size);
    in.read(contents.data(), size);
    return contents;
  }

}  // namespace procflow::util
