#include "ini.hpp"

#include <procflow/util/logging.hpp>
#include <procflow/util/str.hpp>

#include <stdexcept>

namespace procflow::config
{
  static auto logcat = log::Cat("config");

  std::vector<IniEntry>
  parse_ini(std::string_view text, std::string_view origin)
  {
    std::vector<IniEntry> entries;
    std::string section;
    size_t lineno = 0;

    auto bad_line = [&](std::string_view line) {
      return std::invalid_argument{fmt::format("{}:{}: cannot parse '{}'", origin, lineno, line)};
    };

    for (auto raw : split(text, "\n"))
    {
      ++lineno;
      const auto line = TrimWhitespace(raw);
      if (line.empty() or line.front() == '#' or line.front() == ';')
        continue;

      if (line.front() == '[')
      {
        if (line.back() != ']')
          throw bad_line(line);
        section = std::string{TrimWhitespace(line.substr(1, line.size() - 2))};
        continue;
      }

      const auto eq = line.find('=');
      if (eq == std::string_view::npos)
        throw bad_line(line);
      const auto key = TrimWhitespace(line.substr(0, eq));
      if (key.empty())
        throw bad_line(line);

      IniEntry entry{
          section, std::string{key}, std::string{TrimWhitespace(line.substr(eq + 1))}, lineno};
      log::trace(logcat, "{}:{}: [{}]:{}={}", origin, lineno, entry.section, entry.key, entry.value);
      entries.push_back(std::move(entry));
    }
    return entries;
  }

}  // namespace procflow::config
