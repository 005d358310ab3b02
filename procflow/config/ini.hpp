#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace procflow::config
{
  /// a `key=value` line, with the section it appeared under
  struct IniEntry
  {
    std::string section;
    std::string key;
    std::string value;
    size_t line;
  };

  /// Splits ini text into its entries, in file order; repeated keys come back once per line.
  /// Blank lines and lines starting with `#` or `;` are skipped, and whitespace around section
  /// names, keys and values is dropped.  `origin` names the text in error messages.
  ///
  /// @throws std::invalid_argument on a line that is neither `[section]` nor `key=value`
  std::vector<IniEntry>
  parse_ini(std::string_view text, std::string_view origin = "<string>");

}  // namespace procflow::config
