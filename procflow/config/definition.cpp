#include "definition.hpp"

#include <procflow/util/str.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace procflow::config
{
  template <>
  std::string
  parse_value<std::string>(std::string_view text)
  {
    return std::string{text};
  }

  template <>
  bool
  parse_value<bool>(std::string_view text)
  {
    const auto word = lowercase_ascii_string(std::string{text});
    if (word == "true" or word == "on" or word == "yes" or word == "1")
      return true;
    if (word == "false" or word == "off" or word == "no" or word == "0")
      return false;
    throw std::invalid_argument{fmt::format("'{}' is not a boolean", text)};
  }

  template <>
  int
  parse_value<int>(std::string_view text)
  {
    int value = 0;
    if (not parse_int(text, value))
      throw std::invalid_argument{fmt::format("'{}' is not an integer", text)};
    return value;
  }

  ConfigDefinition&
  ConfigDefinition::add(std::unique_ptr<Option> opt)
  {
    if (find(opt->section, opt->name))
      throw std::invalid_argument{
          fmt::format("[{}]:{} is already defined", opt->section, opt->name)};
    _options.push_back(std::move(opt));
    return *this;
  }

  Option*
  ConfigDefinition::find(std::string_view section, std::string_view name) const
  {
    auto itr = std::find_if(_options.begin(), _options.end(), [&](const auto& opt) {
      return opt->section == section and opt->name == name;
    });
    return itr == _options.end() ? nullptr : itr->get();
  }

  const Option&
  ConfigDefinition::find_or_throw(std::string_view section, std::string_view name) const
  {
    if (auto* opt = find(section, name))
      return *opt;
    throw std::invalid_argument{fmt::format("unknown option [{}]:{}", section, name)};
  }

  void
  ConfigDefinition::set(std::string_view section, std::string_view name, std::string_view value)
  {
    auto* opt = find(section, name);
    if (not opt)
      throw std::invalid_argument{fmt::format("unknown option [{}]:{}", section, name)};
    opt->add_value(value);
  }

  void
  ConfigDefinition::accept_all() const
  {
    for (const auto& opt : _options)
      opt->accept();
  }

  void
  ConfigDefinition::add_section_comments(
      const std::string& section, std::vector<std::string> lines)
  {
    for (auto& [name, existing] : _section_comments)
    {
      if (name == section)
      {
        existing.insert(existing.end(), lines.begin(), lines.end());
        return;
      }
    }
    _section_comments.emplace_back(section, std::move(lines));
  }

  std::vector<std::string>
  ConfigDefinition::sections() const
  {
    std::vector<std::string> names;
    for (const auto& opt : _options)
      if (std::find(names.begin(), names.end(), opt->section) == names.end())
        names.push_back(opt->section);
    return names;
  }

  std::string
  ConfigDefinition::generate_ini() const
  {
    std::string ini;
    auto out = std::back_inserter(ini);

    for (const auto& section : sections())
    {
      if (not ini.empty())
        ini += "\n\n";
      fmt::format_to(out, "[{}]\n", section);
      for (const auto& [name, lines] : _section_comments)
        if (name == section)
          for (const auto& line : lines)
            fmt::format_to(out, "# {}\n", line);

      for (const auto& opt : _options)
      {
        if (opt->section != section)
          continue;
        ini += "\n";
        for (const auto& line : opt->comments)
          fmt::format_to(out, "# {}\n", line);
        // commented out so that loading the file back changes nothing
        fmt::format_to(out, "#{}={}\n", opt->name, opt->default_text().value_or(""));
      }
    }
    return ini;
  }

}  // namespace procflow::config
