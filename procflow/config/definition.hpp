#pragma once

#include <fmt/core.h>

#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace procflow::config
{
  /// option tag: the key may repeat, and every value reaches the acceptor in file order
  struct MultiValue_t
  {};
  inline constexpr MultiValue_t MultiValue{};

  /// value used, and written to generated files, when the option is not given
  template <typename T>
  struct Default
  {
    T val;
    constexpr explicit Default(T val) : val{std::move(val)}
    {}
  };

  /// lines written above the option in a generated file
  struct Comment
  {
    std::vector<std::string> lines;
    explicit Comment(std::initializer_list<std::string> lines) : lines{lines}
    {}
  };

  /// acceptor that stores the value in `ref`, which must outlive the definition
  template <typename T>
  auto
  assignment_acceptor(T& ref)
  {
    return [&ref](T arg) { ref = std::move(arg); };
  }

  /// converts ini text into an option value.
  ///
  /// @throws std::invalid_argument if `text` is not a valid T
  template <typename T>
  T
  parse_value(std::string_view text);

  template <>
  std::string
  parse_value<std::string>(std::string_view text);

  /// true/false, on/off, yes/no and 1/0
  template <>
  bool
  parse_value<bool>(std::string_view text);

  template <>
  int
  parse_value<int>(std::string_view text);

  /// one setting: a key within an ini section
  class Option
  {
   public:
    Option(std::string section, std::string name)
        : section{std::move(section)}, name{std::move(name)}
    {}

    virtual ~Option() = default;

    /// parse one value given for this option.
    ///
    /// @throws std::invalid_argument if it does not parse, or repeats a single valued option
    virtual void
    add_value(std::string_view text) = 0;

    /// hand the given values, or the default if none were given, to the acceptor.  rethrows
    /// whatever the acceptor throws.
    virtual void
    accept() const = 0;

    virtual size_t
    value_count() const = 0;

    virtual std::optional<std::string>
    default_text() const = 0;

    const std::string section;
    const std::string name;
    bool multi_valued = false;
    std::vector<std::string> comments;
  };

  template <typename T>
  class TypedOption : public Option
  {
   public:
    /// `opts` are any of MultiValue, Default{...}, Comment{...} and an acceptor taking a T, in
    /// any order.  The acceptor validates the value and throws if it is unusable.
    template <typename... Opts>
    TypedOption(std::string section, std::string name, Opts&&... opts)
        : Option{std::move(section), std::move(name)}
    {
      (apply(std::forward<Opts>(opts)), ...);
    }

    /// the first given value, else the default
    std::optional<T>
    value() const
    {
      if (not _values.empty())
        return _values.front();
      return _default;
    }

    void
    add_value(std::string_view text) override
    {
      if (not multi_valued and not _values.empty())
        throw std::invalid_argument{fmt::format("[{}]:{} given more than once", section, name)};
      try
      {
        _values.push_back(parse_value<T>(text));
      }
      catch (const std::invalid_argument& e)
      {
        throw std::invalid_argument{fmt::format("[{}]:{}: {}", section, name, e.what())};
      }
    }

    void
    accept() const override
    {
      if (not _acceptor)
        return;
      if (_values.empty())
      {
        if (_default)
          _acceptor(*_default);
        return;
      }
      for (const auto& v : _values)
        _acceptor(v);
    }

    size_t
    value_count() const override
    {
      return _values.size();
    }

    std::optional<std::string>
    default_text() const override
    {
      if (not _default)
        return std::nullopt;
      return fmt::format("{}", *_default);
    }

   private:
    void
    apply(MultiValue_t)
    {
      multi_valued = true;
    }

    void
    apply(Comment comment)
    {
      comments = std::move(comment.lines);
    }

    template <typename U>
    void
    apply(Default<U> def)
    {
      static_assert(std::is_constructible_v<T, U>, "default does not convert to the option type");
      _default = T(std::move(def.val));
    }

    template <typename F, std::enable_if_t<std::is_invocable_v<F, T>, int> = 0>
    void
    apply(F&& acceptor)
    {
      _acceptor = std::forward<F>(acceptor);
    }

    std::optional<T> _default;
    std::vector<T> _values;
    std::function<void(T)> _acceptor;
  };

  /// Every option a config file may set, in the order they were defined.  Values found in the
  /// file are fed in with set(); accept_all() then pushes them, or the defaults, to the acceptors.
  class ConfigDefinition
  {
   public:
    template <typename T, typename... Opts>
    ConfigDefinition&
    define_option(std::string section, std::string name, Opts&&... opts)
    {
      return add(std::make_unique<TypedOption<T>>(
          std::move(section), std::move(name), std::forward<Opts>(opts)...));
    }

    /// @throws std::invalid_argument if the option is already defined
    ConfigDefinition&
    add(std::unique_ptr<Option> opt);

    /// @throws std::invalid_argument for an undefined option or a value that does not parse
    void
    set(std::string_view section, std::string_view name, std::string_view value);

    /// the value given for an option, else its default
    ///
    /// @throws std::invalid_argument for an undefined option or the wrong T
    template <typename T>
    std::optional<T>
    get(std::string_view section, std::string_view name) const
    {
      auto* typed = dynamic_cast<const TypedOption<T>*>(&find_or_throw(section, name));
      if (not typed)
        throw std::invalid_argument{
            fmt::format("[{}]:{} is not a {}", section, name, typeid(T).name())};
      return typed->value();
    }

    /// runs every acceptor, in definition order
    void
    accept_all() const;

    void
    add_section_comments(const std::string& section, std::vector<std::string> lines);

    /// an ini file documenting every option, each commented out at its default
    std::string
    generate_ini() const;

   private:
    Option*
    find(std::string_view section, std::string_view name) const;

    const Option&
    find_or_throw(std::string_view section, std::string_view name) const;

    std::vector<std::string>
    sections() const;

    std::vector<std::unique_ptr<Option>> _options;
    std::vector<std::pair<std::string, std::vector<std::string>>> _section_comments;
  };

}  // namespace procflow::config
