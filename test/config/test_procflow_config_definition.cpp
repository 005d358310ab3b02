#include <procflow/config/definition.hpp>

#include <catch2/catch.hpp>

using namespace procflow::config;

TEST_CASE("Typed option parses its value", "[config]")
{
  TypedOption<int> opt("foo", "bar", Default{42});

  CHECK(opt.value() == 42);
  CHECK(opt.value_count() == 0);
  CHECK(opt.default_text() == "42");

  CHECK_NOTHROW(opt.add_value("43"));
  CHECK(opt.value() == 43);
  CHECK(opt.value_count() == 1);

  CHECK_THROWS_AS(opt.add_value("44"), std::invalid_argument);
  CHECK_THROWS_AS(TypedOption<int>("a", "b").add_value("12abc"), std::invalid_argument);
  CHECK_FALSE(TypedOption<int>("a", "b").default_text());
}

TEST_CASE("Booleans accept the usual words", "[config]")
{
  for (auto word : {"false", "off", "0", "no", "OFF"})
    CHECK_FALSE(parse_value<bool>(word));
  for (auto word : {"true", "on", "1", "yes", "Yes"})
    CHECK(parse_value<bool>(word));
  CHECK_THROWS_AS(parse_value<bool>("maybe"), std::invalid_argument);
  CHECK_THROWS_AS(parse_value<int>(""), std::invalid_argument);
}

TEST_CASE("Multi valued options accept every value in order", "[config]")
{
  std::vector<std::string> seen;
  TypedOption<std::string> opt(
      "flow", "step-key", MultiValue, [&](std::string arg) { seen.push_back(std::move(arg)); });

  opt.add_value("stepName");
  opt.add_value("token");
  CHECK(opt.value_count() == 2);
  CHECK(opt.value() == "stepName");

  opt.accept();
  CHECK(seen == std::vector<std::string>{"stepName", "token"});
}

TEST_CASE("Acceptors get the default when nothing was given", "[config]")
{
  int timeout = -1;
  TypedOption<int> opt("engine", "timeout", Default{15}, assignment_acceptor(timeout));
  opt.accept();
  CHECK(timeout == 15);

  bool called = false;
  TypedOption<std::string> no_default("logging", "file", [&](std::string) { called = true; });
  no_default.accept();
  CHECK_FALSE(called);
}

TEST_CASE("ConfigDefinition rejects what it does not know", "[config]")
{
  ConfigDefinition config;
  config.define_option<int>("session", "expiry-leeway", Default{0});

  CHECK_THROWS_AS(
      config.define_option<int>("session", "expiry-leeway", Default{1}), std::invalid_argument);
  CHECK_THROWS_AS(config.set("session", "nope", "1"), std::invalid_argument);
  CHECK_THROWS_AS(config.set("nope", "expiry-leeway", "1"), std::invalid_argument);
  CHECK_THROWS_AS(config.get<std::string>("session", "expiry-leeway"), std::invalid_argument);
  CHECK_THROWS_AS(config.set("session", "expiry-leeway", "soon"), std::invalid_argument);

  config.set("session", "expiry-leeway", "30");
  CHECK(config.get<int>("session", "expiry-leeway") == 30);
}

TEST_CASE("Acceptor errors propagate", "[config]")
{
  ConfigDefinition config;
  config.define_option<int>("flow", "handler-timeout", Default{0}, [](int arg) {
    if (arg < 0)
      throw std::invalid_argument{"negative"};
  });
  config.set("flow", "handler-timeout", "-1");
  CHECK_THROWS_AS(config.accept_all(), std::invalid_argument);
}

TEST_CASE("Generated ini documents options", "[config]")
{
  ConfigDefinition config;
  config.define_option<int>(
      "engine", "timeout", Default{15}, Comment{"Seconds to wait for the engine."});
  config.define_option<std::string>("engine", "rpc");
  config.define_option<bool>("session", "check-token-expiry", Default{true});
  config.add_section_comments("engine", {"Remote engine."});

  auto ini = config.generate_ini();
  CHECK(ini.find("[engine]\n# Remote engine.\n") != std::string::npos);
  CHECK(ini.find("# Seconds to wait for the engine.\n#timeout=15\n") != std::string::npos);
  CHECK(ini.find("#rpc=\n") != std::string::npos);
  CHECK(ini.find("#check-token-expiry=true") != std::string::npos);
  CHECK(ini.find("[engine]") < ini.find("[session]"));
}
