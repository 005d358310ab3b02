#include <procflow/util/str.hpp>

#include <catch2/catch.hpp>

#include <limits>
#include <vector>

using namespace std::literals;

TEST_CASE("TrimWhitespace -- positive tests", "[str][trim]")
{
  // Test that things that should be trimmed actually get trimmed
  auto fee = "    J a c k"s;
  auto fi = "\ra\nd"s;
  auto fo = "\fthe   "s;
  auto fum = " \t\r\n\v\f Beanstalk\n\n\n\t\r\f\v   \n\n\r\f\f\f\f\v"s;
  for (auto* s : {&fee, &fi, &fo, &fum})
    *s = procflow::TrimWhitespace(*s);

  REQUIRE(fee == "J a c k");
  REQUIRE(fi == "a\nd");
  REQUIRE(fo == "the");
  REQUIRE(fum == "Beanstalk");
  REQUIRE(procflow::TrimWhitespace(" \t\n ").empty());
}

TEST_CASE("TrimWhitespace -- negative tests", "[str][trim]")
{
  // Test that things that shouldn't be trimmed don't get trimmed
  auto c = GENERATE(range(std::numeric_limits<char>::min(), std::numeric_limits<char>::max()));
  std::string plant = c + "bean"s + c;
  plant = procflow::TrimWhitespace(plant);
  if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v')
    REQUIRE(plant == "bean");
  else
  {
    REQUIRE(plant.size() == 6);
    REQUIRE(plant.substr(1, 4) == "bean");
  }
}

TEST_CASE("split strings with multiple matches", "[str][split]")
{
  auto splits = procflow::split("this is a test", " ");
  REQUIRE(splits.size() == 4);
  REQUIRE(splits[0] == "this");
  REQUIRE(splits[1] == "is");
  REQUIRE(splits[2] == "a");
  REQUIRE(splits[3] == "test");
}

TEST_CASE("split keeps empty pieces", "[str][split]")
{
  REQUIRE(procflow::split("ab--c----de", "--") == std::vector<std::string_view>{"ab", "c", "", "de"});
  REQUIRE(procflow::split("a.b.", ".") == std::vector<std::string_view>{"a", "b", ""});
  REQUIRE(procflow::split("-a--b--", "-", true) == std::vector<std::string_view>{"a", "", "b"});
  REQUIRE(procflow::split("abc", "") == std::vector<std::string_view>{"a", "b", "c"});
}

TEST_CASE("join", "[str][join]")
{
  std::vector<std::string> keys{"stepName", "token", "amount"};
  CHECK(procflow::join(",", keys) == "stepName,token,amount");
  CHECK(procflow::join("&", std::vector<int>{}).empty());
}

TEST_CASE("parse_int", "[str][parse]")
{
  int64_t v = 0;
  CHECK(procflow::parse_int("1700000000", v));
  CHECK(v == 1700000000);
  CHECK(procflow::parse_int("-12", v));
  CHECK(v == -12);
  CHECK_FALSE(procflow::parse_int("12abc", v));
  CHECK_FALSE(procflow::parse_int("", v));
  CHECK(v == -12);
}

TEST_CASE("percent_encode", "[str][encode]")
{
  CHECK(procflow::percent_encode("onboarding") == "onboarding");
  CHECK(procflow::percent_encode("a b/c") == "a%20b%2Fc");
  CHECK(procflow::percent_encode("x=1&y") == "x%3D1%26y");
  CHECK(procflow::percent_encode("A-z_0.9~") == "A-z_0.9~");
  CHECK(procflow::percent_encode("\xc3\xa9") == "%C3%A9");
}

TEST_CASE("lowercase_ascii_string", "[str]")
{
  CHECK(procflow::lowercase_ascii_string("StepName") == "stepname");
}
