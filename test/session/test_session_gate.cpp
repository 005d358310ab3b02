#include <procflow/session/session_gate.hpp>
#include <procflow/session/token.hpp>

#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>

#include "mocks/mock_transport.hpp"

using namespace procflow;
using namespace procflow::session;

namespace
{
  constexpr int64_t NOW = 1'700'000'000;

  SessionGate::Clock
  fixed_clock()
  {
    return [] { return from_unix_seconds(NOW); };
  }

  SessionGate
  gate_with(std::optional<std::string> token, Duration_t leeway = 0s)
  {
    return SessionGate{std::make_shared<StaticTokenSource>(std::move(token)), leeway, fixed_clock()};
  }
}  // namespace

TEST_CASE("Expiry claim is read from a jwt", "[session][token]")
{
  CHECK(token_expiry(mocks::make_jwt({{"sub", "u1"}, {"exp", NOW}})) == NOW);
  CHECK(token_expiry(mocks::make_jwt({{"exp", 1700000000.75}})) == NOW);
  CHECK(token_expiry(mocks::make_jwt({{"exp", "1700000000"}})) == NOW);

  CHECK_FALSE(token_expiry(mocks::make_jwt({{"sub", "u1"}})));
  CHECK_FALSE(token_expiry(mocks::make_jwt({{"exp", "soon"}})));
  CHECK_FALSE(token_expiry(mocks::make_jwt({{"exp", nullptr}})));
  CHECK_FALSE(token_expiry("opaque-session-token"));
  CHECK_FALSE(token_expiry("a.b.c"));
  CHECK_FALSE(token_expiry(""));
}

TEST_CASE("Expiry claims beyond int64 saturate", "[session][token]")
{
  constexpr auto max = std::numeric_limits<int64_t>::max();
  constexpr auto min = std::numeric_limits<int64_t>::min();
  CHECK(token_expiry(mocks::make_jwt({{"exp", 1e300}})) == max);
  CHECK(token_expiry(mocks::make_jwt({{"exp", -1e300}})) == min);
  CHECK(token_expiry(mocks::make_jwt({{"exp", std::numeric_limits<uint64_t>::max()}})) == max);
  CHECK(token_expiry(mocks::make_jwt({{"exp", int64_t{10'000'000'000}}})) == 10'000'000'000);
}

TEST_CASE("Unix times outside the clock range saturate", "[session][time]")
{
  CHECK(from_unix_seconds(10'000'000'000) > from_unix_seconds(NOW));
  CHECK(from_unix_seconds(MAX_UNIX_SECONDS - 1) < TimePoint_t::max());
  CHECK(from_unix_seconds(MAX_UNIX_SECONDS) == TimePoint_t::max());
  CHECK(from_unix_seconds(std::numeric_limits<int64_t>::max()) == TimePoint_t::max());
  CHECK(from_unix_seconds(std::numeric_limits<int64_t>::min()) == TimePoint_t::min());
}

TEST_CASE("Far future expiry keeps the session alive", "[session]")
{
  CHECK(gate_with(mocks::make_jwt({{"exp", int64_t{10'000'000'000}}})).evaluate(true)
        == SessionStatus::allowed);
  CHECK(gate_with(mocks::make_jwt({{"exp", 1e300}})).evaluate(true) == SessionStatus::allowed);
  CHECK(gate_with(mocks::make_jwt({{"exp", std::numeric_limits<uint64_t>::max()}})).evaluate(true)
        == SessionStatus::allowed);
  CHECK(gate_with(mocks::make_jwt({{"exp", int64_t{10'000'000'000}}}), 3600s).evaluate(true)
        == SessionStatus::allowed);
}

TEST_CASE("Expiry claims before the epoch are expired", "[session]")
{
  CHECK(gate_with(mocks::make_jwt({{"exp", -1e300}})).evaluate(true) == SessionStatus::expired);
  CHECK(gate_with(mocks::make_jwt({{"exp", int64_t{-5}}})).evaluate(true) == SessionStatus::expired);
}

TEST_CASE("Gate always allows when not checking expiry", "[session]")
{
  CHECK(gate_with(std::nullopt).evaluate(false) == SessionStatus::allowed);
  CHECK(gate_with(mocks::make_jwt({{"exp", NOW - 3600}})).evaluate(false) == SessionStatus::allowed);
  CHECK(gate_with(std::nullopt).is_continuation_allowed(false) == true);
}

TEST_CASE("Gate goes by the expiry claim", "[session]")
{
  CHECK(gate_with(mocks::make_jwt({{"exp", NOW + 60}})).evaluate(true) == SessionStatus::allowed);
  CHECK(gate_with(mocks::make_jwt({{"exp", NOW}})).evaluate(true) == SessionStatus::expired);
  CHECK(gate_with(mocks::make_jwt({{"exp", NOW - 1}})).evaluate(true) == SessionStatus::expired);

  CHECK(gate_with(mocks::make_jwt({{"exp", NOW + 60}})).is_continuation_allowed(true) == true);
  CHECK(gate_with(mocks::make_jwt({{"exp", NOW - 60}})).is_continuation_allowed(true) == false);
}

TEST_CASE("Token without an expiry is indeterminate", "[session]")
{
  auto gate = gate_with(mocks::make_jwt({{"sub", "u1"}}));
  CHECK(gate.evaluate(true) == SessionStatus::indeterminate);
  CHECK_FALSE(gate.is_continuation_allowed(true).has_value());

  CHECK(gate_with("not-a-jwt").evaluate(true) == SessionStatus::indeterminate);
}

TEST_CASE("Missing token means the session is over", "[session]")
{
  CHECK(gate_with(std::nullopt).evaluate(true) == SessionStatus::expired);
  CHECK(gate_with(std::string{}).evaluate(true) == SessionStatus::expired);
  CHECK(SessionGate{nullptr, 0s, fixed_clock()}.evaluate(true) == SessionStatus::expired);
}

TEST_CASE("Leeway counts nearly expired tokens as expired", "[session]")
{
  auto token = mocks::make_jwt({{"exp", NOW + 30}});
  CHECK(gate_with(token).evaluate(true) == SessionStatus::allowed);
  CHECK(gate_with(token, 30s).evaluate(true) == SessionStatus::expired);
  CHECK(gate_with(token, 29s).evaluate(true) == SessionStatus::allowed);
}

TEST_CASE("Gate rejects a bad setup", "[session]")
{
  CHECK_THROWS_AS(SessionGate(nullptr, -1s, fixed_clock()), std::invalid_argument);
  CHECK_THROWS_AS(SessionGate(nullptr, 0s, nullptr), std::invalid_argument);
}

TEST_CASE("Session status formats", "[session]")
{
  CHECK(fmt::format("{}", SessionStatus::indeterminate) == "indeterminate");
}
