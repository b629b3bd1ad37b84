#include <catch2/catch.hpp>

#include <cloudburst/clock.hpp>
#include <cloudburst/util.hpp>

#include <cctype>

using namespace cloudburst;

TEST_CASE("Manual clock only moves when told to", "[clock]")
{
  ManualClock clock(FromUnixSeconds(100));
  REQUIRE(ToUnixSeconds(clock.now()) == Approx(100));

  clock.advance(Duration(1.5));
  REQUIRE(ToUnixSeconds(clock.now()) == Approx(101.5));

  clock.set(FromUnixSeconds(5));
  REQUIRE(ToUnixSeconds(clock.now()) == Approx(5));
}

TEST_CASE("System clock follows the wall time", "[clock]")
{
  SystemClock clock;
  auto before = std::chrono::system_clock::now();
  auto now = clock.now();
  REQUIRE(now >= before);
  REQUIRE(now <= std::chrono::system_clock::now());
}

TEST_CASE("UNIX seconds conversion keeps sub-second precision", "[clock]")
{
  TimePoint t = FromUnixSeconds(1600000000.25);
  REQUIRE(ToUnixSeconds(t) == Approx(1600000000.25));
  REQUIRE(ToUnixSeconds(TimePoint()) == 0);
}

TEST_CASE("Durations are printed with millisecond precision", "[util]")
{
  REQUIRE(DurationPrettyPrint(Duration(0)) == "0.000s");
  REQUIRE(DurationPrettyPrint(Duration(61.25)) == "61.250s");
}

TEST_CASE("Readiness tokens are alphanumeric", "[util]")
{
  AuthToken a = GenerateAuthToken(24);
  AuthToken b = GenerateAuthToken(24);
  REQUIRE(a.size() == 24);
  REQUIRE(a != b);
  for(char c : a) {
    REQUIRE(std::isalnum(static_cast<unsigned char>(c)));
  }
  REQUIRE(GenerateAuthToken(0).empty());
}
