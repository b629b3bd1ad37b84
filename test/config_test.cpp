#include <catch2/catch.hpp>

#include <cloudburst/config.hpp>

#include <vector>

using namespace cloudburst;

/// Parses the given arguments as if they were passed on the command line.
static bool
Parse(Config& config, std::vector<std::string> args)
{
  args.insert(args.begin(), "cloudburstd");
  std::vector<char*> argv;
  for(auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return config.parseParameters(static_cast<int>(args.size()), argv.data());
}

TEST_CASE("Config provides defaults", "[config]")
{
  Config config;
  REQUIRE(config.parseParameters());

  REQUIRE(config.getUint32(Config::ThreadCount) == 8);
  REQUIRE(config.getUint32(Config::MaxVMs) == 10);
  REQUIRE(config.getUint32(Config::MaxDelta) == 1);
  REQUIRE(config.getFloat(Config::CycleDelay) == Approx(30));
  REQUIRE(config.getUint64(Config::MaxCycles) == 0);
  REQUIRE(config.getUint64(Config::StatusTimeout) == 10000);
  REQUIRE(config.getUint16(Config::StopRetries) == 1);
  REQUIRE(config.getString(Config::ListenAddress) == "0.0.0.0");
  REQUIRE(config.getUint16(Config::ListenPort) == 8223);
  REQUIRE(config.getString(Config::JobsFile).empty());
  REQUIRE(config.getString(Config::CandidatePattern) == ".*");
  REQUIRE(config.getUint16(Config::AuthTokenLength) == 24);
  REQUIRE(config.isListenerEnabled());
  REQUIRE_FALSE(config.isDebugMode());
  REQUIRE_FALSE(config.isHelpRequested());
}

TEST_CASE("Config reads command line options", "[config]")
{
  Config config;
  REQUIRE(Parse(config,
                { "--max-vms",
                  "3",
                  "--delay=0.5",
                  "--jobs-file",
                  "/tmp/queue.txt",
                  "--candidate-pattern",
                  "cloud-.*",
                  "--no-listener",
                  "-d" }));

  REQUIRE(config.getUint32(Config::MaxVMs) == 3);
  REQUIRE(config.getFloat(Config::CycleDelay) == Approx(0.5));
  REQUIRE(config.getString(Config::JobsFile) == "/tmp/queue.txt");
  REQUIRE(config.getString(Config::CandidatePattern) == "cloud-.*");
  REQUIRE_FALSE(config.isListenerEnabled());
  REQUIRE(config.isDebugMode());
  REQUIRE(config.getKeyAsString(Config::MaxVMs) == "3");
}

TEST_CASE("Config rejects invalid options", "[config]")
{
  Config config;
  REQUIRE_FALSE(Parse(config, { "--max-vms", "many" }));
  REQUIRE_FALSE(Parse(config, { "--unknown-option" }));
  REQUIRE_FALSE(Parse(config, { "--threads", "0" }));
  REQUIRE_FALSE(Parse(config, { "--auth-token-length", "4" }));
  REQUIRE_FALSE(Parse(config, { "--delay=-1" }));
  REQUIRE_FALSE(config.isHelpRequested());
}

TEST_CASE("Config stops after printing the help", "[config]")
{
  Config config;
  REQUIRE_FALSE(Parse(config, { "--help" }));
  REQUIRE(config.isHelpRequested());
}
