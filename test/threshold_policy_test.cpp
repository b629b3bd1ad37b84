#include <catch2/catch.hpp>

#include "mocks.hpp"

#include <cloudburst/threshold_policy.hpp>

using namespace cloudburst;
using namespace cloudburst::test;

TEST_CASE("Threshold policy selects jobs by pattern", "[policy]")
{
  auto config = MakeTestConfig();
  config->set(Config::CandidatePattern, std::string("cloud-[0-9]+"));
  auto log = std::make_shared<Log>(config);
  ThresholdPolicy policy(config, log);

  TimePoint submitted = FromUnixSeconds(1);
  REQUIRE(policy.isCloudCandidate(
    JobInfo("cloud-12", JobInfo::Pending, "", submitted)));
  REQUIRE_FALSE(policy.isCloudCandidate(
    JobInfo("local-12", JobInfo::Pending, "", submitted)));
  // The whole id has to match.
  REQUIRE_FALSE(policy.isCloudCandidate(
    JobInfo("cloud-12-big", JobInfo::Pending, "", submitted)));
}

TEST_CASE("Threshold policy rejects invalid patterns", "[policy]")
{
  auto config = MakeTestConfig();
  config->set(Config::CandidatePattern, std::string("cloud-[0-9"));
  auto log = std::make_shared<Log>(config);
  REQUIRE_THROWS_AS(ThresholdPolicy(config, log), boost::regex_error);
}

TEST_CASE("Threshold policy stops VMs idle for too long", "[policy]")
{
  OrchestratorFixture f;
  f.config->set(Config::IdleThreshold, float(60));
  ThresholdPolicy policy(f.config, f.log);
  REQUIRE(policy.getIdleThreshold() == Duration(60));

  VmInfo vm("1", VmInfo::Ready);
  vm.lastIdle = Duration(59);
  REQUIRE_FALSE(policy.canVmBeStopped(vm, *f.orchestrator));
  vm.lastIdle = Duration(61);
  vm.totalIdle = Duration(61);
  REQUIRE(policy.canVmBeStopped(vm, *f.orchestrator));

  REQUIRE_FALSE(policy.isNewVmNeeded(*f.orchestrator));
}
