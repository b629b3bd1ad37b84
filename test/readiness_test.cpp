#include <catch2/catch.hpp>

#include "mocks.hpp"

#include <thread>

using namespace cloudburst;
using namespace cloudburst::test;

/// Starts one VM and returns its readiness token.
static AuthToken
StartVm(OrchestratorFixture& f)
{
  f.batch->setJobs({ f.pending("J" + std::to_string(f.batch->calls.load())) });
  f.orchestrator->cycle();
  REQUIRE(f.wait());
  return f.cloud->getStarted(f.cloud->getStartedCount() - 1).auth;
}

TEST_CASE("Unknown readiness tokens are rejected", "[readiness]")
{
  OrchestratorFixture f;
  AuthToken auth = StartVm(f);

  REQUIRE_FALSE(f.orchestrator->vmIsReady("not-a-token", "node1"));
  REQUIRE_FALSE(f.orchestrator->vmIsReady("", "node1"));
  REQUIRE(f.orchestrator->getPendingAuthCount() == 1);

  auto tracked = f.orchestrator->getTrackedVms();
  REQUIRE(tracked.size() == 1);
  REQUIRE(tracked[0].state == VmInfo::Starting);
  REQUIRE(tracked[0].auth == auth);
}

TEST_CASE("Readiness tokens are single use", "[readiness]")
{
  OrchestratorFixture f;
  AuthToken auth = StartVm(f);

  REQUIRE(f.orchestrator->vmIsReady(auth, "node1"));
  REQUIRE(f.orchestrator->getPendingAuthCount() == 0);

  REQUIRE_FALSE(f.orchestrator->vmIsReady(auth, "node1"));
  REQUIRE_FALSE(f.orchestrator->vmIsReady(auth, "node2"));
  REQUIRE_FALSE(f.orchestrator->getVmByNodeName("node2"));
  REQUIRE(f.orchestrator->getVmByNodeName("node1"));
}

TEST_CASE("Readiness without a usable node name keeps the token",
          "[readiness]")
{
  OrchestratorFixture f;
  AuthToken first = StartVm(f);
  AuthToken second = StartVm(f);
  REQUIRE(first != second);

  SECTION("Empty node name")
  {
    REQUIRE_FALSE(f.orchestrator->vmIsReady(first, ""));
    REQUIRE(f.orchestrator->getPendingAuthCount() == 2);
    REQUIRE(f.orchestrator->vmIsReady(first, "node1"));
  }

  SECTION("Node name of another ready VM")
  {
    REQUIRE(f.orchestrator->vmIsReady(first, "node1"));
    REQUIRE_FALSE(f.orchestrator->vmIsReady(second, "node1"));
    REQUIRE(f.orchestrator->getPendingAuthCount() == 1);
    REQUIRE(f.orchestrator->vmIsReady(second, "node2"));

    REQUIRE(f.orchestrator->getVmByNodeName("node1")->vmid !=
            f.orchestrator->getVmByNodeName("node2")->vmid);
  }
}

TEST_CASE("Concurrent readiness with one token succeeds once", "[readiness]")
{
  OrchestratorFixture f;
  AuthToken auth = StartVm(f);

  std::atomic<uint32_t> accepted = 0;
  std::atomic<bool> go = false;
  std::vector<std::thread> threads;
  for(int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i]() {
      while(!go) {
        std::this_thread::yield();
      }
      if(f.orchestrator->vmIsReady(auth, "node" + std::to_string(i)))
        ++accepted;
    });
  }
  go = true;
  for(auto& t : threads) {
    t.join();
  }

  REQUIRE(accepted == 1);
  REQUIRE(f.orchestrator->getPendingAuthCount() == 0);

  auto tracked = f.orchestrator->getTrackedVms();
  REQUIRE(tracked.size() == 1);
  REQUIRE(tracked[0].state == VmInfo::Ready);
  REQUIRE(f.orchestrator->getVmByNodeName(tracked[0].nodename));
  REQUIRE(f.getTransitions().back().second == VmInfo::Starting);
}

TEST_CASE("Node name of a stopping VM is free again", "[readiness]")
{
  OrchestratorFixture f;
  f.policy->stopAll = true;
  f.cloud->stopGate.close();

  AuthToken first = StartVm(f);
  REQUIRE(f.orchestrator->vmIsReady(first, "node1"));
  f.batch->setJobs({});
  f.orchestrator->cycle();
  REQUIRE(f.orchestrator->getStoppingVmCount() == 1);
  REQUIRE_FALSE(f.orchestrator->getVmByNodeName("node1"));

  // The stop is still in flight, the token comes from the creation event.
  f.batch->setJobs({ f.pending("J2") });
  f.orchestrator->cycle();
  VmInfo created = f.getTransitions().back().first;
  REQUIRE(created.state == VmInfo::Starting);

  REQUIRE(f.orchestrator->vmIsReady(created.auth, "node1"));
  REQUIRE(f.orchestrator->getStoppingVmCount() == 1);
  f.cloud->stopGate.open();
  REQUIRE(f.wait());

  auto vm = f.orchestrator->getVmByNodeName("node1");
  REQUIRE(vm);
  REQUIRE(vm->vmid == created.vmid);
  REQUIRE(vm->state == VmInfo::Ready);
}
