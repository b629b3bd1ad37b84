#ifndef CLOUDBURST_TEST_MOCKS_HPP
#define CLOUDBURST_TEST_MOCKS_HPP

#include <cloudburst/batch_system.hpp>
#include <cloudburst/clock.hpp>
#include <cloudburst/cloud.hpp>
#include <cloudburst/config.hpp>
#include <cloudburst/log.hpp>
#include <cloudburst/orchestrator.hpp>
#include <cloudburst/policy.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <vector>

namespace cloudburst {
namespace test {

/** @brief Blocks callers of wait() while closed. Never blocks longer than
 * 10 seconds, so a failing test cannot hang the runner on shutdown. */
class Gate
{
  public:
  void close()
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_open = false;
  }
  void open()
  {
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_open = true;
    }
    m_cond.notify_all();
  }
  void wait()
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cond.wait_for(
      lock, std::chrono::seconds(10), [this]() { return m_open; });
  }

  private:
  std::mutex m_mutex;
  std::condition_variable m_cond;
  bool m_open = true;
};

class MockBatchSystem : public BatchSystem
{
  public:
  virtual ~MockBatchSystem() {}

  virtual std::vector<JobInfo> getSchedInfo()
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    ++calls;
    if(fail) {
      throw std::runtime_error("batch system unreachable");
    }
    return m_jobs;
  }

  void setJobs(std::vector<JobInfo> jobs)
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_jobs = std::move(jobs);
  }

  std::atomic<bool> fail = false;
  std::atomic<uint32_t> calls = 0;

  private:
  std::mutex m_mutex;
  std::vector<JobInfo> m_jobs;
};

class MockCloud : public Cloud
{
  public:
  virtual ~MockCloud() {}

  virtual void startVM(VmInfo& vm)
  {
    startGate.wait();
    std::unique_lock<std::mutex> lock(m_mutex);
    ++startCalls;
    started.push_back(vm);
    if(failStarts > 0) {
      --failStarts;
      throw std::runtime_error("quota exceeded");
    }
    vm.instanceId = "i-" + vm.vmid;
    vm.privateIp = "10.1.0." + vm.vmid;
    vm.cloud = "mock";
  }

  virtual void stopVM(VmInfo& vm)
  {
    stopGate.wait();
    std::unique_lock<std::mutex> lock(m_mutex);
    ++stopCalls;
    stopped.push_back(vm);
    if(failStops > 0) {
      --failStops;
      throw std::runtime_error("instance is locked");
    }
  }

  virtual void updateVMStatus(std::vector<VmInfo>& vms)
  {
    refreshGate.wait();
    std::unique_lock<std::mutex> lock(m_mutex);
    ++refreshCalls;
    for(auto& vm : vms) {
      if(reportDown.count(vm.vmid)) {
        vm.state = VmInfo::Down;
      } else if(vm.state == VmInfo::Starting && reportUp) {
        vm.state = VmInfo::Up;
        vm.publicIp = "198.51.100." + vm.vmid;
      }
    }
  }

  /** @brief Copy of the record passed to the n-th startVM call. */
  VmInfo getStarted(std::size_t n)
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    return started.at(n);
  }
  std::size_t getStartedCount()
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    return started.size();
  }
  void setReportDown(const VmID& vmid)
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    reportDown.insert(vmid);
  }

  std::atomic<uint32_t> startCalls = 0;
  std::atomic<uint32_t> stopCalls = 0;
  std::atomic<uint32_t> refreshCalls = 0;
  std::atomic<uint32_t> failStarts = 0;
  std::atomic<uint32_t> failStops = 0;
  std::atomic<bool> reportUp = false;

  Gate startGate;
  Gate stopGate;
  Gate refreshGate;

  private:
  std::mutex m_mutex;
  std::vector<VmInfo> started;
  std::vector<VmInfo> stopped;
  std::set<VmID> reportDown;
};

/** @brief Accepts every job, stops VMs idle for longer than idleThreshold. */
class MockPolicy : public Policy
{
  public:
  virtual ~MockPolicy() {}

  virtual bool isCloudCandidate(const JobInfo& job)
  {
    ++candidateCalls;
    failIfRequested("isCloudCandidate");
    return rejected.count(job.getJobID()) == 0;
  }

  virtual bool isNewVmNeeded(const Orchestrator& orchestrator)
  {
    failIfRequested("isNewVmNeeded");
    return Policy::isNewVmNeeded(orchestrator);
  }

  virtual bool canVmBeStopped(const VmInfo& vm,
                              const Orchestrator& orchestrator)
  {
    offeredStates.push_back(vm.state);
    failIfRequested("canVmBeStopped");
    return stopAll || vm.lastIdle > idleThreshold;
  }

  virtual void before(const Orchestrator& orchestrator)
  {
    ++beforeCalls;
    failIfRequested("before");
  }
  virtual void after(const Orchestrator& orchestrator)
  {
    ++afterCalls;
    failIfRequested("after");
  }

  std::set<JobID> rejected;
  Duration idleThreshold{ 3600 };
  bool stopAll = false;
  /** @brief Every method throws std::runtime_error while set. */
  bool fail = false;

  uint32_t candidateCalls = 0;
  uint32_t beforeCalls = 0;
  uint32_t afterCalls = 0;
  std::vector<VmInfo::State> offeredStates;

  private:
  void failIfRequested(const char* method)
  {
    if(fail)
      throw std::runtime_error(std::string("MockPolicy::") + method +
                               " failed");
  }
};

/** @brief Config with defaults suited for fast tests. */
inline ConfigPtr
MakeTestConfig()
{
  auto config = std::make_shared<Config>();
  config->parseParameters();
  config->set(Config::ThreadCount, uint32_t(4));
  config->set(Config::StatusTimeout, uint64_t(2000));
  config->set(Config::StopRetryBackoff, uint64_t(0));
  config->set(Config::ListenAddress, std::string("127.0.0.1"));
  config->set(Config::ListenPort, uint16_t(0));
  return config;
}

/** @brief Orchestrator wired to mocks and a manual clock. */
struct OrchestratorFixture
{
  explicit OrchestratorFixture(ConfigPtr cfg = MakeTestConfig())
    : config(cfg)
    , log(std::make_shared<Log>(config))
    , clock(std::make_shared<ManualClock>(FromUnixSeconds(1000000)))
    , cloud(std::make_shared<MockCloud>())
    , batch(std::make_shared<MockBatchSystem>())
    , policy(std::make_shared<MockPolicy>())
    , orchestrator(
        std::make_unique<Orchestrator>(config, log, cloud, batch, policy, clock))
  {
    orchestrator->getVmStateSignal().connect(
      [this](const VmInfo& vm, VmInfo::State previous) {
        std::unique_lock<std::mutex> lock(transitionsMutex);
        transitions.emplace_back(vm, previous);
      });
  }
  ~OrchestratorFixture()
  {
    cloud->startGate.open();
    cloud->stopGate.open();
    cloud->refreshGate.open();
  }

  JobInfo pending(const JobID& jobid)
  {
    clock->advance(Duration(1));
    return JobInfo(jobid, JobInfo::Pending, "", clock->now());
  }
  JobInfo running(const JobID& jobid, const NodeName& node)
  {
    clock->advance(Duration(1));
    return JobInfo(
      jobid, JobInfo::Running, node, clock->now() - std::chrono::seconds(1),
      clock->now());
  }

  bool wait()
  {
    return orchestrator->waitForPendingTasks(std::chrono::seconds(5));
  }

  std::vector<std::pair<VmInfo, VmInfo::State>> getTransitions()
  {
    std::unique_lock<std::mutex> lock(transitionsMutex);
    return transitions;
  }

  ConfigPtr config;
  LogPtr log;
  std::shared_ptr<ManualClock> clock;
  std::shared_ptr<MockCloud> cloud;
  std::shared_ptr<MockBatchSystem> batch;
  std::shared_ptr<MockPolicy> policy;
  std::unique_ptr<Orchestrator> orchestrator;

  std::mutex transitionsMutex;
  std::vector<std::pair<VmInfo, VmInfo::State>> transitions;
};
}
}

#endif
