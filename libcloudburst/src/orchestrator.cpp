#include "../include/cloudburst/orchestrator.hpp"
#include "../include/cloudburst/config.hpp"
#include "../include/cloudburst/runner.hpp"
#include "../include/cloudburst/util.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace cloudburst {
Orchestrator::Orchestrator(ConfigPtr config,
                           LogPtr log,
                           CloudPtr cloud,
                           BatchSystemPtr batchSystem,
                           PolicyPtr policy,
                           ClockPtr clock)
  : m_config(config)
  , m_log(log)
  , m_logger(log->createLoggerMT("Orchestrator"))
  , m_cloud(cloud)
  , m_batchSystem(batchSystem)
  , m_policy(policy)
  , m_clock(clock ? clock : std::make_shared<SystemClock>())
  , m_runner(std::make_unique<Runner>(config, log))
{
  if(!m_cloud || !m_batchSystem || !m_policy) {
    throw std::invalid_argument(
      "Orchestrator requires a cloud backend, a batch system and a policy!");
  }

  uint32_t maxDelta = m_config->getUint32(Config::MaxDelta);
  if(maxDelta > 1) {
    CLOUDBURST_LOG(m_logger, Debug)
      << "max-delta is set to " << maxDelta
      << ", but at most one VM is started per cycle.";
  }

  m_runner->start();
}
Orchestrator::~Orchestrator()
{
  m_runner->stop();
}

void
Orchestrator::run(double delaySeconds, uint64_t maxCycles)
{
  uint64_t done = 0;
  Duration delay(delaySeconds);

  CLOUDBURST_LOG(m_logger, Info)
    << "Orchestrator starting with a cycle delay of " << delaySeconds
    << "s and up to " << m_config->getUint32(Config::MaxVMs) << " VMs.";

  while(!m_exitRequested && (maxCycles == 0 || done < maxCycles)) {
    auto t0 = std::chrono::steady_clock::now();

    cycle();
    ++done;

    if(m_exitRequested || (maxCycles != 0 && done >= maxCycles))
      break;

    if(delaySeconds > 0) {
      Duration elapsed = std::chrono::steady_clock::now() - t0;
      if(elapsed > delay) {
        CLOUDBURST_LOG(m_logger, Warning)
          << "Cycle " << m_cycle.load() << " took more than " << delaySeconds
          << " seconds! Starting new cycle without delay.";
      } else {
        std::unique_lock<std::mutex> lock(m_exitMutex);
        m_exitCond.wait_for(
          lock,
          std::chrono::duration_cast<std::chrono::milliseconds>(delay - elapsed),
          [this]() { return m_exitRequested.load(); });
      }
    }
  }

  CLOUDBURST_LOG(m_logger, Info)
    << "Orchestrator stopped after " << done << " cycles.";
}

void
Orchestrator::exit()
{
  {
    std::unique_lock<std::mutex> lock(m_exitMutex);
    m_exitRequested = true;
  }
  m_exitCond.notify_all();
}

void
Orchestrator::cycle()
{
  auto cycleStart = std::chrono::steady_clock::now();
  CLOUDBURST_LOG(m_logger, Debug)
    << "About to start cycle " << m_cycle.load();

  superviseTasks();
  runPolicyHook("before", &Policy::before);

  try {
    updateJobStatus();
  } catch(const std::exception& e) {
    CLOUDBURST_LOG(m_logger, Error)
      << "Could not update job status, skipping the rest of cycle "
      << m_cycle.load() << ". Error: " << e.what();
    ++m_cycle;
    return;
  }

  refreshVmStatus();
  accountIdleTime(cycleStart);
  startNewVm();
  stopUnneededVms();

  runPolicyHook("after", &Policy::after);
  ++m_cycle;
}

template<typename Predicate>
bool
Orchestrator::askPolicy(const std::string& question, Predicate predicate)
{
  try {
    return predicate();
  } catch(const std::exception& e) {
    CLOUDBURST_LOG(m_logger, Error)
      << "Policy could not decide " << question << " in cycle "
      << m_cycle.load() << ", assuming no. Error: " << e.what();
    return false;
  }
}

void
Orchestrator::runPolicyHook(const char* hook,
                            void (Policy::*method)(const Orchestrator&))
{
  try {
    ((*m_policy).*method)(*this);
  } catch(const std::exception& e) {
    CLOUDBURST_LOG(m_logger, Error)
      << "Policy hook '" << hook << "' failed in cycle " << m_cycle.load()
      << ". Error: " << e.what();
  }
}

void
Orchestrator::updateJobStatus()
{
  TimePoint now = m_clock->now();
  std::vector<JobInfo> jobs = m_batchSystem->getSchedInfo();

  // Finished jobs no longer occupy their node.
  std::set<JobID> jobids;
  for(const auto& job : jobs) {
    if(job.getState() != JobInfo::Finished)
      jobids.insert(job.getJobID());
  }

  std::vector<const JobInfo*> newlyPending;
  {
    std::unique_lock<std::mutex> lock(m_vmsMutex);

    for(auto& [nodename, vm] : m_nodes) {
      for(auto it = vm->jobs.begin(); it != vm->jobs.end();) {
        if(jobids.count(*it)) {
          ++it;
          continue;
        }
        CLOUDBURST_LOG(m_logger, Info)
          << "Job " << *it << " terminated its execution on node '"
          << nodename << "'";
        it = vm->jobs.erase(it);
      }
    }

    for(const auto& job : jobs) {
      if(job.isRunning()) {
        m_candidates.erase(job.getJobID());
        auto node = m_nodes.find(job.getExecNodeName());
        if(node != m_nodes.end() &&
           node->second->jobs.insert(job.getJobID()).second) {
          CLOUDBURST_LOG(m_logger, Info)
            << "Job " << job.getJobID() << " was started on node '"
            << job.getExecNodeName() << "'";
        }
      } else if(job.isPending() && job.getSubmittedAt() > m_lastUpdate) {
        newlyPending.push_back(&job);
      }
    }
  }

  for(const JobInfo* job : newlyPending) {
    bool candidate =
      askPolicy("whether job " + job->getJobID() + " is a cloud candidate",
                [&]() { return m_policy->isCloudCandidate(*job); });
    if(candidate) {
      CLOUDBURST_LOG(m_logger, Debug)
        << "Job " << job->getJobID() << " is a cloud candidate.";
      m_candidates.insert_or_assign(job->getJobID(), *job);
    }
  }

  std::map<JobID, JobInfo::State> states;
  for(const auto& job : jobs) {
    states.emplace(job.getJobID(), job.getState());
  }
  for(auto it = m_candidates.begin(); it != m_candidates.end();) {
    auto state = states.find(it->first);
    if(state == states.end() || state->second == JobInfo::Finished) {
      CLOUDBURST_LOG(m_logger, Debug)
        << "Job " << it->first << " left the queue, no longer a candidate.";
      it = m_candidates.erase(it);
    } else {
      ++it;
    }
  }

  m_jobs = std::move(jobs);
  m_lastUpdate = now;
}

void
Orchestrator::refreshVmStatus()
{
  if(m_pendingRefresh.valid()) {
    if(m_pendingRefresh.wait_for(std::chrono::seconds(0)) !=
       std::future_status::ready) {
      CLOUDBURST_LOG(m_logger, Warning)
        << "Previous VM status refresh is still running, not refreshing in "
           "cycle "
        << m_cycle.load() << ".";
      return;
    }
    // Late results describe an older state, they are not applied.
    try {
      m_pendingRefresh.get();
    } catch(const std::exception& e) {
      CLOUDBURST_LOG(m_logger, Debug)
        << "Discarded late VM status refresh failed with: " << e.what();
    }
  }

  std::vector<VmInfo> vms;
  {
    std::unique_lock<std::mutex> lock(m_vmsMutex);
    vms.reserve(m_tracked.size());
    for(const auto& [vmid, vm] : m_tracked) {
      vms.push_back(*vm);
    }
  }
  if(vms.empty())
    return;

  auto future = m_runner->push(
    std::make_unique<RefreshStatusTask>(m_cloud, std::move(vms)),
    VMTask::RefreshStatusPriority);

  std::chrono::milliseconds timeout(
    m_config->getUint64(Config::StatusTimeout));
  if(future.wait_for(timeout) != std::future_status::ready) {
    CLOUDBURST_LOG(m_logger, Warning)
      << "VM status refresh did not finish within " << timeout.count()
      << "ms! Continuing with the last known status.";
    m_pendingRefresh = std::move(future);
    return;
  }

  TaskResultPtr result;
  try {
    result = future.get();
  } catch(const std::exception& e) {
    CLOUDBURST_LOG(m_logger, Warning)
      << "Could not refresh VM status! Error: " << e.what();
    return;
  }
  if(!result->isSuccess() || !result->hasTask()) {
    CLOUDBURST_LOG(m_logger, Warning)
      << "Could not refresh VM status! Error: " << result->getMessage();
    return;
  }
  applyRefreshResult(static_cast<VMTask&>(result->getTask()).getVms());
}

void
Orchestrator::applyRefreshResult(const std::vector<VmInfo>& updated)
{
  TransitionList transitions;
  {
    std::unique_lock<std::mutex> lock(m_vmsMutex);
    for(const VmInfo& u : updated) {
      auto it = m_tracked.find(u.vmid);
      if(it == m_tracked.end())
        continue;
      VmInfoPtr vm = it->second;
      VmInfo::State previous = vm->state;

      vm->mergeCloudFields(u);

      if(u.state == VmInfo::Down) {
        CLOUDBURST_LOG(m_logger, Warning)
          << *vm << " is reported DOWN by the cloud, it is no longer tracked.";
        if(!vm->jobs.empty()) {
          CLOUDBURST_LOG(m_logger, Warning)
            << *vm << " was still running " << vm->jobs.size() << " jobs.";
        }
        dropFromIndicesNoLock(vm);
        vm->state = VmInfo::Down;
        vm->stoppedAt = m_clock->now();
        transitions.emplace_back(*vm, previous);
      } else if(u.state == VmInfo::Up && previous == VmInfo::Starting) {
        CLOUDBURST_LOG(m_logger, Debug) << *vm << " is up.";
        vm->state = VmInfo::Up;
        transitions.emplace_back(*vm, previous);
      }
    }
  }
  emitTransitions(transitions);
}

void
Orchestrator::accountIdleTime(SteadyTimePoint cycleStart)
{
  Duration interval(0);
  if(m_lastIdleAccounting) {
    interval = cycleStart - *m_lastIdleAccounting;
  }
  m_lastIdleAccounting = cycleStart;

  std::unique_lock<std::mutex> lock(m_vmsMutex);
  for(auto& [vmid, vm] : m_tracked) {
    if(vm->jobs.empty()) {
      vm->totalIdle += interval;
      vm->lastIdle += interval;
    } else {
      vm->lastIdle = Duration(0);
    }
  }
}

void
Orchestrator::startNewVm()
{
  if(!askPolicy("whether a new VM is needed",
                [this]() { return m_policy->isNewVmNeeded(*this); }))
    return;

  uint32_t maxVms = m_config->getUint32(Config::MaxVMs);
  std::optional<VmInfo> copy;
  {
    std::unique_lock<std::mutex> lock(m_vmsMutex);
    if(m_tracked.size() + m_staging.size() >= maxVms) {
      CLOUDBURST_LOG(m_logger, Debug)
        << "A new VM is needed, but the limit of " << maxVms
        << " VMs is reached.";
      return;
    }

    auto vm = std::make_shared<VmInfo>(newVmId(), VmInfo::Starting);
    vm->auth = newAuthToken();
    m_pendingAuth[vm->auth] = vm;
    m_staging[vm->vmid] = vm;
    copy = *vm;
  }

  emitTransitions({ { *copy, VmInfo::Down } });
  dispatch(std::make_unique<StartVMTask>(m_cloud, *copy),
           VMTask::StartPriority,
           0);
}

void
Orchestrator::stopUnneededVms()
{
  std::vector<VmInfo> ready;
  {
    std::unique_lock<std::mutex> lock(m_vmsMutex);
    for(const auto& [vmid, vm] : m_tracked) {
      if(vm->isReady())
        ready.push_back(*vm);
    }
  }

  for(const VmInfo& snapshot : ready) {
    if(!askPolicy("whether VM " + snapshot.vmid + " can be stopped",
                  [&]() { return m_policy->canVmBeStopped(snapshot, *this); }))
      continue;

    std::optional<VmInfo> copy;
    VmInfo::State previous = VmInfo::Other;
    {
      std::unique_lock<std::mutex> lock(m_vmsMutex);
      auto it = m_tracked.find(snapshot.vmid);
      if(it == m_tracked.end())
        continue;
      VmInfoPtr vm = it->second;

      if(!vm->jobs.empty()) {
        std::string jobs;
        for(const auto& jobid : vm->jobs) {
          jobs += (jobs.empty() ? "" : " ") + jobid;
        }
        CLOUDBURST_LOG(m_logger, Warning)
          << "Request to stop " << *vm
          << ", but it's still running jobs: " << jobs;
      }

      // Moving and revoking under the same lock as vmIsReady makes a late
      // readiness notification for this VM fail.
      dropFromIndicesNoLock(vm);
      m_stopping[vm->vmid] = vm;
      previous = vm->state;
      vm->state = VmInfo::Stopping;
      copy = *vm;
    }

    emitTransitions({ { *copy, previous } });
    dispatch(
      std::make_unique<StopVMTask>(m_cloud, *copy, 0), VMTask::StopPriority, 0);
  }
}

bool
Orchestrator::vmIsReady(const AuthToken& auth, const NodeName& nodename)
{
  std::optional<VmInfo> copy;
  VmInfo::State previous = VmInfo::Other;
  {
    std::unique_lock<std::mutex> lock(m_vmsMutex);
    auto it = m_pendingAuth.find(auth);
    if(it == m_pendingAuth.end()) {
      CLOUDBURST_LOG(m_logger, Error)
        << "Received notification that node '" << nodename
        << "' is READY, but authentication data does not match any started "
           "VM. Ignoring.";
      return false;
    }
    if(nodename.empty()) {
      CLOUDBURST_LOG(m_logger, Error)
        << "Received READY notification for VM " << it->second->vmid
        << " without a node name. Ignoring.";
      return false;
    }
    bool nodenameTaken = m_nodes.count(nodename) > 0;
    for(const auto& [vmid, staged] : m_staging) {
      nodenameTaken = nodenameTaken || staged->nodename == nodename;
    }
    if(nodenameTaken) {
      CLOUDBURST_LOG(m_logger, Error)
        << "Received READY notification for VM " << it->second->vmid
        << " as node '" << nodename
        << "', but that node name is already in use. Ignoring.";
      return false;
    }

    VmInfoPtr vm = it->second;
    m_pendingAuth.erase(it);

    previous = vm->state;
    vm->state = VmInfo::Ready;
    vm->readyAt = m_clock->now();
    vm->nodename = nodename;
    vm->auth.clear();

    // A VM whose start result has not been applied yet is entered into the
    // node index once it becomes tracked.
    if(m_tracked.count(vm->vmid)) {
      m_nodes[nodename] = vm;
    }
    copy = *vm;
  }

  CLOUDBURST_LOG(m_logger, Info)
    << "VM " << copy->vmid << " reports being ready as node '" << nodename
    << "'";
  emitTransitions({ { *copy, previous } });
  return true;
}

bool
Orchestrator::waitForPendingTasks(std::chrono::milliseconds timeout)
{
  auto deadline = std::chrono::steady_clock::now() + timeout;
  for(;;) {
    superviseTasks();

    auto now = std::chrono::steady_clock::now();
    bool retryDue = std::any_of(m_stopRetries.begin(),
                                m_stopRetries.end(),
                                [now](const auto& r) { return r.due <= now; });
    if(m_inFlight.empty() && !retryDue)
      return true;
    if(now >= deadline)
      return false;

    auto step = std::min<std::chrono::steady_clock::duration>(
      deadline - now, std::chrono::milliseconds(10));
    if(!m_inFlight.empty()) {
      m_inFlight.front().result.wait_for(step);
    }
  }
}

void
Orchestrator::superviseTasks()
{
  auto now = std::chrono::steady_clock::now();

  for(auto it = m_inFlight.begin(); it != m_inFlight.end();) {
    if(it->result.wait_for(std::chrono::seconds(0)) ==
       std::future_status::ready) {
      applyTaskResult(*it);
      it = m_inFlight.erase(it);
      continue;
    }
    if(!it->deadlineReported && now > it->deadline) {
      CLOUDBURST_LOG(m_logger, Error)
        << (it->kind == VMTask::Start ? "Start" : "Stop") << " task of VM "
        << it->vmid << " exceeded its deadline of "
        << m_config->getUint64(Config::TaskDeadline)
        << "s and is still running!";
      it->deadlineReported = true;
    }
    ++it;
  }

  dispatchDueStopRetries(now);
}

void
Orchestrator::applyTaskResult(InFlightTask& task)
{
  TaskResultPtr result;
  std::string error;
  try {
    result = task.result.get();
  } catch(const std::exception& e) {
    error = e.what();
  }

  const VmInfo* updated = nullptr;
  if(result) {
    if(result->isSuccess() && result->hasTask()) {
      updated = &static_cast<VMTask&>(result->getTask()).getVm();
    } else {
      error = result->getMessage();
    }
  }

  if(task.kind == VMTask::Start) {
    applyStartResult(task.vmid, updated, error);
  } else {
    applyStopResult(task.vmid, task.attempt, updated, error);
  }
}

void
Orchestrator::applyStartResult(const VmID& vmid,
                               const VmInfo* updated,
                               const std::string& error)
{
  TransitionList transitions;
  {
    std::unique_lock<std::mutex> lock(m_vmsMutex);
    auto it = m_staging.find(vmid);
    if(it == m_staging.end()) {
      CLOUDBURST_LOG(m_logger, Error)
        << "Start result for VM " << vmid << " has no staged VM!";
      return;
    }
    VmInfoPtr vm = it->second;
    m_staging.erase(it);
    VmInfo::State previous = vm->state;

    if(!updated) {
      CLOUDBURST_LOG(m_logger, Error)
        << "Error starting VM " << vmid << ": " << error;
      dropFromIndicesNoLock(vm);
      vm->state = VmInfo::Down;
      transitions.emplace_back(*vm, previous);
    } else {
      vm->mergeCloudFields(*updated);
      vm->startedAt = m_clock->now();
      if(vm->state == VmInfo::Starting && updated->state == VmInfo::Up) {
        vm->state = VmInfo::Up;
        transitions.emplace_back(*vm, previous);
      }
      m_tracked[vm->vmid] = vm;
      if(vm->isReady()) {
        m_nodes[vm->nodename] = vm;
        CLOUDBURST_LOG(m_logger, Info)
          << "VM " << vmid << " started, already ready as node '"
          << vm->nodename << "'";
      } else {
        CLOUDBURST_LOG(m_logger, Info)
          << "VM " << vmid << " started, waiting for 'READY' notification.";
      }
    }
  }
  emitTransitions(transitions);
}

void
Orchestrator::applyStopResult(const VmID& vmid,
                              uint32_t attempt,
                              const VmInfo* updated,
                              const std::string& error)
{
  if(!updated) {
    uint16_t retries = m_config->getUint16(Config::StopRetries);
    CLOUDBURST_LOG(m_logger, Error)
      << "Error stopping VM " << vmid << ": " << error;

    if(attempt < retries) {
      auto backoff =
        std::chrono::seconds(m_config->getUint64(Config::StopRetryBackoff)) *
        (1u << std::min<uint32_t>(attempt, 16));
      CLOUDBURST_LOG(m_logger, Warning)
        << "Retrying to stop VM " << vmid << " in " << backoff.count()
        << "s (retry " << (attempt + 1) << " of " << retries << ").";
      m_stopRetries.push_back(
        { vmid, attempt + 1, std::chrono::steady_clock::now() + backoff });
    } else {
      CLOUDBURST_LOG(m_logger, Alert)
        << "VM " << vmid << " could not be stopped after " << (attempt + 1)
        << " attempts! It stays in the stopping list and may still be billed "
           "by the cloud provider.";
    }
    return;
  }

  TransitionList transitions;
  {
    std::unique_lock<std::mutex> lock(m_vmsMutex);
    auto it = m_stopping.find(vmid);
    if(it == m_stopping.end()) {
      CLOUDBURST_LOG(m_logger, Error)
        << "Stop result for VM " << vmid << " has no stopping VM!";
      return;
    }
    VmInfoPtr vm = it->second;
    m_stopping.erase(it);

    vm->mergeCloudFields(*updated);
    vm->stoppedAt = m_clock->now();
    VmInfo::State previous = vm->state;
    vm->state = VmInfo::Down;

    TimePoint runningSince =
      vm->readyAt != TimePoint() ? vm->readyAt : vm->startedAt;
    Duration beenRunning = vm->stoppedAt - runningSince;
    double idlePercent = beenRunning.count() > 0
                           ? 100.0 * vm->totalIdle.count() / beenRunning.count()
                           : 0.0;

    CLOUDBURST_LOG(m_logger, Info)
      << "Stopped VM " << vm->vmid << " (" << vm->nodename
      << "); it has run for " << DurationPrettyPrint(beenRunning)
      << ", been idle for " << DurationPrettyPrint(vm->totalIdle)
      << " of them (" << idlePercent << "%)";

    transitions.emplace_back(*vm, previous);
  }
  emitTransitions(transitions);
}

void
Orchestrator::dispatchDueStopRetries(SteadyTimePoint now)
{
  std::vector<StopRetry> due;
  auto it = std::stable_partition(
    m_stopRetries.begin(), m_stopRetries.end(), [now](const StopRetry& r) {
      return r.due > now;
    });
  due.assign(it, m_stopRetries.end());
  m_stopRetries.erase(it, m_stopRetries.end());

  for(const StopRetry& retry : due) {
    std::optional<VmInfo> copy;
    {
      std::unique_lock<std::mutex> lock(m_vmsMutex);
      auto vm = m_stopping.find(retry.vmid);
      if(vm == m_stopping.end())
        continue;
      copy = *vm->second;
    }
    dispatch(std::make_unique<StopVMTask>(m_cloud, *copy, retry.attempt),
             VMTask::StopPriority,
             retry.attempt);
  }
}

void
Orchestrator::dispatch(std::unique_ptr<VMTask> task,
                       int priority,
                       uint32_t attempt)
{
  VMTask::Kind kind = task->getKind();
  VmID vmid = task->getVm().vmid;
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::seconds(m_config->getUint64(Config::TaskDeadline));

  CLOUDBURST_LOG(m_logger, Debug) << "Dispatching " << task->name() << ".";

  auto future = m_runner->push(std::move(task), priority);
  m_inFlight.push_back({ kind, vmid, attempt, std::move(future), deadline });
}

VmID
Orchestrator::newVmId()
{
  VmID vmid;
  do {
    vmid = std::to_string(++m_vmCounter);
  } while(!m_issuedVmIds.insert(vmid).second);
  return vmid;
}

AuthToken
Orchestrator::newAuthToken()
{
  std::size_t length = m_config->getUint16(Config::AuthTokenLength);
  AuthToken token;
  do {
    token = GenerateAuthToken(length);
  } while(m_pendingAuth.count(token) || !m_issuedTokens.insert(token).second);
  return token;
}

void
Orchestrator::dropFromIndicesNoLock(const VmInfoPtr& vm)
{
  if(!vm->auth.empty()) {
    auto it = m_pendingAuth.find(vm->auth);
    if(it != m_pendingAuth.end() && it->second == vm)
      m_pendingAuth.erase(it);
  }
  if(!vm->nodename.empty()) {
    auto it = m_nodes.find(vm->nodename);
    if(it != m_nodes.end() && it->second == vm)
      m_nodes.erase(it);
  }
  m_staging.erase(vm->vmid);
  m_tracked.erase(vm->vmid);
  m_stopping.erase(vm->vmid);
}

void
Orchestrator::emitTransitions(const TransitionList& transitions)
{
  for(const auto& [vm, previous] : transitions) {
    CLOUDBURST_LOG(m_logger, Trace)
      << vm << " changed state from " << previous << " to " << vm.state;
    m_vmStateSignal(vm, previous);
  }
}

std::size_t
Orchestrator::getTrackedVmCount() const
{
  std::unique_lock<std::mutex> lock(m_vmsMutex);
  return m_tracked.size();
}

std::size_t
Orchestrator::getStagingVmCount() const
{
  std::unique_lock<std::mutex> lock(m_vmsMutex);
  return m_staging.size();
}

std::size_t
Orchestrator::getStoppingVmCount() const
{
  std::unique_lock<std::mutex> lock(m_vmsMutex);
  return m_stopping.size();
}

std::size_t
Orchestrator::getPendingAuthCount() const
{
  std::unique_lock<std::mutex> lock(m_vmsMutex);
  return m_pendingAuth.size();
}

std::vector<VmInfo>
Orchestrator::getTrackedVms() const
{
  std::unique_lock<std::mutex> lock(m_vmsMutex);
  std::vector<VmInfo> vms;
  for(const auto& [vmid, vm] : m_tracked) {
    vms.push_back(*vm);
  }
  return vms;
}

std::vector<VmInfo>
Orchestrator::getStoppingVms() const
{
  std::unique_lock<std::mutex> lock(m_vmsMutex);
  std::vector<VmInfo> vms;
  for(const auto& [vmid, vm] : m_stopping) {
    vms.push_back(*vm);
  }
  return vms;
}

std::optional<VmInfo>
Orchestrator::getVmByNodeName(const NodeName& nodename) const
{
  std::unique_lock<std::mutex> lock(m_vmsMutex);
  auto it = m_nodes.find(nodename);
  if(it == m_nodes.end())
    return std::nullopt;
  return *it->second;
}

std::optional<VmInfo>
Orchestrator::getVm(const VmID& vmid) const
{
  std::unique_lock<std::mutex> lock(m_vmsMutex);
  for(const VmIndex* index : { &m_staging, &m_tracked, &m_stopping }) {
    auto it = index->find(vmid);
    if(it != index->end())
      return *it->second;
  }
  return std::nullopt;
}
}
