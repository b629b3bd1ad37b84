#ifndef CLOUDBURST_ORCHESTRATOR_HPP
#define CLOUDBURST_ORCHESTRATOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include <boost/signals2/signal.hpp>

#include "batch_system.hpp"
#include "clock.hpp"
#include "cloud.hpp"
#include "job_info.hpp"
#include "log.hpp"
#include "policy.hpp"
#include "taskresult.hpp"
#include "vm_info.hpp"
#include "vm_tasks.hpp"

namespace cloudburst {
class Runner;

/** @brief Control loop growing and shrinking a pool of cloud VMs.
 *
 * The orchestrator owns all \ref VmInfo records and keeps them in these
 * indices:
 *
 *   - pending-auth: token -> VM, from creation until the readiness handshake.
 *   - staging: vmid -> VM, while the start task is in flight.
 *   - tracked-active: vmid -> VM, after the start succeeded.
 *   - stopping: vmid -> VM, after the policy decided to stop the VM.
 *   - node-lookup: nodename -> VM, for Ready VMs that are tracked-active.
 *
 * A started VM that has not sent its readiness notification yet is in
 * pending-auth and in staging or tracked-active at the same time. Stopping
 * excludes every other index.
 *
 * All indices are guarded by one mutex, which is never held while calling
 * into the \ref Policy, the \ref Cloud or the \ref BatchSystem. Blocking cloud
 * calls run as tasks on an internal \ref Runner and only ever see copies of
 * the records. Their results are applied on the main loop thread.
 *
 * \ref run, \ref cycle and \ref waitForPendingTasks must be called from one
 * thread (the main loop thread). \ref vmIsReady and \ref exit may be called
 * from any thread.
 */
class Orchestrator
{
  public:
  using CandidateMap = std::map<JobID, JobInfo>;

  /** @brief Fired on every lifecycle transition with the new record and the
   * previous state. Newly created VMs report Down as previous state.
   *
   * Fired without any orchestrator lock held, from the thread that caused
   * the transition (main loop or readiness listener).
   */
  using VmStateSignal =
    boost::signals2::signal<void(const VmInfo&, VmInfo::State)>;

  Orchestrator(ConfigPtr config,
               LogPtr log,
               CloudPtr cloud,
               BatchSystemPtr batchSystem,
               PolicyPtr policy,
               ClockPtr clock = nullptr);
  ~Orchestrator();

  /** @brief Run the main loop until \ref exit is called or maxCycles cycles
   * are done.
   *
   * @param delaySeconds Cadence of cycles. 0 runs cycles back to back.
   * @param maxCycles Number of cycles to run, 0 means forever.
   */
  void run(double delaySeconds, uint64_t maxCycles = 0);

  /** @brief Run exactly one cycle without sleeping afterwards. */
  void cycle();

  /** @brief Make \ref run return after the current cycle. */
  void exit();
  bool isExitRequested() const { return m_exitRequested; }

  /** @brief Readiness handshake of a booted VM.
   *
   * Consumes the token and marks the VM Ready. Returns false (and changes
   * nothing) if the token is unknown, was already used or was revoked.
   */
  bool vmIsReady(const AuthToken& auth, const NodeName& nodename);

  /** @brief Apply results of in-flight start and stop tasks until none are
   * left or the timeout expires.
   *
   * Stop retries that are due are dispatched as well. Returns true if no
   * start or stop task is in flight anymore.
   */
  bool waitForPendingTasks(std::chrono::milliseconds timeout);

  /** @brief Pending jobs flagged by the policy as cloud candidates.
   * Main loop thread only. */
  const CandidateMap& getCandidates() const { return m_candidates; }
  /** @brief Job snapshot of the last successful update. Main loop thread
   * only. */
  const std::vector<JobInfo>& getJobs() const { return m_jobs; }

  std::size_t getTrackedVmCount() const;
  std::size_t getStagingVmCount() const;
  std::size_t getStoppingVmCount() const;
  std::size_t getPendingAuthCount() const;
  std::size_t getInFlightTaskCount() const { return m_inFlight.size(); }
  bool isStatusRefreshPending() const { return m_pendingRefresh.valid(); }

  std::vector<VmInfo> getTrackedVms() const;
  std::vector<VmInfo> getStoppingVms() const;
  std::optional<VmInfo> getVmByNodeName(const NodeName& nodename) const;
  /** @brief Look up a VM that is staged, tracked-active or stopping. */
  std::optional<VmInfo> getVm(const VmID& vmid) const;

  uint64_t getCycle() const { return m_cycle; }

  VmStateSignal& getVmStateSignal() { return m_vmStateSignal; }

  private:
  using VmIndex = std::map<std::string, VmInfoPtr>;
  using Transition = std::pair<VmInfo, VmInfo::State>;
  using TransitionList = std::vector<Transition>;

  struct InFlightTask
  {
    VMTask::Kind kind;
    VmID vmid;
    uint32_t attempt;
    std::future<TaskResultPtr> result;
    SteadyTimePoint deadline;
    bool deadlineReported = false;
  };

  struct StopRetry
  {
    VmID vmid;
    uint32_t attempt;
    SteadyTimePoint due;
  };

  ConfigPtr m_config;
  LogPtr m_log;
  LoggerMT m_logger;
  CloudPtr m_cloud;
  BatchSystemPtr m_batchSystem;
  PolicyPtr m_policy;
  ClockPtr m_clock;
  std::unique_ptr<Runner> m_runner;

  mutable std::mutex m_vmsMutex;
  VmIndex m_pendingAuth;
  VmIndex m_staging;
  VmIndex m_tracked;
  VmIndex m_stopping;
  VmIndex m_nodes;
  std::set<VmID> m_issuedVmIds;
  std::set<AuthToken> m_issuedTokens;
  uint64_t m_vmCounter = 0;

  CandidateMap m_candidates;
  std::vector<JobInfo> m_jobs;
  TimePoint m_lastUpdate = TimePoint::min();
  std::optional<SteadyTimePoint> m_lastIdleAccounting;

  std::list<InFlightTask> m_inFlight;
  std::vector<StopRetry> m_stopRetries;
  std::future<TaskResultPtr> m_pendingRefresh;

  std::atomic<uint64_t> m_cycle = 0;
  std::atomic<bool> m_exitRequested = false;
  std::mutex m_exitMutex;
  std::condition_variable m_exitCond;

  VmStateSignal m_vmStateSignal;

  void updateJobStatus();
  void refreshVmStatus();
  void accountIdleTime(SteadyTimePoint cycleStart);
  void startNewVm();
  void stopUnneededVms();

  /** @brief Evaluate a policy predicate. A throwing policy answers no. */
  template<typename Predicate>
  bool askPolicy(const std::string& question, Predicate predicate);
  void runPolicyHook(const char* hook,
                     void (Policy::*method)(const Orchestrator&));

  void superviseTasks();
  void applyTaskResult(InFlightTask& task);
  void applyStartResult(const VmID& vmid,
                        const VmInfo* updated,
                        const std::string& error);
  void applyStopResult(const VmID& vmid,
                       uint32_t attempt,
                       const VmInfo* updated,
                       const std::string& error);
  void applyRefreshResult(const std::vector<VmInfo>& updated);
  void dispatchDueStopRetries(SteadyTimePoint now);
  void dispatch(std::unique_ptr<VMTask> task, int priority, uint32_t attempt);

  VmID newVmId();
  AuthToken newAuthToken();
  /** @brief Remove a VM from every index. Requires m_vmsMutex. */
  void dropFromIndicesNoLock(const VmInfoPtr& vm);
  void emitTransitions(const TransitionList& transitions);
};
}

#endif
