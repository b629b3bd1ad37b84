#ifndef CLOUDBURST_POLICY_HPP
#define CLOUDBURST_POLICY_HPP

#include <memory>

#include "job_info.hpp"
#include "vm_info.hpp"

namespace cloudburst {
class Orchestrator;

/** @brief Decides when the VM pool grows and shrinks.
 *
 * All methods are called from the orchestrator main loop thread without any
 * orchestrator lock held. They may use the const accessors of the passed
 * orchestrator (e.g. the candidate list), but must not change it.
 */
class Policy
{
  public:
  virtual ~Policy();

  /** @brief Return true if a newly pending job may be run in the cloud. */
  virtual bool isCloudCandidate(const JobInfo& job) = 0;

  /** @brief Return true if a new VM should be started this cycle.
   *
   * The default requests a VM as long as there are candidate jobs.
   */
  virtual bool isNewVmNeeded(const Orchestrator& orchestrator);

  /** @brief Return true if the given ready VM is no longer needed.
   *
   * Receives a snapshot of the record taken at the start of the scale down
   * step.
   */
  virtual bool canVmBeStopped(const VmInfo& vm,
                              const Orchestrator& orchestrator) = 0;

  /** @brief Hook called at the start of every cycle. */
  virtual void before(const Orchestrator& orchestrator) {}
  /** @brief Hook called at the end of every cycle. */
  virtual void after(const Orchestrator& orchestrator) {}
};

using PolicyPtr = std::shared_ptr<Policy>;
}

#endif
