#ifndef CLOUDBURST_BATCH_SYSTEM_HPP
#define CLOUDBURST_BATCH_SYSTEM_HPP

#include <memory>
#include <vector>

#include "job_info.hpp"

namespace cloudburst {

/** @brief Interface to the batch system whose queue is monitored.
 *
 * \ref getSchedInfo is called once per orchestrator cycle from the main loop
 * thread. Failures are reported by throwing; the orchestrator then skips the
 * rest of the cycle and tries again on the next one.
 */
class BatchSystem
{
  public:
  virtual ~BatchSystem();

  /** @brief Return records for all jobs currently known to the batch system.
   *
   * Every pending job must carry its submission time and every running job its
   * start time and execution node.
   */
  virtual std::vector<JobInfo> getSchedInfo() = 0;
};

using BatchSystemPtr = std::shared_ptr<BatchSystem>;
}

#endif
