#ifndef CLOUDBURST_JOB_INFO_HPP
#define CLOUDBURST_JOB_INFO_HPP

#include <iosfwd>
#include <string>
#include <string_view>

#include "types.hpp"

namespace cloudburst {

/** @brief Snapshot of one job in the batch system queue.
 *
 * Records are rebuilt every cycle from what the \ref BatchSystem reports.
 * The constructor rejects records that would violate the contract (empty job
 * id, state out of range, running job without execution node, pending job
 * without submission time) by throwing std::invalid_argument, so an invalid
 * record never enters the orchestrator.
 */
class JobInfo
{
  public:
  enum State
  {
    Other = 0,
    Pending = 1,
    Running = 2,
    Finished = 3,
  };

  JobInfo(JobID jobid,
          State state,
          NodeName execNodeName = "",
          TimePoint submittedAt = TimePoint(),
          TimePoint runningAt = TimePoint());
  ~JobInfo();

  const JobID& getJobID() const { return m_jobid; }
  State getState() const { return m_state; }
  /** @brief Node the job runs on. Only non-empty for running jobs. */
  const NodeName& getExecNodeName() const { return m_execNodeName; }
  TimePoint getSubmittedAt() const { return m_submittedAt; }
  TimePoint getRunningAt() const { return m_runningAt; }

  /** @brief A running job is guaranteed to carry an execution node name. */
  bool isRunning() const { return m_state == Running; }
  bool isPending() const { return m_state == Pending; }

  /** @brief Parse PENDING, RUNNING, FINISHED or OTHER (case-insensitive).
   *
   * Throws std::invalid_argument for anything else. */
  static State StateFromString(std::string_view str);

  private:
  JobID m_jobid;
  State m_state;
  NodeName m_execNodeName;
  TimePoint m_submittedAt;
  TimePoint m_runningAt;
};

const char*
JobStateToStr(JobInfo::State state);

std::ostream&
operator<<(std::ostream& o, JobInfo::State state);
std::ostream&
operator<<(std::ostream& o, const JobInfo& job);
}

#endif
