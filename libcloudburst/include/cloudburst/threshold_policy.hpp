#ifndef CLOUDBURST_THRESHOLD_POLICY_HPP
#define CLOUDBURST_THRESHOLD_POLICY_HPP

#include <string>

#include <boost/regex.hpp>

#include "log.hpp"
#include "policy.hpp"

namespace cloudburst {

/** @brief Policy driven by a job id pattern and an idle time threshold.
 *
 * Pending jobs whose id matches candidate-pattern are cloud candidates. A
 * ready VM may be stopped once it has been idle for longer than
 * idle-threshold seconds in a row.
 */
class ThresholdPolicy : public Policy
{
  public:
  /** @brief Throws boost::regex_error if candidate-pattern is invalid. */
  ThresholdPolicy(ConfigPtr config, LogPtr log);
  virtual ~ThresholdPolicy();

  virtual bool isCloudCandidate(const JobInfo& job);
  virtual bool canVmBeStopped(const VmInfo& vm,
                              const Orchestrator& orchestrator);

  Duration getIdleThreshold() const { return m_idleThreshold; }

  private:
  Logger m_logger;
  boost::regex m_candidatePattern;
  Duration m_idleThreshold;
};
}

#endif
