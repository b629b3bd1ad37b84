#include "../include/cloudburst/threshold_policy.hpp"
#include "../include/cloudburst/config.hpp"

namespace cloudburst {
ThresholdPolicy::ThresholdPolicy(ConfigPtr config, LogPtr log)
  : m_logger(log->createLogger("ThresholdPolicy"))
  , m_candidatePattern(std::string(config->getString(Config::CandidatePattern)))
  , m_idleThreshold(config->getFloat(Config::IdleThreshold))
{}
ThresholdPolicy::~ThresholdPolicy() {}

bool
ThresholdPolicy::isCloudCandidate(const JobInfo& job)
{
  return boost::regex_match(job.getJobID(), m_candidatePattern);
}

bool
ThresholdPolicy::canVmBeStopped(const VmInfo& vm,
                                const Orchestrator& orchestrator)
{
  if(vm.lastIdle > m_idleThreshold) {
    CLOUDBURST_LOG(m_logger, Debug)
      << vm << " has been idle for " << vm.lastIdle.count()
      << "s, more than the threshold of " << m_idleThreshold.count() << "s.";
    return true;
  }
  return false;
}
}
