#include "../include/cloudburst/job_info.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <ostream>
#include <stdexcept>

namespace cloudburst {
JobInfo::JobInfo(JobID jobid,
                 State state,
                 NodeName execNodeName,
                 TimePoint submittedAt,
                 TimePoint runningAt)
  : m_jobid(std::move(jobid))
  , m_state(state)
  , m_execNodeName(std::move(execNodeName))
  , m_submittedAt(submittedAt)
  , m_runningAt(runningAt)
{
  if(m_jobid.empty()) {
    throw std::invalid_argument("Job record is missing required job id!");
  }
  if(m_state < Other || m_state > Finished) {
    throw std::invalid_argument("Invalid state " +
                                std::to_string(static_cast<int>(m_state)) +
                                " for job " + m_jobid + "!");
  }
  if(m_state == Running && m_execNodeName.empty()) {
    throw std::invalid_argument(
      "Job " + m_jobid + " is marked RUNNING but has no execution node!");
  }
  if(m_state == Pending && m_submittedAt == TimePoint()) {
    throw std::invalid_argument(
      "Job " + m_jobid + " is marked PENDING but has no submission time!");
  }
}
JobInfo::~JobInfo() {}

JobInfo::State
JobInfo::StateFromString(std::string_view str)
{
  std::string s = boost::algorithm::to_upper_copy(std::string(str));
  if(s == "PENDING")
    return Pending;
  if(s == "RUNNING")
    return Running;
  if(s == "FINISHED")
    return Finished;
  if(s == "OTHER")
    return Other;
  throw std::invalid_argument("Unknown job state \"" + std::string(str) +
                              "\"!");
}

const char*
JobStateToStr(JobInfo::State state)
{
  switch(state) {
    case JobInfo::Pending:
      return "PENDING";
    case JobInfo::Running:
      return "RUNNING";
    case JobInfo::Finished:
      return "FINISHED";
    case JobInfo::Other:
      return "OTHER";
  }
  return "INVALID";
}

std::ostream&
operator<<(std::ostream& o, JobInfo::State state)
{
  return o << JobStateToStr(state);
}

std::ostream&
operator<<(std::ostream& o, const JobInfo& job)
{
  return o << "Job " << job.getJobID();
}
}
