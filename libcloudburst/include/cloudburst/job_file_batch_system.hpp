#ifndef CLOUDBURST_JOB_FILE_BATCH_SYSTEM_HPP
#define CLOUDBURST_JOB_FILE_BATCH_SYSTEM_HPP

#include <iosfwd>
#include <string>
#include <vector>

#include "batch_system.hpp"
#include "log.hpp"

namespace cloudburst {

/** @brief Batch system reading the queue from a plain text file.
 *
 * The file is re-read on every call. Each non-empty line describes one job:
 *
 *     jobid state submitted running node
 *
 * state is one of PENDING, RUNNING, FINISHED or OTHER. Times are UNIX
 * seconds. Missing trailing fields and `-` mean "not set", except that a
 * PENDING job needs its submission time. Everything after a `#` is a comment.
 */
class JobFileBatchSystem : public BatchSystem
{
  public:
  JobFileBatchSystem(std::string path, LogPtr log);
  virtual ~JobFileBatchSystem();

  /** @brief Throws std::runtime_error if the file cannot be read or contains
   * a malformed line. */
  virtual std::vector<JobInfo> getSchedInfo();

  const std::string& getPath() const { return m_path; }

  /** @brief Parse a whole snapshot. Errors name the source and line. */
  static std::vector<JobInfo> ParseSnapshot(std::istream& in,
                                            const std::string& source);

  private:
  std::string m_path;
  Logger m_logger;
};
}

#endif
