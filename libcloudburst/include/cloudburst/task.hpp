#ifndef CLOUDBURST_TASK_HPP
#define CLOUDBURST_TASK_HPP

#include <string>

#include "log.hpp"
#include "taskresult.hpp"

namespace cloudburst {
class Runner;
class Config;

/** @brief Unit of blocking work executed by a \ref Runner worker.
 *
 * This must be sub-classed by actual tasks to be run.
 */
class Task
{
  public:
  /** @brief Constructor */
  Task();
  /** @brief Destructor */
  virtual ~Task();

  /** @brief Execute this task.
   *
   * Must be implemented by actual tasks. Failures should be reported through
   * the returned result, exceptions are only forwarded as a last resort.
   * */
  virtual TaskResultPtr execute() = 0;

  virtual const std::string& name() const { return m_name; };

  protected:
  friend class Runner;

  std::string m_name;

  /// Id of the worker that is running this task. Guaranteed to be available in
  /// execute().
  uint32_t m_workerId = 0;
  /// Pointer to the runner that runs this task. Guaranteed to be available in
  /// execute().
  Runner* m_runner = nullptr;
  /// Pointer to a valid Log instance. Guaranteed to be available in
  /// execute().
  Log* m_log = nullptr;
  /// Pointer to a valid Config instance. Guaranteed to be available in
  /// execute().
  Config* m_config = nullptr;
  /// Pointer to the logger of the worker thread running this task. Guaranteed
  /// to be available in execute().
  Logger* m_logger = nullptr;
};
}

#endif
