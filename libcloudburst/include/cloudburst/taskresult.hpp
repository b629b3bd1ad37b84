#ifndef CLOUDBURST_TASKRESULT_HPP
#define CLOUDBURST_TASKRESULT_HPP

#include <memory>
#include <string>

#include "types.hpp"

namespace cloudburst {
class Task;

/** @brief This class holds the result of a task.
 *
 * The original task is also contained, so the data it worked on can be read
 * back by whoever consumes the result.
 */
class TaskResult
{
  public:
  /** @brief The status code a task can result in.
   */
  enum Status
  {
    Success,
    Failure,
  };

  /** @brief Create a task result with an assigned status and an optional
   * description of what went wrong. */
  explicit TaskResult(Status status, std::string message = "");
  /** @brief Destructor */
  ~TaskResult();

  /** @brief Get the status of this task. */
  Status getStatus() const { return m_status; }
  bool isSuccess() const { return m_status == Success; }
  const std::string& getMessage() const { return m_message; }

  /** @brief Return the task that produced this result.
   *
   * The task is deleted with this task result, because the result owns the task
   * after it has finished. */
  Task& getTask() const { return *m_task; }
  bool hasTask() const { return static_cast<bool>(m_task); }

  private:
  friend class Runner;

  Status m_status;
  std::string m_message;
  std::unique_ptr<Task> m_task;

  void setTask(std::unique_ptr<Task> task);
};

using TaskResultPtr = std::unique_ptr<TaskResult>;
}

#endif
