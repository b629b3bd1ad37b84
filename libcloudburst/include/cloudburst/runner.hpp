#ifndef CLOUDBURST_RUNNER_HPP
#define CLOUDBURST_RUNNER_HPP

#include "log.hpp"
#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "priority_queue_lock_semantics.hpp"
#include "taskresult.hpp"

namespace cloudburst {
class Task;

/** @brief Environment for running a \ref Task in.
 *
 * This class implements a thread pool of running worker threads, each
 * executing \ref Task objects. Callers never block on the pool, they receive a
 * future for every pushed task.
 */
class Runner
{
  public:
  /** @brief Create a runner for tasks.
   *
   * This constructor does not start the internal thread pool yet. */
  Runner(ConfigPtr config, LogPtr log);
  /** Destructor, stops the pool if it is still running. */
  ~Runner();

  /** @brief Start the thread-pool asynchronously.
   *
   * This function returns immediately. */
  void start();
  /** @brief Ends the thread-pool synchronously.
   *
   * This function returns once the last thread has finished. Tasks still
   * queued are dropped, their futures report a broken promise. */
  void stop();

  /** @brief Reports if the runner is already running. */
  inline bool isRunning() const { return m_running; }

  inline uint64_t getWorkQueueSize() const { return m_taskQueue->size(); }
  inline uint32_t getNumberOfRunningTasks() const
  {
    return m_numberOfRunningTasks;
  }
  inline std::size_t getWorkerCount() const { return m_pool.size(); }

  /** @brief Push a new task to the internal task queue.
   *
   * @param task The task to schedule.
   * @param priority Priority of the new task. Higher is more important.
   */
  std::future<TaskResultPtr> push(std::unique_ptr<Task> task, int priority = 0);

  private:
  ConfigPtr m_config;
  LogPtr m_log;
  Logger m_logger;
  std::atomic<bool> m_running = false;

  std::vector<std::thread> m_pool;

  void worker(uint32_t workerId);

  struct QueueEntry
  {
    /** @brief Quick Constructor for a QueueEntry object.
     */
    QueueEntry(std::unique_ptr<Task> task, int priority);
    ~QueueEntry();
    std::unique_ptr<Task> task;
    std::promise<TaskResultPtr> result;
    int priority = 0;

    inline bool operator<(QueueEntry const& b) const
    {
      return priority > b.priority;
    }
  };

  std::unique_ptr<PriorityQueueLockSemanticsUniquePtr<QueueEntry>> m_taskQueue;

  std::condition_variable m_newTasks;

  std::atomic<uint32_t> m_numberOfRunningTasks;
};

using RunnerPtr = std::shared_ptr<Runner>;
}

#endif
