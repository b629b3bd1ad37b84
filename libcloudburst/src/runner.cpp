#include "../include/cloudburst/runner.hpp"
#include "../include/cloudburst/config.hpp"
#include "../include/cloudburst/task.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

namespace cloudburst {
Runner::Runner(ConfigPtr config, LogPtr log)
  : m_config(config)
  , m_log(log)
  , m_logger(log->createLogger("Runner"))
  , m_taskQueue(
      std::make_unique<PriorityQueueLockSemanticsUniquePtr<QueueEntry>>())
  , m_numberOfRunningTasks(0)
{}
Runner::~Runner()
{
  stop();
}

void
Runner::start()
{
  uint32_t i = 0, threadCount = m_config->getUint32(Config::ThreadCount);

  try {
    m_running = true;
    for(i = 0; i < threadCount; ++i) {
      m_pool.push_back(std::thread(std::bind(&Runner::worker, this, i)));
    }
  } catch(std::system_error& e) {
    CLOUDBURST_LOG(m_logger, Error)
      << "Could only initialize " << i << " of " << threadCount
      << " requested threads! Error: " << e.what();
  }
  CLOUDBURST_LOG(m_logger, Debug)
    << "Started runner with " << m_pool.size() << " workers.";
}

void
Runner::stop()
{
  {
    std::unique_lock<std::mutex> lock(m_taskQueue->getMutex());
    m_running = false;
  }
  m_newTasks.notify_all();
  std::for_each(m_pool.begin(), m_pool.end(), [](auto& t) { t.join(); });
  m_pool.clear();
}

std::future<TaskResultPtr>
Runner::push(std::unique_ptr<Task> task, int priority)
{
  task->m_runner = this;
  task->m_log = m_log.get();
  task->m_config = m_config.get();

  std::unique_ptr<QueueEntry> entry =
    std::make_unique<QueueEntry>(std::move(task), priority);
  std::promise<TaskResultPtr>& promise = entry->result;
  auto future = promise.get_future();
  {
    std::unique_lock<std::mutex> lock(m_taskQueue->getMutex());
    m_taskQueue->pushNoLock(std::move(entry));
  }
  m_newTasks.notify_one();
  return future;
}

void
Runner::worker(uint32_t workerId)
{
  m_log->initLocalThread("Worker " + std::to_string(workerId));
  Logger logger = m_log->createLogger("Runner", std::to_string(workerId));
  CLOUDBURST_LOG(logger, Trace) << "Worker " << workerId << " started.";
  while(m_running) {
    std::unique_ptr<QueueEntry> entry = nullptr;
    {
      std::unique_lock<std::mutex> lock(m_taskQueue->getMutex());
      m_newTasks.wait(lock,
                      [this]() { return !m_running || !m_taskQueue->empty(); });

      if(!m_running)
        break;

      entry = m_taskQueue->popNoLock();
    }

    if(!entry->task) {
      CLOUDBURST_LOG(logger, Error)
        << "Worker " << workerId
        << " received a task queue item without a valid task!";
      continue;
    }

    CLOUDBURST_LOG(logger, Trace)
      << "Worker " << workerId
      << " has received a new task: " << entry->task->name()
      << " with priority " << entry->priority;

    // Insert the logger from this worker thread.
    entry->task->m_logger = &logger;
    entry->task->m_workerId = workerId;

    ++m_numberOfRunningTasks;
    try {
      auto result = entry->task->execute();
      if(!result) {
        result = std::make_unique<TaskResult>(TaskResult::Failure,
                                              "Task produced no result");
      }
      result->setTask(std::move(entry->task));
      entry->result.set_value(std::move(result));
    } catch(const std::exception& e) {
      CLOUDBURST_LOG(logger, Error)
        << "Task " << entry->task->name()
        << " raised an exception! Message: " << e.what();
      entry->result.set_exception(std::current_exception());
    }
    --m_numberOfRunningTasks;
  }
  CLOUDBURST_LOG(logger, Trace) << "Worker " << workerId << " ended.";
}

Runner::QueueEntry::QueueEntry(std::unique_ptr<Task> task, int priority)
  : task(std::move(task))
  , priority(priority)
{}
Runner::QueueEntry::~QueueEntry() {}
}
