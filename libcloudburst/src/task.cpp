#include "../include/cloudburst/task.hpp"
#include "../include/cloudburst/taskresult.hpp"

namespace cloudburst {
Task::Task() {}
Task::~Task() {}

TaskResult::TaskResult(Status status, std::string message)
  : m_status(status)
  , m_message(std::move(message))
{}
TaskResult::~TaskResult() {}

void
TaskResult::setTask(std::unique_ptr<Task> task)
{
  m_task = std::move(task);
}
}
