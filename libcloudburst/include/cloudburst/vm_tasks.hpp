#ifndef CLOUDBURST_VM_TASKS_HPP
#define CLOUDBURST_VM_TASKS_HPP

#include <vector>

#include "cloud.hpp"
#include "task.hpp"
#include "vm_info.hpp"

namespace cloudburst {

/** @brief Base class of all tasks calling into the \ref Cloud backend.
 *
 * A VM task works on its own copies of the VM records. After the task has
 * finished, the updated copies are read back from the result on the
 * orchestrator main loop thread.
 */
class VMTask : public Task
{
  public:
  enum Kind
  {
    Start,
    Stop,
    RefreshStatus,
  };

  /// Refreshing status blocks the main loop, stopping VMs saves money.
  static constexpr int RefreshStatusPriority = 20;
  static constexpr int StopPriority = 10;
  static constexpr int StartPriority = 0;

  VMTask(Kind kind, CloudPtr cloud, std::vector<VmInfo> vms);
  virtual ~VMTask();

  Kind getKind() const { return m_kind; }
  std::vector<VmInfo>& getVms() { return m_vms; }
  const std::vector<VmInfo>& getVms() const { return m_vms; }
  /** @brief The single VM of start and stop tasks. */
  VmInfo& getVm() { return m_vms.front(); }
  const VmInfo& getVm() const { return m_vms.front(); }

  protected:
  Kind m_kind;
  CloudPtr m_cloud;
  std::vector<VmInfo> m_vms;
};

class StartVMTask : public VMTask
{
  public:
  StartVMTask(CloudPtr cloud, VmInfo vm);
  virtual ~StartVMTask();

  virtual TaskResultPtr execute();
};

class StopVMTask : public VMTask
{
  public:
  StopVMTask(CloudPtr cloud, VmInfo vm, uint32_t attempt = 0);
  virtual ~StopVMTask();

  virtual TaskResultPtr execute();

  /** @brief Number of earlier failed attempts to stop this VM. */
  uint32_t getAttempt() const { return m_attempt; }

  private:
  uint32_t m_attempt;
};

class RefreshStatusTask : public VMTask
{
  public:
  RefreshStatusTask(CloudPtr cloud, std::vector<VmInfo> vms);
  virtual ~RefreshStatusTask();

  virtual TaskResultPtr execute();
};
}

#endif
