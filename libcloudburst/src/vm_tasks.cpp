#include "../include/cloudburst/vm_tasks.hpp"
#include <exception>
#include <typeinfo>

#include <boost/core/demangle.hpp>

namespace cloudburst {
static std::string
DescribeException(const std::exception& e)
{
  return boost::core::demangle(typeid(e).name()) + ": " + e.what();
}

VMTask::VMTask(Kind kind, CloudPtr cloud, std::vector<VmInfo> vms)
  : m_kind(kind)
  , m_cloud(std::move(cloud))
  , m_vms(std::move(vms))
{}
VMTask::~VMTask() {}

StartVMTask::StartVMTask(CloudPtr cloud, VmInfo vm)
  : VMTask(Start, std::move(cloud), { std::move(vm) })
{
  m_name = "StartVM " + getVm().vmid;
}
StartVMTask::~StartVMTask() {}

TaskResultPtr
StartVMTask::execute()
{
  VmInfo& vm = getVm();
  CLOUDBURST_LOG(*m_logger, Info) << "Starting VM " << vm.vmid << " ...";
  try {
    m_cloud->startVM(vm);
  } catch(const std::exception& e) {
    return std::make_unique<TaskResult>(TaskResult::Failure,
                                        DescribeException(e));
  }
  return std::make_unique<TaskResult>(TaskResult::Success);
}

StopVMTask::StopVMTask(CloudPtr cloud, VmInfo vm, uint32_t attempt)
  : VMTask(Stop, std::move(cloud), { std::move(vm) })
  , m_attempt(attempt)
{
  m_name = "StopVM " + getVm().vmid;
}
StopVMTask::~StopVMTask() {}

TaskResultPtr
StopVMTask::execute()
{
  VmInfo& vm = getVm();
  CLOUDBURST_LOG(*m_logger, Info) << "Stopping VM " << vm.vmid << " ...";
  try {
    m_cloud->stopVM(vm);
  } catch(const std::exception& e) {
    return std::make_unique<TaskResult>(TaskResult::Failure,
                                        DescribeException(e));
  }
  return std::make_unique<TaskResult>(TaskResult::Success);
}

RefreshStatusTask::RefreshStatusTask(CloudPtr cloud, std::vector<VmInfo> vms)
  : VMTask(RefreshStatus, std::move(cloud), std::move(vms))
{
  m_name = "RefreshStatus";
}
RefreshStatusTask::~RefreshStatusTask() {}

TaskResultPtr
RefreshStatusTask::execute()
{
  std::size_t count = m_vms.size();
  try {
    m_cloud->updateVMStatus(m_vms);
  } catch(const std::exception& e) {
    return std::make_unique<TaskResult>(TaskResult::Failure,
                                        DescribeException(e));
  }
  if(m_vms.size() != count) {
    return std::make_unique<TaskResult>(
      TaskResult::Failure,
      "Cloud returned " + std::to_string(m_vms.size()) + " records for " +
        std::to_string(count) + " VMs");
  }
  return std::make_unique<TaskResult>(TaskResult::Success);
}
}
