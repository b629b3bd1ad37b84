#include "../include/cloudburst/dummy_cloud.hpp"

#include <stdexcept>
#include <thread>

namespace cloudburst {
DummyCloud::DummyCloud(LogPtr log)
  : m_logger(log->createLogger("DummyCloud"))
{}
DummyCloud::~DummyCloud() {}

void
DummyCloud::sleepLatency() const
{
  Duration latency;
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    latency = m_latency;
  }
  if(latency.count() > 0) {
    std::this_thread::sleep_for(latency);
  }
}

void
DummyCloud::startVM(VmInfo& vm)
{
  sleepLatency();

  std::unique_lock<std::mutex> lock(m_mutex);
  ++m_startCalls;
  if(m_failStarts > 0) {
    --m_failStarts;
    throw std::runtime_error("Injected failure while starting VM " + vm.vmid);
  }
  if(m_instances.count(vm.vmid)) {
    throw std::runtime_error("VM " + vm.vmid + " is already running!");
  }

  uint32_t n = ++m_nextInstance;
  Instance instance{ "dummy-" + std::to_string(n), VmInfo::Starting };

  vm.instanceId = instance.instanceId;
  vm.cloud = "dummy";
  vm.privateIp = "10.0." + std::to_string((n >> 8) & 0xFF) + "." +
                 std::to_string(n & 0xFF);
  vm.publicIp = "192.0.2." + std::to_string(n & 0xFF);

  m_instances.emplace(vm.vmid, instance);

  CLOUDBURST_LOG(m_logger, Info)
    << "Started instance " << instance.instanceId << " for VM " << vm.vmid
    << " at " << vm.privateIp << ", readiness token " << vm.auth;
}

void
DummyCloud::stopVM(VmInfo& vm)
{
  sleepLatency();

  std::unique_lock<std::mutex> lock(m_mutex);
  ++m_stopCalls;
  if(m_failStops > 0) {
    --m_failStops;
    throw std::runtime_error("Injected failure while stopping VM " + vm.vmid);
  }

  auto it = m_instances.find(vm.vmid);
  if(it == m_instances.end()) {
    CLOUDBURST_LOG(m_logger, Debug)
      << "VM " << vm.vmid << " is not running, nothing to stop.";
    return;
  }
  CLOUDBURST_LOG(m_logger, Info)
    << "Stopped instance " << it->second.instanceId << " of VM " << vm.vmid;
  m_instances.erase(it);
}

void
DummyCloud::updateVMStatus(std::vector<VmInfo>& vms)
{
  std::unique_lock<std::mutex> lock(m_mutex);
  for(VmInfo& vm : vms) {
    auto it = m_instances.find(vm.vmid);
    if(it == m_instances.end()) {
      vm.state = VmInfo::Down;
      continue;
    }
    Instance& instance = it->second;
    if(instance.state == VmInfo::Starting) {
      instance.state = VmInfo::Up;
    }
    if(vm.state == VmInfo::Starting) {
      vm.state = instance.state;
    }
    vm.instanceId = instance.instanceId;
  }
}

void
DummyCloud::failNextStarts(uint32_t count)
{
  std::unique_lock<std::mutex> lock(m_mutex);
  m_failStarts = count;
}

void
DummyCloud::failNextStops(uint32_t count)
{
  std::unique_lock<std::mutex> lock(m_mutex);
  m_failStops = count;
}

void
DummyCloud::setLatency(Duration latency)
{
  std::unique_lock<std::mutex> lock(m_mutex);
  m_latency = latency;
}

void
DummyCloud::crash(const VmID& vmid)
{
  std::unique_lock<std::mutex> lock(m_mutex);
  m_instances.erase(vmid);
}

std::size_t
DummyCloud::getInstanceCount() const
{
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_instances.size();
}

uint32_t
DummyCloud::getStartCalls() const
{
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_startCalls;
}

uint32_t
DummyCloud::getStopCalls() const
{
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_stopCalls;
}
}
