#include "../include/cloudburst/vm_info.hpp"
#include <ostream>
#include <stdexcept>

namespace cloudburst {
VmInfo::VmInfo(VmID vmid, State state)
  : vmid(std::move(vmid))
  , state(state)
{
  if(this->vmid.empty()) {
    throw std::invalid_argument("VM record is missing required vmid!");
  }
  if(state < Starting || state > Other) {
    throw std::invalid_argument("Invalid state " +
                                std::to_string(static_cast<int>(state)) +
                                " for VM " + this->vmid + "!");
  }
}
VmInfo::~VmInfo() {}

void
VmInfo::mergeCloudFields(const VmInfo& o)
{
  if(!o.publicIp.empty())
    publicIp = o.publicIp;
  if(!o.privateIp.empty())
    privateIp = o.privateIp;
  if(!o.cloud.empty())
    cloud = o.cloud;
  if(!o.instanceId.empty())
    instanceId = o.instanceId;
}

const char*
VmStateToStr(VmInfo::State state)
{
  switch(state) {
    case VmInfo::Starting:
      return "STARTING";
    case VmInfo::Up:
      return "UP";
    case VmInfo::Ready:
      return "READY";
    case VmInfo::Stopping:
      return "STOPPING";
    case VmInfo::Down:
      return "DOWN";
    case VmInfo::Other:
      return "OTHER";
  }
  return "INVALID";
}

std::ostream&
operator<<(std::ostream& o, VmInfo::State state)
{
  return o << VmStateToStr(state);
}

std::ostream&
operator<<(std::ostream& o, const VmInfo& vm)
{
  if(!vm.nodename.empty()) {
    return o << "VM Node '" << vm.nodename << "'";
  }
  return o << "VM " << vm.vmid;
}
}
