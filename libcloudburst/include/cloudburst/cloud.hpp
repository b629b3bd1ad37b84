#ifndef CLOUDBURST_CLOUD_HPP
#define CLOUDBURST_CLOUD_HPP

#include <memory>
#include <vector>

#include "vm_info.hpp"

namespace cloudburst {

/** @brief Interface to a cloud provider.
 *
 * All calls are synchronous and may block for a long time. \ref startVM and
 * \ref stopVM are only called from worker threads, possibly concurrently for
 * different VMs, so implementations must be thread-safe. Errors are reported
 * by throwing an exception derived from std::exception.
 */
class Cloud
{
  public:
  virtual ~Cloud();

  /** @brief Request a new VM.
   *
   * The readiness token in vm.auth must be handed to the new machine. On
   * success, cloud assigned fields (addresses, instance id) are filled in.
   */
  virtual void startVM(VmInfo& vm) = 0;

  /** @brief Terminate a VM previously started with \ref startVM. */
  virtual void stopVM(VmInfo& vm) = 0;

  /** @brief Refresh state and cloud fields of all given VMs.
   *
   * Must keep every record in the vector; VMs the provider does not know
   * anymore are reported as Down.
   */
  virtual void updateVMStatus(std::vector<VmInfo>& vms) = 0;
};

using CloudPtr = std::shared_ptr<Cloud>;
}

#endif
