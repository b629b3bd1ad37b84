#ifndef CLOUDBURST_VM_INFO_HPP
#define CLOUDBURST_VM_INFO_HPP

#include <iosfwd>
#include <string>

#include "types.hpp"

namespace cloudburst {

/** @brief Lifecycle record of one VM started by the orchestrator.
 *
 * Records are owned by the \ref Orchestrator. Backends and tasks only ever
 * receive copies, which are merged back on the main loop thread.
 *
 * Fields available once the VM is Up: publicIp, privateIp, cloud, instanceId.
 * Fields available once the VM is Ready: readyAt, nodename, jobs.
 */
class VmInfo
{
  public:
  enum State
  {
    Starting,
    Up,
    Ready,
    Stopping,
    Down,
    Other,
  };

  /** @brief Create a record. Throws std::invalid_argument if vmid is empty or
   * the state is out of range. */
  explicit VmInfo(VmID vmid, State state = Down);
  ~VmInfo();

  VmID vmid;
  State state;

  /// Readiness token. Cleared once the handshake succeeded.
  AuthToken auth;

  TimePoint startedAt;
  TimePoint readyAt;
  TimePoint stoppedAt;

  Duration totalIdle{ 0 };
  Duration lastIdle{ 0 };

  /// Jobs currently running on this VM. Only modified while the VM is Ready.
  JobIDSet jobs;
  NodeName nodename;

  std::string publicIp;
  std::string privateIp;
  std::string cloud;
  std::string instanceId;

  /** @brief True if the VM is up or will soon be (Starting or Up). */
  bool isAlive() const { return state == Starting || state == Up; }
  bool isReady() const { return state == Ready; }

  /** @brief Copy the fields assigned by the cloud backend from another
   * record of the same VM. */
  void mergeCloudFields(const VmInfo& o);
};

const char*
VmStateToStr(VmInfo::State state);

std::ostream&
operator<<(std::ostream& o, VmInfo::State state);
std::ostream&
operator<<(std::ostream& o, const VmInfo& vm);
}

#endif
