#ifndef CLOUDBURST_DUMMY_CLOUD_HPP
#define CLOUDBURST_DUMMY_CLOUD_HPP

#include <map>
#include <mutex>

#include "cloud.hpp"
#include "log.hpp"

namespace cloudburst {

/** @brief In-process cloud that only pretends to run VMs.
 *
 * Instances get an instance id and addresses when started and are reported
 * Up on the next status refresh. Failures and latency can be injected, which
 * makes it usable for dry runs of the daemon and for tests.
 */
class DummyCloud : public Cloud
{
  public:
  explicit DummyCloud(LogPtr log);
  virtual ~DummyCloud();

  virtual void startVM(VmInfo& vm);
  virtual void stopVM(VmInfo& vm);
  virtual void updateVMStatus(std::vector<VmInfo>& vms);

  /** @brief Make the next count calls to startVM throw. */
  void failNextStarts(uint32_t count);
  /** @brief Make the next count calls to stopVM throw. */
  void failNextStops(uint32_t count);
  /** @brief Delay every start and stop call by the given duration. */
  void setLatency(Duration latency);
  /** @brief Forget an instance, as if it crashed. It is reported Down. */
  void crash(const VmID& vmid);

  std::size_t getInstanceCount() const;
  uint32_t getStartCalls() const;
  uint32_t getStopCalls() const;

  private:
  struct Instance
  {
    std::string instanceId;
    VmInfo::State state;
  };

  Logger m_logger;
  mutable std::mutex m_mutex;
  std::map<VmID, Instance> m_instances;
  uint32_t m_nextInstance = 0;
  uint32_t m_failStarts = 0;
  uint32_t m_failStops = 0;
  uint32_t m_startCalls = 0;
  uint32_t m_stopCalls = 0;
  Duration m_latency{ 0 };

  void sleepLatency() const;
};
}

#endif
