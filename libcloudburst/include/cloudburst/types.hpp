#ifndef CLOUDBURST_TYPES
#define CLOUDBURST_TYPES

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace cloudburst {
using JobID = std::string;
using VmID = std::string;
using NodeName = std::string;
using AuthToken = std::string;

using TimePoint = std::chrono::system_clock::time_point;
using SteadyTimePoint = std::chrono::steady_clock::time_point;
/// Durations are kept as fractional seconds, which is what gets reported.
using Duration = std::chrono::duration<double>;

using JobIDSet = std::set<JobID>;

class JobInfo;
class VmInfo;
using VmInfoPtr = std::shared_ptr<VmInfo>;

/** @brief Callback for the readiness handshake, receives (token, nodename). */
using ReadinessHandler =
  std::function<bool(const AuthToken& auth, const NodeName& nodename)>;
}

#endif
