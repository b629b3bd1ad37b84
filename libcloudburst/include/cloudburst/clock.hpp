#ifndef CLOUDBURST_CLOCK_HPP
#define CLOUDBURST_CLOCK_HPP

#include <memory>
#include <mutex>

#include "types.hpp"

namespace cloudburst {

/** @brief Source of the wall time used for all timestamps.
 *
 * The orchestrator only asks its clock for the current time, so simulations
 * and tests can run with a \ref ManualClock instead of the system clock.
 * Cycle pacing and idle accounting always use the real monotonic clock.
 */
class Clock
{
  public:
  virtual ~Clock();

  virtual TimePoint now() const = 0;
};

class SystemClock : public Clock
{
  public:
  virtual ~SystemClock();

  virtual TimePoint now() const;
};

/** @brief Clock that only moves when told to. Thread-safe. */
class ManualClock : public Clock
{
  public:
  explicit ManualClock(TimePoint start = TimePoint());
  virtual ~ManualClock();

  virtual TimePoint now() const;

  void set(TimePoint t);
  void advance(Duration d);

  private:
  mutable std::mutex m_mutex;
  TimePoint m_now;
};

using ClockPtr = std::shared_ptr<Clock>;

/** @brief Seconds since the UNIX epoch, as used in logs and job files. */
double
ToUnixSeconds(TimePoint t);
TimePoint
FromUnixSeconds(double seconds);
}

#endif
