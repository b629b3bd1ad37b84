#include "../include/cloudburst/clock.hpp"

namespace cloudburst {
Clock::~Clock() {}

SystemClock::~SystemClock() {}

TimePoint
SystemClock::now() const
{
  return std::chrono::system_clock::now();
}

ManualClock::ManualClock(TimePoint start)
  : m_now(start)
{}
ManualClock::~ManualClock() {}

TimePoint
ManualClock::now() const
{
  std::lock_guard lock(m_mutex);
  return m_now;
}

void
ManualClock::set(TimePoint t)
{
  std::lock_guard lock(m_mutex);
  m_now = t;
}

void
ManualClock::advance(Duration d)
{
  std::lock_guard lock(m_mutex);
  m_now += std::chrono::duration_cast<TimePoint::duration>(d);
}

double
ToUnixSeconds(TimePoint t)
{
  return std::chrono::duration_cast<Duration>(t.time_since_epoch()).count();
}

TimePoint
FromUnixSeconds(double seconds)
{
  return TimePoint(
    std::chrono::duration_cast<TimePoint::duration>(Duration(seconds)));
}
}
