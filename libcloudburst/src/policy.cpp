#include "../include/cloudburst/policy.hpp"
#include "../include/cloudburst/orchestrator.hpp"

namespace cloudburst {
Policy::~Policy() {}

bool
Policy::isNewVmNeeded(const Orchestrator& orchestrator)
{
  return !orchestrator.getCandidates().empty();
}
}
