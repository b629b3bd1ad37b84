#include "../include/cloudburst/batch_system.hpp"
#include "../include/cloudburst/cloud.hpp"

namespace cloudburst {
BatchSystem::~BatchSystem() {}
Cloud::~Cloud() {}
}
