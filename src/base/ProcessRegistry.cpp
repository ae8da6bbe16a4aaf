#include "ProcessRegistry.hpp"

namespace td {
ProcessRegistry::ProcessRegistry(shared_ptr<SubprocessUtils> _subprocessUtils)
    : subprocessUtils(_subprocessUtils) {}

ProcessRegistry::~ProcessRegistry() { terminateAll(); }

void ProcessRegistry::registerChild(pid_t pid, const string& name) {
  lock_guard<recursive_mutex> guard(registryMutex);
  if (children.find(pid) != children.end()) {
    STFATAL << "Tried to register a child twice: " << pid;
  }
  VLOG(1) << "Registered child " << name << " (" << pid << ")";
  children[pid] = name;
}

void ProcessRegistry::unregisterChild(pid_t pid) {
  lock_guard<recursive_mutex> guard(registryMutex);
  children.erase(pid);
}

void ProcessRegistry::terminateAll() {
  map<pid_t, string> remaining;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    remaining.swap(children);
  }
  for (const auto& it : remaining) {
    LOG(INFO) << "Terminating leftover child " << it.second << " ("
              << it.first << ")";
    subprocessUtils->terminate(it.first, CHILD_TERMINATE_GRACE_MS);
  }
}

size_t ProcessRegistry::size() {
  lock_guard<recursive_mutex> guard(registryMutex);
  return children.size();
}
}  // namespace td
