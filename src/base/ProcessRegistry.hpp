#ifndef __TD_PROCESS_REGISTRY__
#define __TD_PROCESS_REGISTRY__

#include "Headers.hpp"
#include "SubprocessUtils.hpp"

namespace td {
/**
 * @brief Owns the cleanup of every child process spawned by this program.
 *
 * One registry is created by main() and handed to whatever spawns children.
 * Children still registered when it is destroyed are terminated.
 */
class ProcessRegistry {
 public:
  explicit ProcessRegistry(shared_ptr<SubprocessUtils> _subprocessUtils);
  ~ProcessRegistry();

  void registerChild(pid_t pid, const string& name);
  void unregisterChild(pid_t pid);
  /** @brief Terminates and forgets every registered child. */
  void terminateAll();

  size_t size();

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
  map<pid_t, string> children;
  recursive_mutex registryMutex;
};
}  // namespace td

#endif  // __TD_PROCESS_REGISTRY__
