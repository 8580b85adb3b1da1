#include <guest/models.h>

namespace guest {

std::string CategoryName(Category category) {
  switch (category) {
  case Category::kFile:
    return "file";
  case Category::kUrl:
    return "url";
  }
  return "unknown";
}

std::string RunStateName(RunState state) {
  switch (state) {
  case RunState::kSelecting:
    return "selecting";
  case RunState::kStartingAuxiliaries:
    return "starting_auxiliaries";
  case RunState::kDriverStarting:
    return "driver_starting";
  case RunState::kPolling:
    return "polling";
  case RunState::kStopping:
    return "stopping";
  case RunState::kReporting:
    return "reporting";
  case RunState::kDone:
    return "done";
  case RunState::kAborted:
    return "aborted";
  }
  return "unknown";
}

} // namespace guest
