#include <guest/cli_exit_codes.h>

namespace guest {

int OutcomeExitCode(const OutcomeRecord &outcome) {
  return outcome.success ? 0 : 1;
}

} // namespace guest
