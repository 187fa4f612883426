#include <adr/cli_exit_codes.h>

namespace adr {

int MiningExitCode(const DecisionMiningResult &result) {
  if (result.errors.empty()) {
    return kExitSuccess;
  }
  switch (result.errors.front().kind) {
  case MiningErrorKind::kGitError:
    return kExitGitError;
  case MiningErrorKind::kCancelled:
    return kExitCancelled;
  }
  return kExitUsageError;
}

} // namespace adr
