#pragma once

#include <adr/models.h>

namespace adr {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitUsageError = 1;
inline constexpr int kExitGitError = 2;
inline constexpr int kExitCancelled = 3;

// The first fatal error decides; warnings never change the exit code.
int MiningExitCode(const DecisionMiningResult &result);

} // namespace adr
