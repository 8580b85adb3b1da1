#pragma once

#include <guest/models.h>

namespace guest {

constexpr int kExitUsageError = 2;
constexpr int kExitReportFailed = 3;

int OutcomeExitCode(const OutcomeRecord &outcome);

} // namespace guest
