#pragma once
#include <exception>
#include <ostream>
#include <string>
#include <vector>
#include "application/orchestrator.hpp"

namespace download_service {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

// Per task counts and failures grouped by error kind, then the totals.
void printSummary(std::ostream& out, const std::vector<TaskSummary>& summaries);

// Message for a failure escaping the run, including non-standard exceptions.
std::string describeException(std::exception_ptr error);

int exitCodeFor(const std::vector<TaskSummary>& summaries, bool interrupted);

} // namespace download_service
