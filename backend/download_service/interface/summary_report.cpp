#include "summary_report.hpp"
#include <map>

namespace download_service {

void printSummary(std::ostream& out, const std::vector<TaskSummary>& summaries) {
  size_t completed = 0;
  size_t skipped = 0;
  size_t failed = 0;
  size_t broken_tasks = 0;

  out << "\n==== Summary ====" << std::endl;
  for (const auto& summary : summaries) {
    out << summary.input << std::endl;
    if (summary.extraction_error) {
      ++broken_tasks;
      out << "  [X] " << describe(*summary.extraction_error) << std::endl;
      continue;
    }
    out << "  completed " << summary.completed()
        << ", skipped " << summary.skipped()
        << ", failed " << summary.failed()
        << " (" << summary.selected_items << " of " << summary.total_items << " selected)" << std::endl;
    completed += summary.completed();
    skipped += summary.skipped();
    failed += summary.failed();

    std::map<std::string, std::vector<const TransferOutcome*>> by_kind;
    for (const auto& outcome : summary.outcomes) {
      if (outcome.status != TransferStatus::Failed) continue;
      auto kind = outcome.error ? errorKindLabel(outcome.error->kind) : "Unknown";
      by_kind[kind].push_back(&outcome);
    }
    for (const auto& [kind, outcomes] : by_kind) {
      out << "  " << kind << ":" << std::endl;
      for (const auto* outcome : outcomes) {
        out << "    " << outcome->name;
        if (outcome->error) out << " - " << outcome->error->message;
        out << std::endl;
      }
    }
  }
  out << "Total: " << completed << " completed, " << skipped << " skipped, " << failed << " failed";
  if (broken_tasks > 0) out << ", " << broken_tasks << " task(s) not resolved";
  out << std::endl;
}

int exitCodeFor(const std::vector<TaskSummary>& summaries, bool interrupted) {
  if (interrupted) return kExitInterrupted;
  for (const auto& summary : summaries) {
    if (!summary.ok()) return kExitFailure;
  }
  return kExitSuccess;
}

std::string describeException(std::exception_ptr error) {
  if (!error) return "no error";
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

} // namespace download_service
