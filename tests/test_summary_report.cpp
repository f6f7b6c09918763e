#include <catch2/catch.hpp>
#include <sstream>
#include <stdexcept>
#include "interface/summary_report.hpp"

using namespace download_service;

namespace {

TransferOutcome outcome(const std::string& name, TransferStatus status, std::optional<ErrorKind> kind = std::nullopt) {
  TransferOutcome out;
  out.name = name;
  out.status = status;
  if (kind) out.error = makeError(*kind, "because");
  return out;
}

}

TEST_CASE("groups failures by kind", "[summary_report]") {
  TaskSummary task;
  task.input = "https://a.example/x";
  task.total_items = 4;
  task.selected_items = 4;
  task.outcomes = {
    outcome("a.pdf", TransferStatus::Completed),
    outcome("b.pdf", TransferStatus::Skipped),
    outcome("c.pdf", TransferStatus::Failed, ErrorKind::ChecksumMismatch),
    outcome("d.ts", TransferStatus::Failed, ErrorKind::SegmentFetchError),
  };
  TaskSummary broken;
  broken.input = "https://a.example/y";
  broken.extraction_error = makeError(ErrorKind::NotFound, "gone");

  std::ostringstream out;
  printSummary(out, {task, broken});
  auto text = out.str();
  CHECK(text.find("completed 1, skipped 1, failed 2") != std::string::npos);
  CHECK(text.find("ChecksumMismatch:") != std::string::npos);
  CHECK(text.find("c.pdf - because") != std::string::npos);
  CHECK(text.find("SegmentFetchError:") != std::string::npos);
  CHECK(text.find("NotFound: gone") != std::string::npos);
  CHECK(text.find("Total: 1 completed, 1 skipped, 2 failed, 1 task(s) not resolved") != std::string::npos);
}

TEST_CASE("exit codes", "[summary_report]") {
  TaskSummary clean;
  clean.outcomes = {outcome("a", TransferStatus::Completed), outcome("b", TransferStatus::Skipped)};
  TaskSummary failing;
  failing.outcomes = {outcome("c", TransferStatus::Failed, ErrorKind::NetworkError)};

  CHECK(exitCodeFor({clean}, false) == kExitSuccess);
  CHECK(exitCodeFor({}, false) == kExitSuccess);
  CHECK(exitCodeFor({clean, failing}, false) == kExitFailure);
  CHECK(exitCodeFor({clean}, true) == kExitInterrupted);
}

TEST_CASE("escaped failures are described whatever was thrown", "[summary_report]") {
  CHECK(describeException(std::make_exception_ptr(std::runtime_error("disk full"))) == "disk full");
  CHECK(describeException(std::make_exception_ptr(42)) == "unknown exception");
  CHECK(describeException(std::make_exception_ptr(std::string("text"))) == "unknown exception");
  CHECK(describeException(nullptr) == "no error");
}
