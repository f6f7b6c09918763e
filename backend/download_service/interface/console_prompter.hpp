#pragma once
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <termios.h>
#include <unistd.h>
#include "application/orchestrator.hpp"
#include "domain/credential_store.hpp"

namespace download_service {

// Turns echo off on a terminal for its lifetime. The saved settings are also
// kept process wide so restoreTerminalEcho() can put them back while the
// owner is still blocked reading input.
class EchoGuard {
public:
  explicit EchoGuard(int fd = STDIN_FILENO);
  ~EchoGuard();

  EchoGuard(const EchoGuard&) = delete;
  EchoGuard& operator=(const EchoGuard&) = delete;

  bool active() const { return active_; }

private:
  int fd_;
  termios saved_{};
  bool active_{false};
};

// Restores the settings of a live EchoGuard. Returns false when echo was not off.
bool restoreTerminalEcho();

// Terminal prompts. Every method blocks on the input stream.
class ConsolePrompter : public TokenPrompter, public SelectionPrompter {
public:
  ConsolePrompter(std::istream& in = std::cin, std::ostream& out = std::cerr, bool hide_input = true)
    : in_(in), out_(out), hide_input_(hide_input) {}

  std::optional<std::string> promptToken(bool previous_rejected) override;
  bool confirmSaveToken() override;
  std::string chooseItems(const std::string& input, const std::vector<DownloadItem>& items) override;
  std::optional<int> chooseQuality(
    const std::string& input,
    const std::vector<int>& ranks,
    const QualityPolicy& current
  ) override;

  // Next non-empty line, or nullopt at end of input or on "q".
  std::optional<std::string> readInput(const std::string& prompt);

  // Called with true before a prompt is shown and false once it is answered.
  void setPromptHook(std::function<void(bool)> hook) { hook_ = std::move(hook); }

private:
  class Scope;

  std::optional<std::string> readLine();

  std::istream& in_;
  std::ostream& out_;
  bool hide_input_;
  std::function<void(bool)> hook_;
};

} // namespace download_service
