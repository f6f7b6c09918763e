#pragma once
#include <iostream>
#include <mutex>
#include <string>
#include "domain/notifier.hpp"

namespace download_service {

// [i] info, [!] warning, [X] error; colored when the stream is a terminal.
class ConsoleNotifier : public Notifier {
public:
  explicit ConsoleNotifier(std::ostream& out = std::cerr, bool color = false) : out_(out), color_(color) {}

  void info(const std::string& message) override { print("[i]", "\033[36m", message); }
  void warn(const std::string& message) override { print("[!]", "\033[33m", message); }
  void error(const std::string& message) override { print("[X]", "\033[31m", message); }

  static bool isTerminal(int fd);

private:
  void print(const char* tag, const char* color, const std::string& message);

  std::ostream& out_;
  bool color_;
  std::mutex mutex_;
};

} // namespace download_service
