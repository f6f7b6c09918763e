#include "console_notifier.hpp"
#include <unistd.h>

namespace download_service {

bool ConsoleNotifier::isTerminal(int fd) {
  return ::isatty(fd) == 1;
}

void ConsoleNotifier::print(const char* tag, const char* color, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (color_) {
    // clears a progress status line drawn on the same terminal
    out_ << "\r\033[2K" << color << tag << "\033[0m " << message << std::endl;
  } else {
    out_ << tag << ' ' << message << std::endl;
  }
}

} // namespace download_service
