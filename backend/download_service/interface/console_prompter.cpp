#include "console_prompter.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <utility>
#include "common/file_naming.hpp"

namespace download_service {

namespace {

std::string trim(const std::string& text) {
  auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

struct SavedTerminal {
  std::mutex mutex;
  std::optional<std::pair<int, termios>> state;
};

SavedTerminal& savedTerminal() {
  static SavedTerminal saved;
  return saved;
}

} // namespace

EchoGuard::EchoGuard(int fd) : fd_(fd) {
  if (::isatty(fd_) != 1 || ::tcgetattr(fd_, &saved_) != 0) return;
  termios silent = saved_;
  silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
  auto& terminal = savedTerminal();
  std::lock_guard<std::mutex> lock(terminal.mutex);
  active_ = ::tcsetattr(fd_, TCSANOW, &silent) == 0;
  if (active_) terminal.state = std::make_pair(fd_, saved_);
}

EchoGuard::~EchoGuard() {
  if (!active_) return;
  auto& terminal = savedTerminal();
  std::lock_guard<std::mutex> lock(terminal.mutex);
  // already put back by restoreTerminalEcho()
  if (!terminal.state) return;
  ::tcsetattr(fd_, TCSANOW, &saved_);
  terminal.state.reset();
}

bool restoreTerminalEcho() {
  auto& terminal = savedTerminal();
  std::lock_guard<std::mutex> lock(terminal.mutex);
  if (!terminal.state) return false;
  ::tcsetattr(terminal.state->first, TCSANOW, &terminal.state->second);
  terminal.state.reset();
  return true;
}

class ConsolePrompter::Scope {
public:
  explicit Scope(const std::function<void(bool)>& hook) : hook_(hook) {
    if (hook_) hook_(true);
  }
  ~Scope() {
    if (hook_) hook_(false);
  }

  Scope(const Scope&) = delete;
  Scope& operator=(const Scope&) = delete;

private:
  const std::function<void(bool)>& hook_;
};

std::optional<std::string> ConsolePrompter::readLine() {
  std::string line;
  if (!std::getline(in_, line)) return std::nullopt;
  return trim(line);
}

std::optional<std::string> ConsolePrompter::promptToken(bool previous_rejected) {
  Scope scope(hook_);
  if (previous_rejected) {
    out_ << "The access token was rejected by the server." << std::endl;
  } else {
    out_ << "This resource requires an access token (see --token-help)." << std::endl;
  }
  out_ << "Access token (empty to skip): " << std::flush;

  std::optional<std::string> token;
  if (hide_input_) {
    EchoGuard echo_off;
    token = readLine();
  } else {
    token = readLine();
  }
  out_ << std::endl;
  if (!token || token->empty()) return std::nullopt;
  return token;
}

bool ConsolePrompter::confirmSaveToken() {
  Scope scope(hook_);
  out_ << "Save this token for future runs? [y/N]: " << std::flush;
  auto answer = readLine();
  if (!answer) return false;
  auto lower = toLower(*answer);
  return lower == "y" || lower == "yes";
}

std::string ConsolePrompter::chooseItems(const std::string& input, const std::vector<DownloadItem>& items) {
  Scope scope(hook_);
  out_ << input << ": " << items.size() << " items" << std::endl;
  for (size_t i = 0; i < items.size(); ++i) {
    const auto& item = items[i];
    out_ << "  [" << (i + 1) << "] " << mediaKindLabel(item.media_kind) << "  " << item.base_name;
    if (!item.extension.empty()) out_ << "." << item.extension;
    if (!item.variants.empty()) {
      out_ << "  (";
      for (size_t v = 0; v < item.variants.size(); ++v) {
        if (v) out_ << "/";
        out_ << item.variants[v].rank << "p";
      }
      out_ << ")";
    }
    out_ << std::endl;
  }
  out_ << "Select items (e.g. all, 1,3,5-8) [all]: " << std::flush;
  auto answer = readLine();
  if (!answer || answer->empty()) return "all";
  return *answer;
}

std::optional<int> ConsolePrompter::chooseQuality(
  const std::string& input,
  const std::vector<int>& ranks,
  const QualityPolicy& current
) {
  Scope scope(hook_);
  out_ << input << ": videos come in " << ranks.size() << " qualities" << std::endl;
  for (size_t i = 0; i < ranks.size(); ++i) {
    out_ << "  [" << (i + 1) << "] " << ranks[i] << "p" << std::endl;
  }
  for (;;) {
    out_ << "Quality (number or height) [" << current.label() << "]: " << std::flush;
    auto answer = readLine();
    if (!answer || answer->empty()) return std::nullopt;

    auto text = toLower(*answer);
    if (text.back() == 'p') text.pop_back();
    if (!text.empty() && text.size() <= 5 && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
      auto number = std::stoi(text);
      if (number >= 1 && static_cast<size_t>(number) <= ranks.size()) return ranks[static_cast<size_t>(number) - 1];
      if (std::find(ranks.begin(), ranks.end(), number) != ranks.end()) return number;
    }
    out_ << "Not one of the listed qualities: " << *answer << std::endl;
  }
}

std::optional<std::string> ConsolePrompter::readInput(const std::string& prompt) {
  Scope scope(hook_);
  for (;;) {
    out_ << prompt << std::flush;
    auto line = readLine();
    if (!line) return std::nullopt;
    if (line->empty()) continue;
    if (*line == "q" || *line == "quit" || *line == "exit") return std::nullopt;
    return line;
  }
}

} // namespace download_service
