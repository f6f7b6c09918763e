#pragma once
#include <string>

namespace download_service {

// User-facing notices, kept apart from the diagnostic log.
class Notifier {
public:
  virtual ~Notifier() = default;
  // e.g. "no items matched filter", quality fallback
  virtual void info(const std::string& message) = 0;
  // an item failed to download
  virtual void warn(const std::string& message) = 0;
  // a resource could not be parsed or resolved
  virtual void error(const std::string& message) = 0;
};

} // namespace download_service
