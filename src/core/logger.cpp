#include "scru128/core/logger.h"

#include <iostream>

namespace scru128::core {

void StderrLogger::warn(std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[scru128] warning: " << message << "\n";
}

void RecordingLogger::warn(std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  messages_.emplace_back(message);
}

std::vector<std::string> RecordingLogger::messages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_;
}

}  // namespace scru128::core
