#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace scru128::core {

// Abstract warning sink injected into long-lived library objects.
// The library never writes to standard streams on its own; applications decide where
// diagnostics go by choosing an implementation.
class ILogger {
 public:
  virtual ~ILogger() = default;

  // Report an anomaly that the caller recovered from (e.g. a forced generator reset).
  // Contract: thread-safe; must not call back into the object that is logging.
  virtual void warn(std::string_view message) = 0;

 protected:
  ILogger() = default;
  ILogger(const ILogger&) = default;
  ILogger& operator=(const ILogger&) = default;
  ILogger(ILogger&&) = default;
  ILogger& operator=(ILogger&&) = default;
};

// Discards every message. Default for generators.
class NullLogger final : public ILogger {
 public:
  void warn(std::string_view /*message*/) override {}
};

// Writes "[scru128] warning: <message>" lines to std::cerr.
class StderrLogger final : public ILogger {
 public:
  void warn(std::string_view message) override;

 private:
  std::mutex mutex_;
};

// Keeps messages in memory for inspection by tests.
class RecordingLogger final : public ILogger {
 public:
  void warn(std::string_view message) override;

  [[nodiscard]] std::vector<std::string> messages() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> messages_;
};

}  // namespace scru128::core
