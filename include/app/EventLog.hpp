#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string_view>
#include "model/CheckRecord.hpp"

namespace netstatus::app {

enum class LogLevel { Info, Warning, Error };

[[nodiscard]] const char* to_string(LogLevel level);

// Append-only sink for per-check and per-transition lines. Best effort:
// implementations swallow their own write failures.
class IEventLog {
public:
  virtual ~IEventLog() = default;
  virtual void append_line(LogLevel level, std::string_view message, model::Clock::time_point ts) = 0;
};

// "YYYY-MM-DD HH:MM:SS  LEVEL     message"
[[nodiscard]] std::string format_log_line(LogLevel level, std::string_view message, model::Clock::time_point ts);

class FileEventLog : public IEventLog {
public:
  explicit FileEventLog(std::filesystem::path path, bool echo_stderr = true);
  ~FileEventLog() override;
  FileEventLog(const FileEventLog&) = delete;
  FileEventLog& operator=(const FileEventLog&) = delete;

  void append_line(LogLevel level, std::string_view message, model::Clock::time_point ts) override;

  const std::filesystem::path& path() const { return path_; }

private:
  bool ensure_open();

  std::filesystem::path path_;
  bool echo_stderr_;
  std::mutex mu_;
  std::ofstream file_;
  bool warned_{false};
};

} // namespace netstatus::app
