#include "app/EventLog.hpp"
#include "util/TimeFormat.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace netstatus::app {

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
  }
  return "INFO";
}

std::string format_log_line(LogLevel level, std::string_view message, model::Clock::time_point ts) {
  char lvl[16];
  std::snprintf(lvl, sizeof(lvl), "%-8s", to_string(level));
  std::string line = netstatus::util::format_local(ts);
  line += "  ";
  line += lvl;
  line += "  ";
  line.append(message.data(), message.size());
  return line;
}

FileEventLog::FileEventLog(std::filesystem::path path, bool echo_stderr)
    : path_(std::move(path)), echo_stderr_(echo_stderr) {
  if (path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      std::fprintf(stderr, "netstatus: event log: failed to create %s: %s\n",
                   path_.parent_path().c_str(), ec.message().c_str());
    }
  }
}

FileEventLog::~FileEventLog() {
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileEventLog::ensure_open() {
  if (file_.is_open()) return true;
  file_.open(path_, std::ios::app);
  if (!file_) {
    if (!warned_) {
      std::fprintf(stderr, "netstatus: event log: failed to open %s: %s\n",
                   path_.c_str(), std::strerror(errno));
      warned_ = true;
    }
    file_.clear();
    return false;
  }
  warned_ = false;
  return true;
}

void FileEventLog::append_line(LogLevel level, std::string_view message, model::Clock::time_point ts) {
  std::string line = format_log_line(level, message, ts);
  std::lock_guard lk(mu_);
  if (echo_stderr_) std::fprintf(stderr, "%s\n", line.c_str());
  if (!ensure_open()) return;
  file_.write(line.data(), static_cast<std::streamsize>(line.size()));
  file_.put('\n');
  file_.flush();
  if (!file_) {
    // Retry the open on the next line (disk full, file rotated away, ...)
    file_.close();
    file_.clear();
  }
}

} // namespace netstatus::app
