#include "minitest.hpp"
#include "app/EventLog.hpp"
#include "util/TimeFormat.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path tmp_dir(const char* tag) {
  return fs::temp_directory_path() / ("netstatus_test_log_" + std::to_string(::getpid()) + "_" + tag);
}

static std::vector<std::string> read_lines(const fs::path& p) {
  std::vector<std::string> lines;
  std::ifstream f(p);
  std::string l;
  while (std::getline(f, l)) lines.push_back(l);
  return lines;
}

static netstatus::model::Clock::time_point ts() {
  return netstatus::model::Clock::time_point{} + std::chrono::seconds(1700000000);
}

TEST(event_log_line_format) {
  auto line = netstatus::app::format_log_line(netstatus::app::LogLevel::Warning, "gateway=down", ts());
  std::string want = netstatus::util::format_local(ts()) + "  WARNING   gateway=down";
  ASSERT_EQ(line, want);
  auto info = netstatus::app::format_log_line(netstatus::app::LogLevel::Info, "ok", ts());
  ASSERT_TRUE(info.find("  INFO      ok") != std::string::npos);
}

TEST(event_log_level_names) {
  ASSERT_EQ(std::string(netstatus::app::to_string(netstatus::app::LogLevel::Info)), "INFO");
  ASSERT_EQ(std::string(netstatus::app::to_string(netstatus::app::LogLevel::Error)), "ERROR");
}

TEST(event_log_appends_to_file) {
  auto dir = tmp_dir("append");
  auto path = dir / "nested" / "monitor.log";
  {
    netstatus::app::FileEventLog log(path, false);
    log.append_line(netstatus::app::LogLevel::Info, "Monitor starting.", ts());
    log.append_line(netstatus::app::LogLevel::Error, "ALERT: x", ts());
  }
  {
    // A second instance appends rather than truncating
    netstatus::app::FileEventLog log(path, false);
    log.append_line(netstatus::app::LogLevel::Info, "Monitor stopped.", ts());
  }
  auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), 3u);
  ASSERT_TRUE(lines[0].find("Monitor starting.") != std::string::npos);
  ASSERT_TRUE(lines[1].find("ERROR") != std::string::npos);
  ASSERT_TRUE(lines[2].find("Monitor stopped.") != std::string::npos);
  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(event_log_unwritable_path_is_swallowed) {
  auto dir = tmp_dir("blocked");
  std::error_code ec;
  fs::remove_all(dir, ec);
  {
    std::ofstream f(dir); // a regular file where the parent directory should be
    f << "x";
  }
  netstatus::app::FileEventLog log(dir / "monitor.log", false);
  log.append_line(netstatus::app::LogLevel::Info, "first", ts());
  log.append_line(netstatus::app::LogLevel::Info, "second", ts());
  ASSERT_TRUE(!fs::exists(dir / "monitor.log"));
  fs::remove(dir, ec);
}
