#pragma once
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mini {

struct TestCase { std::string name; std::function<void()> fn; };
inline std::vector<TestCase>& registry() { static std::vector<TestCase> r; return r; }

struct Registrar {
  Registrar(const std::string& name, std::function<void()> fn) { registry().push_back({name, std::move(fn)}); }
};

struct AssertionError : public std::runtime_error { using std::runtime_error::runtime_error; };
// Thrown by SKIP(): the environment cannot run the test (no permission, no tool)
struct Skipped : public std::runtime_error { using std::runtime_error::runtime_error; };

inline void json_escape(std::ostream& os, const std::string& s) {
  for (const char c : s) {
    if (c == '"' || c == '\\') os << '\\' << c; else if (c == '\n') os << "\\n"; else os << c;
  }
}

// NETSTATUS_TEST_JSON=1 switches to one JSON object per line.
// A non-empty filter runs only tests whose name contains it.
inline int run_all(const std::string& filter = {}) {
  const char* json_env = std::getenv("NETSTATUS_TEST_JSON");
  bool json = json_env && (*json_env == '1' || *json_env == 't' || *json_env == 'T' || *json_env == 'y' || *json_env == 'Y');
  int failed = 0, passed = 0, skipped = 0, filtered = 0;
  for (auto& t : registry()) {
    if (!filter.empty() && t.name.find(filter) == std::string::npos) { ++filtered; continue; }
    std::string error;
    auto t0 = std::chrono::steady_clock::now();
    try {
      t.fn();
    } catch (const Skipped& s) {
      ++skipped;
      if (json) {
        std::cout << "{\"event\":\"test\",\"name\":\"" << t.name << "\",\"status\":\"skip\",\"reason\":\"";
        json_escape(std::cout, s.what());
        std::cout << "\"}\n";
      } else {
        std::cout << "[SKIP] " << t.name << ": " << s.what() << "\n";
      }
      continue;
    } catch (const std::exception& e) {
      error = e.what();
      if (error.empty()) error = "exception";
    } catch (...) {
      error = "unknown exception";
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    if (error.empty()) ++passed; else ++failed;
    if (json) {
      std::cout << "{\"event\":\"test\",\"name\":\"" << t.name << "\",\"status\":\""
                << (error.empty() ? "pass" : "fail") << "\",\"ms\":" << ms;
      if (!error.empty()) { std::cout << ",\"error\":\""; json_escape(std::cout, error); std::cout << '"'; }
      std::cout << "}\n";
    } else if (error.empty()) {
      std::cout << "[PASS] " << t.name << " (" << ms << " ms)\n";
    } else {
      std::cerr << "[FAIL] " << t.name << ": " << error << "\n";
    }
  }
  if (json) {
    std::cout << "{\"event\":\"summary\",\"passed\":" << passed << ",\"failed\":" << failed
              << ",\"skipped\":" << skipped << ",\"filtered\":" << filtered << "}\n";
  } else {
    std::cout << "\n" << passed << " passed, " << failed << " failed";
    if (skipped) std::cout << ", " << skipped << " skipped";
    if (filtered) std::cout << ", " << filtered << " filtered out";
    std::cout << "\n";
  }
  return failed == 0 ? 0 : 1;
}

template <typename A, typename B>
std::string describe_pair(const A& a, const B& b) {
  std::ostringstream os;
  os << " (" << a << " vs " << b << ")";
  return os.str();
}

} // namespace mini

#define TEST(name) \
  static void name(); \
  static ::mini::Registrar name##_registrar{#name, name}; \
  static void name()

#define SKIP(reason) throw ::mini::Skipped(reason)

#define ASSERT_TRUE(expr) do { if(!(expr)) throw ::mini::AssertionError(std::string("ASSERT_TRUE failed: ") + #expr); } while(0)
#define ASSERT_FALSE(expr) do { if((expr)) throw ::mini::AssertionError(std::string("ASSERT_FALSE failed: ") + #expr); } while(0)
#define ASSERT_EQ(a,b) do { if(!((a)==(b))) { throw ::mini::AssertionError(std::string("ASSERT_EQ failed: ") + #a " == " #b); } } while(0)
#define ASSERT_NE(a,b) do { if(!((a)!=(b))) { throw ::mini::AssertionError(std::string("ASSERT_NE failed: ") + #a " != " #b); } } while(0)
#define ASSERT_NEAR(a,b,eps) do { auto mini_a_ = (a); auto mini_b_ = (b); \
  if(!(std::fabs(mini_a_ - mini_b_) <= (eps))) { \
    throw ::mini::AssertionError(std::string("ASSERT_NEAR failed: ") + #a " ~ " #b + ::mini::describe_pair(mini_a_, mini_b_)); } } while(0)
