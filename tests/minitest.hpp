#pragma once
#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mini {

struct TestCase { std::string name; std::string file; std::function<void()> fn; };
inline std::vector<TestCase>& registry() { static std::vector<TestCase> r; return r; }

struct Registrar {
  Registrar(const std::string& name, const char* file, std::function<void()> fn) {
    registry().push_back({name, file, std::move(fn)});
  }
};

inline void json_escape(std::ostream& os, const std::string& s) {
  for (const char c : s) {
    if (c == '"' || c == '\\') os << '\\' << c; else if (c == '\n') os << "\\n"; else os << c;
  }
}

// Runs every registered test, or only those whose name contains filter
inline int run_all(const char* filter = nullptr) {
  const char* json_env = std::getenv("KATA_TEST_JSON");
  bool json = json_env && (*json_env == '1' || *json_env == 't' || *json_env == 'T' || *json_env == 'y' || *json_env == 'Y');
  int failed = 0; int passed = 0;
  for (auto& t : registry()) {
    if (filter && *filter && t.name.find(filter) == std::string::npos) continue;
    std::string error;
    try {
      t.fn();
    } catch (const std::exception& e) {
      error = e.what();
    } catch (...) {
      error = "unknown exception";
    }
    if (error.empty()) {
      ++passed;
      if (json) std::cout << "{\"event\":\"test\",\"name\":\"" << t.name << "\",\"status\":\"pass\"}\n";
      else std::cout << "[PASS] " << t.name << "\n";
    } else {
      ++failed;
      if (json) {
        std::cout << "{\"event\":\"test\",\"name\":\"" << t.name << "\",\"status\":\"fail\",\"error\":\"";
        json_escape(std::cout, error);
        std::cout << "\"}\n";
      } else {
        std::cerr << "[FAIL] " << t.name << " (" << t.file << "): " << error << "\n";
      }
    }
  }
  if (json) {
    std::cout << "{\"event\":\"summary\",\"passed\":" << passed << ",\"failed\":" << failed << "}\n";
  } else {
    std::cout << "\n" << passed << " passed, " << failed << " failed\n";
  }
  return failed == 0 ? 0 : 1;
}

struct AssertionError : public std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace mini

#define TEST(name) \
  static void name(); \
  static ::mini::Registrar name##_registrar{#name, __FILE__, name}; \
  static void name()

#define MINI_LINE_STR2(x) #x
#define MINI_LINE_STR(x) MINI_LINE_STR2(x)
#define MINI_FAIL(msg) throw ::mini::AssertionError(std::string(msg) + " (line " MINI_LINE_STR(__LINE__) ")")

#define ASSERT_TRUE(expr) do { if(!(expr)) MINI_FAIL(std::string("ASSERT_TRUE failed: ") + #expr); } while(0)
#define ASSERT_EQ(a,b) do { if(!((a)==(b))) { MINI_FAIL(std::string("ASSERT_EQ failed: ") + #a " == " #b); } } while(0)
#define ASSERT_NE(a,b) do { if(!((a)!=(b))) { MINI_FAIL(std::string("ASSERT_NE failed: ") + #a " != " #b); } } while(0)
#define ASSERT_THROWS(expr, Exc) do { \
    bool mini_thrown = false; \
    try { (void)(expr); } catch (const Exc&) { mini_thrown = true; } \
    if (!mini_thrown) MINI_FAIL(std::string("ASSERT_THROWS failed: ") + #expr " throws " #Exc); \
  } while(0)
