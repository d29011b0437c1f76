module;
#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>
#include <type_traits>

export module protoDotCpp.sys.logger;

#include "alias.hpp"

namespace protoDotCpp {
namespace logger {
std::string out;
bool verbose = false;

export const std::string reset = "\033[0m";

export void flush() {
  std::cout << out;
  std::cout.flush();
  out.clear();
}

export void setVerbose(bool value) { verbose = value; }

using EndlType = decltype(std::endl<char, std::char_traits<char>>);

export struct Logger {
 protected:
  std::string content;
  bool isFlushed = false;
  bool muted = false;

  std::string flushContent() {
    isFlushed = true;
    return content + reset + '\n';
  }

 public:
  Logger() {}
  Logger(const std::string& init, bool muted = false)
      : content(init), muted(muted) {}

  template <class T>
  auto& operator<<(const T& msg) {
    if constexpr (std::is_arithmetic_v<T>)
      content += std::to_string(msg);
    else
      content += std::string(msg);
    return *this;
  }

  auto& operator<<(const Path& path) {
    return operator<<(path.generic_string());
  }

  void operator<<(EndlType&) {
    if (muted) {
      isFlushed = true;
      return;
    }
    out += flushContent();
    flush();
  }

  ~Logger() {
    if (!isFlushed && !muted) out += flushContent();
  }
};

#define GENERATE_COLOR(NAME, CODE) \
  export Logger NAME() { return {"\033[0;" #CODE}; };

GENERATE_COLOR(red, 31m);
GENERATE_COLOR(green, 32m);
GENERATE_COLOR(yellow, 33m);
GENERATE_COLOR(blue, 34m);
#undef GENERATE_COLOR

export Logger info() { return {}; }

// Muted unless verbose output is enabled.
export Logger debug() { return {"\033[0;90m", !verbose}; }

export Logger success() { return green(); }

export Logger warn() { return yellow(); }

export Logger error() { return red(); }
}  // namespace logger
}  // namespace protoDotCpp
