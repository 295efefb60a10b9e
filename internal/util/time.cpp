#include "time.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fieldsync::util {

uint64_t NowMillis() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

std::string FormatUnixMillis(uint64_t ms) {
  if (ms == 0) {
    return {};
  }

  const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  std::tm           tm{};
  gmtime_r(&seconds, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << (ms % 1000) << 'Z';
  return out.str();
}

} // namespace fieldsync::util
