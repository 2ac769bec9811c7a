#include "analytics_cache/key_codec.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace analytics_cache {

std::string format_timestamp(TimePoint tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch())
                      .count();
  auto secs = static_cast<std::time_t>(ms / 1000);
  auto millis = static_cast<int>(ms % 1000);
  if (millis < 0) {
    millis += 1000;
    --secs;
  }
  std::tm tm{};
  gmtime_r(&secs, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
     << std::setfill('0') << millis << 'Z';
  return os.str();
}

std::string canonical_params(const Json &params) {
  // Json objects are ordered maps, so dump() already emits sorted keys at
  // every depth. Invalid UTF-8 is replaced rather than thrown.
  return params.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::uint64_t fnv1a64(std::string_view data) {
  std::uint64_t h = 1469598103934665603ULL;
  for (unsigned char c : data) {
    h ^= static_cast<std::uint64_t>(c);
    h *= 1099511628211ULL;
  }
  return h;
}

std::string params_digest(const Json &params) {
  std::ostringstream os;
  os << std::hex << std::setw(16) << std::setfill('0')
     << fnv1a64(canonical_params(params));
  return os.str();
}

std::string generate_key(const std::string &name_space, const Json &params) {
  return name_space + ":" + params_digest(params);
}

} // namespace analytics_cache
