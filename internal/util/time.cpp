#include "time.hpp"

#include <stdexcept>
#include <string>

namespace lending::util {

Timestamp SystemClock::Now() const {
  return ToUnixSeconds(std::chrono::system_clock::now());
}

Timestamp ToUnixSeconds(std::chrono::system_clock::time_point tp) {
  return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
}

Seconds FromProto(const google::protobuf::Duration& duration) {
  if (duration.seconds() < 0 || duration.nanos() < 0) {
    throw std::invalid_argument("duration must not be negative: " + std::to_string(duration.seconds()) + "s");
  }
  return static_cast<Seconds>(duration.seconds());
}

google::protobuf::Duration ToProto(Seconds seconds) {
  google::protobuf::Duration duration;
  duration.set_seconds(static_cast<std::int64_t>(seconds));
  return duration;
}

} // namespace lending::util
