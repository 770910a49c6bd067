#include "time.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace stepdb::util {

void VirtualClock::Advance(EpochSeconds amount) {
  if (amount < 0) {
    throw std::invalid_argument("virtual clock cannot move backwards");
  }
  now_ += amount;
}

void VirtualClock::Pump(const std::vector<EpochSeconds>& amounts) {
  for (const auto amount : amounts) {
    Advance(amount);
  }
}

google::protobuf::Timestamp ToProto(EpochSeconds seconds) {
  const double whole = std::floor(seconds);
  auto         nanos = static_cast<int32_t>(std::llround((seconds - whole) * 1e9));
  auto         secs  = static_cast<int64_t>(whole);
  if (nanos >= 1000000000) {
    secs += 1;
    nanos -= 1000000000;
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(secs);
  ts.set_nanos(nanos);
  return ts;
}

EpochSeconds FromProto(const google::protobuf::Timestamp& ts) {
  return static_cast<EpochSeconds>(ts.seconds()) + static_cast<EpochSeconds>(ts.nanos()) / 1e9;
}

} // namespace stepdb::util
