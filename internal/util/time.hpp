#pragma once

#include <vector>

#include "google/protobuf/timestamp.pb.h"

namespace stepdb::util {

/*
  Time utilities.

  Stored timestamps are epoch seconds, as the steps table keeps them.
  The only source of "now" is an injected Clock so tests control time.
*/

using EpochSeconds = double;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual EpochSeconds Seconds() const = 0;
};

// Starts at 0 and moves only when the test harness says so.
class VirtualClock final : public Clock {
 public:
  EpochSeconds Seconds() const override {
    return now_;
  }

  void Advance(EpochSeconds amount);

  // Advance by each amount in turn.
  void Pump(const std::vector<EpochSeconds>& amounts);

 private:
  EpochSeconds now_ = 0;
};

google::protobuf::Timestamp ToProto(EpochSeconds seconds);
EpochSeconds                FromProto(const google::protobuf::Timestamp& ts);

} // namespace stepdb::util
