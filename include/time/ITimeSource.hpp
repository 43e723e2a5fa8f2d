#pragma once
#include <cstdint>

class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  // Monotonic microseconds; only differences are meaningful.
  virtual int64_t NowMonotonicUs() const = 0;
};
