#pragma once
#include "time/ITimeSource.hpp"
#include <chrono>

class SystemTimeSource : public ITimeSource {
public:
  int64_t NowMonotonicUs() const override {
    using namespace std::chrono;
    return duration_cast<microseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};
