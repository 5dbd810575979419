// Repository: Hush
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from retry logic.
//          Production: RealtimeWaitStrategy sleeps for the retry delay.
//          Tests: RecordingWaitStrategy (records delays, no sleep).
// Copyright (c) 2026 RetroVue

#ifndef HUSH_UTIL_IWAIT_STRATEGY_HPP_
#define HUSH_UTIL_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <thread>

namespace hush::util {

class IWaitStrategy {
 public:
  virtual void WaitFor(std::chrono::milliseconds delay) = 0;
  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  void WaitFor(std::chrono::milliseconds delay) override {
    std::this_thread::sleep_for(delay);
  }
};

}  // namespace hush::util

#endif  // HUSH_UTIL_IWAIT_STRATEGY_HPP_
