#pragma once

#include <cstdint>
#include <functional>
#include <mutex>

namespace archive::runtime {

/*
  Issues the per-call height the registry stamps into created_at.

  Heights are strictly increasing for the life of the process and never
  fall below max(genesis_height, wall clock in unix millis), so a restart
  on a durable store keeps heights ahead of everything already recorded.
*/
class HeightSource {
 public:
  using ClockFn = std::function<uint64_t()>;

  explicit HeightSource(uint64_t genesis_height, ClockFn clock = {});

  uint64_t Next();

 private:
  ClockFn    clock_;
  std::mutex mutex_;
  uint64_t   last_ = 0;
  uint64_t   floor_;
};

} // namespace archive::runtime
