#include "height_source.hpp"

#include <algorithm>

#include "internal/util/time.hpp"

namespace archive::runtime {

HeightSource::HeightSource(uint64_t genesis_height, ClockFn clock) : clock_(std::move(clock)), floor_(genesis_height) {
  if (!clock_) {
    clock_ = [] { return archive::util::ToUnixMillis(archive::util::Now()); };
  }
}

uint64_t HeightSource::Next() {
  std::lock_guard<std::mutex> lock(mutex_);
  last_ = std::max({last_ + 1, floor_, clock_()});
  return last_;
}

} // namespace archive::runtime
