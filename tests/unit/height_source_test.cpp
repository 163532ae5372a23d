#include "internal/runtime/height_source.hpp"

#include <cassert>
#include <iostream>

namespace {

using archive::runtime::HeightSource;

void TestHeightsAreStrictlyIncreasingWithFrozenClock() {
  HeightSource heights(0, [] { return uint64_t{500}; });
  const auto first  = heights.Next();
  const auto second = heights.Next();
  const auto third  = heights.Next();
  assert(first == 500);
  assert(second == 501);
  assert(third == 502);
}

void TestGenesisHeightIsAFloor() {
  HeightSource heights(10'000, [] { return uint64_t{7}; });
  assert(heights.Next() == 10'000);
  assert(heights.Next() == 10'001);
}

void TestClockJumpsAreFollowed() {
  uint64_t     now = 100;
  HeightSource heights(0, [&] { return now; });
  assert(heights.Next() == 100);
  now = 5'000;
  assert(heights.Next() == 5'000);
  // clock going backwards never lowers the height
  now = 10;
  assert(heights.Next() == 5'001);
}

void TestDefaultClockIsWallTime() {
  HeightSource heights(0);
  // well past 2020-01-01 in unix millis
  assert(heights.Next() > 1'577'836'800'000ULL);
}

} // namespace

int main() {
  TestHeightsAreStrictlyIncreasingWithFrozenClock();
  TestGenesisHeightIsAFloor();
  TestClockJumpsAreFollowed();
  TestDefaultClockIsWallTime();

  std::cout << "media_archive_unit_height_source: pass\n";
  return 0;
}
