#include "proctask/util/id.hpp"

#include <chrono>

namespace proctask {

UniqueIdGenerator::UniqueIdGenerator() : gen_(std::random_device{}()) {}

auto UniqueIdGenerator::next() -> TaskId {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now);
  return TaskId{std::format("{:x}{:08x}", micros.count(), dis_(gen_))};
}

auto SequentialIdGenerator::next() -> TaskId {
  return TaskId{std::format("{}-{}", prefix_, ++counter_)};
}

}  // namespace proctask
