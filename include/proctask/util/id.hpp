#pragma once

#include <cstdint>
#include <format>
#include <functional>
#include <random>
#include <string>
#include <string_view>

namespace proctask {

struct TaskTag {};

// Type-safe ID wrapper using phantom type pattern
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;

// Source of ids for specs built without one. Passed into the spec factories
// so callers and tests control uniqueness.
class IdGenerator {
public:
  virtual ~IdGenerator() = default;

  [[nodiscard]] virtual auto next() -> TaskId = 0;
};

// Microseconds since the epoch in hex followed by a random suffix.
class UniqueIdGenerator final : public IdGenerator {
public:
  UniqueIdGenerator();

  [[nodiscard]] auto next() -> TaskId override;

private:
  std::mt19937_64 gen_;
  std::uniform_int_distribution<std::uint32_t> dis_;
};

// prefix-1, prefix-2, ...
class SequentialIdGenerator final : public IdGenerator {
public:
  explicit SequentialIdGenerator(std::string prefix = "task")
      : prefix_(std::move(prefix)) {}

  [[nodiscard]] auto next() -> TaskId override;

private:
  std::string prefix_;
  std::uint64_t counter_{0};
};

}  // namespace proctask

template <typename Tag>
struct std::hash<proctask::TypedId<Tag>> {
  auto operator()(const proctask::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<proctask::TypedId<Tag>> : std::formatter<std::string> {
  auto format(const proctask::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string>::format(std::string(id.value()), ctx);
  }
};
