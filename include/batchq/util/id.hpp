#pragma once

#include "batchq/util/util.hpp"

#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace batchq {

// Each tag names the entity its ids refer to, for log and error text.
struct TaskTag {
  static constexpr std::string_view kind = "task";
};
struct BatchTag {
  static constexpr std::string_view kind = "batch";
};
struct WorkerTag {
  static constexpr std::string_view kind = "worker";
};

// String id that only compares with ids of the same entity.
template <typename Tag>
class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  // Fresh random UUID.
  [[nodiscard]] static auto generate() -> TypedId {
    return TypedId{generate_uuid()};
  }

  [[nodiscard]] static constexpr auto kind() noexcept -> std::string_view {
    return Tag::kind;
  }

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId&, const TypedId&) = default;
  [[nodiscard]] friend auto operator==(const TypedId&, const TypedId&) -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using BatchId = TypedId<BatchTag>;
using WorkerId = TypedId<WorkerTag>;

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace batchq

template <typename Tag>
struct std::hash<batchq::TypedId<Tag>> {
  auto operator()(const batchq::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<batchq::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const batchq::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
