#pragma once

#include <concepts>
#include <cstddef>
#include <expected>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace batchq {

enum class Error : int {
  Success,
  AdmissionDenied,
  NotFound,
  InvalidState,
  BatchTooLarge,
  InvalidInput,
  QueueFull,
  FileNotFound,
  ParseError,
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  EngineUnavailable,
  Unknown,
};

namespace detail {

struct ErrorInfo {
  std::string_view name;
  std::string_view message;
};

inline constexpr ErrorInfo kErrorInfo[] = {
    {"success", "success"},
    {"admission_denied", "concurrency limit reached"},
    {"not_found", "not found"},
    {"invalid_state", "invalid state for operation"},
    {"batch_too_large", "batch exceeds maximum size"},
    {"invalid_input", "invalid input"},
    {"queue_full", "queue is full"},
    {"file_not_found", "file not found"},
    {"parse_error", "parse error"},
    {"database_error", "database error"},
    {"database_open_failed", "failed to open database"},
    {"database_query_failed", "database query failed"},
    {"engine_unavailable", "analysis engine unavailable"},
    {"unknown", "unknown error"},
};

[[nodiscard]] constexpr auto error_info(int ev) noexcept -> const ErrorInfo& {
  auto idx = static_cast<std::size_t>(ev);
  if (ev < 0 || idx >= std::size(kErrorInfo)) {
    return kErrorInfo[std::to_underlying(Error::Unknown)];
  }
  return kErrorInfo[idx];
}

}  // namespace detail

// Stable snake_case identifier, e.g. "admission_denied".
[[nodiscard]] constexpr auto error_name(Error e) noexcept -> std::string_view {
  return detail::error_info(std::to_underlying(e)).name;
}

// Errors caused by the caller's request rather than by the system.
[[nodiscard]] constexpr auto is_request_error(Error e) noexcept -> bool {
  switch (e) {
    case Error::AdmissionDenied:
    case Error::NotFound:
    case Error::InvalidState:
    case Error::BatchTooLarge:
    case Error::InvalidInput:
      return true;
    default:
      return false;
  }
}

class ErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "batchq";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    return std::string{detail::error_info(ev).message};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

// Unknown for codes from other categories.
[[nodiscard]] inline auto to_error(std::error_code ec) -> Error {
  if (ec.category() != error_category()) {
    return Error::Unknown;
  }
  return static_cast<Error>(ec.value());
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace batchq

template <>
struct std::is_error_code_enum<batchq::Error> : std::true_type {};

namespace batchq {

// Heterogeneous lookup for string-keyed maps (per-user counters)
struct StringHash {
  using is_transparent = void;

  [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
    return std::hash<std::string_view>{}(sv);
  }

  [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }

  [[nodiscard]] std::size_t operator()(const char* s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace batchq
