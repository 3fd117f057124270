#pragma once

#include <array>
#include <cerrno>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace cfgsmith {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  FileOpenFailed,
  FileWriteFailed,
  ParseError,
  InvalidArgument,
  AlreadyExists,
  Timeout,
  Cancelled,
  GenerationFailed,
  ReloadFailed,
  WatchUnavailable,
  ProcessSpawnFailed,
  InvalidState,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 15> messages = {
      "success",
      "file not found",
      "failed to open file",
      "failed to write file",
      "parse error",
      "invalid argument",
      "already exists",
      "timeout",
      "cancelled",
      "config generation failed",
      "server reload failed",
      "file watching unavailable",
      "failed to spawn process",
      "invalid state transition",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "cfgsmith";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      std::unreachable();
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

// Concept for types that can be used with Result<T>
template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

[[nodiscard]] inline auto last_system_error() -> std::error_code {
  return {errno, std::system_category()};
}

template <typename T> [[nodiscard]] auto sys_check(T val) -> Result<T> {
  if (val < 0)
    return fail(last_system_error());
  return ok(val);
}

} // namespace cfgsmith

template <> struct std::is_error_code_enum<cfgsmith::Error> : std::true_type {};
