#pragma once
#include <stdint.h>
#include <stdlib.h>
#include <algorithm>
#include <chrono>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/core.h>
#include <fmt/compile.h>
#include <spdlog/spdlog.h>

namespace Skein {

constexpr std::string_view VERSION = "0.1.0";
constexpr uint64_t ID_MAX = std::numeric_limits<uint64_t>::max();
constexpr size_t MiB = 1024 * 1024;

template<class... Ts> struct overload : Ts... { using Ts::operator()...; };
template<class... Ts> overload(Ts...) -> overload<Ts...>;

template <typename T> using OptRef = std::optional<std::reference_wrapper<const T>>;

using Timestamp = std::chrono::system_clock::time_point;

static inline auto timestamp_to_uint(Timestamp ts) noexcept -> uint64_t {
  return std::chrono::duration_cast<std::chrono::duration<uint64_t>>(ts.time_since_epoch()).count();
}
static inline auto now_t() -> Timestamp {
  return std::chrono::system_clock::now();
}
static inline auto now_s() -> uint64_t {
  return timestamp_to_uint(now_t());
}

// Blank and absent are the same thing everywhere a caller-supplied string can
// be left out.
static inline auto non_blank(std::optional<std::string_view> s) noexcept -> std::optional<std::string_view> {
  if (!s || s->empty()) return {};
  return s;
}

struct ApiError : public std::runtime_error {
  uint16_t http_status;
  std::string message, internal_message;
  ApiError(std::string message, uint16_t http_status = 500, std::string internal_message = {})
    : std::runtime_error(internal_message.empty() ? std::string(message) : fmt::format("{} - {}", message, internal_message)),
      http_status(http_status), message(message), internal_message(internal_message) {}

  auto is_not_found() const noexcept -> bool { return http_status == 404; }
  auto is_conflict() const noexcept -> bool { return http_status == 409; }
  auto is_validation_failure() const noexcept -> bool { return http_status == 400; }
};

}
