#pragma once

#include <agentid/common/time.hpp>
#include <agentid/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace agentid::testing {

/// 2025-01-06T10:00:00Z, a Monday.
inline constexpr auto kMonday10am = agentid::schema::timestamp_milliseconds_t{
    1736157600000};

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Settable clock shared by every component built from `fn()`.
class manual_clock final {
 public:
  explicit manual_clock(
      const agentid::schema::timestamp_milliseconds_t start = kMonday10am)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  agentid::common::clock_fn_t fn() const {
    return [now = now_] { return now->load(); };
  }

  agentid::schema::timestamp_milliseconds_t now() const { return now_->load(); }
  void set(const agentid::schema::timestamp_milliseconds_t value) {
    now_->store(value);
  }
  void advance(const agentid::schema::duration_milliseconds_t by) {
    now_->fetch_add(by);
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

}  // namespace agentid::testing
