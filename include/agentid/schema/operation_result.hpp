#pragma once

#include <agentid/schema/operation_error_code.hpp>
#include <string>
#include <utility>

namespace agentid::schema {

/// Value-or-error result for mutating operations.
template <typename T>
struct operation_result final {
  operation_error_code code{operation_error_code::ok};
  std::string message;
  T value{};

  bool ok() const { return code == operation_error_code::ok; }

  static operation_result success(T value) {
    return operation_result{.code = operation_error_code::ok,
                            .message = {},
                            .value = std::move(value)};
  }

  static operation_result failure(operation_error_code code,
                                  std::string message) {
    return operation_result{
        .code = code, .message = std::move(message), .value = T{}};
  }
};

}  // namespace agentid::schema
