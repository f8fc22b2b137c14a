#pragma once

#include <verity/schema/transaction_error_code.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace verity::registry {

/// Failure of one registry operation. The enclosing transaction is rolled
/// back and `code` becomes the transaction result code.
struct operation_error final {
  verity::schema::transaction_error_code code{};
  std::string log;
};

using operation_status_t = std::optional<operation_error>;

template <typename T>
using operation_result_t = std::variant<T, operation_error>;

inline operation_error make_error(verity::schema::transaction_error_code code,
                                  std::string log) {
  return operation_error{.code = code, .log = std::move(log)};
}

}  // namespace verity::registry
