#pragma once

#include <bailment/schema/primitives.hpp>
#include <bailment/schema/transaction_error_code.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace bailment::schema {

template <uint16_t Version>
struct transaction_result;

/// Outcome of one submitted unit. `code` 0 means every instruction applied;
/// any other code means nothing applied.
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  hash32_t state_root{};
  std::vector<std::string> program_logs;
};

using transaction_result_t = transaction_result<1>;

inline transaction_error_code error_code(const transaction_result_t& result) {
  return static_cast<transaction_error_code>(result.code);
}

}  // namespace bailment::schema
