#pragma once

#include <bailment/schema/enum_string.hpp>
#include <bailment/schema/primitives.hpp>
#include <bailment/schema/transaction_error_code.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace bailment::client {

/// Outcome of a submitted protocol step. Failures carry the operation name,
/// the derived address involved and the failing precondition.
struct operation_result final {
  bailment::schema::transaction_error_code code{
      bailment::schema::transaction_error_code::ok};
  std::string operation;
  bailment::schema::pubkey_t address{};
  std::string message;

  bool ok() const {
    return code == bailment::schema::transaction_error_code::ok;
  }
  bailment::schema::error_category_t category() const {
    return bailment::schema::classify(code);
  }
};

enum class idempotent_status_t : uint8_t {
  created = 0,
  already_exists = 1,
  failed = 2
};

inline constexpr auto kIdempotentStatusMappings = std::array{
    std::pair<std::string_view, idempotent_status_t>{
        "created", idempotent_status_t::created},
    std::pair<std::string_view, idempotent_status_t>{
        "already_exists", idempotent_status_t::already_exists},
    std::pair<std::string_view, idempotent_status_t>{
        "failed", idempotent_status_t::failed},
};
static_assert(bailment::schema::is_bijective(kIdempotentStatusMappings));

inline constexpr std::string_view to_string(const idempotent_status_t value) {
  return bailment::schema::name_of(value, kIdempotentStatusMappings);
}

/// Outcome of a step that may already have been performed.
struct idempotent_result final {
  idempotent_status_t status{idempotent_status_t::failed};
  operation_result detail;

  bool ok() const { return status != idempotent_status_t::failed; }
};

}  // namespace bailment::client
