#pragma once

#include <bailment/schema/primitives.hpp>
#include <cstdint>

namespace bailment::schema {

template <uint16_t Version>
struct app_info;

/// Executor identity and last checkpoint.
template <>
struct app_info<1> final {
  uint16_t version{1};
  pubkey_t program_id{};
  bool strict_crypto{};
  int64_t last_height{};
  hash32_t last_state_root{};
  hash32_t chain_id{};
};

using app_info_t = app_info<1>;

}  // namespace bailment::schema
