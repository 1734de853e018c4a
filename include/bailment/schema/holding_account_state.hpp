#pragma once
#include <bailment/schema/enum_string.hpp>
#include <bailment/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: holding account state.
// Balance of one asset held for one owner.
namespace bailment::schema {

enum class holding_account_status_t : uint8_t {
  uninitialized = 0,
  initialized = 1,
  frozen = 2
};

inline constexpr auto kHoldingAccountStatusMappings = std::array{
    std::pair<std::string_view, holding_account_status_t>{
        "uninitialized", holding_account_status_t::uninitialized},
    std::pair<std::string_view, holding_account_status_t>{
        "initialized", holding_account_status_t::initialized},
    std::pair<std::string_view, holding_account_status_t>{
        "frozen", holding_account_status_t::frozen},
};
static_assert(is_bijective(kHoldingAccountStatusMappings));

inline constexpr std::string_view to_string(
    const holding_account_status_t value) {
  return name_of(value, kHoldingAccountStatusMappings);
}

template <uint16_t Version>
struct holding_account_state;

template <>
struct holding_account_state<1> final {
  pubkey_t mint{};
  pubkey_t owner{};
  amount_t amount{};
  holding_account_status_t state{holding_account_status_t::uninitialized};
};

using holding_account_state_t = holding_account_state<1>;

}  // namespace bailment::schema
