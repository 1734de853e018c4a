#pragma once
#include <bailment/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bailment::codec {

inline constexpr std::size_t kSelectorSize = 8;

using selector_t = std::array<uint8_t, kSelectorSize>;

/// First 8 bytes of SHA-256("global:" + name).
selector_t make_selector(std::string_view operation_name);

/// First 8 bytes of SHA-256("account:" + name), prefixed to program-owned
/// records.
selector_t make_account_discriminator(std::string_view record_name);

/// Wire name of the vault-escrow operation with this selector, if any.
std::optional<std::string_view> operation_for_selector(
    const selector_t& selector);

}  // namespace bailment::codec
