#pragma once
#include <bailment/schema/init_escrow.hpp>
#include <bailment/schema/init_vault.hpp>
#include <bailment/schema/lock_tokens.hpp>
#include <bailment/schema/release_to_seller.hpp>
#include <string_view>
#include <variant>

namespace bailment::schema {

/// Closed set of vault-escrow program operations.
using operation_t = std::variant<init_vault_t,
                                 lock_tokens_t,
                                 init_escrow_t,
                                 release_to_seller_t>;

inline std::string_view operation_name(const operation_t& operation) {
  return std::visit(
      [](const auto& value) -> std::string_view {
        return std::decay_t<decltype(value)>::kName;
      },
      operation);
}

}  // namespace bailment::schema
