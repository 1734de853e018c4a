#pragma once
#include <bailment/schema/account.hpp>
#include <bailment/schema/primitives.hpp>
#include <vector>

namespace bailment::schema {

/// Wire form of a single program invocation.
struct instruction_t final {
  pubkey_t program_id{};
  std::vector<account_meta_t> accounts;
  bytes_t data;
};

}  // namespace bailment::schema
