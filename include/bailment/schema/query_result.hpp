#pragma once

#include <bailment/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace bailment::schema {

template <uint16_t Version>
struct query_result;

/// Answer to a read-path query. `value` holds the SCALE encoding of the
/// requested record and is empty whenever `code` is non-zero.
template <>
struct query_result<1> final {
  uint16_t version{1};
  std::string path;
  bytes_t key;
  uint32_t code{};
  std::string log;
  bytes_t value;
  int64_t height{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace bailment::schema
