#pragma once
#include <bailment/schema/primitives.hpp>
#include <initializer_list>
#include <string_view>

namespace bailment::blake3 {

bailment::schema::hash32_t hash(std::string_view text);

/// Digest of the concatenation of `parts`, without materializing it.
bailment::schema::hash32_t hash(
    std::initializer_list<bailment::schema::bytes_view_t> parts);

}  // namespace bailment::blake3
