#pragma once

#include <bailment/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: agreement status.
// One-way lifecycle of an escrow agreement. An agreement without a record is
// uninitialized; there is no transition back to active.
namespace bailment::schema {

enum class agreement_status_t : uint8_t { active = 0, released = 1 };

inline constexpr auto kAgreementStatusMappings = std::array{
    std::pair<std::string_view, agreement_status_t>{
        "active", agreement_status_t::active},
    std::pair<std::string_view, agreement_status_t>{
        "released", agreement_status_t::released},
};
static_assert(is_bijective(kAgreementStatusMappings));

template <>
inline std::optional<agreement_status_t> try_from_string<agreement_status_t>(
    const std::string_view value) {
  return from_string(value, kAgreementStatusMappings);
}

inline constexpr std::string_view to_string(const agreement_status_t value) {
  return name_of(value, kAgreementStatusMappings);
}

}  // namespace bailment::schema
